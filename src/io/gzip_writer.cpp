#include "debsnap/io/gzip_writer.hpp"

namespace debsnap {

GzipWriter::GzipWriter(IWriter& sink, int level) : sink_(sink), out_buffer_(64 * 1024) {
    strm_.zalloc = Z_NULL;
    strm_.zfree = Z_NULL;
    strm_.opaque = Z_NULL;

    // 16 + MAX_WBITS emits a gzip header and trailer instead of raw zlib.
    initialized_ =
        deflateInit2(&strm_, level, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) == Z_OK;
}

GzipWriter::~GzipWriter() {
    if (initialized_) deflateEnd(&strm_);
}

Result GzipWriter::Pump(int flush) {
    while (true) {
        strm_.next_out = out_buffer_.data();
        strm_.avail_out = static_cast<uInt>(out_buffer_.size());

        const int ret = deflate(&strm_, flush);
        if (ret == Z_STREAM_ERROR) return Result::Fail(-1, "deflate failed");

        const size_t produced = out_buffer_.size() - strm_.avail_out;
        if (produced > 0) {
            auto wr = sink_.WriteAll({out_buffer_.data(), produced});
            if (!wr.is_ok()) return wr;
        }

        if (flush == Z_FINISH) {
            if (ret == Z_STREAM_END) return Result::Ok();
            continue;
        }
        if (strm_.avail_out != 0) return Result::Ok();
    }
}

Result GzipWriter::WriteAll(std::span<const std::uint8_t> in) {
    if (!initialized_) return Result::Fail(-1, "Failed to initialize zlib deflate");
    if (finished_) return Result::Fail(-1, "gzip stream already finished");
    if (in.empty()) return Result::Ok();

    strm_.next_in = const_cast<Bytef*>(in.data());
    strm_.avail_in = static_cast<uInt>(in.size());
    auto r = Pump(Z_NO_FLUSH);
    strm_.next_in = Z_NULL;
    strm_.avail_in = 0;
    return r;
}

Result GzipWriter::FsyncNow() { return sink_.FsyncNow(); }

Result GzipWriter::Finish() {
    if (!initialized_) return Result::Fail(-1, "Failed to initialize zlib deflate");
    if (finished_) return Result::Ok();
    auto r = Pump(Z_FINISH);
    if (r.is_ok()) finished_ = true;
    return r;
}

} // namespace debsnap
