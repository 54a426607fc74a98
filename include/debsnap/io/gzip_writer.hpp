#pragma once

#include "debsnap/io/io.hpp"

#include <vector>
#include <zlib.h>

namespace debsnap {

// Deflates into gzip framing and forwards compressed bytes to `sink`.
// Finish() must be called once all input is written; the sink stays owned
// by the caller.
class GzipWriter final : public IWriter {
  public:
    explicit GzipWriter(IWriter& sink, int level = Z_BEST_COMPRESSION);
    ~GzipWriter() override;

    GzipWriter(const GzipWriter&) = delete;
    GzipWriter& operator=(const GzipWriter&) = delete;

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;
    Result Finish();

  private:
    Result Pump(int flush);

    IWriter& sink_;
    z_stream strm_{};
    std::vector<std::uint8_t> out_buffer_;
    bool initialized_ = false;
    bool finished_ = false;
};

} // namespace debsnap
