#include "debsnap/io/gzip_reader.hpp"
#include "debsnap/io/gzip_writer.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

namespace debsnap {
namespace {

class BufferWriter final : public IWriter {
  public:
    Result WriteAll(std::span<const std::uint8_t> in) override {
        data.insert(data.end(), in.begin(), in.end());
        return Result::Ok();
    }
    Result FsyncNow() override { return Result::Ok(); }

    std::vector<std::uint8_t> data;
};

std::span<const std::uint8_t> Bytes(const std::string& s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

TEST(GzipReaderTest, SuccessfullyDecompressesGzipData) {
    // echo -n "hello" | gzip -c | xxd -i
    std::vector<uint8_t> compressed_data = {0x1f, 0x8b, 0x08, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
                                            0x03, 0xcb, 0x48, 0xcd, 0xc9, 0xc9, 0x07, 0x00, 0x86,
                                            0xa6, 0x10, 0x36, 0x05, 0x00, 0x00, 0x00};

    GzipReader gz_reader(std::make_unique<testutil::MemoryReader>(compressed_data));
    EXPECT_EQ(testutil::ReadAll(gz_reader), "hello");
}

TEST(GzipReaderTest, HandlesInvalidGzipHeader) {
    std::vector<uint8_t> garbage = {0x00, 0x01, 0x02, 0x03};

    GzipReader gz_reader(std::make_unique<testutil::MemoryReader>(garbage));

    std::vector<uint8_t> output_buffer(64);
    ssize_t n = gz_reader.Read(output_buffer);

    EXPECT_LT(n, 0);
}

TEST(GzipWriterTest, OutputIsReadableByGzipReader) {
    std::string text;
    for (int i = 0; i < 2000; ++i)
        text += "Package: pkg" + std::to_string(i) + "\nVersion: 1.0\n\n";

    BufferWriter sink;
    {
        GzipWriter gz(sink);
        ASSERT_TRUE(gz.WriteAll(Bytes(text.substr(0, 100))).is_ok());
        ASSERT_TRUE(gz.WriteAll(Bytes(text.substr(100))).is_ok());
        auto fr = gz.Finish();
        ASSERT_TRUE(fr.is_ok()) << fr.msg;
    }
    ASSERT_GE(sink.data.size(), 2u);
    EXPECT_EQ(sink.data[0], 0x1f);
    EXPECT_EQ(sink.data[1], 0x8b);
    EXPECT_LT(sink.data.size(), text.size());

    GzipReader reader(std::make_unique<testutil::MemoryReader>(sink.data));
    EXPECT_EQ(testutil::ReadAll(reader), text);
}

TEST(GzipReaderTest, TruncatedStreamIsAnError) {
    BufferWriter sink;
    {
        GzipWriter gz(sink);
        ASSERT_TRUE(gz.WriteAll(Bytes(std::string(10000, 'x') + "tail")).is_ok());
        ASSERT_TRUE(gz.Finish().is_ok());
    }
    sink.data.resize(sink.data.size() / 2);

    GzipReader reader(std::make_unique<testutil::MemoryReader>(sink.data));
    std::vector<std::uint8_t> buf(64 * 1024);
    ssize_t n = 0;
    do {
        n = reader.Read(buf);
    } while (n > 0);
    EXPECT_LT(n, 0);
}

} // namespace
} // namespace debsnap
