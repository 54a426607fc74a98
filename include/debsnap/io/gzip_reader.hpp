#pragma once

#include "debsnap/io/io.hpp"

#include <memory>
#include <vector>
#include <zlib.h>

namespace debsnap {

class GzipReader final : public IReader {
  public:
    explicit GzipReader(std::unique_ptr<IReader> source);
    ~GzipReader() override;

    ssize_t Read(std::span<std::uint8_t> out) override;

  private:
    std::unique_ptr<IReader> source_;
    z_stream strm_{};
    std::vector<std::uint8_t> in_buffer_;
    bool eof_reached_ = false;
};

} // namespace debsnap
