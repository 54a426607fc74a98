#pragma once

#include "debsnap/util/result.hpp"

#include <cstdint>
#include <span>
#include <sys/types.h>

namespace debsnap {

class IReader {
public:
    virtual ~IReader() = default;
    // Bytes read, 0 at end of stream, -1 on error.
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
};

class IWriter {
public:
    virtual ~IWriter() = default;
    virtual Result WriteAll(std::span<const std::uint8_t> in) = 0;
    virtual Result FsyncNow() = 0;
};

} // namespace debsnap
