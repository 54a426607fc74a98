#include "debsnap/io/fd_writer.hpp"

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace debsnap {

Result FdWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        return Result::Fail(errno, "Write failed (" + std::string(std::strerror(errno)) + ")");
    }

    return Result::Ok();
}

Result FdWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        return Result::Fail(errno, "fsync failed (" + std::string(std::strerror(errno)) + ")");
    }
    return Result::Ok();
}

} // namespace debsnap
