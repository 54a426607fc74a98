#pragma once

#include "debsnap/io/fd.hpp"
#include "debsnap/io/io.hpp"
#include "debsnap/util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace debsnap {

// Sequential reader over a pool archive or index file. Directories are
// refused at Open().
class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader &out);

    ssize_t Read(std::span<std::uint8_t> out) override;

private:
    std::string path_;
    Fd fd_;
};

} // namespace debsnap
