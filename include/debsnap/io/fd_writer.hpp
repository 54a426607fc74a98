#pragma once

#include "debsnap/io/fd.hpp"
#include "debsnap/io/io.hpp"
#include "debsnap/util/result.hpp"

#include <span>
#include <string>

namespace debsnap {

// Writes to a descriptor it owns. Used for scratch files that are later
// linked or renamed into place.
class FdWriter final : public IWriter {
  public:
    FdWriter() = default;
    explicit FdWriter(Fd fd) : fd_(std::move(fd)) {}

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;

    int Get() const { return fd_.Get(); }
    void Close() { fd_.Close(); }

  private:
    Fd fd_;
};

} // namespace debsnap
