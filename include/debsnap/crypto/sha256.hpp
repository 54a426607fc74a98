#pragma once

#include "debsnap/io/io.hpp"
#include "debsnap/util/result.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace debsnap {

// Streaming SHA-256 over OpenSSL EVP. After a failed update or FinalHex()
// every further call is a no-op and FinalHex() returns "".
class Sha256Hasher {
public:
    Sha256Hasher();
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;
    ~Sha256Hasher();

    void Update(std::span<const std::uint8_t> data);
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Lowercase hex digest of everything `reader` yields, "" on read error.
std::string Sha256Hex(IReader& reader);

// Digest of a pool archive or index file, as written to inventory rows and
// compared by the installer's verifier.
Result Sha256HexFile(const std::string& path, std::string& out_hex);

} // namespace debsnap
