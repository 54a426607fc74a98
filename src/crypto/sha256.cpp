#include "debsnap/crypto/sha256.hpp"

#include "debsnap/io/file_reader.hpp"

#include <openssl/evp.h>

#include <array>
#include <cerrno>
#include <vector>

namespace debsnap {

namespace {

constexpr size_t kDigestLen = 32;
constexpr size_t kChunk = 256 * 1024;

struct MdCtxFree {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

std::string ToHex(const std::array<std::uint8_t, kDigestLen>& digest) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest.size() * 2);
    for (std::uint8_t b : digest) {
        out.push_back(kHex[b >> 4]);
        out.push_back(kHex[b & 0xF]);
    }
    return out;
}

} // namespace

struct Sha256Hasher::Impl {
    std::unique_ptr<EVP_MD_CTX, MdCtxFree> ctx{EVP_MD_CTX_new()};
    bool usable = false;
};

Sha256Hasher::Sha256Hasher() : impl_(std::make_unique<Impl>()) {
    impl_->usable = impl_->ctx &&
                    EVP_DigestInit_ex(impl_->ctx.get(), EVP_sha256(), nullptr) == 1;
}

Sha256Hasher::Sha256Hasher(Sha256Hasher&&) noexcept = default;
Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&&) noexcept = default;
Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::Update(std::span<const std::uint8_t> data) {
    if (!impl_ || !impl_->usable || data.empty()) return;
    if (EVP_DigestUpdate(impl_->ctx.get(), data.data(), data.size()) != 1) {
        impl_->usable = false;
    }
}

std::string Sha256Hasher::FinalHex() {
    if (!impl_ || !impl_->usable) return {};
    impl_->usable = false;

    std::array<std::uint8_t, kDigestLen> digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx.get(), digest.data(), &len) != 1 || len != kDigestLen) {
        return {};
    }
    return ToHex(digest);
}

std::string Sha256Hex(IReader& reader) {
    Sha256Hasher hasher;
    std::vector<std::uint8_t> buf(kChunk);
    for (;;) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n < 0) return {};
        if (n == 0) break;
        hasher.Update({buf.data(), static_cast<size_t>(n)});
    }
    return hasher.FinalHex();
}

Result Sha256HexFile(const std::string& path, std::string& out_hex) {
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.ok) return r;
    out_hex = Sha256Hex(reader);
    if (out_hex.empty()) return Result::Fail(EIO, "sha256 failed: " + path);
    return Result::Ok();
}

} // namespace debsnap
