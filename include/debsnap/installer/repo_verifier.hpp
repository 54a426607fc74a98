#pragma once

#include "debsnap/util/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace debsnap {

struct VerifySummary {
    size_t stanzas = 0;
    size_t hashed = 0;
    std::vector<std::string> problems;
};

// Packages if present, otherwise Packages.gz decompressed.
Result ReadRepoIndex(const std::filesystem::path& repo, std::string& out);

// Checks that a flat repository can back APT: pool/ exists, the index has
// at least one stanza and every Filename it names is present with the
// declared Size (and SHA256 when `check_hashes`).
Result VerifyRepo(const std::filesystem::path& repo, bool check_hashes, VerifySummary& out);

} // namespace debsnap
