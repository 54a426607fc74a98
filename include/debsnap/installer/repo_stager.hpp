#pragma once

#include "debsnap/installer/repo_verifier.hpp"
#include "debsnap/util/result.hpp"

#include <cstddef>
#include <filesystem>

namespace debsnap {

inline constexpr const char* kDefaultStageDir = "/opt/offline-repo";

struct StageSummary {
    size_t copied = 0;
    size_t unchanged = 0;
    size_t removed = 0;
    size_t links = 0;
    bool skipped_copy = false;
    VerifySummary verify;
};

// Makes `dest` an exact copy of `src`: new and changed files are copied
// (size + mtime decide "changed"), mtimes and symlinks are kept, entries
// missing from `src` are deleted, and the tree is opened up for reading by
// APT's unprivileged fetcher (u+rwX,go+rX,go-w).
class RepoStager {
public:
    explicit RepoStager(bool verify_hashes = false) : verify_hashes_(verify_hashes) {}

    // Mirror then verify. Nothing outside `dest` is touched.
    Result Stage(const std::filesystem::path& src, const std::filesystem::path& dest, StageSummary& out) const;

    Result Mirror(const std::filesystem::path& src, const std::filesystem::path& dest, StageSummary& out) const;

private:
    Result MirrorDir(const std::filesystem::path& src, const std::filesystem::path& dest, StageSummary& out) const;
    Result MirrorFile(const std::filesystem::path& src, const std::filesystem::path& dest, StageSummary& out) const;
    Result MirrorSymlink(const std::filesystem::path& src, const std::filesystem::path& dest, StageSummary& out) const;

    bool verify_hashes_;
};

// u+rwX,go+rX,go-w on one entry (symlinks are left alone).
Result OpenUpPermissions(const std::filesystem::path& p);

} // namespace debsnap
