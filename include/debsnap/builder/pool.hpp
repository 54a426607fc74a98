#pragma once

#include "debsnap/debian/package_record.hpp"
#include "debsnap/util/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace debsnap {

// The append-only directory of .deb archives behind a repository. Files are
// only ever added, and only under names that are not taken yet.
class Pool {
public:
    enum class AddOutcome { kAdded, kAlreadyPresent };

    explicit Pool(std::filesystem::path dir);

    const std::filesystem::path& Dir() const { return dir_; }

    Result Ensure() const;

    // Every regular *.deb below Dir(), flat or nested, sorted by path.
    Result ListArchives(std::vector<std::filesystem::path>& out) const;

    // First conventional filename of `rec` present directly in Dir().
    std::optional<std::filesystem::path> FindExact(const PackageRecord& rec) const;

    // Places the bytes of `src` at Dir()/dest_name. An existing destination
    // is reported as kAlreadyPresent and left untouched. With `move_hint`
    // the source is a scratch file and may be hard-linked instead of copied.
    Result AddNoClobber(const std::filesystem::path& src,
                        const std::string& dest_name,
                        AddOutcome& outcome,
                        bool move_hint = false) const;

private:
    std::filesystem::path dir_;
};

// Archives grouped by the package-name part of their filename, built once
// per run from Pool::ListArchives.
class PoolNameIndex {
public:
    PoolNameIndex() = default;
    explicit PoolNameIndex(const std::vector<std::filesystem::path>& archives);

    const std::vector<std::filesystem::path>& Candidates(const std::string& bare_name) const;
    size_t size() const { return count_; }

private:
    std::unordered_map<std::string, std::vector<std::filesystem::path>> by_name_;
    size_t count_ = 0;
};

} // namespace debsnap
