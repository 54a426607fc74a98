#include "debsnap/builder/pool.hpp"

#include "debsnap/io/atomic_file.hpp"
#include "debsnap/util/path_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <unistd.h>

namespace fs = std::filesystem;

namespace debsnap {

Pool::Pool(fs::path dir) : dir_(std::move(dir)) {}

Result Pool::Ensure() const {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        return Result::Fail(ec.value(), "create_directories failed: " + dir_.string() + ": " + ec.message());
    }
    if (!fs::is_directory(dir_, ec)) {
        return Result::Fail(-1, "pool path is not a directory: " + dir_.string());
    }
    return Result::Ok();
}

Result Pool::ListArchives(std::vector<fs::path>& out) const {
    out.clear();
    std::error_code ec;
    if (!fs::exists(dir_, ec)) return Result::Ok();

    for (fs::recursive_directory_iterator it(dir_, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end;
         it.increment(ec)) {
        std::error_code sec;
        if (!it->is_regular_file(sec)) continue;
        if (!EndsWith(it->path().filename().string(), ".deb")) continue;
        out.push_back(it->path());
    }
    if (ec) return Result::Fail(ec.value(), "cannot walk " + dir_.string() + ": " + ec.message());

    std::sort(out.begin(), out.end());
    return Result::Ok();
}

std::optional<fs::path> Pool::FindExact(const PackageRecord& rec) const {
    for (const auto& name : CanonicalArchiveNames(rec)) {
        fs::path candidate = dir_ / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) return candidate;
    }
    return std::nullopt;
}

Result Pool::AddNoClobber(const fs::path& src,
                          const std::string& dest_name,
                          AddOutcome& outcome,
                          bool move_hint) const {
    outcome = AddOutcome::kAlreadyPresent;
    if (dest_name.empty() || dest_name.find('/') != std::string::npos) {
        return Result::Fail(-1, "invalid pool filename: " + dest_name);
    }

    const fs::path dest = dir_ / dest_name;
    std::error_code ec;
    if (fs::exists(dest, ec)) return Result::Ok();

    // Same filesystem: a hard link is atomic and refuses to replace.
    if (move_hint) {
        if (::link(src.c_str(), dest.c_str()) == 0) {
            outcome = AddOutcome::kAdded;
            return Result::Ok();
        }
        if (errno == EEXIST) return Result::Ok();
    }

    TempFile tmp;
    auto cr = TempFile::CreateIn(dir_.string(), ".incoming-", tmp);
    if (!cr.is_ok()) return cr;

    auto cp = CopyFileInto(src.string(), tmp);
    if (!cp.is_ok()) return cp;

    bool existed = false;
    auto commit = tmp.CommitNoClobber(dest.string(), 0644, existed);
    if (!commit.is_ok()) return commit;

    outcome = existed ? AddOutcome::kAlreadyPresent : AddOutcome::kAdded;
    return Result::Ok();
}

PoolNameIndex::PoolNameIndex(const std::vector<fs::path>& archives) {
    for (const auto& path : archives) {
        by_name_[ArchiveNameKey(path.filename().string())].push_back(path);
        ++count_;
    }
}

const std::vector<fs::path>& PoolNameIndex::Candidates(const std::string& bare_name) const {
    static const std::vector<fs::path> kNone;
    auto it = by_name_.find(bare_name);
    return it == by_name_.end() ? kNone : it->second;
}

} // namespace debsnap
