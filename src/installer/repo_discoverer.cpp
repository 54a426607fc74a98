#include "debsnap/installer/repo_discoverer.hpp"

#include "debsnap/util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <iterator>

namespace fs = std::filesystem;

namespace debsnap {

namespace {

size_t DepthBelow(const fs::path& dir, const fs::path& root) {
    const fs::path rel = dir.lexically_relative(root);
    if (rel.empty() || rel == ".") return 0;
    return static_cast<size_t>(std::distance(rel.begin(), rel.end()));
}

} // namespace

bool IsFlatRepo(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir / "pool", ec)) return false;
    return fs::is_regular_file(dir / "Packages", ec) || fs::is_regular_file(dir / "Packages.gz", ec);
}

Result DiscoverAllRepos(const fs::path& root, std::vector<fs::path>& out) {
    out.clear();

    std::error_code ec;
    const fs::path base = fs::absolute(root, ec).lexically_normal();
    if (ec || !fs::is_directory(base, ec)) {
        return Result::Fail(ENOENT, "search root is not a directory: " + root.string());
    }

    if (IsFlatRepo(base)) out.push_back(base);

    for (fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end;
         it.increment(ec)) {
        std::error_code sec;
        if (!it->is_directory(sec) || it->is_symlink(sec)) continue;
        if (it->path().filename() == "pool") {
            it.disable_recursion_pending();
            continue;
        }
        if (IsFlatRepo(it->path())) out.push_back(it->path());
    }
    if (ec) return Result::Fail(ec.value(), "cannot search " + base.string() + ": " + ec.message());

    std::sort(out.begin(), out.end(), [&](const fs::path& a, const fs::path& b) {
        const size_t da = DepthBelow(a, base);
        const size_t db = DepthBelow(b, base);
        if (da != db) return da < db;
        return a.native() < b.native();
    });
    return Result::Ok();
}

Result DiscoverRepo(const fs::path& root, fs::path& out) {
    std::vector<fs::path> all;
    auto dr = DiscoverAllRepos(root, all);
    if (!dr.is_ok()) return dr;
    if (all.empty()) {
        return Result::Fail(ENOENT, "no repository found under " + root.string() +
                                        " (need pool/ and Packages or Packages.gz in one directory)");
    }
    if (all.size() > 1) {
        for (size_t i = 1; i < all.size(); ++i) LogWarn("ignoring additional repository %s", all[i].c_str());
    }
    out = all.front();
    LogDebug("discovered repository %s", out.c_str());
    return Result::Ok();
}

} // namespace debsnap
