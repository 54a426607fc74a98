#include "debsnap/installer/repo_stager.hpp"

#include "debsnap/io/atomic_file.hpp"
#include "debsnap/system/signals.hpp"
#include "debsnap/util/logger.hpp"
#include "debsnap/util/path_utils.hpp"

#include <cerrno>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace debsnap {

namespace {

Result FsFail(const std::error_code& ec, const std::string& what, const fs::path& p) {
    return Result::Fail(ec.value(), what + " " + p.string() + ": " + ec.message());
}

Result RemoveEntry(const fs::path& p) {
    std::error_code ec;
    fs::remove_all(p, ec);
    if (ec) return FsFail(ec, "cannot remove", p);
    return Result::Ok();
}

} // namespace

Result OpenUpPermissions(const fs::path& p) {
    std::error_code ec;
    const auto st = fs::symlink_status(p, ec);
    if (ec) return FsFail(ec, "cannot stat", p);
    if (fs::is_symlink(st)) return Result::Ok();

    using fs::perms;
    perms mode = st.permissions();
    const perms any_exec = perms::owner_exec | perms::group_exec | perms::others_exec;
    mode |= perms::owner_read | perms::owner_write | perms::group_read | perms::others_read;
    if (fs::is_directory(st) || (mode & any_exec) != perms::none) mode |= any_exec;
    mode &= ~(perms::group_write | perms::others_write);

    if (mode != st.permissions()) {
        fs::permissions(p, mode, fs::perm_options::replace, ec);
        if (ec) return FsFail(ec, "chmod failed on", p);
    }
    return Result::Ok();
}

Result RepoStager::MirrorSymlink(const fs::path& src, const fs::path& dest, StageSummary& out) const {
    std::error_code ec;
    const fs::path target = fs::read_symlink(src, ec);
    if (ec) return FsFail(ec, "cannot read link", src);

    if (fs::is_symlink(fs::symlink_status(dest, ec))) {
        std::error_code rec;
        if (fs::read_symlink(dest, rec) == target && !rec) {
            ++out.unchanged;
            return Result::Ok();
        }
    }
    if (fs::exists(fs::symlink_status(dest, ec))) {
        auto rr = RemoveEntry(dest);
        if (!rr.is_ok()) return rr;
    }
    fs::create_symlink(target, dest, ec);
    if (ec) return FsFail(ec, "cannot create link", dest);
    ++out.links;
    return Result::Ok();
}

Result RepoStager::MirrorFile(const fs::path& src, const fs::path& dest, StageSummary& out) const {
    std::error_code ec;
    const auto src_size = fs::file_size(src, ec);
    if (ec) return FsFail(ec, "cannot stat", src);
    const auto src_time = fs::last_write_time(src, ec);
    if (ec) return FsFail(ec, "cannot stat", src);

    const auto dest_st = fs::symlink_status(dest, ec);
    if (fs::is_regular_file(dest_st)) {
        std::error_code sec, tec;
        const auto dest_size = fs::file_size(dest, sec);
        const auto dest_time = fs::last_write_time(dest, tec);
        if (!sec && !tec && dest_size == src_size && dest_time == src_time) {
            ++out.unchanged;
            return OpenUpPermissions(dest);
        }
    } else if (fs::exists(dest_st)) {
        auto rr = RemoveEntry(dest);
        if (!rr.is_ok()) return rr;
    }

    const auto src_mode = fs::status(src, ec).permissions();
    if (ec) return FsFail(ec, "cannot stat", src);

    TempFile tmp;
    auto cr = TempFile::CreateIn(dest.parent_path().string(), "." + dest.filename().string() + ".stage-", tmp);
    if (!cr.is_ok()) return cr;
    auto cp = CopyFileInto(src.string(), tmp);
    if (!cp.is_ok()) return cp;
    auto commit = tmp.CommitReplace(dest.string(), static_cast<mode_t>(src_mode & fs::perms::mask));
    if (!commit.is_ok()) return commit;

    fs::last_write_time(dest, src_time, ec);
    if (ec) return FsFail(ec, "cannot set mtime on", dest);
    ++out.copied;
    return OpenUpPermissions(dest);
}

Result RepoStager::MirrorDir(const fs::path& src, const fs::path& dest, StageSummary& out) const {
    std::error_code ec;
    const auto dest_st = fs::symlink_status(dest, ec);
    if (fs::exists(dest_st) && !fs::is_directory(dest_st)) {
        auto rr = RemoveEntry(dest);
        if (!rr.is_ok()) return rr;
    }
    fs::create_directories(dest, ec);
    if (ec) return FsFail(ec, "cannot create", dest);

    std::set<fs::path> names;
    for (fs::directory_iterator it(src, ec), end; !ec && it != end; it.increment(ec)) {
        if (CancelRequested()) return Result::Fail(EINTR, "interrupted while staging");

        const fs::path name = it->path().filename();
        const fs::path target = dest / name;
        std::error_code sec;
        const auto st = it->symlink_status(sec);
        if (sec) return FsFail(sec, "cannot stat", it->path());

        Result r = Result::Ok();
        if (fs::is_symlink(st)) {
            r = MirrorSymlink(it->path(), target, out);
        } else if (fs::is_directory(st)) {
            r = MirrorDir(it->path(), target, out);
        } else if (fs::is_regular_file(st)) {
            r = MirrorFile(it->path(), target, out);
        } else {
            LogWarn("not staging special file %s", it->path().c_str());
            continue;
        }
        if (!r.is_ok()) return r;
        names.insert(name);
    }
    if (ec) return FsFail(ec, "cannot list", src);

    std::vector<fs::path> extras;
    for (fs::directory_iterator it(dest, ec), end; !ec && it != end; it.increment(ec)) {
        if (!names.contains(it->path().filename())) extras.push_back(it->path());
    }
    if (ec) return FsFail(ec, "cannot list", dest);
    for (const auto& extra : extras) {
        LogDebug("deleting %s", extra.c_str());
        auto rr = RemoveEntry(extra);
        if (!rr.is_ok()) return rr;
        ++out.removed;
    }

    auto pr = OpenUpPermissions(dest);
    if (!pr.is_ok()) return pr;
    const auto src_time = fs::last_write_time(src, ec);
    if (!ec) fs::last_write_time(dest, src_time, ec);
    if (ec) LogDebug("cannot carry mtime of %s: %s", src.c_str(), ec.message().c_str());
    return Result::Ok();
}

Result RepoStager::Mirror(const fs::path& src, const fs::path& dest, StageSummary& out) const {
    std::error_code ec;
    if (!fs::is_directory(src, ec)) return Result::Fail(ENOENT, "source is not a directory: " + src.string());

    const fs::path from = NormalizedAbsolute(src);
    const fs::path to = NormalizedAbsolute(dest);
    if (from == to) {
        LogInfo("Repository already at %s; not copying", to.c_str());
        out.skipped_copy = true;
        return Result::Ok();
    }
    if (IsSameOrWithin(to, from) || IsSameOrWithin(from, to)) {
        return Result::Fail(EINVAL, "refusing to mirror between nested directories " + from.string() +
                                        " and " + to.string());
    }

    LogInfo("Mirroring %s/ -> %s/", from.c_str(), to.c_str());
    auto mr = MirrorDir(from, to, out);
    if (!mr.is_ok()) return mr;
    LogInfo("Staged: %zu copied, %zu unchanged, %zu links, %zu deleted", out.copied, out.unchanged, out.links,
            out.removed);
    return Result::Ok();
}

Result RepoStager::Stage(const fs::path& src, const fs::path& dest, StageSummary& out) const {
    out = StageSummary{};
    auto mr = Mirror(src, dest, out);
    if (!mr.is_ok()) return mr;

    auto vr = VerifyRepo(dest, verify_hashes_, out.verify);
    if (!vr.is_ok()) return Result::Fail(vr.err, "staged repository failed verification: " + vr.msg);
    return Result::Ok();
}

} // namespace debsnap
