#include "debsnap/installer/source_switch.hpp"

#include "debsnap/io/atomic_file.hpp"
#include "debsnap/util/logger.hpp"
#include "debsnap/util/path_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace debsnap {

const char* ToString(SourceSwitch::State state) {
    switch (state) {
        case SourceSwitch::State::kActive:      return "active";
        case SourceSwitch::State::kQuarantined: return "quarantined";
        case SourceSwitch::State::kSwitched:    return "switched";
        case SourceSwitch::State::kVerified:    return "verified";
        case SourceSwitch::State::kFailed:      return "failed";
    }
    return "unknown";
}

SourceSwitch::SourceSwitch(const AptClient& apt, Options opt) : apt_(apt), opt_(std::move(opt)) {
    opt_.stage_dir = NormalizedAbsolute(opt_.stage_dir);
    if (opt_.stamp.empty()) opt_.stamp = UtcStamp();
}

Result SourceSwitch::Expect(State wanted, const char* step) const {
    if (state_ == wanted) return Result::Ok();
    return Result::Fail(EPERM, std::string(step) + " not allowed in state " + ToString(state_));
}

Result SourceSwitch::Fail(Result r) {
    state_ = State::kFailed;
    if (moved_ > 0) r.msg += "; previous sources are in " + quarantine_dir_.string();
    if (!unmoved_.empty()) {
        r.msg += "; left in place:";
        for (const auto& p : unmoved_) r.msg += " " + p.string();
    }
    LogError("%s", r.msg.c_str());
    return r;
}

// Returns 0 or the rename errno. A file left behind is recorded.
int SourceSwitch::MoveInto(const fs::path& src, const fs::path& dest) {
    if (opt_.rename_fn(src.c_str(), dest.c_str()) == 0) {
        LogDebug("quarantined %s", src.c_str());
        ++moved_;
        return 0;
    }
    const int e = errno;
    LogError("cannot move %s to %s: %s", src.c_str(), dest.c_str(), std::strerror(e));
    unmoved_.push_back(src);
    return e;
}

Result SourceSwitch::Quarantine() {
    auto er = Expect(State::kActive, "quarantine");
    if (!er.is_ok()) return er;

    const fs::path dir = opt_.layout.backup_base / ("sources.backup." + opt_.stamp);
    if (::mkdir(dir.c_str(), 0755) != 0) {
        const int e = errno;
        return Fail(Result::Fail(e, "cannot create quarantine " + dir.string() + ": " + std::strerror(e)));
    }
    quarantine_dir_ = dir;
    LogInfo("Quarantining APT sources into %s", dir.c_str());

    std::error_code ec;
    if (fs::exists(fs::symlink_status(opt_.layout.sources_list, ec))) {
        // The local source is written at this path, so it must be gone first.
        const int e = MoveInto(opt_.layout.sources_list, dir / "sources.list");
        if (e != 0) {
            return Fail(Result::Fail(e, "cannot quarantine " + opt_.layout.sources_list.string() + ": " +
                                            std::strerror(e)));
        }
    }

    if (fs::is_directory(opt_.layout.sources_list_d, ec)) {
        std::vector<fs::path> entries;
        for (fs::directory_iterator it(opt_.layout.sources_list_d, ec), end; !ec && it != end; it.increment(ec)) {
            entries.push_back(it->path());
        }
        if (ec) {
            return Fail(Result::Fail(ec.value(), "cannot list " + opt_.layout.sources_list_d.string() + ": " +
                                                     ec.message()));
        }
        std::sort(entries.begin(), entries.end());

        if (!entries.empty()) {
            const fs::path sub = dir / "sources.list.d";
            if (::mkdir(sub.c_str(), 0755) != 0) {
                const int e = errno;
                return Fail(Result::Fail(e, "cannot create " + sub.string() + ": " + std::strerror(e)));
            }
            // Entries left here are caught by the source guard.
            for (const auto& entry : entries) MoveInto(entry, sub / entry.filename());
        }
    }

    if (!unmoved_.empty()) LogWarn("%zu source file(s) could not be quarantined", unmoved_.size());
    state_ = State::kQuarantined;
    return Result::Ok();
}

Result SourceSwitch::WriteLocalSource() {
    auto er = Expect(State::kQuarantined, "write local source");
    if (!er.is_ok()) return er;

    const std::string line = FormatLocalSourceLine(opt_.stage_dir, opt_.trusted);
    auto wr = WriteFileAtomic(opt_.layout.sources_list.string(), line + "\n", 0644);
    if (!wr.is_ok()) return Fail(wr);

    LogInfo("Wrote %s: %s", opt_.layout.sources_list.c_str(), line.c_str());
    state_ = State::kSwitched;
    return Result::Ok();
}

Result SourceSwitch::CheckNoStraySources() {
    auto er = Expect(State::kSwitched, "source guard");
    if (!er.is_ok()) return er;

    std::vector<SourceEntry> entries;
    auto sr = ScanSourceEntries(opt_.layout, entries);
    if (!sr.is_ok()) return Fail(Result::Fail(sr.err, "cannot check sources: " + sr.msg));

    size_t local = 0;
    for (const auto& entry : entries) {
        if (!EntryReferencesOnly(entry, opt_.stage_dir)) {
            return Fail(Result::Fail(EEXIST, "stray APT source after quarantine at " + entry.file.string() + ":" +
                                                 std::to_string(entry.line) + ": " + entry.text));
        }
        ++local;
    }
    if (local == 0) {
        return Fail(Result::Fail(ENOENT, "no active source references " + opt_.stage_dir.string()));
    }

    guard_passed_ = true;
    return Result::Ok();
}

Result SourceSwitch::Verify() {
    auto er = Expect(State::kSwitched, "verify");
    if (!er.is_ok()) return er;
    if (!guard_passed_) return Result::Fail(EPERM, "verify not allowed before the source guard passed");

    LogInfo("apt-get update (local repository only)");
    auto cr = apt_.ClearLists();
    if (!cr.is_ok()) return Fail(cr);
    auto cl = apt_.Clean();
    if (!cl.is_ok()) return Fail(cl);
    auto ur = apt_.Update();
    if (!ur.is_ok()) return Fail(ur);

    std::vector<std::string> files;
    auto pr = apt_.PackageFiles(files);
    if (!pr.is_ok()) return Fail(pr);
    if (!HasLocalPackagesIndex(files, opt_.stage_dir)) {
        return Fail(Result::Fail(ENOENT, "APT loaded no Packages index from file:" + opt_.stage_dir.string()));
    }

    LogInfo("Local source verified: %zu package index(es) loaded", files.size());
    state_ = State::kVerified;
    return Result::Ok();
}

Result SourceSwitch::Run() {
    auto r = Quarantine();
    if (!r.is_ok()) return r;
    r = WriteLocalSource();
    if (!r.is_ok()) return r;
    r = CheckNoStraySources();
    if (!r.is_ok()) return r;
    return Verify();
}

} // namespace debsnap
