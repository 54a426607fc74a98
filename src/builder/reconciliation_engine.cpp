#include "debsnap/builder/reconciliation_engine.hpp"

#include "debsnap/builder/worker_pool.hpp"
#include "debsnap/debian/deb_archive_reader.hpp"
#include "debsnap/system/signals.hpp"
#include "debsnap/util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <exception>

namespace fs = std::filesystem;

namespace debsnap {

namespace {

ReconcileItem Skip(const PackageRecord& rec, std::string reason) {
    ReconcileItem item;
    item.record = rec;
    item.outcome = ReconcileOutcome::kSkipped;
    item.reason = std::move(reason);
    return item;
}

// mkdtemp below `parent`, one directory per repack so concurrent runs of the
// repack tool never see each other's output.
Result MakeWorkDir(const fs::path& parent, const std::string& stem, fs::path& out) {
    std::string tpl = (parent / (stem + "-XXXXXX")).string();
    if (::mkdtemp(tpl.data()) == nullptr) {
        return Result::Fail(errno, "mkdtemp failed under " + parent.string() + ": " + std::strerror(errno));
    }
    out = tpl;
    return Result::Ok();
}

void RemoveTree(const fs::path& dir) {
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) LogWarn("cannot remove %s: %s", dir.c_str(), ec.message().c_str());
}

} // namespace

const char* ToString(ReconcileOutcome outcome) {
    switch (outcome) {
        case ReconcileOutcome::kPresentExact:    return "present";
        case ReconcileOutcome::kPresentVerified: return "present-verified";
        case ReconcileOutcome::kRepacked:        return "repacked";
        case ReconcileOutcome::kSkipped:         return "skipped";
    }
    return "unknown";
}

std::vector<ReconcileItem> ReconcileReport::Skipped() const {
    std::vector<ReconcileItem> out;
    for (const auto& item : items) {
        if (item.outcome == ReconcileOutcome::kSkipped) out.push_back(item);
    }
    return out;
}

ReconciliationEngine::ReconciliationEngine(const Pool& pool, const IRepacker& repacker, Options opt)
    : pool_(pool), repacker_(repacker), opt_(std::move(opt)) {
    if (opt_.scratch_dir.empty()) opt_.scratch_dir = pool_.Dir().parent_path() / ".debsnap-repack";
}

Result ReconciliationEngine::Reconcile(std::vector<PackageRecord> records, ReconcileReport& out) const {
    out = ReconcileReport{};
    NormalizeRecords(records);

    std::vector<fs::path> archives;
    auto lr = pool_.ListArchives(archives);
    if (!lr.is_ok()) return lr;
    const PoolNameIndex index(archives);

    const bool can_repack = repacker_.Available();
    if (!can_repack) LogWarn("dpkg-repack not found; packages missing from the pool will be skipped");

    std::error_code ec;
    fs::create_directories(opt_.scratch_dir, ec);
    if (ec) {
        return Result::Fail(ec.value(),
                            "cannot create scratch dir " + opt_.scratch_dir.string() + ": " + ec.message());
    }

    const unsigned jobs = ResolveJobs(opt_.jobs);
    LogInfo("Reconciling %zu installed packages against %zu pool archives (%u workers)",
            records.size(), index.size(), jobs);

    out.items = RunBounded(records, jobs, [&](const PackageRecord& rec) {
        if (CancelRequested()) return Skip(rec, "interrupted");
        try {
            return ReconcileOne(rec, index, can_repack, opt_.scratch_dir);
        } catch (const std::exception& e) {
            return Skip(rec, std::string("internal error: ") + e.what());
        }
    });

    fs::remove(opt_.scratch_dir, ec);

    for (const auto& item : out.items) {
        switch (item.outcome) {
            case ReconcileOutcome::kPresentExact:    ++out.present_exact; break;
            case ReconcileOutcome::kPresentVerified: ++out.present_verified; break;
            case ReconcileOutcome::kRepacked:        ++out.repacked; break;
            case ReconcileOutcome::kSkipped:
                ++out.skipped;
                LogWarn("skipped %s: %s", item.record.ToString().c_str(), item.reason.c_str());
                break;
        }
    }

    LogInfo("Reconciliation: %zu present, %zu verified, %zu repacked, %zu skipped",
            out.present_exact, out.present_verified, out.repacked, out.skipped);
    return Result::Ok();
}

ReconcileItem ReconciliationEngine::ReconcileOne(const PackageRecord& rec,
                                                 const PoolNameIndex& index,
                                                 bool can_repack,
                                                 const fs::path& scratch) const {
    ReconcileItem item;
    item.record = rec;

    if (auto exact = pool_.FindExact(rec)) {
        item.outcome = ReconcileOutcome::kPresentExact;
        item.archive = *exact;
        return item;
    }

    fs::path verified;
    if (FindVerified(rec, index, verified)) {
        item.outcome = ReconcileOutcome::kPresentVerified;
        item.archive = verified;
        return item;
    }

    if (!can_repack) return Skip(rec, "repack tool unavailable");

    RepackInto(rec, scratch, item);
    return item;
}

bool ReconciliationEngine::FindVerified(const PackageRecord& rec,
                                        const PoolNameIndex& index,
                                        fs::path& out) const {
    for (const auto& candidate : index.Candidates(rec.BareName())) {
        DebIdentity id;
        auto rr = ReadDebIdentity(candidate.string(), id);
        if (!rr.is_ok()) {
            LogDebug("cannot read %s: %s", candidate.c_str(), rr.msg.c_str());
            continue;
        }
        if (id.Matches(rec)) {
            out = candidate;
            return true;
        }
        LogDebug("%s carries %s %s %s, not %s", candidate.filename().c_str(), id.package.c_str(),
                 id.version.c_str(), id.architecture.c_str(), rec.ToString().c_str());
    }
    return false;
}

void ReconciliationEngine::RepackInto(const PackageRecord& rec,
                                      const fs::path& scratch,
                                      ReconcileItem& item) const {
    item.outcome = ReconcileOutcome::kSkipped;

    fs::path work;
    auto wr = MakeWorkDir(scratch, rec.BareName(), work);
    if (!wr.is_ok()) {
        item.reason = wr.msg;
        return;
    }

    fs::path produced;
    auto rr = repacker_.Repack(rec, work, produced);
    if (!rr.is_ok()) {
        item.reason = "repack failed: " + rr.msg;
        RemoveTree(work);
        return;
    }

    DebIdentity id;
    auto ir = ReadDebIdentity(produced.string(), id);
    if (!ir.is_ok()) {
        item.reason = "repacked archive unreadable: " + ir.msg;
        RemoveTree(work);
        return;
    }
    if (!id.Matches(rec)) {
        item.reason = "identity mismatch: repacked archive is " + id.package + " " + id.version + " " +
                      id.architecture;
        RemoveTree(work);
        return;
    }

    Pool::AddOutcome added{};
    auto ar = pool_.AddNoClobber(produced, CanonicalArchiveName(id), added, /*move_hint=*/true);
    RemoveTree(work);
    if (!ar.is_ok()) {
        item.reason = "cannot add to pool: " + ar.msg;
        return;
    }

    item.archive = pool_.Dir() / CanonicalArchiveName(id);
    item.outcome = added == Pool::AddOutcome::kAdded ? ReconcileOutcome::kRepacked
                                                     : ReconcileOutcome::kPresentExact;
    LogDebug("%s %s", ToString(item.outcome), item.archive.c_str());
}

} // namespace debsnap
