#include "debsnap/builder/build_pipeline.hpp"

#include "debsnap/builder/host_package_query.hpp"
#include "debsnap/builder/pool.hpp"
#include "debsnap/builder/update_fetcher.hpp"
#include "debsnap/system/signals.hpp"
#include "debsnap/util/logger.hpp"

#include <cerrno>

namespace debsnap {

BuildPipeline::BuildPipeline(std::shared_ptr<const ICommandRunner> runner,
                             std::shared_ptr<const IRepacker> repacker,
                             BuildOptions opt)
    : runner_(std::move(runner)), repacker_(std::move(repacker)), opt_(std::move(opt)) {}

Result BuildPipeline::Run(BuildReport& out) const {
    out = BuildReport{};
    if (opt_.repo_dir.empty()) return Result::Fail(-1, "repository directory not set");

    if (opt_.check_tools) {
        auto tr = RequireTools({"dpkg-query", "apt-ftparchive"});
        if (!tr.is_ok()) return tr;
    }

    const Pool pool(opt_.repo_dir / "pool");
    LogInfo("Repo dir: %s", opt_.repo_dir.c_str());
    auto er = pool.Ensure();
    if (!er.is_ok()) return er;

    if (opt_.include_updates) {
        LogInfo("[1/6] Refreshing indices and downloading updates (no install)");
        auto fr = FetchUpdates(*runner_);
        if (!fr.is_ok()) return Result::Fail(fr.err, "fetching updates failed: " + fr.msg);
        out.updates_fetched = true;
    } else {
        LogInfo("[1/6] Skipping download of updates; using what is already on the system");
    }

    LogInfo("[2/6] Harvesting cached archives from %s", opt_.cache_dir.c_str());
    auto hr = HarvestCache(opt_.cache_dir, pool, out.harvest);
    if (!hr.is_ok()) return hr;

    LogInfo("[3/6] Ensuring every installed package has an archive in the pool");
    std::vector<PackageRecord> installed;
    auto qr = QueryInstalledPackages(*runner_, installed);
    if (!qr.is_ok()) return qr;

    ReconciliationEngine engine(pool, *repacker_, {.jobs = opt_.jobs, .scratch_dir = {}});
    auto rr = engine.Reconcile(std::move(installed), out.reconcile);
    if (!rr.is_ok()) return rr;
    if (CancelRequested()) {
        return Result::Fail(EINTR, "interrupted by signal " + std::to_string(CancelSignal()) +
                                       " after reconciliation; rerun to resume");
    }

    LogInfo("[4/6] Building Packages, Packages.gz and Release");
    auto ir = IndexGenerator(*runner_, opt_.repo_dir).Generate(out.index);
    if (!ir.is_ok()) return ir;

    LogInfo("[5/6] Emitting inventory with SHA256");
    auto ar = InventoryAuditor(opt_.repo_dir, opt_.jobs).Audit(out.inventory);
    if (!ar.is_ok()) return ar;

    if (opt_.register_repo) {
        LogInfo("[6/6] Registering local repo -> %s", opt_.register_list_path.c_str());
        auto gr = RegisterRepo(*runner_, opt_.repo_dir, opt_.trusted, opt_.register_list_path);
        if (!gr.is_ok()) return gr;
        out.registered = true;
    } else {
        LogInfo("[6/6] Not registering the repository on this host");
    }

    LogInfo("Repo built at %s: %zu archives, %zu repacked, %zu skipped", opt_.repo_dir.c_str(),
            out.inventory.rows.size(), out.reconcile.repacked, out.reconcile.skipped);
    return Result::Ok();
}

} // namespace debsnap
