#pragma once

#include "debsnap/builder/cache_harvester.hpp"
#include "debsnap/builder/index_generator.hpp"
#include "debsnap/builder/inventory_auditor.hpp"
#include "debsnap/builder/reconciliation_engine.hpp"
#include "debsnap/builder/repacker.hpp"
#include "debsnap/builder/repo_registrar.hpp"
#include "debsnap/system/command_runner.hpp"
#include "debsnap/util/result.hpp"

#include <filesystem>
#include <memory>

namespace debsnap {

struct BuildOptions {
    std::filesystem::path repo_dir;
    std::filesystem::path cache_dir = "/var/cache/apt/archives";
    bool include_updates = false;
    bool register_repo = false;
    bool trusted = true;
    unsigned jobs = 0;
    std::filesystem::path register_list_path = kRegisteredListPath;
    // Look up dpkg-query and apt-ftparchive on PATH before touching anything.
    bool check_tools = true;
};

struct BuildReport {
    bool updates_fetched = false;
    HarvestSummary harvest;
    ReconcileReport reconcile;
    IndexSummary index;
    InventoryReport inventory;
    bool registered = false;
};

// fetch -> harvest -> reconcile -> index -> audit -> register
class BuildPipeline {
public:
    BuildPipeline(std::shared_ptr<const ICommandRunner> runner,
                  std::shared_ptr<const IRepacker> repacker,
                  BuildOptions opt);

    Result Run(BuildReport& out) const;

private:
    std::shared_ptr<const ICommandRunner> runner_;
    std::shared_ptr<const IRepacker> repacker_;
    BuildOptions opt_;
};

} // namespace debsnap
