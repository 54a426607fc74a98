#pragma once

#include "debsnap/debian/source_entries.hpp"
#include "debsnap/installer/post_upgrade_reporter.hpp"
#include "debsnap/installer/repo_stager.hpp"
#include "debsnap/installer/source_switch.hpp"
#include "debsnap/installer/upgrade_driver.hpp"
#include "debsnap/system/command_runner.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace debsnap {

// Process exit status of debsnap-install.
enum class InstallExit : int {
    kOk = 0,
    kFailure = 1,
    kUsage = 2,
    kPreflight = 3,
    kNoRepository = 4,
    kStagingFailed = 5,
    kStraySource = 6,
    kVerifyFailed = 7,
};

struct InstallOptions {
    std::filesystem::path search_root = ".";
    std::filesystem::path stage_dir = kDefaultStageDir;
    SourceLayout layout;
    std::filesystem::path lists_dir = "/var/lib/apt/lists";
    bool verify_hashes = false;
    bool trusted = true;
    UpgradeOptions upgrade;
    bool require_root = true;
    bool check_tools = true;
    // Quarantine suffix; the current UTC time when empty.
    std::string stamp;
    SourceSwitch::RenameFn rename_fn = &::rename;
};

struct InstallOutcome {
    InstallExit exit = InstallExit::kOk;
    std::string message;
    std::filesystem::path repo;
    std::filesystem::path quarantine_dir;
    SourceSwitch::State switch_state = SourceSwitch::State::kActive;
    StageSummary stage;
    UpgradeReport upgrade;
    PostUpgradeReport post;

    bool ok() const { return exit == InstallExit::kOk; }
};

// discover -> stage -> switch -> upgrade -> report. Everything up to the
// switch verification is fail-closed; the upgrade itself is best effort.
class InstallPipeline {
public:
    InstallPipeline(std::shared_ptr<const ICommandRunner> runner, InstallOptions opt);

    InstallOutcome Run() const;

private:
    Result Preflight() const;

    std::shared_ptr<const ICommandRunner> runner_;
    InstallOptions opt_;
};

} // namespace debsnap
