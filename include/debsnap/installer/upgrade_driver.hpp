#pragma once

#include "debsnap/installer/apt_client.hpp"
#include "debsnap/installer/source_switch.hpp"
#include "debsnap/util/result.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace debsnap {

struct UpgradeOptions {
    unsigned passes = 2;
    std::vector<std::string> extra_packages = {"linux-generic", "base-files", "lsb-release"};
    // Empty skips the desktop step.
    std::string desktop_meta = "ubuntu-desktop";
    bool refresh_boot = true;
    // Whether a tool is installed; PATH lookup when unset.
    std::function<bool(const std::string&)> has_tool;
};

struct UpgradeStep {
    std::string name;
    bool ok = false;
    bool skipped = false;
    std::string detail;
};

struct UpgradeReport {
    std::vector<UpgradeStep> steps;

    size_t Failed() const;
};

// Upgrade against the verified local source. Every step is best effort: a
// failure is recorded and the next step still runs.
class UpgradeDriver {
public:
    UpgradeDriver(const AptClient& apt, UpgradeOptions opt);

    // Refuses to start unless the switch reached kVerified.
    Result Run(SourceSwitch::State switch_state, UpgradeReport& out) const;

private:
    void Step(UpgradeReport& out, const std::string& name, const std::function<Result()>& fn) const;
    void Skip(UpgradeReport& out, const std::string& name, const std::string& why) const;
    Result RunTool(const std::vector<std::string>& argv) const;
    bool HasTool(const std::string& tool) const;

    const AptClient& apt_;
    UpgradeOptions opt_;
};

} // namespace debsnap
