#include "debsnap/installer/upgrade_driver.hpp"

#include "debsnap/util/logger.hpp"

#include <cerrno>

namespace debsnap {

size_t UpgradeReport::Failed() const {
    size_t n = 0;
    for (const auto& step : steps) {
        if (!step.ok && !step.skipped) ++n;
    }
    return n;
}

UpgradeDriver::UpgradeDriver(const AptClient& apt, UpgradeOptions opt) : apt_(apt), opt_(std::move(opt)) {}

bool UpgradeDriver::HasTool(const std::string& tool) const {
    if (opt_.has_tool) return opt_.has_tool(tool);
    return FindInPath(tool).has_value();
}

void UpgradeDriver::Step(UpgradeReport& out, const std::string& name, const std::function<Result()>& fn) const {
    LogInfo("%s", name.c_str());
    UpgradeStep step;
    step.name = name;
    const Result r = fn();
    step.ok = r.is_ok();
    if (!step.ok) {
        step.detail = r.msg;
        LogWarn("%s failed (continuing): %s", name.c_str(), r.msg.c_str());
    }
    out.steps.push_back(std::move(step));
}

void UpgradeDriver::Skip(UpgradeReport& out, const std::string& name, const std::string& why) const {
    LogWarn("%s skipped: %s", name.c_str(), why.c_str());
    out.steps.push_back({.name = name, .ok = false, .skipped = true, .detail = why});
}

Result UpgradeDriver::RunTool(const std::vector<std::string>& argv) const {
    CommandSpec spec;
    spec.argv = argv;
    CommandOutput out;
    auto rr = apt_.Runner().Run(spec, out);
    if (!rr.is_ok()) return rr;
    if (!out.Succeeded()) {
        return Result::Fail(out.exit_code, DescribeCommand(argv) + " exited " + std::to_string(out.exit_code) +
                                               ": " + LastLines(out.err, 3));
    }
    return Result::Ok();
}

Result UpgradeDriver::Run(SourceSwitch::State switch_state, UpgradeReport& out) const {
    out = UpgradeReport{};
    if (switch_state != SourceSwitch::State::kVerified) {
        return Result::Fail(EPERM, std::string("upgrade refused: source switch is ") + ToString(switch_state));
    }

    for (unsigned pass = 1; pass <= opt_.passes; ++pass) {
        Step(out, "full-upgrade pass " + std::to_string(pass), [&] { return apt_.FullUpgrade(); });
    }

    if (!opt_.extra_packages.empty()) {
        std::string name = "install";
        for (const auto& pkg : opt_.extra_packages) name += " " + pkg;
        Step(out, name, [&] { return apt_.Install(opt_.extra_packages); });
    }

    if (!opt_.desktop_meta.empty()) {
        Step(out, "install " + opt_.desktop_meta, [&] { return apt_.Install({opt_.desktop_meta}); });
    }

    if (opt_.refresh_boot) {
        if (HasTool("update-initramfs")) {
            Step(out, "update-initramfs", [&] { return RunTool({"update-initramfs", "-u", "-k", "all"}); });
        } else {
            Skip(out, "update-initramfs", "tool not installed");
        }
        if (HasTool("update-grub")) {
            Step(out, "update-grub", [&] { return RunTool({"update-grub"}); });
        } else {
            Skip(out, "update-grub", "tool not installed");
        }
    }

    Step(out, "final local-only refresh", [&] {
        auto r = apt_.ClearLists();
        if (r.is_ok()) r = apt_.Clean();
        if (r.is_ok()) r = apt_.Update();
        return r;
    });
    Step(out, "final full-upgrade", [&] { return apt_.FullUpgrade(); });
    Step(out, "autoremove --purge", [&] { return apt_.AutoremovePurge(); });

    LogInfo("Upgrade finished: %zu steps, %zu failed", out.steps.size(), out.Failed());
    return Result::Ok();
}

} // namespace debsnap
