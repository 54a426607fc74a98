#include "debsnap/installer/install_pipeline.hpp"

#include "debsnap/installer/apt_client.hpp"
#include "debsnap/installer/repo_discoverer.hpp"
#include "debsnap/util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <unistd.h>

namespace debsnap {

namespace {

InstallOutcome& Finish(InstallOutcome& out, InstallExit exit, const std::string& message) {
    out.exit = exit;
    out.message = message;
    if (exit != InstallExit::kOk) LogError("%s", message.c_str());
    return out;
}

} // namespace

InstallPipeline::InstallPipeline(std::shared_ptr<const ICommandRunner> runner, InstallOptions opt)
    : runner_(std::move(runner)), opt_(std::move(opt)) {}

Result InstallPipeline::Preflight() const {
    if (opt_.require_root && ::geteuid() != 0) return Result::Fail(EPERM, "must run as root");
    if (opt_.check_tools) return RequireTools({"apt-get", "apt-cache", "dpkg"});
    return Result::Ok();
}

InstallOutcome InstallPipeline::Run() const {
    InstallOutcome out;

    auto pr = Preflight();
    if (!pr.is_ok()) return Finish(out, InstallExit::kPreflight, pr.msg);

    auto dr = DiscoverRepo(opt_.search_root, out.repo);
    if (!dr.is_ok()) return Finish(out, InstallExit::kNoRepository, dr.msg);
    LogInfo("[1/6] Repo source: %s", out.repo.c_str());

    LogInfo("[2/6] Staging repo to %s", opt_.stage_dir.c_str());
    auto sr = RepoStager(opt_.verify_hashes).Stage(out.repo, opt_.stage_dir, out.stage);
    if (!sr.is_ok()) return Finish(out, InstallExit::kStagingFailed, sr.msg);

    const AptClient apt(*runner_, opt_.lists_dir);
    SourceSwitch sw(apt, {.layout = opt_.layout,
                          .stage_dir = opt_.stage_dir,
                          .trusted = opt_.trusted,
                          .stamp = opt_.stamp,
                          .rename_fn = opt_.rename_fn});

    LogInfo("[3/6] Quarantining all existing APT sources");
    auto qr = sw.Quarantine();
    out.quarantine_dir = sw.QuarantineDir();
    if (qr.is_ok()) qr = sw.WriteLocalSource();
    out.switch_state = sw.GetState();
    if (!qr.is_ok()) return Finish(out, InstallExit::kFailure, qr.msg);

    auto gr = sw.CheckNoStraySources();
    out.switch_state = sw.GetState();
    if (!gr.is_ok()) return Finish(out, InstallExit::kStraySource, gr.msg);

    LogInfo("[4/6] Verifying the local source");
    auto vr = sw.Verify();
    out.switch_state = sw.GetState();
    if (!vr.is_ok()) return Finish(out, InstallExit::kVerifyFailed, vr.msg);

    LogInfo("[5/6] Upgrading from the local repository");
    auto ur = UpgradeDriver(apt, opt_.upgrade).Run(sw.GetState(), out.upgrade);
    if (!ur.is_ok()) return Finish(out, InstallExit::kFailure, ur.msg);

    LogInfo("[6/6] Post-upgrade report");
    auto rr = CollectPostUpgradeReport(apt, opt_.layout, out.post);
    if (!rr.is_ok()) {
        LogWarn("post-upgrade report incomplete: %s", rr.msg.c_str());
    } else {
        const std::string text = FormatPostUpgradeReport(out.post);
        std::fputs(text.c_str(), stdout);
        LogInfo("%s", text.c_str());
    }

    return Finish(out, InstallExit::kOk, "upgrade done; previous sources are in " + out.quarantine_dir.string());
}

} // namespace debsnap
