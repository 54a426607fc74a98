#include "debsnap/builder/update_fetcher.hpp"

#include "debsnap/util/logger.hpp"

#include <string>
#include <vector>

namespace debsnap {

namespace {

Result RunApt(const ICommandRunner& runner, std::vector<std::string> argv) {
    CommandSpec spec;
    spec.argv = std::move(argv);
    spec.env = {{"DEBIAN_FRONTEND", "noninteractive"}};

    CommandOutput out;
    auto rr = runner.Run(spec, out);
    if (!rr.is_ok()) return rr;
    if (!out.Succeeded()) {
        return Result::Fail(out.exit_code, DescribeCommand(spec.argv) + " exited " +
                                               std::to_string(out.exit_code) + ": " + LastLines(out.err, 3));
    }
    return Result::Ok();
}

} // namespace

Result FetchUpdates(const ICommandRunner& runner) {
    LogInfo("Refreshing package index");
    auto ur = RunApt(runner, {"apt-get", "update"});
    if (!ur.is_ok()) return ur;

    LogInfo("Downloading pending upgrades into the archive cache");
    return RunApt(runner, {"apt-get", "-y", "--download-only", "dist-upgrade"});
}

} // namespace debsnap
