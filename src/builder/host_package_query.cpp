#include "debsnap/builder/host_package_query.hpp"

#include "debsnap/util/logger.hpp"

#include <string>

namespace debsnap {

Result QueryInstalledPackages(const ICommandRunner& runner, std::vector<PackageRecord>& out) {
    out.clear();

    CommandSpec spec;
    spec.argv = {"dpkg-query", "-W", std::string("-f=") + kInstalledQueryFormat};

    CommandOutput res;
    auto rr = runner.Run(spec, res);
    if (!rr.is_ok()) return rr;
    if (!res.Succeeded()) {
        return Result::Fail(res.exit_code, "dpkg-query failed: " + LastLines(res.err, 3));
    }

    std::vector<std::string> rejected;
    out = ParseInstalledPackages(res.out, &rejected);
    for (const auto& line : rejected) LogWarn("ignoring dpkg-query line: %s", line.c_str());

    if (out.empty()) return Result::Fail(-1, "dpkg-query reported no installed packages");
    LogInfo("Host has %zu installed packages", out.size());
    return Result::Ok();
}

} // namespace debsnap
