#pragma once

#include "debsnap/debian/package_record.hpp"
#include "debsnap/system/command_runner.hpp"
#include "debsnap/util/result.hpp"

#include <vector>

namespace debsnap {

// Snapshot of the installed set via dpkg-query, sorted and de-duplicated.
Result QueryInstalledPackages(const ICommandRunner& runner, std::vector<PackageRecord>& out);

} // namespace debsnap
