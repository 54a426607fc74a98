#pragma once

#include "debsnap/system/command_runner.hpp"
#include "debsnap/util/result.hpp"

namespace debsnap {

// Refreshes the index and downloads the newest archives of every pending
// upgrade into the APT cache without installing them.
Result FetchUpdates(const ICommandRunner& runner);

} // namespace debsnap
