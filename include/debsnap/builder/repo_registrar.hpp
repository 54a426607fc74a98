#pragma once

#include "debsnap/system/command_runner.hpp"
#include "debsnap/util/result.hpp"

#include <filesystem>

namespace debsnap {

inline constexpr const char* kRegisteredListPath = "/etc/apt/sources.list.d/offline-repo.list";

// Adds the built repository to the build host's own sources (next to the
// existing ones) and refreshes the index.
Result RegisterRepo(const ICommandRunner& runner,
                    const std::filesystem::path& repo_dir,
                    bool trusted,
                    const std::filesystem::path& list_path = kRegisteredListPath);

} // namespace debsnap
