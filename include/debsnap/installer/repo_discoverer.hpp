#pragma once

#include "debsnap/util/result.hpp"

#include <filesystem>
#include <vector>

namespace debsnap {

// A flat repository: a pool/ directory next to Packages or Packages.gz.
bool IsFlatRepo(const std::filesystem::path& dir);

// Every flat repository at or below `root`, shallowest first, equal depths
// in lexicographic path order. pool/ trees are not searched and unreadable
// directories are passed over.
Result DiscoverAllRepos(const std::filesystem::path& root, std::vector<std::filesystem::path>& out);

// The first entry of DiscoverAllRepos. Fails with ENOENT when there is none.
Result DiscoverRepo(const std::filesystem::path& root, std::filesystem::path& out);

} // namespace debsnap
