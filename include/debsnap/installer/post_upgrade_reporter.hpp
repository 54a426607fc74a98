#pragma once

#include "debsnap/debian/source_entries.hpp"
#include "debsnap/installer/apt_client.hpp"
#include "debsnap/util/result.hpp"

#include <string>
#include <vector>

namespace debsnap {

struct PostUpgradeReport {
    std::vector<DpkgListRow> kernels;
    std::vector<std::string> sources;
};

Result CollectPostUpgradeReport(const AptClient& apt, const SourceLayout& layout, PostUpgradeReport& out);
std::string FormatPostUpgradeReport(const PostUpgradeReport& report);

} // namespace debsnap
