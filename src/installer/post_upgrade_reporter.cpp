#include "debsnap/installer/post_upgrade_reporter.hpp"

namespace debsnap {

Result CollectPostUpgradeReport(const AptClient& apt, const SourceLayout& layout, PostUpgradeReport& out) {
    out = PostUpgradeReport{};

    auto kr = apt.ListInstalled("linux-image-*", out.kernels);
    if (!kr.is_ok()) return kr;

    std::vector<SourceEntry> entries;
    auto sr = ScanSourceEntries(layout, entries);
    if (!sr.is_ok()) return sr;
    for (const auto& entry : entries) out.sources.push_back(entry.text);
    return Result::Ok();
}

std::string FormatPostUpgradeReport(const PostUpgradeReport& report) {
    std::string out = "Installed kernel images:\n";
    if (report.kernels.empty()) out += "  (none)\n";
    for (const auto& k : report.kernels) out += "  " + k.name + "  " + k.version + "\n";

    out += "\nActive APT sources:\n";
    if (report.sources.empty()) out += "  (none)\n";
    for (const auto& s : report.sources) out += "  " + s + "\n";
    return out;
}

} // namespace debsnap
