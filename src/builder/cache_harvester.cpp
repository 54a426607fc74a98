#include "debsnap/builder/cache_harvester.hpp"

#include "debsnap/util/logger.hpp"
#include "debsnap/util/path_utils.hpp"

#include <algorithm>
#include <vector>

namespace fs = std::filesystem;

namespace debsnap {

Result HarvestCache(const fs::path& cache_dir, const Pool& pool, HarvestSummary& out) {
    out = HarvestSummary{};

    std::error_code ec;
    if (!fs::is_directory(cache_dir, ec)) {
        LogWarn("archive cache %s not found; nothing to harvest", cache_dir.c_str());
        return Result::Ok();
    }

    std::vector<fs::path> debs;
    for (fs::directory_iterator it(cache_dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code sec;
        if (it->is_regular_file(sec) && EndsWith(it->path().filename().string(), ".deb")) {
            debs.push_back(it->path());
        }
    }
    if (ec) return Result::Fail(ec.value(), "cannot list " + cache_dir.string() + ": " + ec.message());
    std::sort(debs.begin(), debs.end());

    auto er = pool.Ensure();
    if (!er.is_ok()) return er;

    for (const auto& deb : debs) {
        const std::string name = deb.filename().string();
        // The same identity may already sit in the pool under its other
        // conventional name (dpkg-deb drops the epoch, APT spells it %3a).
        if (const auto rec = RecordFromArchiveName(name)) {
            const auto existing = pool.FindExact(*rec);
            if (existing && existing->filename() != name) {
                LogDebug("%s already pooled as %s", name.c_str(), existing->filename().c_str());
                ++out.already_present;
                continue;
            }
        }

        Pool::AddOutcome outcome{};
        auto ar = pool.AddNoClobber(deb, name, outcome);
        if (!ar.is_ok()) {
            LogWarn("cannot copy %s: %s", deb.c_str(), ar.msg.c_str());
            ++out.failed;
        } else if (outcome == Pool::AddOutcome::kAdded) {
            ++out.copied;
        } else {
            ++out.already_present;
        }
    }

    LogInfo("Harvested %s: %zu copied, %zu already present, %zu failed",
            cache_dir.c_str(), out.copied, out.already_present, out.failed);
    return Result::Ok();
}

} // namespace debsnap
