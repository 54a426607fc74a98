#pragma once

#include "debsnap/builder/pool.hpp"
#include "debsnap/util/result.hpp"

#include <cstddef>
#include <filesystem>

namespace debsnap {

struct HarvestSummary {
    size_t copied = 0;
    size_t already_present = 0;
    size_t failed = 0;
};

// Copies every *.deb sitting directly in `cache_dir` into the pool under its
// own filename. Existing pool files are never replaced, and an archive whose
// identity is already pooled under its other conventional name is skipped.
// A missing cache is logged and yields an empty summary.
Result HarvestCache(const std::filesystem::path& cache_dir, const Pool& pool, HarvestSummary& out);

} // namespace debsnap
