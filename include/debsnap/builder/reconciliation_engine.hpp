#pragma once

#include "debsnap/builder/pool.hpp"
#include "debsnap/builder/repacker.hpp"
#include "debsnap/debian/package_record.hpp"
#include "debsnap/util/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace debsnap {

enum class ReconcileOutcome {
    kPresentExact,
    kPresentVerified,
    kRepacked,
    kSkipped,
};

const char* ToString(ReconcileOutcome outcome);

struct ReconcileItem {
    PackageRecord record;
    ReconcileOutcome outcome = ReconcileOutcome::kSkipped;
    // Pool file backing the record; empty when skipped.
    std::filesystem::path archive;
    std::string reason;
};

struct ReconcileReport {
    std::vector<ReconcileItem> items;
    size_t present_exact = 0;
    size_t present_verified = 0;
    size_t repacked = 0;
    size_t skipped = 0;

    size_t Total() const { return items.size(); }
    std::vector<ReconcileItem> Skipped() const;
};

// Decides for every installed package whether the pool already backs it and
// repacks the ones it does not. A single package never fails the batch:
// problems end up as kSkipped items with a reason.
class ReconciliationEngine {
public:
    struct Options {
        unsigned jobs = 0;
        // Parent of the per-package repack directories. Defaults to
        // "<pool>/../.debsnap-repack" so links into the pool stay on one
        // filesystem.
        std::filesystem::path scratch_dir;
    };

    ReconciliationEngine(const Pool& pool, const IRepacker& repacker, Options opt);

    // Fails only when the pool cannot be read or the scratch area cannot be
    // created; per-package results are in `out`.
    Result Reconcile(std::vector<PackageRecord> records, ReconcileReport& out) const;

private:
    ReconcileItem ReconcileOne(const PackageRecord& rec,
                               const PoolNameIndex& index,
                               bool can_repack,
                               const std::filesystem::path& scratch) const;
    bool FindVerified(const PackageRecord& rec,
                      const PoolNameIndex& index,
                      std::filesystem::path& out) const;
    void RepackInto(const PackageRecord& rec,
                    const std::filesystem::path& scratch,
                    ReconcileItem& item) const;

    const Pool& pool_;
    const IRepacker& repacker_;
    Options opt_;
};

} // namespace debsnap
