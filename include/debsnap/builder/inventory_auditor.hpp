#pragma once

#include "debsnap/util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace debsnap {

inline constexpr const char* kInventoryFileName = "installed-packages.csv";
inline constexpr const char* kInventoryHeader = "Package,Version,Architecture,Size,Filename,SHA256";

// Describes one archive of the pool. `filename` is relative to the repo root.
struct InventoryRow {
    std::string package;
    std::string version;
    std::string architecture;
    std::uint64_t size = 0;
    std::string filename;
    std::string sha256;
};

struct InventoryReport {
    std::vector<InventoryRow> rows;
    size_t metadata_failures = 0;
    size_t hash_failures = 0;
};

std::string CsvField(const std::string& value);
std::string FormatCsvRow(const InventoryRow& row);
// Header line followed by one line per row.
std::string FormatInventoryCsv(const std::vector<InventoryRow>& rows);

// Audit listing of every archive under <repo>/pool. Not read back by
// anything in the build.
class InventoryAuditor {
public:
    InventoryAuditor(std::filesystem::path repo_dir, unsigned jobs);

    // Rows come back in sorted pool order whatever the worker count.
    Result Collect(InventoryReport& out) const;
    // Collect, then write <repo>/installed-packages.csv atomically.
    Result Audit(InventoryReport& out) const;

    std::filesystem::path CsvPath() const { return repo_dir_ / kInventoryFileName; }

private:
    InventoryRow Describe(const std::filesystem::path& deb, bool& meta_ok, bool& hash_ok) const;

    std::filesystem::path repo_dir_;
    unsigned jobs_;
};

} // namespace debsnap
