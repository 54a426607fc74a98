#include "debsnap/builder/inventory_auditor.hpp"

#include "debsnap/builder/pool.hpp"
#include "debsnap/builder/worker_pool.hpp"
#include "debsnap/crypto/sha256.hpp"
#include "debsnap/debian/deb_archive_reader.hpp"
#include "debsnap/io/atomic_file.hpp"
#include "debsnap/util/logger.hpp"
#include "debsnap/util/path_utils.hpp"

namespace fs = std::filesystem;

namespace debsnap {

namespace {

struct Described {
    InventoryRow row;
    bool meta_ok = true;
    bool hash_ok = true;
};

} // namespace

std::string CsvField(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) return value;
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string FormatCsvRow(const InventoryRow& row) {
    return CsvField(row.package) + "," + CsvField(row.version) + "," + CsvField(row.architecture) + "," +
           std::to_string(row.size) + "," + CsvField(row.filename) + "," + CsvField(row.sha256);
}

std::string FormatInventoryCsv(const std::vector<InventoryRow>& rows) {
    std::string out = kInventoryHeader;
    out.push_back('\n');
    for (const auto& row : rows) {
        out += FormatCsvRow(row);
        out.push_back('\n');
    }
    return out;
}

InventoryAuditor::InventoryAuditor(fs::path repo_dir, unsigned jobs)
    : repo_dir_(std::move(repo_dir)), jobs_(jobs) {}

InventoryRow InventoryAuditor::Describe(const fs::path& deb, bool& meta_ok, bool& hash_ok) const {
    InventoryRow row;
    row.filename = RelativePathString(deb, repo_dir_);

    DebIdentity id;
    auto ir = ReadDebIdentity(deb.string(), id);
    meta_ok = ir.is_ok();
    if (meta_ok) {
        row.package = id.package;
        row.version = id.version;
        row.architecture = id.architecture;
    } else {
        LogWarn("no control data for %s: %s", row.filename.c_str(), ir.msg.c_str());
    }

    std::error_code ec;
    const auto size = fs::file_size(deb, ec);
    if (!ec) row.size = size;

    auto hr = Sha256HexFile(deb.string(), row.sha256);
    hash_ok = hr.is_ok();
    if (!hash_ok) {
        row.sha256.clear();
        LogWarn("cannot hash %s: %s", row.filename.c_str(), hr.msg.c_str());
    }
    return row;
}

Result InventoryAuditor::Collect(InventoryReport& out) const {
    out = InventoryReport{};

    std::vector<fs::path> archives;
    auto lr = Pool(repo_dir_ / "pool").ListArchives(archives);
    if (!lr.is_ok()) return lr;

    auto described = RunBounded(archives, ResolveJobs(jobs_), [&](const fs::path& deb) {
        Described d;
        d.row = Describe(deb, d.meta_ok, d.hash_ok);
        return d;
    });

    out.rows.reserve(described.size());
    for (auto& d : described) {
        if (!d.meta_ok) ++out.metadata_failures;
        if (!d.hash_ok) ++out.hash_failures;
        out.rows.push_back(std::move(d.row));
    }
    return Result::Ok();
}

Result InventoryAuditor::Audit(InventoryReport& out) const {
    auto cr = Collect(out);
    if (!cr.is_ok()) return cr;

    auto wr = WriteFileAtomic(CsvPath().string(), FormatInventoryCsv(out.rows));
    if (!wr.is_ok()) return wr;

    LogInfo("Inventory: %zu archives -> %s (%zu without metadata, %zu unhashed)", out.rows.size(),
            CsvPath().c_str(), out.metadata_failures, out.hash_failures);
    return Result::Ok();
}

} // namespace debsnap
