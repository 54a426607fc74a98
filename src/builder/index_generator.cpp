#include "debsnap/builder/index_generator.hpp"

#include "debsnap/debian/control_fields.hpp"
#include "debsnap/io/atomic_file.hpp"
#include "debsnap/util/logger.hpp"

#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace debsnap {

IndexGenerator::IndexGenerator(const ICommandRunner& runner, fs::path repo_dir)
    : runner_(runner), repo_dir_(std::move(repo_dir)) {}

Result IndexGenerator::Capture(const std::vector<std::string>& argv, std::string& out) const {
    CommandSpec spec;
    spec.argv = argv;
    spec.cwd = repo_dir_.string();

    CommandOutput res;
    auto rr = runner_.Run(spec, res);
    if (!rr.is_ok()) return rr;
    if (!res.Succeeded()) {
        return Result::Fail(res.exit_code, DescribeCommand(argv) + " exited " + std::to_string(res.exit_code) +
                                               ": " + LastLines(res.err, 3));
    }
    out = std::move(res.out);
    return Result::Ok();
}

Result IndexGenerator::Generate(IndexSummary& out) const {
    out = IndexSummary{};

    std::string packages;
    auto pr = Capture({"apt-ftparchive", "packages", "./pool"}, packages);
    if (!pr.is_ok()) return pr;

    auto stanzas = ParseControlStanzas(packages);
    if (!stanzas) return Result::Fail(-1, "apt-ftparchive produced an unparsable index: " + stanzas.error());
    out.stanzas = stanzas->size();
    if (out.stanzas == 0) LogWarn("Packages index is empty; the pool holds no readable archives");

    auto wr = WriteFileAtomic((repo_dir_ / "Packages").string(), packages);
    if (!wr.is_ok()) return wr;
    auto gr = WriteGzipFileAtomic((repo_dir_ / "Packages.gz").string(), packages);
    if (!gr.is_ok()) return gr;
    LogInfo("Wrote Packages and Packages.gz (%zu stanzas)", out.stanzas);

    // A stale Release would be summarized into the new one.
    std::error_code ec;
    fs::remove(repo_dir_ / "Release", ec);
    if (ec) return Result::Fail(ec.value(), "cannot remove old Release: " + ec.message());

    std::string release;
    auto rr = Capture({"apt-ftparchive", "release", "."}, release);
    if (!rr.is_ok()) return rr;
    auto rw = WriteFileAtomic((repo_dir_ / "Release").string(), release);
    if (!rw.is_ok()) return rw;
    out.release_written = true;
    return Result::Ok();
}

} // namespace debsnap
