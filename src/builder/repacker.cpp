#include "debsnap/builder/repacker.hpp"

#include "debsnap/util/path_utils.hpp"

#include <vector>

namespace fs = std::filesystem;

namespace debsnap {

DpkgRepacker::DpkgRepacker() : runner_(DefaultCommandRunner()) {}

DpkgRepacker::DpkgRepacker(std::shared_ptr<const ICommandRunner> runner)
    : runner_(runner ? std::move(runner) : DefaultCommandRunner()) {}

bool DpkgRepacker::Available() const { return FindInPath("dpkg-repack").has_value(); }

Result DpkgRepacker::Repack(const PackageRecord& rec, const fs::path& work_dir, fs::path& out_archive) const {
    CommandSpec spec;
    spec.argv = {"dpkg-repack", rec.name};
    spec.cwd = work_dir.string();

    CommandOutput out;
    auto rr = runner_->Run(spec, out);
    if (!rr.is_ok()) return rr;
    if (!out.Succeeded()) {
        std::string detail = LastLines(out.err.empty() ? out.out : out.err, 2);
        if (detail.empty()) detail = "no output";
        return Result::Fail(out.exit_code,
                            "dpkg-repack exited " + std::to_string(out.exit_code) + ": " + detail);
    }
    return FindSingleArchive(work_dir, out_archive);
}

Result FindSingleArchive(const fs::path& dir, fs::path& out) {
    std::vector<fs::path> found;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code sec;
        if (it->is_regular_file(sec) && EndsWith(it->path().filename().string(), ".deb")) {
            found.push_back(it->path());
        }
    }
    if (ec) return Result::Fail(ec.value(), "cannot list " + dir.string() + ": " + ec.message());
    if (found.empty()) return Result::Fail(-1, "no archive produced in " + dir.string());
    if (found.size() > 1) {
        return Result::Fail(-1, "expected one archive in " + dir.string() + ", found " +
                                    std::to_string(found.size()));
    }
    out = found.front();
    return Result::Ok();
}

} // namespace debsnap
