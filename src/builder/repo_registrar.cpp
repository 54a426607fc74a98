#include "debsnap/builder/repo_registrar.hpp"

#include "debsnap/debian/source_entries.hpp"
#include "debsnap/io/atomic_file.hpp"
#include "debsnap/util/logger.hpp"

namespace debsnap {

Result RegisterRepo(const ICommandRunner& runner,
                    const std::filesystem::path& repo_dir,
                    bool trusted,
                    const std::filesystem::path& list_path) {
    const std::string line = FormatLocalSourceLine(repo_dir, trusted);
    auto wr = WriteFileAtomic(list_path.string(), line + "\n");
    if (!wr.is_ok()) return wr;
    LogInfo("Registered %s -> %s", line.c_str(), list_path.c_str());

    CommandSpec spec;
    spec.argv = {"apt-get", "update"};
    spec.env = {{"DEBIAN_FRONTEND", "noninteractive"}};
    CommandOutput out;
    auto rr = runner.Run(spec, out);
    if (!rr.is_ok()) return rr;
    if (!out.Succeeded()) {
        return Result::Fail(out.exit_code, "apt-get update failed after registering: " + LastLines(out.err, 3));
    }
    return Result::Ok();
}

} // namespace debsnap
