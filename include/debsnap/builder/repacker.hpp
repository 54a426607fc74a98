#pragma once

#include "debsnap/debian/package_record.hpp"
#include "debsnap/system/command_runner.hpp"
#include "debsnap/util/result.hpp"

#include <filesystem>
#include <memory>

namespace debsnap {

// Turns the installed state of one package into an archive file.
class IRepacker {
public:
    virtual ~IRepacker() = default;
    virtual bool Available() const = 0;
    // Leaves exactly one archive in `work_dir` and reports its path.
    virtual Result Repack(const PackageRecord& rec,
                          const std::filesystem::path& work_dir,
                          std::filesystem::path& out_archive) const = 0;
};

class DpkgRepacker final : public IRepacker {
public:
    DpkgRepacker();
    explicit DpkgRepacker(std::shared_ptr<const ICommandRunner> runner);

    bool Available() const override;
    Result Repack(const PackageRecord& rec,
                  const std::filesystem::path& work_dir,
                  std::filesystem::path& out_archive) const override;

private:
    std::shared_ptr<const ICommandRunner> runner_;
};

// Locates the single *.deb a repack run left in `dir`.
Result FindSingleArchive(const std::filesystem::path& dir, std::filesystem::path& out);

} // namespace debsnap
