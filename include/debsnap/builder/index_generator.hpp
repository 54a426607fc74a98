#pragma once

#include "debsnap/system/command_runner.hpp"
#include "debsnap/util/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace debsnap {

struct IndexSummary {
    size_t stanzas = 0;
    bool release_written = false;
};

// Regenerates Packages, Packages.gz and Release of a flat repository from
// its pool with apt-ftparchive. Every file is replaced atomically.
class IndexGenerator {
public:
    IndexGenerator(const ICommandRunner& runner, std::filesystem::path repo_dir);

    Result Generate(IndexSummary& out) const;

private:
    Result Capture(const std::vector<std::string>& argv, std::string& out) const;

    const ICommandRunner& runner_;
    std::filesystem::path repo_dir_;
};

} // namespace debsnap
