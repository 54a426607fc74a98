#pragma once

#include "debsnap/util/result.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace debsnap {

struct CommandSpec {
    std::vector<std::string> argv;
    // Empty means inherit the caller's working directory.
    std::string cwd;
    // Added to (or replacing entries of) the inherited environment.
    std::vector<std::pair<std::string, std::string>> env;
};

struct CommandOutput {
    int exit_code = -1;
    std::string out;
    std::string err;

    bool Succeeded() const { return exit_code == 0; }
};

// Seam for every external collaborator (dpkg, apt, bootloader tools).
// Run() fails only when the process could not be started or waited for;
// a non-zero exit status is reported through CommandOutput.
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;
    virtual Result Run(const CommandSpec& spec, CommandOutput& out) const = 0;
};

class PosixCommandRunner final : public ICommandRunner {
public:
    Result Run(const CommandSpec& spec, CommandOutput& out) const override;
};

std::shared_ptr<const ICommandRunner> DefaultCommandRunner();

std::string DescribeCommand(const std::vector<std::string>& argv);
std::string LastLines(const std::string& text, size_t max_lines);

std::optional<std::string> FindInPath(const std::string& tool);
// Fails listing every tool from `tools` that is not on PATH.
Result RequireTools(const std::vector<std::string>& tools);

} // namespace debsnap
