#pragma once

#include "debsnap/system/command_runner.hpp"
#include "debsnap/util/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace debsnap {

// One "ii" row of dpkg -l.
struct DpkgListRow {
    std::string name;
    std::string version;
};

std::vector<DpkgListRow> ParseDpkgList(std::string_view text);
// Lines APT prints for a source it could not fetch ("Err:..." / "E: ...").
std::vector<std::string> AptErrorLines(std::string_view text);
// Index entries of the "Package files:" section of apt-cache policy, e.g.
// "file:/opt/offline-repo ./ Packages". dpkg's status file is not listed.
std::vector<std::string> ParsePolicyPackageFiles(std::string_view text);
// True when `files` holds the Packages index of the flat repo at `repo`.
bool HasLocalPackagesIndex(const std::vector<std::string>& files, const std::filesystem::path& repo);

// apt-get / apt-cache / dpkg as used by the installer, run non-interactively.
class AptClient {
public:
    explicit AptClient(const ICommandRunner& runner,
                       std::filesystem::path lists_dir = "/var/lib/apt/lists");

    // Fails on a non-zero exit and on any fetch error line.
    Result Update() const;
    Result Clean() const;
    // rm -rf <lists>/*
    Result ClearLists() const;
    // full-upgrade keeping existing configuration files.
    Result FullUpgrade() const;
    Result Install(const std::vector<std::string>& packages) const;
    Result AutoremovePurge() const;
    // Package indexes loaded into the APT cache.
    Result PackageFiles(std::vector<std::string>& out) const;
    Result ListInstalled(const std::string& pattern, std::vector<DpkgListRow>& out) const;

    const ICommandRunner& Runner() const { return runner_; }

private:
    Result RunChecked(std::vector<std::string> argv, CommandOutput& out) const;

    const ICommandRunner& runner_;
    std::filesystem::path lists_dir_;
};

} // namespace debsnap
