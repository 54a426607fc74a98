#include "debsnap/installer/apt_client.hpp"

#include "debsnap/util/logger.hpp"
#include "debsnap/util/path_utils.hpp"

#include <sstream>

namespace fs = std::filesystem;

namespace debsnap {

namespace {

const std::vector<std::string> kKeepConfig = {
    "-o", "Dpkg::Options::=--force-confold",
    "-o", "Dpkg::Options::=--force-confdef",
};

std::string_view TrimLeft(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    return s;
}

template <typename Fn>
void ForEachLine(std::string_view text, Fn fn) {
    size_t pos = 0;
    while (pos < text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string_view::npos) end = text.size();
        fn(text.substr(pos, end - pos));
        pos = end + 1;
    }
}

void LogOutput(const std::string& tool, const std::string& text) {
    ForEachLine(text, [&](std::string_view line) {
        if (!line.empty()) LogDebug("%s: %.*s", tool.c_str(), static_cast<int>(line.size()), line.data());
    });
}

} // namespace

std::vector<DpkgListRow> ParseDpkgList(std::string_view text) {
    std::vector<DpkgListRow> out;
    ForEachLine(text, [&](std::string_view line) {
        if (!StartsWith(line, "ii ")) return;
        std::istringstream is{std::string(line)};
        std::string status;
        DpkgListRow row;
        if (is >> status >> row.name >> row.version) out.push_back(std::move(row));
    });
    return out;
}

std::vector<std::string> AptErrorLines(std::string_view text) {
    std::vector<std::string> out;
    ForEachLine(text, [&](std::string_view line) {
        line = TrimLeft(line);
        if (StartsWith(line, "Err:") || StartsWith(line, "E:")) out.emplace_back(line);
    });
    return out;
}

std::vector<std::string> ParsePolicyPackageFiles(std::string_view text) {
    std::vector<std::string> out;
    bool in_files = false;
    ForEachLine(text, [&](std::string_view line) {
        if (!line.empty() && line.front() != ' ') {
            in_files = StartsWith(line, "Package files:");
            return;
        }
        if (!in_files) return;
        line = TrimLeft(line);
        // " 500 file:/opt/offline-repo ./ Packages"; "release ..." lines carry no priority.
        size_t digits = 0;
        while (digits < line.size() && line[digits] >= '0' && line[digits] <= '9') ++digits;
        if (digits == 0 || digits == line.size() || line[digits] != ' ') return;
        line = TrimLeft(line.substr(digits));
        if (line.size() >= 9 && line.substr(line.size() - 9) == " Packages") out.emplace_back(line);
    });
    return out;
}

bool HasLocalPackagesIndex(const std::vector<std::string>& files, const fs::path& repo) {
    std::string uri = "file:" + repo.string();
    while (uri.size() > 6 && uri.back() == '/') uri.pop_back();
    for (const auto& f : files) {
        if (f == uri + " ./ Packages" || f == uri + "/ ./ Packages") return true;
    }
    return false;
}

AptClient::AptClient(const ICommandRunner& runner, fs::path lists_dir)
    : runner_(runner), lists_dir_(std::move(lists_dir)) {}

Result AptClient::RunChecked(std::vector<std::string> argv, CommandOutput& out) const {
    CommandSpec spec;
    spec.argv = std::move(argv);
    spec.env = {{"DEBIAN_FRONTEND", "noninteractive"}};

    LogDebug("running %s", DescribeCommand(spec.argv).c_str());
    auto rr = runner_.Run(spec, out);
    if (!rr.is_ok()) return rr;
    LogOutput(spec.argv.front(), out.out);
    LogOutput(spec.argv.front(), out.err);
    if (!out.Succeeded()) {
        return Result::Fail(out.exit_code, DescribeCommand(spec.argv) + " exited " + std::to_string(out.exit_code) +
                                               ": " + LastLines(out.err.empty() ? out.out : out.err, 3));
    }
    return Result::Ok();
}

Result AptClient::Update() const {
    CommandOutput out;
    auto rr = RunChecked({"apt-get", "update"}, out);
    if (!rr.is_ok()) return rr;

    auto errors = AptErrorLines(out.out);
    for (auto& line : AptErrorLines(out.err)) errors.push_back(std::move(line));
    if (!errors.empty()) {
        return Result::Fail(-1, "apt-get update reported " + std::to_string(errors.size()) +
                                    " error(s), first: " + errors.front());
    }
    return Result::Ok();
}

Result AptClient::Clean() const {
    CommandOutput out;
    return RunChecked({"apt-get", "clean"}, out);
}

Result AptClient::ClearLists() const {
    std::error_code ec;
    if (!fs::exists(lists_dir_, ec)) return Result::Ok();

    std::vector<fs::path> entries;
    for (fs::directory_iterator it(lists_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(it->path());
    }
    if (ec) return Result::Fail(ec.value(), "cannot list " + lists_dir_.string() + ": " + ec.message());

    for (const auto& entry : entries) {
        fs::remove_all(entry, ec);
        if (ec) return Result::Fail(ec.value(), "cannot remove " + entry.string() + ": " + ec.message());
    }
    return Result::Ok();
}

Result AptClient::FullUpgrade() const {
    std::vector<std::string> argv = {"apt-get", "-y"};
    argv.insert(argv.end(), kKeepConfig.begin(), kKeepConfig.end());
    argv.push_back("full-upgrade");
    CommandOutput out;
    return RunChecked(std::move(argv), out);
}

Result AptClient::Install(const std::vector<std::string>& packages) const {
    if (packages.empty()) return Result::Ok();
    std::vector<std::string> argv = {"apt-get", "-y", "install"};
    argv.insert(argv.end(), packages.begin(), packages.end());
    CommandOutput out;
    return RunChecked(std::move(argv), out);
}

Result AptClient::AutoremovePurge() const {
    CommandOutput out;
    return RunChecked({"apt-get", "-y", "autoremove", "--purge"}, out);
}

Result AptClient::PackageFiles(std::vector<std::string>& out) const {
    out.clear();
    CommandOutput res;
    auto rr = RunChecked({"apt-cache", "policy"}, res);
    if (!rr.is_ok()) return rr;
    out = ParsePolicyPackageFiles(res.out);
    return Result::Ok();
}

Result AptClient::ListInstalled(const std::string& pattern, std::vector<DpkgListRow>& out) const {
    out.clear();
    CommandSpec spec;
    spec.argv = {"dpkg", "-l", pattern};
    CommandOutput res;
    auto rr = runner_.Run(spec, res);
    if (!rr.is_ok()) return rr;
    // dpkg -l exits 1 when nothing matches the pattern.
    if (!res.Succeeded() && res.exit_code != 1) {
        return Result::Fail(res.exit_code, "dpkg -l failed: " + LastLines(res.err, 3));
    }
    out = ParseDpkgList(res.out);
    return Result::Ok();
}

} // namespace debsnap
