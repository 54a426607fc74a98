#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace debsnap::config {

inline constexpr const char* kDefaultBuildConfigPath = "/etc/debsnap/build.json";
inline constexpr const char* kDefaultInstallConfigPath = "/etc/debsnap/install.json";

// Every key is optional; command-line flags take precedence.
class BuilderConfigFromFile {
public:
    std::optional<std::string> repo_dir;
    std::optional<std::string> cache_dir;
    std::optional<bool> include_updates;
    std::optional<bool> register_repo;
    std::optional<bool> trusted;
    std::optional<std::uint64_t> jobs;
    std::optional<std::string> log_file;

    bool LoadFile(const std::string &path);

    void Reset();
};

class InstallerConfigFromFile {
public:
    std::optional<std::string> search_root;
    std::optional<std::string> stage_dir;
    std::optional<std::string> log_dir;
    std::optional<std::string> sources_list;
    std::optional<std::string> sources_list_dir;
    std::optional<std::string> backup_dir;
    std::optional<std::string> lists_dir;
    std::optional<bool> verify_pool_hashes;
    std::optional<std::uint64_t> upgrade_passes;
    std::optional<std::vector<std::string>> extra_packages;
    std::optional<std::string> desktop_meta;
    std::optional<bool> refresh_boot;

    bool LoadFile(const std::string &path);

    void Reset();
};

} // namespace debsnap::config
