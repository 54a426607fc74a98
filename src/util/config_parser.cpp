#include "debsnap/util/config_parser.hpp"

#include "debsnap/util/config_json_utils.hpp"

#include <cstdio>

namespace debsnap::config {

namespace {

template <typename Config>
bool LoadInto(const std::string& path, Config& cfg) {
    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        std::fprintf(stderr, "Config: %s\n", err.c_str());
        return false;
    }

    if (!detail::FillConfigFromJson(json, cfg, err)) {
        std::fprintf(stderr, "Config: %s in %s\n", err.c_str(), path.c_str());
        return false;
    }

    return true;
}

} // namespace

void BuilderConfigFromFile::Reset() {
    repo_dir.reset();
    cache_dir.reset();
    include_updates.reset();
    register_repo.reset();
    trusted.reset();
    jobs.reset();
    log_file.reset();
}

bool BuilderConfigFromFile::LoadFile(const std::string& path) {
    Reset();
    return LoadInto(path, *this);
}

void InstallerConfigFromFile::Reset() {
    search_root.reset();
    stage_dir.reset();
    log_dir.reset();
    sources_list.reset();
    sources_list_dir.reset();
    backup_dir.reset();
    lists_dir.reset();
    verify_pool_hashes.reset();
    upgrade_passes.reset();
    extra_packages.reset();
    desktop_meta.reset();
    refresh_boot.reset();
}

bool InstallerConfigFromFile::LoadFile(const std::string& path) {
    Reset();
    return LoadInto(path, *this);
}

} // namespace debsnap::config
