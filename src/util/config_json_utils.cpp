#include "debsnap/util/config_json_utils.hpp"

#include "debsnap/builder/worker_pool.hpp"

#include <fstream>

namespace debsnap::config::detail {

namespace {

// A present key of the wrong type is an error; an absent key is not.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::optional<std::string>& out,
                        std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::optional<std::uint64_t>& out,
                     std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    auto v = it->get<long long>();
    if (v < 0) {
        err = std::string(key) + " must not be negative";
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, std::optional<bool>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be true or false";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool GetStringArrayIfPresent(const nlohmann::json& j, const char* key,
                             std::optional<std::vector<std::string>>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_array()) {
        err = std::string(key) + " must be an array of strings";
        return false;
    }
    std::vector<std::string> values;
    for (const auto& v : *it) {
        if (!v.is_string()) {
            err = std::string(key) + " must be an array of strings";
            return false;
        }
        values.push_back(v.get<std::string>());
    }
    out = std::move(values);
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const nlohmann::json::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, BuilderConfigFromFile& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "RepoDir", cfg.repo_dir, err) ||
        !GetStringIfPresent(j, "CacheDir", cfg.cache_dir, err) ||
        !GetBoolIfPresent(j, "IncludeUpdates", cfg.include_updates, err) ||
        !GetBoolIfPresent(j, "Register", cfg.register_repo, err) ||
        !GetBoolIfPresent(j, "Trusted", cfg.trusted, err) ||
        !GetU64IfPresent(j, "Jobs", cfg.jobs, err) ||
        !GetStringIfPresent(j, "LogFile", cfg.log_file, err)) {
        return false;
    }

    if (cfg.repo_dir && cfg.repo_dir->empty()) {
        err = "RepoDir must not be empty";
        return false;
    }
    if (cfg.jobs && *cfg.jobs > kMaxJobs) {
        err = "Jobs must be at most " + std::to_string(kMaxJobs);
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, InstallerConfigFromFile& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "SearchRoot", cfg.search_root, err) ||
        !GetStringIfPresent(j, "StageDir", cfg.stage_dir, err) ||
        !GetStringIfPresent(j, "LogDir", cfg.log_dir, err) ||
        !GetStringIfPresent(j, "SourcesList", cfg.sources_list, err) ||
        !GetStringIfPresent(j, "SourcesListDir", cfg.sources_list_dir, err) ||
        !GetStringIfPresent(j, "BackupDir", cfg.backup_dir, err) ||
        !GetStringIfPresent(j, "ListsDir", cfg.lists_dir, err) ||
        !GetBoolIfPresent(j, "VerifyPoolHashes", cfg.verify_pool_hashes, err) ||
        !GetU64IfPresent(j, "UpgradePasses", cfg.upgrade_passes, err) ||
        !GetStringArrayIfPresent(j, "ExtraPackages", cfg.extra_packages, err) ||
        !GetStringIfPresent(j, "DesktopMeta", cfg.desktop_meta, err) ||
        !GetBoolIfPresent(j, "RefreshBoot", cfg.refresh_boot, err)) {
        return false;
    }

    if (cfg.stage_dir && (cfg.stage_dir->empty() || cfg.stage_dir->front() != '/')) {
        err = "StageDir must be an absolute path";
        return false;
    }
    if (cfg.upgrade_passes && *cfg.upgrade_passes > 10) {
        err = "UpgradePasses must be between 0 and 10";
        return false;
    }

    return true;
}

} // namespace debsnap::config::detail
