#pragma once

#include "debsnap/util/config_parser.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace debsnap::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, BuilderConfigFromFile& cfg, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, InstallerConfigFromFile& cfg, std::string& err);

} // namespace debsnap::config::detail
