#pragma once

#include <filesystem>

#include "nlohmann/json.hpp"

namespace cloudlink::io {

nlohmann::json loadJsonFile(const std::filesystem::path &path);
bool saveJsonFile(const std::filesystem::path &path, const nlohmann::json &data);

} // namespace cloudlink::io
