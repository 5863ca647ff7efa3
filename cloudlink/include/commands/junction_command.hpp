#pragma once

#include <string>
#include <vector>

#include "core/context.hpp"
#include "model/app_config.hpp"

namespace cloudlink::commands {

int runListCommand(const cloudlink::Context &ctx, const model::AppConfig &config, const std::vector<std::string> &args);
int runRemoveCommand(const cloudlink::Context &ctx, const model::AppConfig &config, const std::vector<std::string> &args);
int runVerifyCommand(const cloudlink::Context &ctx, const model::AppConfig &config, const std::vector<std::string> &args);
int runInfoCommand(const cloudlink::Context &ctx, const model::AppConfig &config, const std::vector<std::string> &args);

} // namespace cloudlink::commands
