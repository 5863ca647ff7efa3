#pragma once

#include <string>
#include <vector>

#include "core/context.hpp"
#include "model/app_config.hpp"

namespace cloudlink::commands {

// config show | path | get <section.key> | set <section.key> <value>
int runConfigCommand(const cloudlink::Context &ctx, model::AppConfig &config, const std::vector<std::string> &args);

// Prints <cloud root>/Backup/<folder name> for the given source.
int runSuggestCommand(const cloudlink::Context &ctx, const model::AppConfig &config, const std::vector<std::string> &args);

} // namespace cloudlink::commands
