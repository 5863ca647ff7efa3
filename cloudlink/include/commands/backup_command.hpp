#pragma once

#include <string>
#include <vector>

#include "core/context.hpp"
#include "model/app_config.hpp"

namespace cloudlink::commands {

int runBackupCommand(
    const cloudlink::Context &ctx,
    model::AppConfig &config,
    const std::vector<std::string> &args
);

int runValidateCommand(
    const cloudlink::Context &ctx,
    model::AppConfig &config,
    const std::vector<std::string> &args
);

int runRollbackCommand(
    const cloudlink::Context &ctx,
    model::AppConfig &config,
    const std::vector<std::string> &args
);

} // namespace cloudlink::commands
