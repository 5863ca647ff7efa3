#include "commands/config_command.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace cloudlink::commands
{

    int runConfigCommand(const cloudlink::Context &ctx, model::AppConfig &config, const std::vector<std::string> &args)
    {
        const std::string action = args.empty() ? "show" : args.front();

        if (action == "show")
        {
            std::cout << config.data().dump(2) << '\n';
            return 0;
        }
        if (action == "path")
        {
            std::cout << config.file().string() << '\n';
            return 0;
        }
        if (action == "get")
        {
            if (args.size() != 2)
            {
                ctx.error("config get: expected <section.key>");
                return 1;
            }
            const auto value = config.get(args[1]);
            if (!value.has_value())
            {
                ctx.error("config get: unknown key ", args[1]);
                return 1;
            }
            std::cout << (value->is_string() ? value->get<std::string>() : value->dump()) << '\n';
            return 0;
        }
        if (action == "set")
        {
            if (args.size() != 3)
            {
                ctx.error("config set: expected <section.key> <value>");
                return 1;
            }
            if (!config.set(args[1], args[2]))
            {
                ctx.error("config set: invalid key ", args[1], " (use section.key)");
                return 1;
            }
            if (!config.save(ctx))
            {
                return 1;
            }
            ctx.log("Set ", args[1], " = ", config.get(args[1])->dump());
            return 0;
        }

        ctx.error("Invalid config action: ", action, " (use show|path|get|set)");
        return 1;
    }

    int runSuggestCommand(const cloudlink::Context &ctx, const model::AppConfig &config, const std::vector<std::string> &args)
    {
        if (args.size() != 1 || args.front().empty())
        {
            ctx.error("suggest: expected exactly one source path");
            return 1;
        }

        const model::Settings settings = config.settings();
        if (settings.cloudRoot.empty())
        {
            ctx.error("No cloud folder detected; set it with: cloudlink config set paths.cloud_root <dir>");
            return 1;
        }
        std::cout << model::suggestTargetPath(settings.cloudRoot, fs::path(args.front())).string() << '\n';
        return 0;
    }

} // namespace cloudlink::commands
