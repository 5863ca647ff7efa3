#include "commands/junction_command.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "commands/runtime.hpp"

namespace fs = std::filesystem;

namespace cloudlink::commands
{
    namespace
    {

        bool singlePath(const std::vector<std::string> &args, const char *command, fs::path &out, const cloudlink::Context &ctx)
        {
            if (args.size() != 1 || args.front().empty())
            {
                ctx.error(command, ": expected exactly one path");
                return false;
            }
            out = args.front();
            return true;
        }

    } // namespace

    int runListCommand(const cloudlink::Context &ctx, const model::AppConfig &config, const std::vector<std::string> &args)
    {
        Runtime runtime(ctx, config);
        std::vector<fs::path> roots;
        int depth = runtime.settings.scanDepth;

        for (size_t i = 0; i < args.size(); ++i)
        {
            const std::string &arg = args[i];
            if (arg == "--depth")
            {
                if (i + 1 >= args.size())
                {
                    ctx.error("list: --depth requires value");
                    return 1;
                }
                try
                {
                    depth = std::stoi(args[++i]);
                }
                catch (const std::exception &)
                {
                    ctx.error("list: invalid depth ", args[i]);
                    return 1;
                }
                if (depth < 0)
                {
                    ctx.error("list: depth must not be negative");
                    return 1;
                }
                continue;
            }
            roots.emplace_back(arg);
        }
        if (roots.empty())
        {
            roots = runtime.settings.scanRoots;
        }

        const auto junctions = runtime.registry.listJunctions(roots, depth);
        if (junctions.empty())
        {
            std::cout << "No junctions found\n";
            return 0;
        }
        for (const auto &item : junctions)
        {
            std::cout << item.source.string() << " -> " << item.target.string();
            if (!item.created.empty())
            {
                std::cout << "  [" << item.created << "]";
            }
            if (!item.targetExists)
            {
                std::cout << "  (target missing)";
            }
            std::cout << '\n';
        }
        return 0;
    }

    int runRemoveCommand(const cloudlink::Context &ctx, const model::AppConfig &config, const std::vector<std::string> &args)
    {
        fs::path path;
        if (!singlePath(args, "remove", path, ctx))
        {
            return 1;
        }

        Runtime runtime(ctx, config);
        const Status status = runtime.registry.removeJunction(path);
        if (!status)
        {
            ctx.error(status.error().describe());
            return 1;
        }
        return 0;
    }

    int runVerifyCommand(const cloudlink::Context &ctx, const model::AppConfig &config, const std::vector<std::string> &args)
    {
        fs::path path;
        if (!singlePath(args, "verify", path, ctx))
        {
            return 1;
        }

        Runtime runtime(ctx, config);
        const Status status = runtime.registry.verifyJunction(path);
        if (!status)
        {
            ctx.error(status.error().describe());
            return 1;
        }
        ctx.log("Junction is valid: ", path.string());
        return 0;
    }

    int runInfoCommand(const cloudlink::Context &ctx, const model::AppConfig &config, const std::vector<std::string> &args)
    {
        fs::path path;
        if (!singlePath(args, "info", path, ctx))
        {
            return 1;
        }

        Runtime runtime(ctx, config);
        const auto info = runtime.registry.info(path);
        if (!info.has_value())
        {
            ctx.error("Not a junction: ", path.string());
            return 1;
        }
        std::cout << "Path:    " << info->source.string() << '\n'
                  << "Target:  " << info->target.string() << (info->targetExists ? "" : " (missing)") << '\n'
                  << "Created: " << (info->created.empty() ? "-" : info->created) << '\n';
        return 0;
    }

} // namespace cloudlink::commands
