#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "commands/backup_command.hpp"
#include "commands/config_command.hpp"
#include "commands/junction_command.hpp"
#include "core/context.hpp"
#include "model/app_config.hpp"

namespace fs = std::filesystem;

namespace
{

    constexpr const char *kAppName = "cloudlink";
    constexpr const char *kVersion = "1.0.0";

    void printHelp()
    {
        std::cout << kAppName << " " << kVersion << "\n"
                  << "Moves a folder into cloud storage and leaves a junction in its place.\n"
                  << "\n"
                  << "Usage:\n"
                  << "  " << kAppName << " backup <source> <target> [--validate-only] [--silent]\n"
                  << "  " << kAppName << " validate <source> <target>\n"
                  << "  " << kAppName << " rollback [--discard]\n"
                  << "  " << kAppName << " list [roots...] [--depth N]\n"
                  << "  " << kAppName << " remove <junction>\n"
                  << "  " << kAppName << " verify <junction>\n"
                  << "  " << kAppName << " info <junction>\n"
                  << "  " << kAppName << " suggest <source>\n"
                  << "  " << kAppName << " config show|path|get <section.key>|set <section.key> <value>\n"
                  << "\n"
                  << "Global options:\n"
                  << "  --config FILE   use FILE instead of " << cloudlink::model::AppConfig::defaultFile().string() << "\n"
                  << "  --verbose       print debug messages\n"
                  << "\n"
                  << "Examples:\n"
                  << "  " << kAppName << " backup ~/Documents/Projects ~/OneDrive/Backup\n"
                  << "  " << kAppName << " list ~/Documents --depth 2\n"
                  << "  " << kAppName << " config set backup.copy_retries 5\n";
    }

    std::string upper(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        return value;
    }

    struct GlobalOptions
    {
        fs::path configFile;
        bool verbose = false;
    };

    // Pulls --config/--verbose out of the argument list wherever they appear.
    bool extractGlobals(std::vector<std::string> &args, GlobalOptions &opt)
    {
        std::vector<std::string> rest;
        for (size_t i = 0; i < args.size(); ++i)
        {
            if (args[i] == "--verbose")
            {
                opt.verbose = true;
                continue;
            }
            if (args[i] == "--config")
            {
                if (i + 1 >= args.size())
                {
                    std::cerr << "[error] --config requires value\n";
                    return false;
                }
                opt.configFile = args[++i];
                continue;
            }
            rest.push_back(args[i]);
        }
        args.swap(rest);
        return true;
    }

    void setupLogging(cloudlink::Context &ctx, const cloudlink::model::AppConfig &config, bool verbose)
    {
        ctx.setVerbose(verbose || upper(config.logLevel()) == "DEBUG");
        ctx.setConsole(config.consoleOutput());
        if (!config.logToFile())
        {
            return;
        }

        const fs::path logFile = config.logDirectory() / ("cloudlink_" + cloudlink::timestampCompact() + ".log");
        if (!ctx.openLogFile(logFile))
        {
            ctx.warn("Could not open log file ", logFile.string());
            return;
        }
        ctx.debug("Logging to ", logFile.string());
    }

} // namespace

int main(int argc, char **argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    GlobalOptions global;
    if (!extractGlobals(args, global))
    {
        return 1;
    }
    if (args.empty())
    {
        printHelp();
        return 1;
    }

    const std::string command = args.front();
    args.erase(args.begin());

    if (command == "help" || command == "--help" || command == "-h")
    {
        printHelp();
        return 0;
    }
    if (command == "version" || command == "--version" || command == "-v")
    {
        std::cout << kAppName << " " << kVersion << '\n';
        return 0;
    }

    cloudlink::Context ctx(global.verbose);
    cloudlink::model::AppConfig config(global.configFile.empty() ? cloudlink::model::AppConfig::defaultFile() : global.configFile);
    config.load(ctx);
    setupLogging(ctx, config, global.verbose);
    ctx.debug("Command: ", command);

    if (command == "backup")
    {
        return cloudlink::commands::runBackupCommand(ctx, config, args);
    }
    if (command == "validate")
    {
        return cloudlink::commands::runValidateCommand(ctx, config, args);
    }
    if (command == "rollback")
    {
        return cloudlink::commands::runRollbackCommand(ctx, config, args);
    }
    if (command == "list")
    {
        return cloudlink::commands::runListCommand(ctx, config, args);
    }
    if (command == "remove")
    {
        return cloudlink::commands::runRemoveCommand(ctx, config, args);
    }
    if (command == "verify")
    {
        return cloudlink::commands::runVerifyCommand(ctx, config, args);
    }
    if (command == "info")
    {
        return cloudlink::commands::runInfoCommand(ctx, config, args);
    }
    if (command == "suggest")
    {
        return cloudlink::commands::runSuggestCommand(ctx, config, args);
    }
    if (command == "config")
    {
        return cloudlink::commands::runConfigCommand(ctx, config, args);
    }

    std::cerr << "Unknown command: " << command << '\n';
    printHelp();
    return 1;
}
