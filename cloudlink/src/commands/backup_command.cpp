#include "commands/backup_command.hpp"

#include <filesystem>
#include <string>

#include "commands/runtime.hpp"

namespace fs = std::filesystem;

namespace cloudlink::commands
{
    namespace
    {

        struct BackupOptions
        {
            std::string source;
            std::string target;
            bool validateOnly = false;
            bool silent = false;
        };

        bool parseOptions(const std::vector<std::string> &args, BackupOptions &opt, const char *command, const cloudlink::Context &ctx)
        {
            std::vector<std::string> positionals;

            for (size_t i = 0; i < args.size(); ++i)
            {
                const std::string &arg = args[i];
                if (arg == "--validate-only")
                {
                    opt.validateOnly = true;
                    continue;
                }
                if (arg == "--silent")
                {
                    opt.silent = true;
                    continue;
                }
                if (arg == "--source" || arg == "--target")
                {
                    if (i + 1 >= args.size())
                    {
                        ctx.error(command, ": ", arg, " requires value");
                        return false;
                    }
                    (arg == "--source" ? opt.source : opt.target) = args[++i];
                    continue;
                }
                if (arg.rfind("--", 0) == 0)
                {
                    ctx.error(command, ": unknown option ", arg);
                    return false;
                }
                positionals.push_back(arg);
            }

            size_t next = 0;
            if (opt.source.empty() && next < positionals.size())
            {
                opt.source = positionals[next++];
            }
            if (opt.target.empty() && next < positionals.size())
            {
                opt.target = positionals[next++];
            }
            if (next < positionals.size())
            {
                ctx.error(command, ": unexpected argument ", positionals[next]);
                return false;
            }
            return true;
        }

        bool resolvePaths(BackupOptions &opt, const model::AppConfig &config, const char *command, const cloudlink::Context &ctx)
        {
            if (config.rememberPaths())
            {
                if (opt.source.empty() && !config.lastSource().empty())
                {
                    opt.source = config.lastSource();
                    ctx.log("Using last source: ", opt.source);
                }
                if (opt.target.empty() && !config.lastTarget().empty())
                {
                    opt.target = config.lastTarget();
                    ctx.log("Using last target: ", opt.target);
                }
            }
            if (opt.source.empty() || opt.target.empty())
            {
                ctx.error(command, ": source and target are required");
                return false;
            }
            return true;
        }

        void printRecord(const cloudlink::Context &ctx, const model::RollbackRecord &record)
        {
            ctx.log("Pending rollback point (", record.timestamp, "):");
            ctx.log("  source: ", record.source.string());
            ctx.log("  target: ", record.target.string());
            ctx.log("  moved: ", record.backupCreated ? "yes" : "no", ", linked: ", record.junctionCreated ? "yes" : "no");
        }

    } // namespace

    int runBackupCommand(const cloudlink::Context &ctx, model::AppConfig &config, const std::vector<std::string> &args)
    {
        BackupOptions opt;
        if (!parseOptions(args, opt, "backup", ctx) || !resolvePaths(opt, config, "backup", ctx))
        {
            return 1;
        }

        Runtime runtime(ctx, config);
        if (opt.validateOnly)
        {
            const Status status = runtime.orchestrator.validatePaths(opt.source, opt.target);
            if (!status)
            {
                ctx.error(status.error().describe());
                return 1;
            }
            ctx.log("Paths are valid");
            return 0;
        }

        core::ProgressCallback progress;
        if (!opt.silent)
        {
            progress = [&ctx](const std::string &stage, int percent)
            {
                ctx.log("[", percent, "%] ", stage);
            };
        }

        const core::BackupOutcome outcome = runtime.orchestrator.executeBackup(opt.source, opt.target, progress);
        if (outcome.ok())
        {
            if (config.rememberPaths())
            {
                config.setLastPaths(opt.source, opt.target);
                config.save(ctx);
            }
            return 0;
        }

        ctx.error("Backup failed (", core::backupStateName(outcome.finalState), "): ", outcome.error.describe());
        if (outcome.rollbackError.has_value())
        {
            ctx.error("ROLLBACK FAILED, manual intervention may be required: ", outcome.rollbackError->describe());
            ctx.error("Retry with: cloudlink rollback");
            return 2;
        }
        if (outcome.finalState == core::BackupState::RolledBack)
        {
            ctx.log("Original folder restored");
        }
        return 1;
    }

    int runValidateCommand(const cloudlink::Context &ctx, model::AppConfig &config, const std::vector<std::string> &args)
    {
        BackupOptions opt;
        if (!parseOptions(args, opt, "validate", ctx) || !resolvePaths(opt, config, "validate", ctx))
        {
            return 1;
        }

        Runtime runtime(ctx, config);
        const Status status = runtime.orchestrator.validatePaths(opt.source, opt.target);
        if (!status)
        {
            ctx.error(status.error().describe());
            return 1;
        }
        ctx.log("Paths are valid");
        return 0;
    }

    int runRollbackCommand(const cloudlink::Context &ctx, model::AppConfig &config, const std::vector<std::string> &args)
    {
        bool discard = false;
        for (const auto &arg : args)
        {
            if (arg == "--discard")
            {
                discard = true;
                continue;
            }
            ctx.error("rollback: unexpected argument ", arg);
            return 1;
        }

        Runtime runtime(ctx, config);
        if (const auto record = runtime.orchestrator.pendingRecord())
        {
            printRecord(ctx, *record);
        }

        const Status status = discard ? runtime.orchestrator.discardRollbackPoint() : runtime.orchestrator.rollback();
        if (!status)
        {
            ctx.error(status.error().describe());
            return status.kind() == ErrorKind::Rollback ? 2 : 1;
        }
        return 0;
    }

} // namespace cloudlink::commands
