#include "core/relocation_ops.hpp"

#include <chrono>
#include <thread>

#include "io/shell_commands.hpp"

namespace fs = std::filesystem;

namespace cloudlink::core
{
    namespace
    {

        std::string failureText(const io::ProcessResult &result)
        {
            if (!result.err.empty())
            {
                return result.err;
            }
            if (result.timedOut)
            {
                return "command timeout";
            }
            return "exit code " + std::to_string(result.code);
        }

    } // namespace

    RelocationOps::RelocationOps(
        io::CommandExecutor &executor,
        const io::PathInspector &inspector,
        const cloudlink::Context &ctx,
        const model::Settings &settings)
        : executor_(executor), inspector_(inspector), ctx_(ctx), settings_(settings)
    {
    }

    Status RelocationOps::rename(const fs::path &from, const fs::path &to)
    {
        ctx_.debug("Rename ", from.string(), " -> ", to.string());
        const io::ProcessResult result = executor_.execute(io::renameCommand(from, to), settings_.commandTimeoutSeconds);
        if (!result.success)
        {
            return Status::failure(ErrorKind::Move, "rename failed: " + failureText(result), {from, to});
        }
        return Status::success();
    }

    Status RelocationOps::copyTree(const fs::path &from, const fs::path &to)
    {
        const int attempts = settings_.copyRetries + 1;
        std::string lastError;
        for (int attempt = 1; attempt <= attempts; ++attempt)
        {
            ctx_.debug("Copy ", from.string(), " -> ", to.string(), " (attempt ", attempt, "/", attempts, ")");
            const io::ProcessResult result = executor_.execute(io::copyTreeCommand(from, to), settings_.copyTimeoutSeconds);
            if (result.success && inspector_.exists(to))
            {
                return Status::success();
            }

            lastError = failureText(result);
            ctx_.warn("Copy attempt ", attempt, " failed: ", lastError);
            if (attempt < attempts && settings_.copyRetryWaitSeconds > 0)
            {
                std::this_thread::sleep_for(std::chrono::seconds(settings_.copyRetryWaitSeconds * attempt));
            }
        }
        return Status::failure(ErrorKind::Move, "copy failed: " + lastError, {from, to});
    }

    Status RelocationOps::removeTree(const fs::path &path)
    {
        ctx_.debug("Remove tree ", path.string());
        const io::ProcessResult result = executor_.execute(io::removeTreeCommand(path), settings_.commandTimeoutSeconds);
        if (inspector_.exists(path) || inspector_.isJunction(path))
        {
            return Status::failure(ErrorKind::Move, "could not remove " + path.string() + ": " + failureText(result), {path});
        }
        return Status::success();
    }

    Status RelocationOps::createJunction(const fs::path &link, const fs::path &target)
    {
        ctx_.debug("Create junction ", link.string(), " -> ", target.string());
        const io::ProcessResult result = executor_.execute(io::createJunctionCommand(link, target), settings_.commandTimeoutSeconds);
        if (!result.success)
        {
            return Status::failure(ErrorKind::Link, "junction creation failed: " + failureText(result), {link, target});
        }
        if (!inspector_.isJunction(link))
        {
            return Status::failure(ErrorKind::Link, "junction creation completed but no junction exists", {link});
        }
        return Status::success();
    }

    Status RelocationOps::removeJunction(const fs::path &link)
    {
        ctx_.debug("Remove junction ", link.string());
        const io::ProcessResult result = executor_.execute(io::removeJunctionCommand(link), settings_.commandTimeoutSeconds);
        if (!result.success)
        {
            return Status::failure(ErrorKind::Command, "failed to remove junction: " + failureText(result), {link});
        }
        if (inspector_.isJunction(link))
        {
            return Status::failure(ErrorKind::Command, "junction still present after removal", {link});
        }
        return Status::success();
    }

} // namespace cloudlink::core
