#include "core/junction_registry.hpp"

#include <sys/types.h>
#include <sys/stat.h>

#include "io/shell_commands.hpp"

namespace fs = std::filesystem;

namespace cloudlink::core
{
    namespace
    {

        std::string creationTime(const fs::path &path)
        {
#ifdef _WIN32
            struct _stat64 info{};
            if (_wstat64(path.wstring().c_str(), &info) != 0)
            {
                return {};
            }
            return cloudlink::formatTimestamp(static_cast<std::time_t>(info.st_ctime));
#else
            struct stat info{};
            if (lstat(path.c_str(), &info) != 0)
            {
                return {};
            }
            return cloudlink::formatTimestamp(info.st_mtime);
#endif
        }

    } // namespace

    JunctionRegistry::JunctionRegistry(io::CommandExecutor &executor, RelocationOps &ops, const cloudlink::Context &ctx)
        : executor_(executor), ops_(ops), inspector_(ops.inspector()), ctx_(ctx)
    {
    }

    std::vector<model::JunctionInfo> JunctionRegistry::listJunctions(const std::vector<fs::path> &roots, int depth)
    {
        std::vector<model::JunctionInfo> out;
        for (const auto &root : roots)
        {
            if (!inspector_.isDirectory(root))
            {
                ctx_.warn("Skipping scan root that is not a directory: ", root.string());
                continue;
            }

            const io::ProcessResult result = executor_.execute(io::listJunctionsCommand(root, depth), ops_.settings().commandTimeoutSeconds);
            if (!result.success)
            {
                ctx_.warn("Junction scan failed for ", root.string(), ": ", result.err.empty() ? "exit code " + std::to_string(result.code) : result.err);
                continue;
            }

            for (auto &entry : io::parseJunctionListing(result.out))
            {
                if (!inspector_.isJunction(entry.source))
                {
                    continue;
                }
                entry.targetExists = inspector_.exists(entry.target);
                out.push_back(std::move(entry));
            }
        }
        ctx_.debug("Found ", out.size(), " junction(s) under ", roots.size(), " root(s)");
        return out;
    }

    Status JunctionRegistry::removeJunction(const fs::path &given)
    {
        const fs::path path = io::linkLocation(given);
        if (!inspector_.exists(path) && !inspector_.isJunction(path))
        {
            return Status::failure(ErrorKind::NotFound, "path does not exist", {path});
        }
        if (!inspector_.isJunction(path))
        {
            return Status::failure(ErrorKind::NotJunction, "path is not a junction", {path});
        }

        const Status removed = ops_.removeJunction(path);
        if (removed)
        {
            ctx_.log("Junction removed: ", path.string());
        }
        return removed;
    }

    Status JunctionRegistry::verifyJunction(const fs::path &given) const
    {
        const fs::path path = io::linkLocation(given);
        if (!inspector_.exists(path) && !inspector_.isJunction(path))
        {
            return Status::failure(ErrorKind::NotFound, "path does not exist", {path});
        }
        if (!inspector_.isJunction(path))
        {
            return Status::failure(ErrorKind::NotJunction, "path is not a junction", {path});
        }

        const auto target = inspector_.junctionTarget(path);
        if (!target.has_value())
        {
            return Status::failure(ErrorKind::Verification, "junction target could not be resolved", {path});
        }
        if (!inspector_.exists(*target))
        {
            return Status::failure(ErrorKind::Verification, "junction target no longer exists", {path, *target});
        }
        return Status::success();
    }

    std::optional<model::JunctionInfo> JunctionRegistry::info(const fs::path &given) const
    {
        const fs::path path = io::linkLocation(given);
        if (!inspector_.isJunction(path))
        {
            return std::nullopt;
        }

        model::JunctionInfo out;
        out.source = path;
        if (const auto target = inspector_.junctionTarget(path))
        {
            out.target = *target;
            out.targetExists = inspector_.exists(*target);
        }
        out.created = creationTime(path);
        return out;
    }

} // namespace cloudlink::core
