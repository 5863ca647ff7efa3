#include "core/path_checks.hpp"

#include <string>

namespace fs = std::filesystem;

namespace cloudlink::core
{
    namespace
    {

        Status reject(const std::string &message, const fs::path &path)
        {
            return Status::failure(ErrorKind::Validation, message, {path});
        }

        std::string limitText(const model::Settings &settings)
        {
            return " (path limit: " + std::to_string(settings.maxPathLength) + " characters)";
        }

    } // namespace

    Status checkSourcePath(const io::PathInspector &inspector, const model::Settings &settings, const fs::path &source)
    {
        if (source.empty())
        {
            return reject("Source path cannot be empty", source);
        }
        if (!inspector.exists(source))
        {
            return reject("Source path does not exist", source);
        }
        if (!inspector.isDirectory(source))
        {
            return reject("Source path must be a directory", source);
        }
        if (!inspector.isReadable(source))
        {
            return reject("Source path is not accessible (permission denied)", source);
        }
        if (inspector.canonical(source).string().size() > settings.maxPathLength)
        {
            return reject("Source path is too long" + limitText(settings), source);
        }
        return Status::success();
    }

    Status checkTargetPath(const io::PathInspector &inspector, const model::Settings &settings, const fs::path &target)
    {
        if (target.empty())
        {
            return reject("Target path cannot be empty", target);
        }

        const bool targetIsDirectory = inspector.isDirectory(target);
        if (inspector.exists(target) && !targetIsDirectory)
        {
            return reject("Target path is a file, not a directory", target);
        }

        fs::path receiver = targetIsDirectory ? target : target.parent_path();
        if (receiver.empty())
        {
            receiver = fs::path(".");
        }
        if (!inspector.isDirectory(receiver))
        {
            return reject("Target parent directory does not exist", receiver);
        }
        if (!inspector.isWritable(receiver))
        {
            return reject("No write permission for target parent directory", receiver);
        }
        if (inspector.freeSpaceBytes(receiver) < settings.minFreeSpaceBytes)
        {
            return reject("Insufficient disk space at target location", receiver);
        }
        if (inspector.canonical(target).string().size() > settings.maxPathLength)
        {
            return reject("Target path is too long" + limitText(settings), target);
        }
        return Status::success();
    }

    bool isWithin(const fs::path &path, const fs::path &root)
    {
        if (root.empty())
        {
            return false;
        }
        auto it = path.begin();
        for (auto rootIt = root.begin(); rootIt != root.end(); ++rootIt)
        {
            if (rootIt->empty())
            {
                continue;
            }
            if (it == path.end() || *it != *rootIt)
            {
                return false;
            }
            ++it;
        }
        return true;
    }

} // namespace cloudlink::core
