#include "io/path_inspector.hpp"

#include <system_error>

#ifdef _WIN32
#define NOMINMAX
#include <windows.h>
#include <io.h>
#else
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace cloudlink::io
{

    bool FilesystemInspector::exists(const fs::path &path) const
    {
        std::error_code ec;
        return !path.empty() && fs::exists(path, ec);
    }

    bool FilesystemInspector::isDirectory(const fs::path &path) const
    {
        std::error_code ec;
        return !path.empty() && fs::is_directory(path, ec);
    }

    bool FilesystemInspector::isJunction(const fs::path &path) const
    {
        if (path.empty())
        {
            return false;
        }
        const fs::path link = linkLocation(path);
#ifdef _WIN32
        const DWORD attributes = GetFileAttributesW(link.wstring().c_str());
        if (attributes == INVALID_FILE_ATTRIBUTES)
        {
            return false;
        }
        return (attributes & FILE_ATTRIBUTE_REPARSE_POINT) != 0 && (attributes & FILE_ATTRIBUTE_DIRECTORY) != 0;
#else
        std::error_code ec;
        if (!fs::is_symlink(fs::symlink_status(link, ec)))
        {
            return false;
        }
        return fs::is_directory(link, ec);
#endif
    }

    std::optional<fs::path> FilesystemInspector::junctionTarget(const fs::path &path) const
    {
        if (!isJunction(path))
        {
            return std::nullopt;
        }

        const fs::path link = linkLocation(path);
        std::error_code ec;
        fs::path target = fs::read_symlink(link, ec);
        if (ec || target.empty())
        {
            return std::nullopt;
        }
        if (target.is_relative())
        {
            target = link.parent_path() / target;
        }
        return target;
    }

    std::uint64_t FilesystemInspector::freeSpaceBytes(const fs::path &directory) const
    {
        std::error_code ec;
        const fs::space_info info = fs::space(directory, ec);
        if (ec)
        {
            return 0;
        }
        return static_cast<std::uint64_t>(info.available);
    }

    bool FilesystemInspector::isReadable(const fs::path &path) const
    {
#ifdef _WIN32
        if (_waccess(path.wstring().c_str(), 4) != 0)
        {
            return false;
        }
#else
        if (access(path.c_str(), R_OK) != 0)
        {
            return false;
        }
#endif
        if (!isDirectory(path))
        {
            return true;
        }

        std::error_code ec;
        fs::directory_iterator it(path, ec);
        return !ec;
    }

    bool FilesystemInspector::isWritable(const fs::path &path) const
    {
#ifdef _WIN32
        return _waccess(path.wstring().c_str(), 2) == 0;
#else
        return access(path.c_str(), W_OK) == 0;
#endif
    }

    bool FilesystemInspector::sameVolume(const fs::path &a, const fs::path &b) const
    {
#ifdef _WIN32
        return fs::absolute(a).root_name() == fs::absolute(b).root_name();
#else
        struct stat first{};
        struct stat second{};
        if (stat(a.c_str(), &first) != 0 || stat(b.c_str(), &second) != 0)
        {
            return false;
        }
        return first.st_dev == second.st_dev;
#endif
    }

    fs::path FilesystemInspector::canonical(const fs::path &path) const
    {
        std::error_code ec;
        fs::path out = fs::weakly_canonical(path, ec);
        if (ec)
        {
            return fs::absolute(path, ec).lexically_normal();
        }
        return out;
    }

    fs::path linkLocation(const fs::path &path)
    {
        fs::path out = path.lexically_normal();
        if (!out.has_filename() && out.has_relative_path())
        {
            out = out.parent_path();
        }
        return out;
    }

    fs::path canonicalLocation(const PathInspector &inspector, const fs::path &path)
    {
        fs::path absolute = path;
        if (absolute.is_relative())
        {
            std::error_code ec;
            absolute = fs::absolute(path, ec);
        }
        absolute = linkLocation(absolute);

        const fs::path name = absolute.filename();
        if (name.empty() || !absolute.has_parent_path() || absolute.parent_path() == absolute)
        {
            return absolute;
        }
        return inspector.canonical(absolute.parent_path()) / name;
    }

} // namespace cloudlink::io
