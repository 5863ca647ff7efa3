#include "io/fs_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <system_error>

#ifdef _WIN32
#define NOMINMAX
#include <windows.h>
#include <fcntl.h>
#include <io.h>
#include <sys/stat.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace cloudlink::io
{
    namespace
    {

#ifdef _WIN32
        int openForWrite(const fs::path &path)
        {
            return _wopen(path.wstring().c_str(), _O_CREAT | _O_WRONLY | _O_TRUNC | _O_BINARY, _S_IREAD | _S_IWRITE);
        }

        long writeSome(int fd, const char *data, std::size_t size)
        {
            return _write(fd, data, static_cast<unsigned int>(size));
        }

        int syncFile(int fd) { return _commit(fd); }
        int closeFile(int fd) { return _close(fd); }

        // MOVEFILE_WRITE_THROUGH returns only once the rename is on disk.
        bool replaceFile(const fs::path &from, const fs::path &to)
        {
            return MoveFileExW(from.wstring().c_str(), to.wstring().c_str(), MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH) != 0;
        }

        bool syncDirectory(const fs::path &) { return true; }
#else
        int openForWrite(const fs::path &path)
        {
            return open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0600);
        }

        long writeSome(int fd, const char *data, std::size_t size)
        {
            return static_cast<long>(write(fd, data, size));
        }

        int syncFile(int fd) { return fsync(fd); }
        int closeFile(int fd) { return close(fd); }

        bool replaceFile(const fs::path &from, const fs::path &to)
        {
            return rename(from.c_str(), to.c_str()) == 0;
        }

        bool syncDirectory(const fs::path &directory)
        {
            const fs::path target = directory.empty() ? fs::path(".") : directory;
            const int fd = open(target.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
            if (fd < 0)
            {
                return false;
            }
            const bool synced = fsync(fd) == 0;
            close(fd);
            return synced;
        }
#endif

        bool writeAll(int fd, const std::string &content)
        {
            std::size_t written = 0;
            while (written < content.size())
            {
                const long chunk = writeSome(fd, content.data() + written, content.size() - written);
                if (chunk < 0 && errno == EINTR)
                {
                    continue;
                }
                if (chunk <= 0)
                {
                    return false;
                }
                written += static_cast<std::size_t>(chunk);
            }
            return true;
        }

    } // namespace

    bool ensureDir(const fs::path &path)
    {
        std::error_code ec;
        if (fs::exists(path, ec))
        {
            return fs::is_directory(path, ec);
        }
        return fs::create_directories(path, ec) && !ec;
    }

    bool writeFileAtomic(const fs::path &path, const std::string &content)
    {
        if (path.has_parent_path() && !ensureDir(path.parent_path()))
        {
            return false;
        }

        fs::path temp = path;
        temp += ".tmp";
        const int fd = openForWrite(temp);
        if (fd < 0)
        {
            return false;
        }
        const bool stored = writeAll(fd, content) && syncFile(fd) == 0;
        const bool closed = closeFile(fd) == 0;

        std::error_code ec;
        if (!stored || !closed || !replaceFile(temp, path))
        {
            fs::remove(temp, ec);
            return false;
        }
        return syncDirectory(path.parent_path());
    }

    std::vector<std::string> listTree(const fs::path &root)
    {
        std::vector<std::string> out;
        std::error_code ec;
        if (!fs::exists(root, ec))
        {
            return out;
        }

        for (auto it = fs::recursive_directory_iterator(root, ec); !ec && it != fs::recursive_directory_iterator(); it.increment(ec))
        {
            std::string rel = fs::relative(it->path(), root, ec).generic_string();
            if (ec)
            {
                break;
            }
            if (it->is_directory(ec) && !it->is_symlink(ec))
            {
                rel += "/";
            }
            out.push_back(rel);
        }

        std::sort(out.begin(), out.end());
        return out;
    }

    fs::path homeDirectory()
    {
#ifdef _WIN32
        const char *home = std::getenv("USERPROFILE");
#else
        const char *home = std::getenv("HOME");
#endif
        if (home != nullptr && *home != '\0')
        {
            return fs::path(home);
        }
        std::error_code ec;
        return fs::current_path(ec);
    }

} // namespace cloudlink::io
