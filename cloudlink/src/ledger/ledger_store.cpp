#include "ledger/ledger_store.hpp"

#include <fstream>
#include <system_error>

#include "io/fs_utils.hpp"

#ifdef _WIN32
#define NOMINMAX
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;
using nlohmann::json;

namespace cloudlink::ledger
{
    namespace
    {

        fs::path lockPathFor(const fs::path &file)
        {
            fs::path out = file;
            out += ".lock";
            return out;
        }

    } // namespace

    FileLedgerStore::FileLedgerStore(fs::path file) : file_(std::move(file)) {}

    FileLedgerStore::~FileLedgerStore()
    {
        unlock();
    }

    bool FileLedgerStore::write(const json &document)
    {
        return io::writeFileAtomic(file_, document.dump(2) + "\n");
    }

    std::optional<json> FileLedgerStore::read()
    {
        std::error_code ec;
        if (!fs::exists(file_, ec))
        {
            return std::nullopt;
        }

        std::ifstream in(file_);
        if (!in.is_open())
        {
            throw LedgerReadError("Could not open rollback ledger: " + file_.string());
        }

        json data = json::parse(in, nullptr, false);
        if (data.is_discarded() || !data.is_object())
        {
            throw LedgerReadError("Rollback ledger is not a JSON object: " + file_.string());
        }
        return data;
    }

    bool FileLedgerStore::remove()
    {
        std::error_code ec;
        fs::remove(file_, ec);
        return !ec;
    }

    bool FileLedgerStore::exists() const
    {
        std::error_code ec;
        return fs::exists(file_, ec);
    }

    bool FileLedgerStore::tryLock()
    {
        if (file_.has_parent_path() && !io::ensureDir(file_.parent_path()))
        {
            return false;
        }
        const fs::path lockPath = lockPathFor(file_);

#ifdef _WIN32
        if (lockHandle_ != nullptr)
        {
            return false;
        }
        HANDLE handle = CreateFileW(lockPath.wstring().c_str(), GENERIC_READ | GENERIC_WRITE, 0, nullptr, OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (handle == INVALID_HANDLE_VALUE)
        {
            return false;
        }
        lockHandle_ = handle;
        return true;
#else
        if (lockFd_ >= 0)
        {
            return false;
        }
        const int fd = open(lockPath.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
        if (fd < 0)
        {
            return false;
        }
        if (flock(fd, LOCK_EX | LOCK_NB) != 0)
        {
            close(fd);
            return false;
        }
        lockFd_ = fd;
        return true;
#endif
    }

    void FileLedgerStore::unlock()
    {
#ifdef _WIN32
        if (lockHandle_ != nullptr)
        {
            CloseHandle(static_cast<HANDLE>(lockHandle_));
            lockHandle_ = nullptr;
        }
#else
        if (lockFd_ >= 0)
        {
            flock(lockFd_, LOCK_UN);
            close(lockFd_);
            lockFd_ = -1;
        }
#endif
    }

    std::string FileLedgerStore::describe() const
    {
        return file_.string();
    }

    bool MemoryLedgerStore::write(const json &document)
    {
        document_ = document;
        return true;
    }

    std::optional<json> MemoryLedgerStore::read()
    {
        return document_;
    }

    bool MemoryLedgerStore::remove()
    {
        document_.reset();
        return true;
    }

    bool MemoryLedgerStore::exists() const
    {
        return document_.has_value();
    }

    bool MemoryLedgerStore::tryLock()
    {
        if (locked_)
        {
            return false;
        }
        locked_ = true;
        return true;
    }

    void MemoryLedgerStore::unlock()
    {
        locked_ = false;
    }

    std::string MemoryLedgerStore::describe() const
    {
        return "<memory>";
    }

} // namespace cloudlink::ledger
