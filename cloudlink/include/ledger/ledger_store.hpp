#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include "nlohmann/json.hpp"

namespace cloudlink::ledger {

class LedgerReadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Single-slot durable storage for the rollback document.
class LedgerStore {
public:
    virtual ~LedgerStore() = default;

    virtual bool write(const nlohmann::json &document) = 0;
    // nullopt when the slot is empty; throws LedgerReadError when it holds something unreadable.
    virtual std::optional<nlohmann::json> read() = 0;
    virtual bool remove() = 0;
    virtual bool exists() const = 0;

    // Exclusive ownership of the slot for one relocation attempt.
    virtual bool tryLock() = 0;
    virtual void unlock() = 0;

    virtual std::string describe() const = 0;
};

class FileLedgerStore : public LedgerStore {
public:
    explicit FileLedgerStore(std::filesystem::path file);
    ~FileLedgerStore() override;

    FileLedgerStore(const FileLedgerStore &) = delete;
    FileLedgerStore &operator=(const FileLedgerStore &) = delete;

    bool write(const nlohmann::json &document) override;
    std::optional<nlohmann::json> read() override;
    bool remove() override;
    bool exists() const override;
    bool tryLock() override;
    void unlock() override;
    std::string describe() const override;

    const std::filesystem::path &file() const { return file_; }

private:
    std::filesystem::path file_;
#ifdef _WIN32
    void *lockHandle_ = nullptr;
#else
    int lockFd_ = -1;
#endif
};

class MemoryLedgerStore : public LedgerStore {
public:
    bool write(const nlohmann::json &document) override;
    std::optional<nlohmann::json> read() override;
    bool remove() override;
    bool exists() const override;
    bool tryLock() override;
    void unlock() override;
    std::string describe() const override;

private:
    std::optional<nlohmann::json> document_;
    bool locked_ = false;
};

} // namespace cloudlink::ledger
