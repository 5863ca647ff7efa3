#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace cloudlink {

enum class ErrorKind {
    None,
    Validation,
    Ledger,
    Busy,
    Move,
    Link,
    Verification,
    Rollback,
    NotFound,
    NotJunction,
    Command,
};

const char *errorKindName(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    std::vector<std::filesystem::path> paths;

    // "<Kind> error: <message> [path, path]"
    std::string describe() const;
};

class Status {
public:
    Status() = default;

    static Status success() { return Status(); }
    static Status failure(ErrorKind kind, std::string message, std::vector<std::filesystem::path> paths = {});

    bool ok() const { return error_.kind == ErrorKind::None; }
    explicit operator bool() const { return ok(); }

    ErrorKind kind() const { return error_.kind; }
    const std::string &message() const { return error_.message; }
    const Error &error() const { return error_; }

private:
    explicit Status(Error error) : error_(std::move(error)) {}

    Error error_;
};

} // namespace cloudlink
