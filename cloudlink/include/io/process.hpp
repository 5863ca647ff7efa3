#pragma once

#include <string>
#include <utility>
#include <vector>

#include "core/context.hpp"

namespace cloudlink::io {

constexpr int kDefaultCommandTimeout = 30;
constexpr int kDefaultCopyTimeout = 120;

// One OS-level command as an argument vector. Nothing here is ever handed to a shell.
struct Command {
    std::string program;
    std::vector<std::string> args;
    std::vector<std::pair<std::string, std::string>> env;
    // Query commands: a non-zero exit is tolerated when the command still printed output.
    bool readOnly = false;
    // Exit codes 0..maxSuccessCode count as success (robocopy reports 1..7 for "copied").
    int maxSuccessCode = 0;
};

struct ProcessResult {
    int code = -1;
    bool success = false;
    bool timedOut = false;
    std::string commandLine;
    std::string out;
    std::string err;
    long long processId = -1;
};

std::string shellQuote(const std::string &value);
std::string displayCommand(const Command &command);

ProcessResult runCommand(const Command &command, int timeoutSeconds, const cloudlink::Context &ctx);

class CommandExecutor {
public:
    virtual ~CommandExecutor() = default;
    virtual ProcessResult execute(const Command &command, int timeoutSeconds) = 0;
};

class ProcessExecutor : public CommandExecutor {
public:
    explicit ProcessExecutor(const cloudlink::Context &ctx) : ctx_(ctx) {}

    ProcessResult execute(const Command &command, int timeoutSeconds) override;

private:
    const cloudlink::Context &ctx_;
};

} // namespace cloudlink::io
