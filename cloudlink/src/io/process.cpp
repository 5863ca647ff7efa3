#include "io/process.hpp"

#include <chrono>
#include <sstream>
#include <string>
#include <vector>

#include "io/output_cleanup.hpp"

#ifdef _WIN32
#define NOMINMAX
#include <windows.h>
#include <functional>
#include <thread>
#else
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;
#endif

namespace cloudlink::io {
namespace {

#ifdef _WIN32

bool utf8ToWide(const std::string &input, std::wstring &out) {
    out.clear();
    if (input.empty()) {
        return true;
    }

    const int size = MultiByteToWideChar(CP_UTF8, 0, input.c_str(), -1, nullptr, 0);
    if (size <= 0) {
        return false;
    }

    out.resize(static_cast<std::size_t>(size));
    if (MultiByteToWideChar(CP_UTF8, 0, input.c_str(), -1, out.data(), size) <= 0) {
        out.clear();
        return false;
    }
    out.resize(static_cast<std::size_t>(size - 1));
    return true;
}

void drainPipe(HANDLE pipe, std::string &out) {
    char buffer[4096];
    DWORD read = 0;
    while (ReadFile(pipe, buffer, sizeof(buffer), &read, nullptr) && read > 0) {
        out.append(buffer, read);
    }
}

// Inherited environment plus the command's overrides, as a CREATE_UNICODE_ENVIRONMENT block.
std::wstring buildEnvironmentBlock(const Command &command) {
    std::wstring block;
    wchar_t *current = GetEnvironmentStringsW();
    if (current != nullptr) {
        for (const wchar_t *entry = current; *entry != L'\0'; entry += wcslen(entry) + 1) {
            block.append(entry);
            block.push_back(L'\0');
        }
        FreeEnvironmentStringsW(current);
    }
    for (const auto &item : command.env) {
        std::wstring key;
        std::wstring value;
        utf8ToWide(item.first, key);
        utf8ToWide(item.second, value);
        block += key + L"=" + value;
        block.push_back(L'\0');
    }
    block.push_back(L'\0');
    return block;
}

ProcessResult runCommandWindows(const Command &command, int timeoutSeconds, const cloudlink::Context &ctx) {
    ProcessResult result;
    result.commandLine = displayCommand(command);

    std::wstring wideCmdLine;
    if (!utf8ToWide(result.commandLine, wideCmdLine)) {
        ctx.error("Failed to convert command line to wide string");
        return result;
    }

    SECURITY_ATTRIBUTES sa{};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE outRead = nullptr;
    HANDLE outWrite = nullptr;
    HANDLE errRead = nullptr;
    HANDLE errWrite = nullptr;
    if (!CreatePipe(&outRead, &outWrite, &sa, 0) || !CreatePipe(&errRead, &errWrite, &sa, 0)) {
        ctx.error("Failed to create output pipes: Error code ", static_cast<unsigned long>(GetLastError()));
        return result;
    }
    SetHandleInformation(outRead, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(errRead, HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOW si{};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
    si.hStdOutput = outWrite;
    si.hStdError = errWrite;
    PROCESS_INFORMATION pi{};

    std::wstring environment = buildEnvironmentBlock(command);

    BOOL ok = CreateProcessW(
        nullptr,
        wideCmdLine.data(),
        nullptr,
        nullptr,
        TRUE,
        CREATE_NO_WINDOW | CREATE_UNICODE_ENVIRONMENT,
        environment.data(),
        nullptr,
        &si,
        &pi
    );
    CloseHandle(outWrite);
    CloseHandle(errWrite);

    if (!ok) {
        CloseHandle(outRead);
        CloseHandle(errRead);
        ctx.error("Failed to create process: Error code ", static_cast<unsigned long>(GetLastError()));
        return result;
    }

    result.processId = static_cast<long long>(pi.dwProcessId);

    std::thread outReader(drainPipe, outRead, std::ref(result.out));
    std::thread errReader(drainPipe, errRead, std::ref(result.err));

    const DWORD waitMs = timeoutSeconds > 0 ? static_cast<DWORD>(timeoutSeconds) * 1000 : INFINITE;
    if (WaitForSingleObject(pi.hProcess, waitMs) == WAIT_TIMEOUT) {
        result.timedOut = true;
        TerminateProcess(pi.hProcess, 1);
        WaitForSingleObject(pi.hProcess, INFINITE);
    }

    outReader.join();
    errReader.join();

    DWORD exitCode = 0;
    if (GetExitCodeProcess(pi.hProcess, &exitCode)) {
        result.code = static_cast<int>(exitCode);
    } else {
        result.code = -1;
        ctx.error("Failed to get process exit code");
    }

    CloseHandle(outRead);
    CloseHandle(errRead);
    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);
    return result;
}

#else

std::vector<char *> makeArgv(std::vector<std::string> &storage) {
    std::vector<char *> argv;
    argv.reserve(storage.size() + 1);
    for (auto &item : storage) {
        argv.push_back(const_cast<char *>(item.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

// Built before fork(): the child may only call async-signal-safe functions.
std::vector<std::string> makeEnvironment(const Command &command) {
    std::vector<std::string> out;
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string item(*entry);
        bool overridden = false;
        for (const auto &pair : command.env) {
            if (item.compare(0, pair.first.size() + 1, pair.first + "=") == 0) {
                overridden = true;
                break;
            }
        }
        if (!overridden) {
            out.push_back(std::move(item));
        }
    }
    for (const auto &pair : command.env) {
        out.push_back(pair.first + "=" + pair.second);
    }
    return out;
}

void closeFd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

ProcessResult runCommandPosix(const Command &command, int timeoutSeconds, const cloudlink::Context &ctx) {
    ProcessResult result;
    result.commandLine = displayCommand(command);

    std::vector<std::string> storage;
    storage.reserve(command.args.size() + 1);
    storage.push_back(command.program);
    storage.insert(storage.end(), command.args.begin(), command.args.end());
    std::vector<char *> argv = makeArgv(storage);

    std::vector<std::string> envStorage = makeEnvironment(command);
    std::vector<char *> envp = makeArgv(envStorage);

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (pipe(outPipe) != 0) {
        ctx.error("Failed to create stdout pipe: ", std::strerror(errno));
        return result;
    }
    if (pipe(errPipe) != 0) {
        ctx.error("Failed to create stderr pipe: ", std::strerror(errno));
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return result;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        ctx.error("Failed to fork process: ", std::strerror(errno));
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        return result;
    }

    if (pid == 0) {
        const int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        close(outPipe[0]);
        close(outPipe[1]);
        close(errPipe[0]);
        close(errPipe[1]);
        environ = envp.data();
        execvp(command.program.c_str(), argv.data());
        _exit(127);
    }

    result.processId = static_cast<long long>(pid);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    int fds[2] = {outPipe[0], errPipe[0]};
    std::string *sinks[2] = {&result.out, &result.err};
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeoutSeconds);

    while (fds[0] >= 0 || fds[1] >= 0) {
        int waitMs = -1;
        if (timeoutSeconds > 0) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                result.timedOut = true;
                kill(pid, SIGKILL);
                break;
            }
            waitMs = static_cast<int>(left.count());
        }

        pollfd polled[2];
        nfds_t count = 0;
        int owner[2] = {-1, -1};
        for (int i = 0; i < 2; ++i) {
            if (fds[i] >= 0) {
                polled[count].fd = fds[i];
                polled[count].events = POLLIN;
                polled[count].revents = 0;
                owner[count] = i;
                ++count;
            }
        }

        const int ready = poll(polled, count, waitMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            ctx.error("Failed to poll process output: ", std::strerror(errno));
            kill(pid, SIGKILL);
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((polled[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            const int index = owner[i];
            char buffer[4096];
            const ssize_t n = read(fds[index], buffer, sizeof(buffer));
            if (n > 0) {
                sinks[index]->append(buffer, static_cast<std::size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                closeFd(fds[index]);
            }
        }
    }

    closeFd(fds[0]);
    closeFd(fds[1]);

    int status = 0;
    pid_t waited = -1;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) {
        result.code = -1;
        ctx.error("Failed to wait for process: ", std::strerror(errno));
        return result;
    }

    if (WIFEXITED(status)) {
        result.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.code = 128 + WTERMSIG(status);
        if (!result.timedOut) {
            ctx.warn("Process terminated by signal: ", WTERMSIG(status));
        }
    } else {
        result.code = -1;
        ctx.error("Process ended abnormally");
    }
    return result;
}

#endif

} // namespace

std::string shellQuote(const std::string &value) {
#ifdef _WIN32
    if (value.empty()) {
        return "\"\"";
    }

    bool needQuotes = false;
    for (char ch : value) {
        if (ch == ' ' || ch == '\t' || ch == '"' || std::string("&|^<>%()").find(ch) != std::string::npos) {
            needQuotes = true;
            break;
        }
    }
    if (!needQuotes) {
        return value;
    }

    std::string out;
    out.push_back('"');
    std::size_t backslashes = 0;
    for (char ch : value) {
        if (ch == '\\') {
            ++backslashes;
            continue;
        }
        if (ch == '"') {
            out.append(backslashes * 2 + 1, '\\');
            out.push_back('"');
            backslashes = 0;
            continue;
        }
        out.append(backslashes, '\\');
        backslashes = 0;
        out.push_back(ch);
    }
    out.append(backslashes * 2, '\\');
    out.push_back('"');
    return out;
#else
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') {
            out += "'\\''";
        } else {
            out.push_back(ch);
        }
    }
    out.push_back('\'');
    return out;
#endif
}

std::string displayCommand(const Command &command) {
    std::ostringstream cmd;
    cmd << shellQuote(command.program);
    for (const auto &arg : command.args) {
        cmd << ' ' << shellQuote(arg);
    }
    return cmd.str();
}

ProcessResult runCommand(const Command &command, int timeoutSeconds, const cloudlink::Context &ctx) {
    ctx.debug("exec: ", displayCommand(command));

#ifdef _WIN32
    ProcessResult result = runCommandWindows(command, timeoutSeconds, ctx);
#else
    ProcessResult result = runCommandPosix(command, timeoutSeconds, ctx);
#endif

    result.out = cleanCommandOutput(result.out);
    result.err = cleanCommandErrors(result.err);

    if (result.timedOut) {
        result.success = false;
        if (result.err.empty()) {
            result.err = "Command timeout";
        }
        ctx.error("Command timeout after ", timeoutSeconds, " seconds: ", result.commandLine);
        return result;
    }

    result.success = result.code >= 0 && result.code <= command.maxSuccessCode;
    if (!result.success && command.readOnly && !result.out.empty()) {
        result.success = true;
        ctx.debug("Command exited with ", result.code, " but produced output: ", result.commandLine);
    } else if (result.success) {
        ctx.debug("Command succeeded: ", result.commandLine);
    } else {
        ctx.debug("Command failed with return code ", result.code, ": ", result.err);
    }
    return result;
}

ProcessResult ProcessExecutor::execute(const Command &command, int timeoutSeconds) {
    return runCommand(command, timeoutSeconds, ctx_);
}

} // namespace cloudlink::io
