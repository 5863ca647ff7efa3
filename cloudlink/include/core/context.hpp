#pragma once

#include <filesystem>
#include <ctime>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

namespace cloudlink {

class Context {
public:
    explicit Context(bool verbose = true, bool console = true) : verbose_(verbose), console_(console) {}

    Context(const Context &) = delete;
    Context &operator=(const Context &) = delete;

    // Mirrors every message into `file` (appending). Returns false if it can't be opened.
    bool openLogFile(const std::filesystem::path &file);
    const std::filesystem::path &logFile() const { return logFile_; }

    template <typename... Args>
    void log(const Args &...args) const {
        write(std::cout, "", "INFO", concat(args...));
    }

    template <typename... Args>
    void debug(const Args &...args) const {
        if (!verbose_) {
            writeFileOnly("DEBUG", concat(args...));
            return;
        }
        write(std::cout, "[debug] ", "DEBUG", concat(args...));
    }

    template <typename... Args>
    void warn(const Args &...args) const {
        write(std::cerr, "[warn] ", "WARNING", concat(args...));
    }

    template <typename... Args>
    void error(const Args &...args) const {
        write(std::cerr, "[error] ", "ERROR", concat(args...));
    }

    bool verbose() const { return verbose_; }
    void setVerbose(bool verbose) { verbose_ = verbose; }
    void setConsole(bool console) { console_ = console; }

private:
    template <typename... Args>
    static std::string concat(const Args &...args) {
        std::ostringstream out;
        (out << ... << args);
        return out.str();
    }

    void write(std::ostream &stream, const char *prefix, const char *level, const std::string &message) const;
    void writeFileOnly(const char *level, const std::string &message) const;

    bool verbose_;
    bool console_;
    std::filesystem::path logFile_;
    std::unique_ptr<std::ofstream> file_;
    mutable std::mutex mutex_;
};

std::string timestampNow();
std::string timestampCompact();
std::string formatTimestamp(std::time_t value);

} // namespace cloudlink
