#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "nlohmann/json.hpp"

namespace cloudlink::model {

struct Settings {
    int commandTimeoutSeconds = 30;
    int copyTimeoutSeconds = 120;
    int copyRetries = 3;
    int copyRetryWaitSeconds = 10;
    std::uint64_t minFreeSpaceBytes = 100ULL * 1024 * 1024;
    std::size_t maxPathLength = 260;
    int scanDepth = 1;
    std::vector<std::filesystem::path> scanRoots;
    std::filesystem::path cloudRoot;
};

class AppConfig {
public:
    explicit AppConfig(std::filesystem::path file = defaultFile());

    static std::filesystem::path defaultDirectory();
    static std::filesystem::path defaultFile();
    static nlohmann::json defaults();

    // Missing file keeps the defaults. Returns false only for an unreadable or malformed file.
    bool load(const cloudlink::Context &ctx);
    bool save(const cloudlink::Context &ctx) const;

    const std::filesystem::path &file() const { return file_; }
    const nlohmann::json &data() const { return data_; }

    // Dotted keys: "backup.min_free_space_mb".
    std::optional<nlohmann::json> get(const std::string &key) const;
    bool set(const std::string &key, const std::string &value);

    Settings settings() const;
    std::filesystem::path ledgerFile() const;
    std::filesystem::path logDirectory() const;
    std::string logLevel() const;
    bool consoleOutput() const;
    bool logToFile() const;
    bool rememberPaths() const;

    std::string lastSource() const;
    std::string lastTarget() const;
    void setLastPaths(const std::string &source, const std::string &target);

private:
    void merge(const nlohmann::json &fileConfig);

    std::filesystem::path file_;
    nlohmann::json data_;
};

std::optional<std::filesystem::path> detectCloudRoot(const std::filesystem::path &home);
std::filesystem::path suggestTargetPath(const std::filesystem::path &cloudRoot, const std::filesystem::path &source);
std::vector<std::filesystem::path> defaultScanRoots(const std::filesystem::path &home);

} // namespace cloudlink::model
