#include "model/app_config.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <system_error>

#include "io/fs_utils.hpp"
#include "io/json_reader.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace cloudlink::model
{
    namespace
    {

        constexpr const char *kConfigDirName = ".cloudlink";

        std::vector<std::string> splitKey(const std::string &key)
        {
            std::vector<std::string> out;
            std::string token;
            for (char ch : key)
            {
                if (ch == '.')
                {
                    out.push_back(token);
                    token.clear();
                    continue;
                }
                token.push_back(ch);
            }
            out.push_back(token);
            return out;
        }

        std::string lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        // "true" -> bool, "42" -> integer, "[..]"/"{..}" -> JSON, anything else -> string.
        json parseValue(const std::string &value)
        {
            const std::string key = lower(value);
            if (key == "true" || key == "false")
            {
                return key == "true";
            }
            if (!value.empty() && (value.front() == '[' || value.front() == '{'))
            {
                json parsed = json::parse(value, nullptr, false);
                if (!parsed.is_discarded())
                {
                    return parsed;
                }
            }
            const bool numeric = !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c)
                                                               { return std::isdigit(c) != 0; });
            if (numeric && value.size() < 18)
            {
                return std::stoll(value);
            }
            return value;
        }

        template <typename T>
        T sectionValue(const json &data, const char *section, const char *key, T fallback)
        {
            if (!data.contains(section) || !data[section].is_object())
            {
                return fallback;
            }
            const json &node = data[section];
            if (!node.contains(key))
            {
                return fallback;
            }
            try
            {
                return node[key].get<T>();
            }
            catch (const json::exception &)
            {
                return fallback;
            }
        }

    } // namespace

    AppConfig::AppConfig(fs::path file) : file_(std::move(file)), data_(defaults()) {}

    fs::path AppConfig::defaultDirectory()
    {
        return io::homeDirectory() / kConfigDirName;
    }

    fs::path AppConfig::defaultFile()
    {
        return defaultDirectory() / "config.json";
    }

    json AppConfig::defaults()
    {
        return json{
            {"backup", {
                           {"timeout_seconds", 30},
                           {"copy_timeout_seconds", 120},
                           {"copy_retries", 3},
                           {"copy_retry_wait_seconds", 10},
                           {"min_free_space_mb", 100},
                           {"max_path_length", 260},
                       }},
            {"logging", {
                            {"level", "INFO"},
                            {"console_output", true},
                            {"log_to_file", true},
                        }},
            {"paths", {
                          {"last_source", ""},
                          {"last_target", ""},
                          {"cloud_root", ""},
                          {"ledger_file", ""},
                      }},
            {"scan", {
                         {"roots", json::array()},
                         {"depth", 1},
                     }},
            {"ui", {
                       {"remember_paths", true},
                   }},
        };
    }

    bool AppConfig::load(const cloudlink::Context &ctx)
    {
        std::error_code ec;
        if (!fs::exists(file_, ec))
        {
            ctx.debug("Using default configuration");
            return true;
        }

        try
        {
            merge(io::loadJsonFile(file_));
            ctx.debug("Configuration loaded from ", file_.string());
            return true;
        }
        catch (const std::exception &e)
        {
            ctx.warn("Error loading configuration ", file_.string(), ": ", e.what());
            ctx.warn("Using default configuration");
            data_ = defaults();
            return false;
        }
    }

    bool AppConfig::save(const cloudlink::Context &ctx) const
    {
        if (!io::saveJsonFile(file_, data_))
        {
            ctx.error("Error saving configuration to ", file_.string());
            return false;
        }
        ctx.debug("Configuration saved to ", file_.string());
        return true;
    }

    void AppConfig::merge(const json &fileConfig)
    {
        for (auto it = fileConfig.begin(); it != fileConfig.end(); ++it)
        {
            if (data_.contains(it.key()) && data_[it.key()].is_object() && it.value().is_object())
            {
                data_[it.key()].update(it.value());
                continue;
            }
            data_[it.key()] = it.value();
        }
    }

    std::optional<json> AppConfig::get(const std::string &key) const
    {
        const json *node = &data_;
        for (const auto &part : splitKey(key))
        {
            if (!node->is_object() || !node->contains(part))
            {
                return std::nullopt;
            }
            node = &(*node)[part];
        }
        return *node;
    }

    bool AppConfig::set(const std::string &key, const std::string &value)
    {
        const std::vector<std::string> parts = splitKey(key);
        if (parts.size() < 2 || std::any_of(parts.begin(), parts.end(), [](const std::string &p)
                                            { return p.empty(); }))
        {
            return false;
        }

        json *node = &data_;
        for (size_t i = 0; i + 1 < parts.size(); ++i)
        {
            json &child = (*node)[parts[i]];
            if (!child.is_object())
            {
                child = json::object();
            }
            node = &child;
        }
        (*node)[parts.back()] = parseValue(value);
        return true;
    }

    Settings AppConfig::settings() const
    {
        Settings out;
        out.commandTimeoutSeconds = std::max(1, sectionValue<int>(data_, "backup", "timeout_seconds", out.commandTimeoutSeconds));
        out.copyTimeoutSeconds = std::max(1, sectionValue<int>(data_, "backup", "copy_timeout_seconds", out.copyTimeoutSeconds));
        out.copyRetries = std::max(0, sectionValue<int>(data_, "backup", "copy_retries", out.copyRetries));
        out.copyRetryWaitSeconds = std::max(0, sectionValue<int>(data_, "backup", "copy_retry_wait_seconds", out.copyRetryWaitSeconds));

        const std::uint64_t minFreeMb = sectionValue<std::uint64_t>(data_, "backup", "min_free_space_mb", 100);
        out.minFreeSpaceBytes = minFreeMb * 1024 * 1024;
        out.maxPathLength = sectionValue<std::size_t>(data_, "backup", "max_path_length", out.maxPathLength);
        out.scanDepth = std::max(0, sectionValue<int>(data_, "scan", "depth", out.scanDepth));

        for (const auto &root : sectionValue<std::vector<std::string>>(data_, "scan", "roots", {}))
        {
            if (!root.empty())
            {
                out.scanRoots.emplace_back(root);
            }
        }
        if (out.scanRoots.empty())
        {
            out.scanRoots = defaultScanRoots(io::homeDirectory());
        }

        const std::string cloudRoot = sectionValue<std::string>(data_, "paths", "cloud_root", "");
        if (!cloudRoot.empty())
        {
            out.cloudRoot = cloudRoot;
        }
        else if (auto detected = detectCloudRoot(io::homeDirectory()))
        {
            out.cloudRoot = *detected;
        }
        return out;
    }

    fs::path AppConfig::ledgerFile() const
    {
        const std::string configured = sectionValue<std::string>(data_, "paths", "ledger_file", "");
        if (!configured.empty())
        {
            return fs::path(configured);
        }
        return file_.parent_path() / "rollback.json";
    }

    fs::path AppConfig::logDirectory() const
    {
        return file_.parent_path() / "logs";
    }

    std::string AppConfig::logLevel() const
    {
        return sectionValue<std::string>(data_, "logging", "level", "INFO");
    }

    bool AppConfig::consoleOutput() const
    {
        return sectionValue<bool>(data_, "logging", "console_output", true);
    }

    bool AppConfig::logToFile() const
    {
        return sectionValue<bool>(data_, "logging", "log_to_file", true);
    }

    bool AppConfig::rememberPaths() const
    {
        return sectionValue<bool>(data_, "ui", "remember_paths", true);
    }

    std::string AppConfig::lastSource() const
    {
        return sectionValue<std::string>(data_, "paths", "last_source", "");
    }

    std::string AppConfig::lastTarget() const
    {
        return sectionValue<std::string>(data_, "paths", "last_target", "");
    }

    void AppConfig::setLastPaths(const std::string &source, const std::string &target)
    {
        data_["paths"]["last_source"] = source;
        data_["paths"]["last_target"] = target;
    }

    std::optional<fs::path> detectCloudRoot(const fs::path &home)
    {
        static const char *candidates[] = {
            "OneDrive",
            "OneDrive - Personal",
            "OneDrive - Business",
            "OneDrive for Business",
        };

        std::error_code ec;
        for (const char *name : candidates)
        {
            const fs::path path = home / name;
            if (fs::is_directory(path, ec))
            {
                return path;
            }
        }
        return std::nullopt;
    }

    fs::path suggestTargetPath(const fs::path &cloudRoot, const fs::path &source)
    {
        fs::path name = source.filename();
        if (name.empty())
        {
            name = source.parent_path().filename();
        }
        return cloudRoot / "Backup" / name;
    }

    std::vector<fs::path> defaultScanRoots(const fs::path &home)
    {
        return {
            home / "Documents",
            home / "Desktop",
            home / "Downloads",
            home / "Pictures",
            home / "Videos",
            home / "Music",
        };
    }

} // namespace cloudlink::model
