#include "io/shell_commands.hpp"

#include <cstdlib>
#include <ctime>
#include <utility>

#include "nlohmann/json.hpp"

#include "core/context.hpp"
#include "io/output_cleanup.hpp"
#include "io/path_inspector.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace cloudlink::io
{
    namespace
    {

#ifdef _WIN32
        constexpr const char *kScanRootVariable = "CLOUDLINK_SCAN_ROOT";
        constexpr const char *kScanDepthVariable = "CLOUDLINK_SCAN_DEPTH";

        // Paths reach every script through the environment, never through the script text.
        constexpr const char *kListJunctionsScript =
            "Get-ChildItem -LiteralPath $env:CLOUDLINK_SCAN_ROOT -Recurse -Depth ([int]$env:CLOUDLINK_SCAN_DEPTH) "
            "-Force -ErrorAction SilentlyContinue | Where-Object { $_.LinkType -eq 'Junction' } | "
            "Select-Object FullName, Target, CreationTime | ConvertTo-Json -Depth 3";

        // Directory.Move is a rename and fails across volumes.
        constexpr const char *kMoveScript =
            "$ErrorActionPreference = 'Stop'; [System.IO.Directory]::Move($env:CLOUDLINK_MOVE_FROM, $env:CLOUDLINK_MOVE_TO)";

        // Recursive Directory.Delete removes nested junctions without entering them.
        constexpr const char *kDeleteTreeScript =
            "$ErrorActionPreference = 'Stop'; [System.IO.Directory]::Delete($env:CLOUDLINK_DELETE_TREE, $true)";

        constexpr const char *kCreateJunctionScript =
            "$ErrorActionPreference = 'Stop'; "
            "New-Item -ItemType Junction -Path $env:CLOUDLINK_LINK_PATH -Target $env:CLOUDLINK_LINK_TARGET | Out-Null";

        constexpr const char *kDeleteJunctionScript =
            "$ErrorActionPreference = 'Stop'; [System.IO.Directory]::Delete($env:CLOUDLINK_DELETE_LINK, $false)";

        Command powerShellCommand(const char *script, std::vector<std::pair<std::string, std::string>> env)
        {
            Command command{"powershell", {"-NoProfile", "-NonInteractive", "-EncodedCommand", encodePowerShellCommand(script)}};
            command.env = std::move(env);
            return command;
        }
#endif

        fs::path resolveLinkTarget(const fs::path &link, const std::string &target)
        {
            fs::path out(target);
            if (!out.empty() && out.is_relative())
            {
                out = link.parent_path() / out;
            }
            return out.lexically_normal();
        }

        // "/Date(1700000000000)/" as emitted by ConvertTo-Json for DateTime values.
        std::string parseJsonDate(const std::string &value)
        {
            const auto open = value.find('(');
            const auto close = value.find(')');
            if (open == std::string::npos || close == std::string::npos || close <= open + 1)
            {
                return value;
            }
            const long long millis = std::atoll(value.substr(open + 1, close - open - 1).c_str());
            return cloudlink::formatTimestamp(static_cast<std::time_t>(millis / 1000));
        }

        std::vector<cloudlink::model::JunctionInfo> parseJsonListing(const std::string &output)
        {
            std::vector<cloudlink::model::JunctionInfo> out;
            json data = json::parse(output, nullptr, false);
            if (data.is_discarded())
            {
                return out;
            }
            if (data.is_object())
            {
                data = json::array({data});
            }
            if (!data.is_array())
            {
                return out;
            }

            for (const auto &item : data)
            {
                if (!item.is_object() || !item.contains("FullName") || !item["FullName"].is_string())
                {
                    continue;
                }
                cloudlink::model::JunctionInfo info;
                info.source = fs::path(item["FullName"].get<std::string>());

                const json &target = item.contains("Target") ? item["Target"] : json();
                if (target.is_string())
                {
                    info.target = resolveLinkTarget(info.source, target.get<std::string>());
                }
                else if (target.is_array() && !target.empty() && target[0].is_string())
                {
                    info.target = resolveLinkTarget(info.source, target[0].get<std::string>());
                }

                if (item.contains("CreationTime") && item["CreationTime"].is_string())
                {
                    info.created = parseJsonDate(item["CreationTime"].get<std::string>());
                }
                out.push_back(std::move(info));
            }
            return out;
        }

        // find -printf '%p\0%l\0%T@\0' : path, link text, modification time, NUL separated.
        std::vector<cloudlink::model::JunctionInfo> parseFindListing(const std::string &output)
        {
            std::vector<cloudlink::model::JunctionInfo> out;
            std::vector<std::string> fields;
            std::string current;
            for (char ch : output)
            {
                if (ch == '\0')
                {
                    fields.push_back(current);
                    current.clear();
                    continue;
                }
                current.push_back(ch);
            }
            if (!current.empty())
            {
                fields.push_back(current);
            }

            for (size_t i = 0; i + 2 < fields.size(); i += 3)
            {
                const std::string path = trimCopy(fields[i]);
                if (path.empty())
                {
                    continue;
                }
                cloudlink::model::JunctionInfo info;
                info.source = fs::path(path);
                info.target = resolveLinkTarget(info.source, fields[i + 1]);
                info.created = cloudlink::formatTimestamp(static_cast<std::time_t>(std::atof(fields[i + 2].c_str())));
                out.push_back(std::move(info));
            }
            return out;
        }

    } // namespace

    Command renameCommand(const fs::path &from, const fs::path &to)
    {
#ifdef _WIN32
        return powerShellCommand(kMoveScript, {{"CLOUDLINK_MOVE_FROM", from.string()}, {"CLOUDLINK_MOVE_TO", to.string()}});
#else
        return Command{"mv", {"-T", "--", from.string(), to.string()}};
#endif
    }

    Command copyTreeCommand(const fs::path &from, const fs::path &to)
    {
#ifdef _WIN32
        Command command{"robocopy", {from.string(), to.string(), "/E", "/COPY:DAT", "/R:0", "/W:0", "/MT:8", "/NP", "/NFL", "/NDL"}};
        command.maxSuccessCode = 7;
        return command;
#else
        return Command{"cp", {"-a", "-T", "--", from.string(), to.string()}};
#endif
    }

    Command removeTreeCommand(const fs::path &path)
    {
#ifdef _WIN32
        return powerShellCommand(kDeleteTreeScript, {{"CLOUDLINK_DELETE_TREE", path.string()}});
#else
        return Command{"rm", {"-rf", "--", path.string()}};
#endif
    }

    Command createJunctionCommand(const fs::path &link, const fs::path &target)
    {
#ifdef _WIN32
        return powerShellCommand(kCreateJunctionScript, {{"CLOUDLINK_LINK_PATH", link.string()}, {"CLOUDLINK_LINK_TARGET", target.string()}});
#else
        return Command{"ln", {"-s", "-T", "--", target.string(), link.string()}};
#endif
    }

    Command removeJunctionCommand(const fs::path &link)
    {
        // No trailing separator: the command must act on the link itself, not on what it points at.
        const fs::path location = linkLocation(link);
#ifdef _WIN32
        return powerShellCommand(kDeleteJunctionScript, {{"CLOUDLINK_DELETE_LINK", location.string()}});
#else
        return Command{"rm", {"-f", "--", location.string()}};
#endif
    }

    Command listJunctionsCommand(const fs::path &root, int depth)
    {
        if (depth < 0)
        {
            depth = 0;
        }
#ifdef _WIN32
        Command command = powerShellCommand(kListJunctionsScript, {{kScanRootVariable, root.string()}, {kScanDepthVariable, std::to_string(depth)}});
#else
        Command command{"find", {"-H", root.string(), "-mindepth", "1", "-maxdepth", std::to_string(depth + 1), "-type", "l", "-printf", "%p\\0%l\\0%T@\\0"}};
#endif
        command.readOnly = true;
        return command;
    }

    std::vector<cloudlink::model::JunctionInfo> parseJunctionListing(const std::string &output)
    {
        const std::string text = trimCopy(output);
        if (text.empty())
        {
            return {};
        }
        if (text.front() == '[' || text.front() == '{')
        {
            return parseJsonListing(text);
        }
        return parseFindListing(output);
    }

    std::string base64Encode(const std::string &bytes)
    {
        static const char *alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        std::string out;
        out.reserve((bytes.size() + 2) / 3 * 4);

        size_t i = 0;
        for (; i + 2 < bytes.size(); i += 3)
        {
            const unsigned value = (static_cast<unsigned char>(bytes[i]) << 16) |
                                   (static_cast<unsigned char>(bytes[i + 1]) << 8) |
                                   static_cast<unsigned char>(bytes[i + 2]);
            out.push_back(alphabet[(value >> 18) & 0x3F]);
            out.push_back(alphabet[(value >> 12) & 0x3F]);
            out.push_back(alphabet[(value >> 6) & 0x3F]);
            out.push_back(alphabet[value & 0x3F]);
        }

        const size_t rest = bytes.size() - i;
        if (rest == 1)
        {
            const unsigned value = static_cast<unsigned char>(bytes[i]) << 16;
            out.push_back(alphabet[(value >> 18) & 0x3F]);
            out.push_back(alphabet[(value >> 12) & 0x3F]);
            out += "==";
        }
        else if (rest == 2)
        {
            const unsigned value = (static_cast<unsigned char>(bytes[i]) << 16) |
                                   (static_cast<unsigned char>(bytes[i + 1]) << 8);
            out.push_back(alphabet[(value >> 18) & 0x3F]);
            out.push_back(alphabet[(value >> 12) & 0x3F]);
            out.push_back(alphabet[(value >> 6) & 0x3F]);
            out.push_back('=');
        }
        return out;
    }

    // -EncodedCommand expects base64 of UTF-16LE text; the scripts used here are ASCII.
    std::string encodePowerShellCommand(const std::string &script)
    {
        std::string utf16;
        utf16.reserve(script.size() * 2);
        for (char ch : script)
        {
            utf16.push_back(ch);
            utf16.push_back('\0');
        }
        return base64Encode(utf16);
    }

} // namespace cloudlink::io
