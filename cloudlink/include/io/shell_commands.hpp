#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "io/process.hpp"
#include "model/records.hpp"

namespace cloudlink::io {

// Platform argument vectors for every filesystem command the tool issues.

Command renameCommand(const std::filesystem::path &from, const std::filesystem::path &to);
Command copyTreeCommand(const std::filesystem::path &from, const std::filesystem::path &to);
Command removeTreeCommand(const std::filesystem::path &path);
Command createJunctionCommand(const std::filesystem::path &link, const std::filesystem::path &target);
Command removeJunctionCommand(const std::filesystem::path &link);
Command listJunctionsCommand(const std::filesystem::path &root, int depth);

// Parses the output of listJunctionsCommand. Relative link targets are resolved against the link's folder.
std::vector<cloudlink::model::JunctionInfo> parseJunctionListing(const std::string &output);

std::string base64Encode(const std::string &bytes);
std::string encodePowerShellCommand(const std::string &script);

} // namespace cloudlink::io
