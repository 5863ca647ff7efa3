#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace cloudlink::io {

bool ensureDir(const std::filesystem::path &path);
// Writes and syncs a sibling temporary file, renames it over `path`, then syncs the directory.
bool writeFileAtomic(const std::filesystem::path &path, const std::string &content);
// Relative paths of every entry below `root`, sorted, with directories suffixed by '/'.
std::vector<std::string> listTree(const std::filesystem::path &root);
std::filesystem::path homeDirectory();

} // namespace cloudlink::io
