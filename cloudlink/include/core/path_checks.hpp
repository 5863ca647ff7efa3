#pragma once

#include <filesystem>

#include "core/errors.hpp"
#include "io/path_inspector.hpp"
#include "model/app_config.hpp"

namespace cloudlink::core {

// Source must be an existing, listable directory whose canonical path fits the path limit.
Status checkSourcePath(const io::PathInspector &inspector, const model::Settings &settings, const std::filesystem::path &source);

// Target may exist only as a directory. The folder that will receive the data must exist,
// be writable and have the configured free space.
Status checkTargetPath(const io::PathInspector &inspector, const model::Settings &settings, const std::filesystem::path &target);

// Lexical containment of two canonical paths; a path is within itself.
bool isWithin(const std::filesystem::path &path, const std::filesystem::path &root);

} // namespace cloudlink::core
