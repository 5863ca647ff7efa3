#pragma once

#include <filesystem>

#include "core/context.hpp"
#include "core/errors.hpp"
#include "io/path_inspector.hpp"
#include "io/process.hpp"
#include "model/app_config.hpp"

namespace cloudlink::core {

// Filesystem steps shared by relocation, compensation and junction maintenance.
// Each step re-checks the outcome through the inspector instead of trusting the exit code alone.
class RelocationOps {
public:
    RelocationOps(
        io::CommandExecutor &executor,
        const io::PathInspector &inspector,
        const cloudlink::Context &ctx,
        const model::Settings &settings
    );

    Status rename(const std::filesystem::path &from, const std::filesystem::path &to);
    // Copies the tree, retrying with a linearly growing wait.
    Status copyTree(const std::filesystem::path &from, const std::filesystem::path &to);
    Status removeTree(const std::filesystem::path &path);
    Status createJunction(const std::filesystem::path &link, const std::filesystem::path &target);
    Status removeJunction(const std::filesystem::path &link);

    const io::PathInspector &inspector() const { return inspector_; }
    const model::Settings &settings() const { return settings_; }

private:
    io::CommandExecutor &executor_;
    const io::PathInspector &inspector_;
    const cloudlink::Context &ctx_;
    model::Settings settings_;
};

} // namespace cloudlink::core
