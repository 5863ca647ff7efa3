#pragma once

#include <filesystem>
#include <optional>
#include <vector>

#include "core/context.hpp"
#include "core/errors.hpp"
#include "core/relocation_ops.hpp"
#include "io/process.hpp"
#include "model/records.hpp"

namespace cloudlink::core {

// Read and maintenance path over existing junctions. Never touches the rollback ledger.
class JunctionRegistry {
public:
    JunctionRegistry(io::CommandExecutor &executor, RelocationOps &ops, const cloudlink::Context &ctx);

    // Depth 1 covers the children and grandchildren of every root. Unreadable roots are logged and skipped.
    std::vector<model::JunctionInfo> listJunctions(const std::vector<std::filesystem::path> &roots, int depth = 1);

    // Removes the link only; the data it points at stays where it is.
    Status removeJunction(const std::filesystem::path &path);
    Status verifyJunction(const std::filesystem::path &path) const;
    std::optional<model::JunctionInfo> info(const std::filesystem::path &path) const;

private:
    io::CommandExecutor &executor_;
    RelocationOps &ops_;
    const io::PathInspector &inspector_;
    const cloudlink::Context &ctx_;
};

} // namespace cloudlink::core
