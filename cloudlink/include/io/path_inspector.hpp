#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

namespace cloudlink::io {

class PathInspector {
public:
    virtual ~PathInspector() = default;

    // Follows links: a junction to a live directory exists and is a directory.
    virtual bool exists(const std::filesystem::path &path) const = 0;
    virtual bool isDirectory(const std::filesystem::path &path) const = 0;
    // Directory reparse point (junction) on Windows, symlink to a directory elsewhere.
    virtual bool isJunction(const std::filesystem::path &path) const = 0;
    virtual std::optional<std::filesystem::path> junctionTarget(const std::filesystem::path &path) const = 0;
    virtual std::uint64_t freeSpaceBytes(const std::filesystem::path &directory) const = 0;

    virtual bool isReadable(const std::filesystem::path &path) const = 0;
    virtual bool isWritable(const std::filesystem::path &path) const = 0;
    virtual bool sameVolume(const std::filesystem::path &a, const std::filesystem::path &b) const = 0;

    // Absolute, link-free form; falls back to a lexical absolute path when resolution fails.
    virtual std::filesystem::path canonical(const std::filesystem::path &path) const = 0;
};

class FilesystemInspector : public PathInspector {
public:
    bool exists(const std::filesystem::path &path) const override;
    bool isDirectory(const std::filesystem::path &path) const override;
    bool isJunction(const std::filesystem::path &path) const override;
    std::optional<std::filesystem::path> junctionTarget(const std::filesystem::path &path) const override;
    std::uint64_t freeSpaceBytes(const std::filesystem::path &directory) const override;
    bool isReadable(const std::filesystem::path &path) const override;
    bool isWritable(const std::filesystem::path &path) const override;
    bool sameVolume(const std::filesystem::path &a, const std::filesystem::path &b) const override;
    std::filesystem::path canonical(const std::filesystem::path &path) const override;
};

// Drops trailing separators so the final component names the link itself rather than its target.
std::filesystem::path linkLocation(const std::filesystem::path &path);

// Canonical parent joined with the unresolved final component, so a link at `path` is not followed.
std::filesystem::path canonicalLocation(const PathInspector &inspector, const std::filesystem::path &path);

} // namespace cloudlink::io
