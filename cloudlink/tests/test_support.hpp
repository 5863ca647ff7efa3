#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "io/path_inspector.hpp"
#include "io/process.hpp"
#include "model/app_config.hpp"

namespace cloudlink::test_support {

std::filesystem::path makeTempRoot(const std::string &prefix);
void cleanupTemp(const std::filesystem::path &root);
void writeFile(const std::filesystem::path &path, const std::string &content);
std::string readFile(const std::filesystem::path &path);

// No retry waits and no free-space floor, so temp directories always qualify.
model::Settings fastSettings();

bool isMoveCommand(const io::Command &command);
bool isCopyCommand(const io::Command &command);
bool isLinkCommand(const io::Command &command);
bool isRemoveTreeCommand(const io::Command &command);

// Runs commands for real unless failIf says otherwise; every command is recorded.
class RecordingExecutor : public io::CommandExecutor {
public:
    explicit RecordingExecutor(const cloudlink::Context &ctx) : ctx_(ctx) {}

    io::ProcessResult execute(const io::Command &command, int timeoutSeconds) override;

    std::size_t count(const std::function<bool(const io::Command &)> &match) const;

    std::function<bool(const io::Command &)> failIf;
    std::function<void(const io::Command &)> beforeRun;
    std::vector<io::Command> calls;

private:
    const cloudlink::Context &ctx_;
};

class TunableInspector : public io::FilesystemInspector {
public:
    bool sameVolume(const std::filesystem::path &a, const std::filesystem::path &b) const override;
    std::optional<std::filesystem::path> junctionTarget(const std::filesystem::path &path) const override;
    bool isReadable(const std::filesystem::path &path) const override;
    bool isWritable(const std::filesystem::path &path) const override;

    std::optional<bool> sameVolumeOverride;
    std::optional<std::filesystem::path> junctionTargetOverride;
    // Paths reported as permission denied.
    std::optional<std::filesystem::path> unreadable;
    std::optional<std::filesystem::path> unwritable;
};

} // namespace cloudlink::test_support
