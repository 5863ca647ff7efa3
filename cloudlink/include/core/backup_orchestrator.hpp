#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "core/context.hpp"
#include "core/errors.hpp"
#include "core/relocation_ops.hpp"
#include "ledger/rollback_ledger.hpp"
#include "model/records.hpp"

namespace cloudlink::core {

enum class BackupState {
    Idle,
    Validating,
    SnapshotWritten,
    Moving,
    Moved,
    Linking,
    Linked,
    Verifying,
    Committed,
    RollingBack,
    RolledBack,
    RollbackFailed,
};

const char *backupStateName(BackupState state);

// Called with a stage label and a completion percentage. May run on the caller's worker thread.
using ProgressCallback = std::function<void(const std::string &stage, int percent)>;

struct BackupOutcome {
    BackupState finalState = BackupState::Idle;
    // What stopped the run. Kind None on success.
    Error error;
    // Set only when the compensating rollback itself failed.
    std::optional<Error> rollbackError;

    bool ok() const { return finalState == BackupState::Committed; }
};

class BackupOrchestrator {
public:
    BackupOrchestrator(ledger::RollbackLedger &ledger, RelocationOps &ops, const cloudlink::Context &ctx);

    // Pure check: nothing on disk changes and no rollback point is written.
    Status validatePaths(const std::filesystem::path &source, const std::filesystem::path &target) const;

    BackupOutcome executeBackup(
        const std::filesystem::path &source,
        const std::filesystem::path &target,
        const ProgressCallback &progress = {}
    );

    // Compensates the pending rollback point, if any. No pending point is a successful no-op.
    Status rollback();
    // Drops the pending rollback point without touching the filesystem.
    Status discardRollbackPoint();

    std::optional<model::RollbackRecord> pendingRecord();

    BackupState state() const { return state_; }

private:
    struct ResolvedPaths {
        std::filesystem::path source;
        std::filesystem::path target;
    };

    ResolvedPaths resolvePaths(const std::filesystem::path &source, const std::filesystem::path &target) const;

    Status moveData(const model::RollbackRecord &record);
    Status createLink(const model::RollbackRecord &record);
    Status verifyLink(const model::RollbackRecord &record) const;

    Status rollbackHoldingLock();
    BackupOutcome failAndCompensate(BackupOutcome outcome, const Status &trigger, const ProgressCallback &progress);

    void enter(BackupState state);
    static void report(const ProgressCallback &progress, const std::string &stage, int percent);

    ledger::RollbackLedger &ledger_;
    RelocationOps &ops_;
    const io::PathInspector &inspector_;
    const cloudlink::Context &ctx_;
    BackupState state_ = BackupState::Idle;
};

} // namespace cloudlink::core
