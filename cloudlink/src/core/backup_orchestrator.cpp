#include "core/backup_orchestrator.hpp"

#include "core/path_checks.hpp"
#include "io/fs_utils.hpp"

namespace fs = std::filesystem;

namespace cloudlink::core
{
    namespace
    {

        class StoreLock
        {
        public:
            explicit StoreLock(ledger::LedgerStore &store) : store_(store), held_(store.tryLock()) {}
            ~StoreLock()
            {
                if (held_)
                {
                    store_.unlock();
                }
            }

            StoreLock(const StoreLock &) = delete;
            StoreLock &operator=(const StoreLock &) = delete;

            bool held() const { return held_; }

        private:
            ledger::LedgerStore &store_;
            bool held_;
        };

        Status busy(const ledger::LedgerStore &store)
        {
            return Status::failure(ErrorKind::Busy, "another relocation holds the rollback ledger " + store.describe());
        }

    } // namespace

    const char *backupStateName(BackupState state)
    {
        switch (state)
        {
        case BackupState::Idle:
            return "Idle";
        case BackupState::Validating:
            return "Validating";
        case BackupState::SnapshotWritten:
            return "SnapshotWritten";
        case BackupState::Moving:
            return "Moving";
        case BackupState::Moved:
            return "Moved";
        case BackupState::Linking:
            return "Linking";
        case BackupState::Linked:
            return "Linked";
        case BackupState::Verifying:
            return "Verifying";
        case BackupState::Committed:
            return "Committed";
        case BackupState::RollingBack:
            return "RollingBack";
        case BackupState::RolledBack:
            return "RolledBack";
        case BackupState::RollbackFailed:
            return "RollbackFailed";
        }
        return "Unknown";
    }

    BackupOrchestrator::BackupOrchestrator(ledger::RollbackLedger &ledger, RelocationOps &ops, const cloudlink::Context &ctx)
        : ledger_(ledger), ops_(ops), inspector_(ops.inspector()), ctx_(ctx)
    {
    }

    BackupOrchestrator::ResolvedPaths BackupOrchestrator::resolvePaths(const fs::path &source, const fs::path &target) const
    {
        ResolvedPaths out;
        out.source = io::canonicalLocation(inspector_, source);
        out.target = model::effectiveTarget(out.source, inspector_.canonical(target), inspector_.isDirectory(target));
        return out;
    }

    Status BackupOrchestrator::validatePaths(const fs::path &source, const fs::path &target) const
    {
        const model::Settings &settings = ops_.settings();

        if (!source.empty() && (inspector_.isJunction(source) || inspector_.isJunction(io::canonicalLocation(inspector_, source))))
        {
            return Status::failure(ErrorKind::Validation, "Source path is already a junction link", {source});
        }
        Status status = checkSourcePath(inspector_, settings, source);
        if (!status)
        {
            return status;
        }
        status = checkTargetPath(inspector_, settings, target);
        if (!status)
        {
            return status;
        }

        const ResolvedPaths paths = resolvePaths(source, target);
        const fs::path canonicalSource = inspector_.canonical(source);
        if (paths.target.string().size() > settings.maxPathLength)
        {
            return Status::failure(ErrorKind::Validation, "Final target path is too long", {paths.target});
        }
        if (inspector_.canonical(target) == canonicalSource)
        {
            return Status::failure(ErrorKind::Validation, "Source and target are the same folder", {source, target});
        }
        if (isWithin(paths.target, canonicalSource))
        {
            return Status::failure(ErrorKind::Validation, "Target lies inside the source folder", {source, paths.target});
        }
        if (inspector_.exists(paths.target) || inspector_.isJunction(paths.target))
        {
            return Status::failure(ErrorKind::Validation, "Final target path already exists", {paths.target});
        }

        if (!settings.cloudRoot.empty() && !isWithin(paths.target, inspector_.canonical(settings.cloudRoot)))
        {
            ctx_.warn("Target is outside the cloud folder ", settings.cloudRoot.string(), ": ", paths.target.string());
        }
        return Status::success();
    }

    BackupOutcome BackupOrchestrator::executeBackup(const fs::path &source, const fs::path &target, const ProgressCallback &progress)
    {
        BackupOutcome outcome;
        enter(BackupState::Idle);

        StoreLock lock(ledger_.store());
        if (!lock.held())
        {
            outcome.error = busy(ledger_.store()).error();
            ctx_.error(outcome.error.describe());
            return outcome;
        }
        if (ledger_.hasPendingRecord())
        {
            outcome.error = Status::failure(ErrorKind::Busy, "an unfinished relocation is recorded in " + ledger_.store().describe() + "; run rollback first").error();
            ctx_.error(outcome.error.describe());
            return outcome;
        }

        ctx_.log("Starting backup: ", source.string(), " -> ", target.string());

        enter(BackupState::Validating);
        report(progress, "Validating paths", 10);
        const Status valid = validatePaths(source, target);
        if (!valid)
        {
            ctx_.error("Validation failed: ", valid.error().describe());
            enter(BackupState::Idle);
            outcome.error = valid.error();
            return outcome;
        }

        const ResolvedPaths paths = resolvePaths(source, target);
        if (paths.target != inspector_.canonical(target))
        {
            ctx_.log("Target directory exists, data will be placed in ", paths.target.string());
        }

        model::RollbackRecord record;
        record.source = paths.source;
        record.target = paths.target;
        record.sourceExistedBefore = inspector_.exists(paths.source);
        record.targetExistedBefore = inspector_.exists(paths.target);
        record.sourceWasJunctionBefore = inspector_.isJunction(paths.source);
        if (record.sourceWasJunctionBefore)
        {
            record.originalJunctionTarget = inspector_.junctionTarget(paths.source);
        }
        record.timestamp = timestampNow();

        report(progress, "Preparing rollback point", 20);
        if (!ledger_.snapshot(record))
        {
            enter(BackupState::Idle);
            outcome.error = Status::failure(ErrorKind::Ledger, "could not write rollback point to " + ledger_.store().describe()).error();
            return outcome;
        }
        enter(BackupState::SnapshotWritten);

        enter(BackupState::Moving);
        report(progress, "Moving files", 50);
        Status step = moveData(record);
        if (!step)
        {
            return failAndCompensate(outcome, step, progress);
        }
        enter(BackupState::Moved);

        enter(BackupState::Linking);
        report(progress, "Creating junction", 80);
        step = createLink(record);
        if (!step)
        {
            return failAndCompensate(outcome, step, progress);
        }
        enter(BackupState::Linked);

        enter(BackupState::Verifying);
        report(progress, "Verifying backup", 90);
        step = verifyLink(record);
        if (!step)
        {
            return failAndCompensate(outcome, step, progress);
        }

        if (!ledger_.clear())
        {
            // The relocation is complete; a stale point must not be rolled back later.
            outcome.error = Status::failure(
                                ErrorKind::Ledger,
                                "backup completed but the rollback point could not be cleared; run 'rollback --discard'",
                                {fs::path(ledger_.store().describe())})
                                .error();
            ctx_.warn(outcome.error.describe());
        }
        enter(BackupState::Committed);
        outcome.finalState = state_;
        report(progress, "Backup completed successfully", 100);
        ctx_.log("Backup completed successfully: ", record.source.string(), " -> ", record.target.string());
        return outcome;
    }

    Status BackupOrchestrator::moveData(const model::RollbackRecord &record)
    {
        const fs::path &from = record.source;
        const fs::path &to = record.target;

        const fs::path parent = to.parent_path();
        if (!parent.empty() && !inspector_.exists(parent))
        {
            ctx_.log("Creating parent directory: ", parent.string());
            if (!io::ensureDir(parent))
            {
                return Status::failure(ErrorKind::Move, "could not create target parent directory", {parent});
            }
        }

        bool renamed = false;
        if (inspector_.sameVolume(from, parent))
        {
            const Status status = ops_.rename(from, to);
            if (status)
            {
                renamed = true;
            }
            else
            {
                ctx_.warn("Standard move failed, copying instead: ", status.message());
            }
        }
        else
        {
            ctx_.log("Source and target are on different volumes, copying");
        }

        if (renamed)
        {
            if (!ledger_.update(true, std::nullopt))
            {
                return Status::failure(ErrorKind::Ledger, "could not record the completed move", {from, to});
            }
        }
        else
        {
            const Status copied = ops_.copyTree(from, to);
            if (!copied)
            {
                return copied;
            }
            if (!ledger_.update(true, std::nullopt))
            {
                return Status::failure(ErrorKind::Ledger, "could not record the completed copy", {from, to});
            }
            const Status removed = ops_.removeTree(from);
            if (!removed)
            {
                ctx_.warn("Could not remove source after copy: ", removed.message());
            }
        }

        if (!inspector_.exists(to))
        {
            return Status::failure(ErrorKind::Move, "move completed but target does not exist", {to});
        }
        if (inspector_.exists(from) || inspector_.isJunction(from))
        {
            ctx_.warn("Source still exists after move, deleting it: ", from.string());
            const Status removed = ops_.removeTree(from);
            if (!removed)
            {
                return Status::failure(ErrorKind::Move, "move completed but source still exists", {from});
            }
        }

        ctx_.log("Moved ", from.string(), " -> ", to.string());
        return Status::success();
    }

    Status BackupOrchestrator::createLink(const model::RollbackRecord &record)
    {
        const Status linked = ops_.createJunction(record.source, record.target);
        if (!linked)
        {
            return linked;
        }
        if (!ledger_.update(std::nullopt, true))
        {
            return Status::failure(ErrorKind::Ledger, "could not record the created junction", {record.source});
        }
        ctx_.log("Junction created: ", record.source.string(), " -> ", record.target.string());
        return Status::success();
    }

    Status BackupOrchestrator::verifyLink(const model::RollbackRecord &record) const
    {
        if (!inspector_.isJunction(record.source))
        {
            return Status::failure(ErrorKind::Verification, "source is not a junction", {record.source});
        }
        if (!inspector_.exists(record.target))
        {
            return Status::failure(ErrorKind::Verification, "target does not exist", {record.target});
        }

        const auto linked = inspector_.junctionTarget(record.source);
        if (!linked.has_value())
        {
            return Status::failure(ErrorKind::Verification, "junction target could not be resolved", {record.source});
        }
        const fs::path actual = inspector_.canonical(*linked);
        const fs::path expected = inspector_.canonical(record.target);
        if (actual != expected)
        {
            return Status::failure(ErrorKind::Verification, "junction points to an unexpected location", {record.source, actual, expected});
        }
        return Status::success();
    }

    BackupOutcome BackupOrchestrator::failAndCompensate(BackupOutcome outcome, const Status &trigger, const ProgressCallback &progress)
    {
        ctx_.error("Backup failed in ", backupStateName(state_), ": ", trigger.error().describe());
        outcome.error = trigger.error();

        enter(BackupState::RollingBack);
        report(progress, "Rolling back", 30);
        const Status rolled = rollbackHoldingLock();
        if (rolled)
        {
            enter(BackupState::RolledBack);
        }
        else
        {
            enter(BackupState::RollbackFailed);
            outcome.rollbackError = rolled.error();
        }
        outcome.finalState = state_;
        return outcome;
    }

    Status BackupOrchestrator::rollbackHoldingLock()
    {
        const auto record = ledger_.load();
        if (!record.has_value())
        {
            if (ledger_.lastLoadFailed())
            {
                return Status::failure(ErrorKind::Ledger, "rollback point is unreadable", {fs::path(ledger_.store().describe())});
            }
            ctx_.log("No rollback point found, nothing to roll back");
            return Status::success();
        }

        const Status result = ledger::compensate(*record, ops_, ctx_);
        if (!result)
        {
            ctx_.error("Rollback point kept at ", ledger_.store().describe(), " for a manual retry");
            return result;
        }
        if (!ledger_.clear())
        {
            return Status::failure(ErrorKind::Ledger, "rollback completed but the rollback point could not be cleared", {fs::path(ledger_.store().describe())});
        }
        return result;
    }

    Status BackupOrchestrator::rollback()
    {
        StoreLock lock(ledger_.store());
        if (!lock.held())
        {
            return busy(ledger_.store());
        }
        if (!ledger_.hasPendingRecord())
        {
            ctx_.log("No rollback point found, nothing to roll back");
            return Status::success();
        }

        enter(BackupState::RollingBack);
        const Status result = rollbackHoldingLock();
        enter(result ? BackupState::RolledBack : BackupState::RollbackFailed);
        return result;
    }

    Status BackupOrchestrator::discardRollbackPoint()
    {
        StoreLock lock(ledger_.store());
        if (!lock.held())
        {
            return busy(ledger_.store());
        }
        if (!ledger_.clear())
        {
            return Status::failure(ErrorKind::Ledger, "could not remove rollback point", {fs::path(ledger_.store().describe())});
        }
        ctx_.log("Rollback point discarded");
        return Status::success();
    }

    std::optional<model::RollbackRecord> BackupOrchestrator::pendingRecord()
    {
        return ledger_.load();
    }

    void BackupOrchestrator::enter(BackupState state)
    {
        state_ = state;
        ctx_.debug("State: ", backupStateName(state));
    }

    void BackupOrchestrator::report(const ProgressCallback &progress, const std::string &stage, int percent)
    {
        if (progress)
        {
            progress(stage, percent);
        }
    }

} // namespace cloudlink::core
