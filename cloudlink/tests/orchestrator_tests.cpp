#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "core/backup_orchestrator.hpp"
#include "io/fs_utils.hpp"
#include "ledger/ledger_store.hpp"
#include "ledger/rollback_ledger.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;
using namespace cloudlink;
using namespace cloudlink::test_support;

namespace
{

    struct Harness
    {
        explicit Harness(std::unique_ptr<ledger::LedgerStore> ledgerStore = std::make_unique<ledger::MemoryLedgerStore>())
            : store(std::move(ledgerStore))
        {
        }

        Context ctx{false};
        model::Settings settings = fastSettings();
        RecordingExecutor executor{ctx};
        TunableInspector inspector;
        core::RelocationOps ops{executor, inspector, ctx, settings};
        std::unique_ptr<ledger::LedgerStore> store;
        ledger::RollbackLedger rollbackLedger{*store, ctx};
        core::BackupOrchestrator orchestrator{rollbackLedger, ops, ctx};
    };

    struct Workspace
    {
        Workspace()
        {
            root = makeTempRoot("cloudlink_backup");
            source = root / "proj";
            cloud = root / "onedrive";
            writeFile(source / "readme.txt", "hello");
            writeFile(source / "src" / "main.cpp", "int main() {}");
            fs::create_directories(source / "empty");
            fs::create_directories(cloud);
            originalTree = io::listTree(source);
        }

        ~Workspace()
        {
            cleanupTemp(root);
        }

        void expectSourceUntouched() const
        {
            EXPECT_FALSE(fs::is_symlink(fs::symlink_status(source)));
            EXPECT_TRUE(fs::is_directory(source));
            EXPECT_EQ(io::listTree(source), originalTree);
            EXPECT_EQ(readFile(source / "readme.txt"), "hello");
        }

        fs::path root;
        fs::path source;
        fs::path cloud;
        std::vector<std::string> originalTree;
    };

    // Memory store whose n-th write fails.
    class FlakyStore : public ledger::MemoryLedgerStore
    {
    public:
        explicit FlakyStore(int failingWrite) : failingWrite_(failingWrite) {}

        bool write(const nlohmann::json &document) override
        {
            if (++writes_ == failingWrite_)
            {
                return false;
            }
            return MemoryLedgerStore::write(document);
        }

    private:
        int failingWrite_;
        int writes_ = 0;
    };

} // namespace

TEST(BackupOrchestrator, RelocatesFolderAndLeavesJunction)
{
    Workspace ws;
    Harness h;
    const fs::path target = ws.cloud / "backup";

    std::vector<int> percents;
    const auto outcome = h.orchestrator.executeBackup(ws.source, target, [&](const std::string &, int percent)
                                                      { percents.push_back(percent); });

    ASSERT_TRUE(outcome.ok()) << outcome.error.describe();
    EXPECT_EQ(outcome.finalState, core::BackupState::Committed);
    EXPECT_EQ(h.orchestrator.state(), core::BackupState::Committed);
    EXPECT_TRUE(h.inspector.isJunction(ws.source));
    EXPECT_EQ(fs::canonical(ws.source), fs::canonical(target));
    EXPECT_EQ(io::listTree(target), ws.originalTree);
    EXPECT_FALSE(h.store->exists());
    EXPECT_EQ(percents, (std::vector<int>{10, 20, 50, 80, 90, 100}));
}

TEST(BackupOrchestrator, NestsIntoExistingTargetDirectory)
{
    Workspace ws;
    Harness h;
    const fs::path target = ws.cloud / "backup";
    writeFile(target / "unrelated.txt", "keep me");

    const auto outcome = h.orchestrator.executeBackup(ws.source, target);

    ASSERT_TRUE(outcome.ok()) << outcome.error.describe();
    EXPECT_EQ(fs::canonical(ws.source), fs::canonical(target / "proj"));
    EXPECT_EQ(io::listTree(target / "proj"), ws.originalTree);
    EXPECT_EQ(readFile(target / "unrelated.txt"), "keep me");
}

TEST(BackupOrchestrator, MoveFailureRollsBackToOriginalFolder)
{
    Workspace ws;
    Harness h;
    h.executor.failIf = [](const io::Command &command)
    {
        return isMoveCommand(command) || isCopyCommand(command);
    };
    const fs::path target = ws.cloud / "backup";

    const auto outcome = h.orchestrator.executeBackup(ws.source, target);

    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.finalState, core::BackupState::RolledBack);
    EXPECT_EQ(outcome.error.kind, ErrorKind::Move);
    EXPECT_FALSE(outcome.rollbackError.has_value());
    ws.expectSourceUntouched();
    EXPECT_FALSE(fs::exists(target));
    EXPECT_FALSE(h.store->exists());
    EXPECT_EQ(h.executor.count(isCopyCommand), 2u);
}

TEST(BackupOrchestrator, RejectsSourceThatIsAlreadyJunction)
{
    Workspace ws;
    Harness h;
    const fs::path link = ws.root / "linked";
    fs::create_directory_symlink(ws.source, link);

    const Status status = h.orchestrator.validatePaths(link, ws.cloud / "backup");
    EXPECT_EQ(status.kind(), ErrorKind::Validation);

    const auto outcome = h.orchestrator.executeBackup(link, ws.cloud / "backup");
    EXPECT_EQ(outcome.error.kind, ErrorKind::Validation);
    EXPECT_EQ(outcome.finalState, core::BackupState::Idle);
    EXPECT_FALSE(h.store->exists());
    EXPECT_TRUE(h.executor.calls.empty());
    EXPECT_TRUE(fs::is_symlink(fs::symlink_status(link)));
    ws.expectSourceUntouched();
}

TEST(BackupOrchestrator, RejectsJunctionSourceGivenWithTrailingSeparator)
{
    Workspace ws;
    Harness h;
    const fs::path link = ws.root / "linked";
    fs::create_directory_symlink(ws.source, link);
    const fs::path given = link / "";
    const fs::path target = ws.cloud / "backup";

    EXPECT_EQ(h.orchestrator.validatePaths(given, target).kind(), ErrorKind::Validation);

    const auto outcome = h.orchestrator.executeBackup(given, target);
    EXPECT_EQ(outcome.error.kind, ErrorKind::Validation);
    EXPECT_EQ(outcome.finalState, core::BackupState::Idle);
    EXPECT_TRUE(h.executor.calls.empty());
    EXPECT_TRUE(fs::is_symlink(fs::symlink_status(link)));
    EXPECT_FALSE(fs::exists(fs::symlink_status(target)));
    ws.expectSourceUntouched();
}

TEST(BackupOrchestrator, FailedLedgerUpdateAfterMoveRollsBack)
{
    Workspace ws;
    Harness h(std::make_unique<FlakyStore>(2));
    const fs::path target = ws.cloud / "backup";

    const auto outcome = h.orchestrator.executeBackup(ws.source, target);

    EXPECT_EQ(outcome.finalState, core::BackupState::RolledBack);
    EXPECT_EQ(outcome.error.kind, ErrorKind::Ledger);
    EXPECT_NE(outcome.error.message.find("could not record the completed move"), std::string::npos);
    EXPECT_FALSE(outcome.rollbackError.has_value());
    EXPECT_EQ(h.executor.count(isLinkCommand), 0u);
    ws.expectSourceUntouched();
    EXPECT_FALSE(fs::exists(target));
    EXPECT_FALSE(h.store->exists());
}

TEST(BackupOrchestrator, LinkFailureMovesDataBack)
{
    Workspace ws;
    Harness h;
    h.executor.failIf = isLinkCommand;
    const fs::path target = ws.cloud / "backup";

    const auto outcome = h.orchestrator.executeBackup(ws.source, target);

    EXPECT_EQ(outcome.finalState, core::BackupState::RolledBack);
    EXPECT_EQ(outcome.error.kind, ErrorKind::Link);
    ws.expectSourceUntouched();
    EXPECT_FALSE(fs::exists(target));
    EXPECT_FALSE(h.store->exists());
}

TEST(BackupOrchestrator, VerificationMismatchRollsBack)
{
    Workspace ws;
    Harness h;
    h.inspector.junctionTargetOverride = ws.root / "somewhere_else";
    const fs::path target = ws.cloud / "backup";

    const auto outcome = h.orchestrator.executeBackup(ws.source, target);

    EXPECT_EQ(outcome.finalState, core::BackupState::RolledBack);
    EXPECT_EQ(outcome.error.kind, ErrorKind::Verification);
    ws.expectSourceUntouched();
    EXPECT_FALSE(fs::exists(target));
}

TEST(BackupOrchestrator, CopyFallbackRecordsBackupBeforeDeletingSource)
{
    Workspace ws;
    Harness h;
    h.inspector.sameVolumeOverride = false;
    const fs::path target = ws.cloud / "backup";

    bool recordedBeforeDelete = false;
    h.executor.beforeRun = [&](const io::Command &command)
    {
        if (isRemoveTreeCommand(command) && !recordedBeforeDelete)
        {
            const auto document = h.store->read();
            recordedBeforeDelete = document.has_value() && document->value("backup_created", false);
        }
    };

    const auto outcome = h.orchestrator.executeBackup(ws.source, target);

    ASSERT_TRUE(outcome.ok()) << outcome.error.describe();
    EXPECT_TRUE(recordedBeforeDelete);
    EXPECT_EQ(h.executor.count(isMoveCommand), 0u);
    EXPECT_EQ(h.executor.count(isCopyCommand), 1u);
    EXPECT_EQ(io::listTree(target), ws.originalTree);
}

TEST(BackupOrchestrator, FailedRollbackIsReportedSeparately)
{
    Workspace ws;
    Harness h;
    int moves = 0;
    h.executor.failIf = [&](const io::Command &command)
    {
        if (isMoveCommand(command))
        {
            return ++moves > 1;
        }
        return isLinkCommand(command) || isCopyCommand(command);
    };
    const fs::path target = ws.cloud / "backup";

    const auto outcome = h.orchestrator.executeBackup(ws.source, target);

    EXPECT_EQ(outcome.finalState, core::BackupState::RollbackFailed);
    EXPECT_EQ(outcome.error.kind, ErrorKind::Link);
    ASSERT_TRUE(outcome.rollbackError.has_value());
    EXPECT_EQ(outcome.rollbackError->kind, ErrorKind::Rollback);
    EXPECT_TRUE(h.store->exists());
    EXPECT_TRUE(fs::exists(target / "readme.txt"));

    // The kept record lets a later manual rollback finish the job.
    h.executor.failIf = nullptr;
    const Status retry = h.orchestrator.rollback();
    EXPECT_TRUE(retry.ok()) << retry.error().describe();
    ws.expectSourceUntouched();
    EXPECT_FALSE(h.store->exists());
}

TEST(BackupOrchestrator, RollbackAfterCrashUsesDurableRecord)
{
    Workspace ws;
    const fs::path ledgerFile = ws.root / "state" / "rollback.json";
    const fs::path target = ws.cloud / "backup";

    {
        Context ctx(false);
        ledger::FileLedgerStore store(ledgerFile);
        ledger::RollbackLedger crashed(store, ctx);
        model::RollbackRecord record;
        record.source = ws.source;
        record.target = target;
        record.sourceExistedBefore = true;
        record.timestamp = timestampNow();
        ASSERT_TRUE(crashed.snapshot(record));
        fs::rename(ws.source, target);
        ASSERT_TRUE(crashed.update(true, std::nullopt));
        fs::create_directory_symlink(target, ws.source);
        ASSERT_TRUE(crashed.update(std::nullopt, true));
    }

    Harness h(std::make_unique<ledger::FileLedgerStore>(ledgerFile));
    const Status status = h.orchestrator.rollback();

    EXPECT_TRUE(status.ok()) << status.error().describe();
    EXPECT_EQ(h.orchestrator.state(), core::BackupState::RolledBack);
    ws.expectSourceUntouched();
    EXPECT_FALSE(fs::exists(target));
    EXPECT_FALSE(fs::exists(ledgerFile));
}

TEST(BackupOrchestrator, RollbackAfterCrashDuringCopyDiscardsPartialCopy)
{
    Workspace ws;
    const fs::path ledgerFile = ws.root / "rollback.json";
    const fs::path target = ws.cloud / "backup";

    {
        Context ctx(false);
        ledger::FileLedgerStore store(ledgerFile);
        ledger::RollbackLedger crashed(store, ctx);
        model::RollbackRecord record;
        record.source = ws.source;
        record.target = target;
        record.sourceExistedBefore = true;
        ASSERT_TRUE(crashed.snapshot(record));
        writeFile(target / "readme.txt", "hel");
    }

    Harness h(std::make_unique<ledger::FileLedgerStore>(ledgerFile));
    EXPECT_TRUE(h.orchestrator.rollback().ok());
    ws.expectSourceUntouched();
    EXPECT_FALSE(fs::exists(target));
}

TEST(BackupOrchestrator, RollbackWithoutRecordIsNoOp)
{
    Harness h;
    const Status first = h.orchestrator.rollback();
    const Status second = h.orchestrator.rollback();

    EXPECT_TRUE(first.ok());
    EXPECT_TRUE(second.ok());
    EXPECT_EQ(h.orchestrator.state(), core::BackupState::Idle);
    EXPECT_TRUE(h.executor.calls.empty());
}

TEST(BackupOrchestrator, ConcurrentAttemptIsRejected)
{
    Workspace ws;
    Harness h;
    ASSERT_TRUE(h.store->tryLock());

    const auto outcome = h.orchestrator.executeBackup(ws.source, ws.cloud / "backup");

    EXPECT_EQ(outcome.error.kind, ErrorKind::Busy);
    EXPECT_EQ(outcome.finalState, core::BackupState::Idle);
    ws.expectSourceUntouched();
    h.store->unlock();
}

TEST(BackupOrchestrator, PendingRecordBlocksNewAttempt)
{
    Workspace ws;
    Harness h;
    model::RollbackRecord stale;
    stale.source = ws.root / "other";
    stale.target = ws.cloud / "other";
    ASSERT_TRUE(h.rollbackLedger.snapshot(stale));

    const auto outcome = h.orchestrator.executeBackup(ws.source, ws.cloud / "backup");

    EXPECT_EQ(outcome.error.kind, ErrorKind::Busy);
    EXPECT_TRUE(h.executor.calls.empty());

    EXPECT_TRUE(h.orchestrator.discardRollbackPoint().ok());
    EXPECT_TRUE(h.orchestrator.executeBackup(ws.source, ws.cloud / "backup").ok());
}

TEST(BackupOrchestratorValidation, RejectsBadPaths)
{
    Workspace ws;
    Harness h;
    writeFile(ws.root / "file.txt", "x");

    EXPECT_EQ(h.orchestrator.validatePaths("", ws.cloud).kind(), ErrorKind::Validation);
    EXPECT_EQ(h.orchestrator.validatePaths(ws.root / "missing", ws.cloud).kind(), ErrorKind::Validation);
    EXPECT_EQ(h.orchestrator.validatePaths(ws.root / "file.txt", ws.cloud).kind(), ErrorKind::Validation);
    EXPECT_EQ(h.orchestrator.validatePaths(ws.source, "").kind(), ErrorKind::Validation);
    EXPECT_EQ(h.orchestrator.validatePaths(ws.source, ws.root / "file.txt").kind(), ErrorKind::Validation);
    EXPECT_EQ(h.orchestrator.validatePaths(ws.source, ws.root / "nope" / "deeper").kind(), ErrorKind::Validation);
    EXPECT_EQ(h.orchestrator.validatePaths(ws.source, ws.source / "inside").kind(), ErrorKind::Validation);
    EXPECT_EQ(h.orchestrator.validatePaths(ws.source, ws.source).kind(), ErrorKind::Validation);
    EXPECT_TRUE(h.executor.calls.empty());
    EXPECT_FALSE(h.store->exists());
}

TEST(BackupOrchestratorValidation, RejectsExistingEffectiveTarget)
{
    Workspace ws;
    Harness h;
    fs::create_directories(ws.cloud / "proj");

    const Status status = h.orchestrator.validatePaths(ws.source, ws.cloud);

    EXPECT_EQ(status.kind(), ErrorKind::Validation);
    ASSERT_FALSE(status.error().paths.empty());
    EXPECT_EQ(status.error().paths.front(), fs::canonical(ws.cloud) / "proj");
}

TEST(BackupOrchestratorValidation, EnforcesPathLimitAndFreeSpace)
{
    Workspace ws;
    Context ctx(false);
    RecordingExecutor executor(ctx);
    TunableInspector inspector;
    model::Settings settings = fastSettings();
    settings.maxPathLength = 8;
    core::RelocationOps ops(executor, inspector, ctx, settings);
    ledger::MemoryLedgerStore store;
    ledger::RollbackLedger ledger(store, ctx);
    core::BackupOrchestrator orchestrator(ledger, ops, ctx);

    EXPECT_EQ(orchestrator.validatePaths(ws.source, ws.cloud / "backup").kind(), ErrorKind::Validation);

    settings.maxPathLength = 4096;
    settings.minFreeSpaceBytes = ~0ULL;
    core::RelocationOps hungry(executor, inspector, ctx, settings);
    core::BackupOrchestrator picky(ledger, hungry, ctx);
    const Status status = picky.validatePaths(ws.source, ws.cloud / "backup");
    EXPECT_EQ(status.kind(), ErrorKind::Validation);
    EXPECT_NE(status.message().find("disk space"), std::string::npos);
}

TEST(BackupOrchestratorValidation, RejectsUnreadableSourceAndUnwritableTarget)
{
    Workspace ws;
    Harness h;

    h.inspector.unreadable = ws.source;
    Status status = h.orchestrator.validatePaths(ws.source, ws.cloud / "backup");
    EXPECT_EQ(status.kind(), ErrorKind::Validation);
    EXPECT_NE(status.message().find("not accessible"), std::string::npos);

    h.inspector.unreadable.reset();
    h.inspector.unwritable = ws.cloud;
    status = h.orchestrator.validatePaths(ws.source, ws.cloud / "backup");
    EXPECT_EQ(status.kind(), ErrorKind::Validation);
    EXPECT_NE(status.message().find("write permission"), std::string::npos);

    const auto outcome = h.orchestrator.executeBackup(ws.source, ws.cloud / "backup");
    EXPECT_EQ(outcome.finalState, core::BackupState::Idle);
    EXPECT_TRUE(h.executor.calls.empty());
    EXPECT_FALSE(h.store->exists());
    ws.expectSourceUntouched();
}

TEST(BackupOrchestratorValidation, RejectsNestedTargetOverPathLimit)
{
    Workspace ws;
    Harness h;
    // Source and target fit; the nested final path does not.
    h.settings.maxPathLength = ws.cloud.string().size() + 2;
    core::RelocationOps tight(h.executor, h.inspector, h.ctx, h.settings);
    core::BackupOrchestrator orchestrator(h.rollbackLedger, tight, h.ctx);
    ASSERT_LE(ws.source.string().size(), h.settings.maxPathLength);

    const Status status = orchestrator.validatePaths(ws.source, ws.cloud);

    EXPECT_EQ(status.kind(), ErrorKind::Validation);
    EXPECT_NE(status.message().find("Final target path is too long"), std::string::npos);
    ASSERT_FALSE(status.error().paths.empty());
    EXPECT_EQ(status.error().paths.front(), ws.cloud / "proj");
}
