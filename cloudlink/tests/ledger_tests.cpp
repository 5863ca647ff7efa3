#include <filesystem>
#include <string>

#include <gtest/gtest.h>

#include "ledger/ledger_store.hpp"
#include "ledger/rollback_ledger.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;
using namespace cloudlink;
using namespace cloudlink::test_support;

namespace
{

    model::RollbackRecord sampleRecord()
    {
        model::RollbackRecord record;
        record.source = "/home/user/Documents/proj";
        record.target = "/home/user/OneDrive/Backup/proj";
        record.sourceExistedBefore = true;
        record.timestamp = "2024-01-02T03:04:05.000006";
        return record;
    }

} // namespace

TEST(RollbackRecordJson, UsesPersistedKeyNames)
{
    model::RollbackRecord record = sampleRecord();
    record.sourceWasJunctionBefore = true;
    record.originalJunctionTarget = fs::path("/mnt/old");

    const nlohmann::json doc = record;
    EXPECT_EQ(doc.at("source").get<std::string>(), "/home/user/Documents/proj");
    EXPECT_EQ(doc.at("target").get<std::string>(), "/home/user/OneDrive/Backup/proj");
    EXPECT_TRUE(doc.at("source_existed").get<bool>());
    EXPECT_FALSE(doc.at("target_existed").get<bool>());
    EXPECT_TRUE(doc.at("source_is_junction").get<bool>());
    EXPECT_EQ(doc.at("original_junction_target").get<std::string>(), "/mnt/old");
    EXPECT_FALSE(doc.at("backup_created").get<bool>());
    EXPECT_FALSE(doc.at("junction_created").get<bool>());
    EXPECT_EQ(doc.at("timestamp").get<std::string>(), "2024-01-02T03:04:05.000006");
}

TEST(RollbackRecordJson, OmitsUnsetJunctionTarget)
{
    const nlohmann::json doc = sampleRecord();
    EXPECT_FALSE(doc.contains("original_junction_target"));
}

TEST(RollbackLedger, UpdateMergesFlagsAndKeepsOtherFields)
{
    Context ctx(false);
    ledger::MemoryLedgerStore store;
    ledger::RollbackLedger ledger(store, ctx);
    ASSERT_TRUE(ledger.snapshot(sampleRecord()));

    ASSERT_TRUE(ledger.update(true, std::nullopt));
    ASSERT_TRUE(ledger.update(std::nullopt, true));

    const auto doc = store.read();
    ASSERT_TRUE(doc.has_value());
    EXPECT_TRUE(doc->at("backup_created").get<bool>());
    EXPECT_TRUE(doc->at("junction_created").get<bool>());
    EXPECT_EQ(doc->at("source").get<std::string>(), "/home/user/Documents/proj");
    EXPECT_EQ(doc->at("timestamp").get<std::string>(), "2024-01-02T03:04:05.000006");
}

TEST(RollbackLedger, UpdateWithoutSnapshotFails)
{
    Context ctx(false);
    ledger::MemoryLedgerStore store;
    ledger::RollbackLedger ledger(store, ctx);
    EXPECT_FALSE(ledger.update(true, std::nullopt));
}

TEST(RollbackLedger, RecordSurvivesNewInstanceOverSameFile)
{
    const fs::path root = makeTempRoot("cloudlink_ledger");
    const fs::path file = root / "nested" / "rollback.json";
    Context ctx(false);

    {
        ledger::FileLedgerStore store(file);
        ledger::RollbackLedger ledger(store, ctx);
        ASSERT_TRUE(ledger.snapshot(sampleRecord()));
        ASSERT_TRUE(ledger.update(true, std::nullopt));
    }

    ledger::FileLedgerStore store(file);
    ledger::RollbackLedger ledger(store, ctx);
    EXPECT_TRUE(ledger.hasPendingRecord());
    const auto record = ledger.load();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->source, fs::path("/home/user/Documents/proj"));
    EXPECT_TRUE(record->backupCreated);
    EXPECT_FALSE(record->junctionCreated);

    EXPECT_TRUE(ledger.clear());
    EXPECT_FALSE(fs::exists(file));
    EXPECT_FALSE(ledger.hasPendingRecord());
    EXPECT_FALSE(ledger.load().has_value());
    EXPECT_FALSE(ledger.lastLoadFailed());

    cleanupTemp(root);
}

TEST(RollbackLedger, CorruptFileIsReportedNotThrown)
{
    const fs::path root = makeTempRoot("cloudlink_ledger");
    const fs::path file = root / "rollback.json";
    writeFile(file, "{ not json");
    Context ctx(false);

    ledger::FileLedgerStore store(file);
    ledger::RollbackLedger ledger(store, ctx);
    EXPECT_TRUE(ledger.hasPendingRecord());
    EXPECT_FALSE(ledger.load().has_value());
    EXPECT_TRUE(ledger.lastLoadFailed());

    writeFile(file, R"({"source": "/a"})");
    EXPECT_FALSE(ledger.load().has_value());
    EXPECT_TRUE(ledger.lastLoadFailed());

    cleanupTemp(root);
}

TEST(FileLedgerStore, LockIsExclusiveAcrossInstances)
{
    const fs::path root = makeTempRoot("cloudlink_ledger");
    const fs::path file = root / "rollback.json";

    ledger::FileLedgerStore first(file);
    ledger::FileLedgerStore second(file);
    ASSERT_TRUE(first.tryLock());
    EXPECT_FALSE(second.tryLock());
    first.unlock();
    EXPECT_TRUE(second.tryLock());
    second.unlock();

    cleanupTemp(root);
}

TEST(Compensate, RestoresOriginalJunction)
{
#ifdef _WIN32
    GTEST_SKIP() << "Uses POSIX directory symlinks.";
#else
    const fs::path root = makeTempRoot("cloudlink_compensate");
    const fs::path original = root / "original";
    const fs::path source = root / "link";
    writeFile(original / "data.txt", "x");

    Context ctx(false);
    RecordingExecutor executor(ctx);
    io::FilesystemInspector inspector;
    core::RelocationOps ops(executor, inspector, ctx, fastSettings());

    model::RollbackRecord record;
    record.source = source;
    record.target = root / "moved";
    record.sourceExistedBefore = true;
    record.sourceWasJunctionBefore = true;
    record.originalJunctionTarget = original;

    const Status status = ledger::compensate(record, ops, ctx);
    EXPECT_TRUE(status.ok()) << status.error().describe();
    EXPECT_TRUE(inspector.isJunction(source));
    EXPECT_EQ(fs::canonical(source), fs::canonical(original));

    cleanupTemp(root);
#endif
}

TEST(Compensate, ContinuesAfterFailedStepAndReportsIt)
{
    const fs::path root = makeTempRoot("cloudlink_compensate");
    const fs::path target = root / "cloud" / "proj";
    writeFile(target / "data.txt", "x");

    Context ctx(false);
    RecordingExecutor executor(ctx);
    executor.failIf = [](const io::Command &command)
    {
        return isMoveCommand(command) || isCopyCommand(command);
    };
    io::FilesystemInspector inspector;
    core::RelocationOps ops(executor, inspector, ctx, fastSettings());

    model::RollbackRecord record;
    record.source = root / "proj";
    record.target = target;
    record.backupCreated = true;

    const Status status = ledger::compensate(record, ops, ctx);
    EXPECT_EQ(status.kind(), ErrorKind::Rollback);
    EXPECT_FALSE(status.error().paths.empty());
    EXPECT_TRUE(fs::exists(target / "data.txt"));

    cleanupTemp(root);
}
