#pragma once

#include "core/backup_orchestrator.hpp"
#include "core/context.hpp"
#include "core/junction_registry.hpp"
#include "core/relocation_ops.hpp"
#include "io/path_inspector.hpp"
#include "io/process.hpp"
#include "ledger/ledger_store.hpp"
#include "ledger/rollback_ledger.hpp"
#include "model/app_config.hpp"

namespace cloudlink::commands {

// Production wiring of the collaborators for one CLI invocation.
struct Runtime {
    Runtime(const cloudlink::Context &ctx, const model::AppConfig &config);

    Runtime(const Runtime &) = delete;
    Runtime &operator=(const Runtime &) = delete;

    model::Settings settings;
    io::ProcessExecutor executor;
    io::FilesystemInspector inspector;
    core::RelocationOps ops;
    ledger::FileLedgerStore store;
    ledger::RollbackLedger ledger;
    core::BackupOrchestrator orchestrator;
    core::JunctionRegistry registry;
};

} // namespace cloudlink::commands
