#pragma once

#include <optional>

#include "core/context.hpp"
#include "core/errors.hpp"
#include "core/relocation_ops.hpp"
#include "ledger/ledger_store.hpp"
#include "model/records.hpp"

namespace cloudlink::ledger {

// Write-ahead record of the relocation in flight. At most one record lives in the slot.
class RollbackLedger {
public:
    RollbackLedger(LedgerStore &store, const cloudlink::Context &ctx);

    bool snapshot(const model::RollbackRecord &record);
    // Merges the given flags into the persisted record, keeping every other field.
    bool update(std::optional<bool> backupCreated, std::optional<bool> junctionCreated);
    // In-memory record if present, else the durable one. nullopt for an empty or unreadable slot.
    std::optional<model::RollbackRecord> load();
    bool clear();

    // True while the durable slot holds anything, readable or not.
    bool hasPendingRecord() const;
    bool lastLoadFailed() const { return lastLoadFailed_; }

    LedgerStore &store() { return store_; }

private:
    LedgerStore &store_;
    const cloudlink::Context &ctx_;
    std::optional<model::RollbackRecord> current_;
    bool lastLoadFailed_ = false;
};

// Undoes a partially applied relocation in reverse order of forward progress. Every step
// runs even when an earlier one failed; the returned status is a Rollback error if any did.
Status compensate(
    const model::RollbackRecord &record,
    core::RelocationOps &ops,
    const cloudlink::Context &ctx
);

} // namespace cloudlink::ledger
