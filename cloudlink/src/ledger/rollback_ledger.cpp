#include "ledger/rollback_ledger.hpp"

#include <string>
#include <vector>

#include "io/fs_utils.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace cloudlink::ledger
{

    RollbackLedger::RollbackLedger(LedgerStore &store, const cloudlink::Context &ctx) : store_(store), ctx_(ctx) {}

    bool RollbackLedger::snapshot(const model::RollbackRecord &record)
    {
        if (!store_.write(json(record)))
        {
            ctx_.error("Failed to write rollback point to ", store_.describe());
            return false;
        }
        current_ = record;
        ctx_.debug("Rollback point written: ", record.source.string(), " -> ", record.target.string());
        return true;
    }

    bool RollbackLedger::update(std::optional<bool> backupCreated, std::optional<bool> junctionCreated)
    {
        if (!current_.has_value())
        {
            current_ = load();
        }
        if (!current_.has_value())
        {
            ctx_.error("No rollback point to update");
            return false;
        }

        if (backupCreated.has_value())
        {
            current_->backupCreated = *backupCreated;
        }
        if (junctionCreated.has_value())
        {
            current_->junctionCreated = *junctionCreated;
        }

        if (!store_.write(json(*current_)))
        {
            ctx_.error("Failed to update rollback status in ", store_.describe());
            return false;
        }
        return true;
    }

    std::optional<model::RollbackRecord> RollbackLedger::load()
    {
        lastLoadFailed_ = false;
        if (current_.has_value())
        {
            return current_;
        }

        try
        {
            std::optional<json> document = store_.read();
            if (!document.has_value())
            {
                return std::nullopt;
            }
            current_ = document->get<model::RollbackRecord>();
            return current_;
        }
        catch (const LedgerReadError &e)
        {
            ctx_.error(e.what());
        }
        catch (const json::exception &e)
        {
            ctx_.error("Rollback ledger ", store_.describe(), " is malformed: ", e.what());
        }
        lastLoadFailed_ = true;
        return std::nullopt;
    }

    bool RollbackLedger::clear()
    {
        current_.reset();
        if (!store_.remove())
        {
            ctx_.error("Failed to clear rollback point ", store_.describe());
            return false;
        }
        ctx_.debug("Rollback point cleared");
        return true;
    }

    bool RollbackLedger::hasPendingRecord() const
    {
        return current_.has_value() || store_.exists();
    }

    Status compensate(const model::RollbackRecord &record, core::RelocationOps &ops, const cloudlink::Context &ctx)
    {
        const io::PathInspector &inspector = ops.inspector();
        const fs::path &source = record.source;
        const fs::path &target = record.target;

        bool success = true;
        std::vector<std::string> failures;
        auto fail = [&](const Status &status)
        {
            success = false;
            failures.push_back(status.message());
            ctx.error("Rollback step failed: ", status.error().describe());
        };

        ctx.log("Starting rollback for ", source.string());

        // 1. the link we created at source
        const bool sourceIsLink = inspector.isJunction(source);
        bool removeLink = record.junctionCreated || (sourceIsLink && !record.sourceWasJunctionBefore);
        if (sourceIsLink && record.sourceWasJunctionBefore && !record.junctionCreated)
        {
            const auto linked = inspector.junctionTarget(source);
            removeLink = linked.has_value() && inspector.canonical(*linked) == inspector.canonical(target);
        }
        if (removeLink)
        {
            if (inspector.isDirectory(source) && !sourceIsLink)
            {
                ctx.warn("Source is a plain directory, no junction to remove: ", source.string());
            }
            else
            {
                const Status status = ops.removeJunction(source);
                if (status)
                {
                    ctx.log("Junction removed: ", source.string());
                }
                else
                {
                    fail(status);
                }
            }
        }

        // 2. the data we moved to target
        const bool targetPresent = inspector.exists(target) && !inspector.isJunction(target);
        const bool sourcePresent = inspector.exists(source) && !inspector.isJunction(source);
        if (targetPresent && !sourcePresent && (record.backupCreated || !record.targetExistedBefore))
        {
            if (source.has_parent_path() && !io::ensureDir(source.parent_path()))
            {
                fail(Status::failure(ErrorKind::Rollback, "could not recreate parent of " + source.string(), {source}));
            }
            else
            {
                Status status = ops.rename(target, source);
                if (!status)
                {
                    ctx.warn("Move back failed, copying instead: ", status.message());
                    status = ops.copyTree(target, source);
                    if (status)
                    {
                        status = ops.removeTree(target);
                    }
                }
                if (status)
                {
                    ctx.log("Moved back: ", target.string(), " -> ", source.string());
                }
                else
                {
                    fail(status);
                }
            }
        }
        else if (targetPresent && sourcePresent && !record.targetExistedBefore)
        {
            Status status;
            if (record.backupCreated)
            {
                // Source deletion stopped half way: target holds the complete copy.
                status = ops.copyTree(target, source);
                if (status)
                {
                    status = ops.removeTree(target);
                }
                if (status)
                {
                    ctx.log("Restored partially removed source from ", target.string());
                }
            }
            else
            {
                status = ops.removeTree(target);
                if (status)
                {
                    ctx.log("Discarded partial copy: ", target.string());
                }
            }
            if (!status)
            {
                fail(status);
            }
        }
        else if (record.backupCreated && !targetPresent && !sourcePresent)
        {
            fail(Status::failure(ErrorKind::Rollback, "neither source nor target holds the data", {source, target}));
        }

        // 3. the junction that was at source before we started
        if (record.sourceWasJunctionBefore && record.originalJunctionTarget.has_value())
        {
            if (!inspector.exists(source) && !inspector.isJunction(source))
            {
                const Status status = ops.createJunction(source, *record.originalJunctionTarget);
                if (status)
                {
                    ctx.log("Original junction restored: ", source.string(), " -> ", record.originalJunctionTarget->string());
                }
                else
                {
                    fail(status);
                }
            }
        }

        if (success)
        {
            ctx.log("Rollback completed successfully");
            return Status::success();
        }

        ctx.error("Rollback completed with errors");
        std::string message;
        for (size_t i = 0; i < failures.size(); ++i)
        {
            if (i > 0)
            {
                message += "; ";
            }
            message += failures[i];
        }
        return Status::failure(ErrorKind::Rollback, message, {source, target});
    }

} // namespace cloudlink::ledger
