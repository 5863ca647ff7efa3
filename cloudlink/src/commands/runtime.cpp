#include "commands/runtime.hpp"

namespace cloudlink::commands
{

    Runtime::Runtime(const cloudlink::Context &ctx, const model::AppConfig &config)
        : settings(config.settings()),
          executor(ctx),
          ops(executor, inspector, ctx, settings),
          store(config.ledgerFile()),
          ledger(store, ctx),
          orchestrator(ledger, ops, ctx),
          registry(executor, ops, ctx)
    {
    }

} // namespace cloudlink::commands
