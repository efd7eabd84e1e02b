#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/execution/chain_executor.hpp"
#include "internal/grpc/automation_server.hpp"
#include "internal/model/slippage.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/automation_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/status/status_registry.hpp"
#if PULSE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace pulse::factory {

using namespace pulse;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const pulse::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if PULSE_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("sqlite backend requested without database.sqlite.path");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::BootstrapSchema(*sqlite_db);
    PULSE_LOG_INFO("Using sqlite repository", {observability::StringField("path", database.sqlite().path()),
                                               observability::BoolField("wal_mode", database.sqlite().wal_mode())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  PULSE_LOG_INFO("Using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const pulse::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.statuses   = std::make_shared<status::StatusRegistry>();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  // The loader has validated the execution section and filled its defaults.
  const auto& execution_config = config.execution();

  service::ServiceContext ctx;
  ctx.repository       = app.repository;
  ctx.statuses         = app.statuses;
  ctx.executor         = std::make_shared<execution::UnavailableChainExecutor>();
  ctx.default_slippage = model::SlippageTolerance::FromDecimal(execution_config.default_slippage());
  ctx.node_spacing_x   = execution_config.node_spacing_x();
  ctx.stale_after_ms   = static_cast<uint64_t>(execution_config.stale_after_seconds()) * 1000;

  app.automation_service = std::make_shared<service::AutomationService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::AutomationServer>(app.automation_service));

  return app;
}

} // namespace pulse::factory
