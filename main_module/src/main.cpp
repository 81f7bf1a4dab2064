#include "crow.h"
#include "app_context.h"
#include "config/env.h"
#include "cron/expiry_sweeper.h"
#include "handlers/base_handler.h"

int main() {
    configureLogging();

    StoreConfig cfg = loadStoreConfig();
    AppContext ctx(cfg);

    // Просроченные заказы чистит и публичный процесс, и админка
    ExpirySweeper sweeper(ctx.store, ctx.ledger, cfg.sweep_interval);

    crow::SimpleApp app;

    // Проверка активации
    CROW_ROUTE(app, "/health")([] {
        return "OK";
    });

    registerRoutes(app, ctx);

    const int port = static_cast<int>(to_ll(getenv_or("PUBLIC_PORT", "8001"), 8001));
    CROW_LOG_INFO << "[public] data file " << cfg.data_file << ", port " << port;

    sweeper.start();
    app.port(port).multithreaded().run();

    CROW_LOG_INFO << "[public] shutting down";
    sweeper.stop();
}
