#include <memory>
#include "crow.h"
#include "app_context.h"
#include "config/env.h"
#include "cron/expiry_sweeper.h"
#include "handlers/base_handler.h"
#include "TelegramBridge.h"
#include "TelegramClient.h"

int main() {
    configureLogging();

    StoreConfig cfg = loadStoreConfig();
    AppContext ctx(cfg);

    // Кошельки из окружения перекрывают записанные в документе
    auto wallets = walletsFromEnv();
    if (!wallets.empty()) {
        try {
            ctx.store.update([&](Document& doc) {
                for (const auto& w : wallets) doc.settings.crypto_wallets[w.first] = w.second;
            });
            CROW_LOG_INFO << "[admin] " << wallets.size() << " crypto wallets taken from environment";
        } catch (const StoreError& e) {
            CROW_LOG_ERROR << "[admin] failed to store wallets from environment: " << e.what();
        }
    }

    ExpirySweeper sweeper(ctx.store, ctx.ledger, cfg.sweep_interval);

    AdminCredentials creds;
    creds.username = getenv_or("ADMIN_USERNAME", "admin");
    creds.password = getenv_or("ADMIN_PASSWORD", "admin123");

    // Бот поднимается только при наличии токена
    std::unique_ptr<TelegramClient> telegram;
    std::unique_ptr<TelegramBridge> bridge;
    const std::string token = getenv_or("TELEGRAM_BOT_TOKEN", "");
    if (!token.empty()) {
        BridgeConfig bc;
        bc.admin_ids = parseIdList(getenv_or("ADMIN_TELEGRAM_IDS", ""));
        if (bc.admin_ids.empty()) {
            CROW_LOG_WARNING << "[admin] ADMIN_TELEGRAM_IDS is empty, bot will ignore everyone";
        }
        telegram = std::make_unique<TelegramClient>(token);
        bridge = std::make_unique<TelegramBridge>(*telegram, ctx.store, ctx.chats, bc);
    } else {
        CROW_LOG_WARNING << "[admin] TELEGRAM_BOT_TOKEN not set, bot disabled";
    }

    crow::SimpleApp app;

    CROW_ROUTE(app, "/health")([] {
        return "OK";
    });

    registerAdminRoutes(app, ctx, creds);

    const int port = static_cast<int>(to_ll(getenv_or("ADMIN_PORT", "8002"), 8002));
    const auto grace = std::chrono::seconds(to_ll(getenv_or("BRIDGE_SHUTDOWN_GRACE_SECONDS", "5"), 5));
    CROW_LOG_INFO << "[admin] data file " << cfg.data_file << ", port " << port;

    sweeper.start();
    if (bridge) bridge->start();

    app.port(port).multithreaded().run();

    CROW_LOG_INFO << "[admin] shutting down";
    if (bridge) bridge->stop(std::chrono::duration_cast<std::chrono::milliseconds>(grace));
    sweeper.stop();
}
