#pragma once

#include "config/env.h"
#include "db/document_store.h"
#include "domain/chat_registry.h"
#include "domain/order_ledger.h"
#include "domain/profile_catalog.h"
#include "security/session_registry.h"

// Сервисы процесса. Порядок полей важен: реестры ссылаются на объявленные выше
struct AppContext {
    DocumentStore store;
    OrderLedger ledger;
    ChatRegistry chats;
    ProfileCatalog catalog;
    SessionRegistry sessions;

    explicit AppContext(const StoreConfig& cfg)
        : store(cfg.data_file, cfg.cache_ttl),
          chats(ledger),
          catalog(chats) {}
};
