#pragma once
#include "crow.h"
#include "app_context.h"
#include "auth_handler.h"
#include "profile_handler.h"
#include "chat_handler.h"
#include "order_handler.h"
#include "settings_handler.h"


inline void registerRoutes(crow::SimpleApp& app, AppContext& ctx) {
    registerAuthRoutes(app, ctx);
    registerProfileRoutes(app, ctx);
    registerChatRoutes(app, ctx);
    registerOrderRoutes(app, ctx);
    registerSettingsRoutes(app, ctx);
}
