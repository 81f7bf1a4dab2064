#pragma once
#include "crow.h"
#include "app_context.h"
#include "auth_handler.h"
#include "profile_handler.h"
#include "chat_handler.h"
#include "booking_handler.h"
#include "settings_handler.h"
#include "comment_handler.h"


inline void registerAdminRoutes(crow::SimpleApp& app, AppContext& ctx, const AdminCredentials& creds) {
    registerAdminAuthRoutes(app, ctx, creds);
    registerAdminProfileRoutes(app, ctx);
    registerAdminChatRoutes(app, ctx);
    registerAdminBookingRoutes(app, ctx);
    registerAdminSettingsRoutes(app, ctx);
    registerAdminCommentRoutes(app, ctx);
}
