#include "document_json.h"

#include <set>
#include <stdexcept>

using json = nlohmann::json;

// ============================================================
// Утилиты: старые записи data.json хранят поля в разных типах
// (id числом или строкой, telegram_user_id числом), поэтому читаем мягко
// ============================================================

static std::string str_or(const json& j, const char* key, const std::string& def = "") {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return def;
    return it->get<std::string>();
}

static long long ll_or(const json& j, const char* key, long long def = 0) {
    auto it = j.find(key);
    if (it == j.end()) return def;
    if (it->is_number_integer()) return it->get<long long>();
    if (it->is_number()) return static_cast<long long>(it->get<double>());
    if (it->is_string()) {
        try { return std::stoll(it->get<std::string>()); } catch (const std::logic_error&) { return def; }
    }
    return def;
}

static double num_or(const json& j, const char* key, double def = 0.0) {
    auto it = j.find(key);
    if (it == j.end()) return def;
    if (it->is_number()) return it->get<double>();
    if (it->is_string()) {
        try { return std::stod(it->get<std::string>()); } catch (const std::logic_error&) { return def; }
    }
    return def;
}

static bool bool_or(const json& j, const char* key, bool def = false) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) return def;
    return it->get<bool>();
}

static std::optional<std::string> opt_str(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (it->is_string()) {
        auto s = it->get<std::string>();
        if (s.empty()) return std::nullopt;
        return s;
    }
    if (it->is_number_integer()) return std::to_string(it->get<long long>());
    return std::nullopt;
}

static Timestamp ts_or(const json& j, const char* key, Timestamp def = Timestamp{}) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return def;
    auto ts = parseTimestamp(it->get<std::string>());
    return ts ? *ts : def;
}

static std::optional<Timestamp> opt_ts(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return parseTimestamp(it->get<std::string>());
}

static std::vector<std::string> str_list(const json& j, const char* key) {
    std::vector<std::string> out;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) return out;
    for (const auto& v : *it) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

static json nullable(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

template <typename T>
static std::vector<T> list_of(const json& j, const char* key) {
    std::vector<T> out;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) return out;
    out.reserve(it->size());
    for (const auto& item : *it) {
        if (item.is_object()) out.push_back(item.get<T>());
    }
    return out;
}

// ============================================================
// Profile
// ============================================================

void to_json(json& j, const Profile& p) {
    j = json{
        {"id", p.id},
        {"name", p.name},
        {"age", p.age},
        {"gender", p.gender},
        {"nationality", p.nationality},
        {"city", p.city},
        {"travel_cities", p.travel_cities},
        {"description", p.description},
        {"photos", p.photos},
        {"height", p.height},
        {"weight", p.weight},
        {"chest", p.chest},
        {"visible", p.visible},
        {"created_at", formatTimestamp(p.created_at)}
    };
}

void from_json(const json& j, Profile& p) {
    p.id = ll_or(j, "id");
    p.name = str_or(j, "name");
    p.age = static_cast<int>(ll_or(j, "age"));
    p.gender = str_or(j, "gender");
    p.nationality = str_or(j, "nationality");
    p.city = str_or(j, "city");
    p.travel_cities = str_list(j, "travel_cities");
    p.description = str_or(j, "description");
    p.photos = str_list(j, "photos");
    p.height = static_cast<int>(ll_or(j, "height"));
    p.weight = static_cast<int>(ll_or(j, "weight"));
    p.chest = static_cast<int>(ll_or(j, "chest"));
    p.visible = bool_or(j, "visible", true);
    p.created_at = ts_or(j, "created_at");
}

// ============================================================
// Chat
// ============================================================

void to_json(json& j, const Chat& c) {
    j = json{
        {"id", c.id},
        {"profile_id", c.profile_id},
        {"profile_name", c.profile_name},
        {"telegram_user_id", nullable(c.telegram_user_id)},
        {"created_at", formatTimestamp(c.created_at)},
        {"last_read_message_id", c.last_read_message_id}
    };
}

void from_json(const json& j, Chat& c) {
    c.id = ll_or(j, "id");
    c.profile_id = ll_or(j, "profile_id");
    c.profile_name = str_or(j, "profile_name");
    c.telegram_user_id = opt_str(j, "telegram_user_id");
    c.created_at = ts_or(j, "created_at");
    c.last_read_message_id = ll_or(j, "last_read_message_id");
}

// ============================================================
// Message: отправитель хранится парой флагов is_from_user / is_system
// ============================================================

void to_json(json& j, const ChatMessage& m) {
    j = json{
        {"id", m.id},
        {"chat_id", m.chat_id},
        {"text", m.text},
        {"is_from_user", m.sender == Sender::User},
        {"created_at", formatTimestamp(m.created_at)}
    };
    if (m.sender == Sender::System) j["is_system"] = true;
    if (m.sender == Sender::User) j["is_read"] = m.is_read;
    if (m.attachment) {
        j["file_url"] = m.attachment->url;
        j["file_type"] = m.attachment->kind;
        j["file_name"] = m.attachment->file_name;
    }
}

void from_json(const json& j, ChatMessage& m) {
    m.id = ll_or(j, "id");
    m.chat_id = ll_or(j, "chat_id");
    m.text = str_or(j, "text");
    if (bool_or(j, "is_system")) {
        m.sender = Sender::System;
    } else if (bool_or(j, "is_from_user")) {
        m.sender = Sender::User;
    } else {
        m.sender = Sender::Admin;
    }
    m.is_read = bool_or(j, "is_read");
    m.created_at = ts_or(j, "created_at");

    auto url = str_or(j, "file_url");
    if (!url.empty()) {
        Attachment a;
        a.url = url;
        a.file_name = str_or(j, "file_name");
        a.kind = str_or(j, "file_type", attachmentKindFor(a.file_name));
        m.attachment = a;
    } else {
        m.attachment.reset();
    }
}

// ============================================================
// Order
// ============================================================

void to_json(json& j, const Order& o) {
    j = json{
        {"id", o.id},
        {"order_number", o.order_number},
        {"profile_id", o.profile_id},
        {"telegram_user_id", nullable(o.telegram_user_id)},
        {"amount", o.amount},
        {"bonus_amount", o.bonus_amount},
        {"total_amount", o.total_amount},
        {"crypto_type", o.crypto_type},
        {"currency", o.currency},
        {"status", toString(o.status)},
        {"created_at", formatTimestamp(o.created_at)},
        {"expires_at", formatTimestamp(o.expires_at)},
        {"booked_at", o.booked_at ? json(formatTimestamp(*o.booked_at)) : json(nullptr)},
        {"promo_code", nullable(o.promo_code)}
    };
}

void from_json(const json& j, Order& o) {
    o.id = ll_or(j, "id");
    o.order_number = str_or(j, "order_number");
    if (o.order_number.empty()) o.order_number = std::to_string(o.id);
    o.profile_id = ll_or(j, "profile_id");
    o.telegram_user_id = opt_str(j, "telegram_user_id");
    o.amount = num_or(j, "amount");
    o.bonus_amount = num_or(j, "bonus_amount");
    o.total_amount = num_or(j, "total_amount", o.amount + o.bonus_amount);
    o.crypto_type = str_or(j, "crypto_type");
    o.currency = str_or(j, "currency", "USD");
    // Любой статус кроме "unpaid" считаем конечным, такие заказы чистильщик не трогает
    o.status = str_or(j, "status", "unpaid") == "unpaid" ? OrderStatus::Unpaid : OrderStatus::Booked;
    o.created_at = ts_or(j, "created_at");
    o.expires_at = ts_or(j, "expires_at", o.created_at);
    o.booked_at = opt_ts(j, "booked_at");
    o.promo_code = opt_str(j, "promo_code");
}

// ============================================================
// Comment / Promocode
// ============================================================

void to_json(json& j, const Comment& c) {
    j = json{
        {"id", c.id},
        {"profile_id", c.profile_id},
        {"user_name", c.user_name},
        {"telegram_username", c.telegram_username},
        {"promo_code", nullable(c.promo_code)},
        {"telegram_user_id", nullable(c.telegram_user_id)},
        {"text", c.text},
        {"created_at", formatTimestamp(c.created_at)}
    };
}

void from_json(const json& j, Comment& c) {
    c.id = ll_or(j, "id");
    c.profile_id = ll_or(j, "profile_id");
    c.user_name = str_or(j, "user_name");
    c.telegram_username = str_or(j, "telegram_username");
    c.promo_code = opt_str(j, "promo_code");
    c.telegram_user_id = opt_str(j, "telegram_user_id");
    c.text = str_or(j, "text");
    c.created_at = ts_or(j, "created_at");
}

void to_json(json& j, const Promocode& p) {
    j = json{
        {"id", p.id},
        {"code", p.code},
        {"discount", p.discount},
        {"is_active", p.is_active},
        {"used_by", p.used_by},
        {"created_at", formatTimestamp(p.created_at)}
    };
}

void from_json(const json& j, Promocode& p) {
    p.id = ll_or(j, "id");
    p.code = str_or(j, "code");
    p.discount = num_or(j, "discount");
    p.is_active = bool_or(j, "is_active", true);
    p.used_by = str_list(j, "used_by");
    p.created_at = ts_or(j, "created_at");
}

void to_json(json& j, const VipProfile& p) {
    j = json{
        {"id", p.id},
        {"name", p.name},
        {"age", p.age},
        {"city", p.city},
        {"gender", p.gender},
        {"photos", p.photos},
        {"created_at", formatTimestamp(p.created_at)}
    };
}

void from_json(const json& j, VipProfile& p) {
    p.id = ll_or(j, "id");
    p.name = str_or(j, "name");
    p.age = static_cast<int>(ll_or(j, "age"));
    p.city = str_or(j, "city");
    p.gender = str_or(j, "gender", "female");
    p.photos = str_list(j, "photos");
    p.created_at = ts_or(j, "created_at");
}

// ============================================================
// Settings
// ============================================================

void to_json(json& j, const Banner& b) {
    j = json{
        {"text", b.text},
        {"visible", b.visible},
        {"link", b.link},
        {"link_text", b.link_text}
    };
}

void from_json(const json& j, Banner& b) {
    b.text = str_or(j, "text");
    b.visible = bool_or(j, "visible");
    b.link = str_or(j, "link");
    b.link_text = str_or(j, "link_text");
}

void to_json(json& j, const Settings& s) {
    j = json{
        {"crypto_wallets", s.crypto_wallets},
        {"bonus_percentage", s.bonus_percentage},
        {"banner", s.banner},
        {"app", s.app},
        {"vip_catalogs", s.vip_catalogs}
    };
}

void from_json(const json& j, Settings& s) {
    // Недостающие подсекции берём из настроек по умолчанию
    s = defaultDocument().settings;

    auto wallets = j.find("crypto_wallets");
    if (wallets != j.end() && wallets->is_object()) {
        s.crypto_wallets.clear();
        for (auto it = wallets->begin(); it != wallets->end(); ++it) {
            if (it.value().is_string()) s.crypto_wallets[it.key()] = it.value().get<std::string>();
        }
    }
    s.bonus_percentage = num_or(j, "bonus_percentage", Settings::kDefaultBonusPercentage);

    auto banner = j.find("banner");
    if (banner != j.end() && banner->is_object()) s.banner = banner->get<Banner>();

    auto app = j.find("app");
    if (app != j.end() && app->is_object()) s.app = *app;

    auto catalogs = j.find("vip_catalogs");
    if (catalogs != j.end() && catalogs->is_object()) s.vip_catalogs = *catalogs;
}

// ============================================================
// Document
// ============================================================

void to_json(json& j, const IdCounters& c) {
    j = json{
        {"profiles", c.profiles},
        {"chats", c.chats},
        {"messages", c.messages},
        {"orders", c.orders},
        {"comments", c.comments},
        {"vip_profiles", c.vip_profiles}
    };
}

void from_json(const json& j, IdCounters& c) {
    c.profiles = ll_or(j, "profiles");
    c.chats = ll_or(j, "chats");
    c.messages = ll_or(j, "messages");
    c.orders = ll_or(j, "orders");
    c.comments = ll_or(j, "comments");
    c.vip_profiles = ll_or(j, "vip_profiles");
}

static const std::set<std::string>& knownSections() {
    static const std::set<std::string> keys = {
        "version", "counters", "profiles", "chats", "messages", "orders", "comments", "promocodes",
        "vip_profiles", "settings"
    };
    return keys;
}

void to_json(json& j, const Document& d) {
    j = json::object();
    for (auto it = d.extra.begin(); it != d.extra.end(); ++it) {
        j[it.key()] = it.value();
    }
    j["version"] = d.version;
    j["counters"] = d.counters;
    j["profiles"] = d.profiles;
    j["chats"] = d.chats;
    j["messages"] = d.messages;
    j["orders"] = d.orders;
    j["comments"] = d.comments;
    j["promocodes"] = d.promocodes;
    j["vip_profiles"] = d.vip_profiles;
    j["settings"] = d.settings;
}

void from_json(const json& j, Document& d) {
    if (!j.is_object()) {
        throw std::invalid_argument("document root must be a JSON object");
    }

    d.version = static_cast<std::uint64_t>(ll_or(j, "version"));
    d.profiles = list_of<Profile>(j, "profiles");
    d.chats = list_of<Chat>(j, "chats");
    d.messages = list_of<ChatMessage>(j, "messages");
    d.orders = list_of<Order>(j, "orders");
    d.comments = list_of<Comment>(j, "comments");
    d.promocodes = list_of<Promocode>(j, "promocodes");
    d.vip_profiles = list_of<VipProfile>(j, "vip_profiles");

    auto counters = j.find("counters");
    d.counters = counters != j.end() && counters->is_object() ? counters->get<IdCounters>() : IdCounters{};
    syncCounters(d);

    auto settings = j.find("settings");
    if (settings != j.end() && settings->is_object()) {
        d.settings = settings->get<Settings>();
    } else {
        d.settings = defaultDocument().settings;
    }

    d.extra = json::object();
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (knownSections().count(it.key()) == 0) d.extra[it.key()] = it.value();
    }
}
