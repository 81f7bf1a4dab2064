#include "entities.h"

#include <algorithm>
#include <cctype>

Document defaultDocument() {
    Document doc;

    doc.settings.crypto_wallets = {
        {"trc20", "TY76gU8J9o8j7U6tY5r4E3W2Q1"},
        {"erc20", "0x8a9C6e5D8b0E2a1F3c4B6E7D8C9A0B1C2D3E4F5"},
        {"bnb", "bnb1q3e5r7t9y1u3i5o7p9l1k3j5h7g9f2d4s6q8w0"}
    };
    doc.settings.bonus_percentage = Settings::kDefaultBonusPercentage;

    doc.settings.banner.text = "Special Offer: 15% discount with promo code WELCOME15";
    doc.settings.banner.visible = true;
    doc.settings.banner.link = "https://t.me/yourchannel";
    doc.settings.banner.link_text = "Join Channel";

    doc.settings.app = {
        {"app_name", "Muji"},
        {"default_age", 25},
        {"default_city", "Moscow"},
        {"vip_blurred_count", 3},
        {"extra_vip_blurred_count", 3},
        {"secret_blurred_count", 3}
    };

    auto catalog = [](const char* name, int price, const char* url) {
        return nlohmann::json{
            {"name", name},
            {"price", price},
            {"redirect_url", url},
            {"visible", true},
            {"preview_count", 3},
            {"preview_profiles", nlohmann::json::array()}
        };
    };
    doc.settings.vip_catalogs = {
        {"vip", catalog("VIP Catalog", 199, "https://t.me/vip_channel")},
        {"extra_vip", catalog("Extra VIP", 699, "https://t.me/extra_vip_channel")},
        {"secret", catalog("Secret Catalog", 2499, "https://t.me/secret_channel")}
    };

    return doc;
}

void syncCounters(Document& doc) {
    doc.counters.profiles = std::max(doc.counters.profiles, maxId(doc.profiles));
    doc.counters.chats = std::max(doc.counters.chats, maxId(doc.chats));
    doc.counters.messages = std::max(doc.counters.messages, maxId(doc.messages));
    doc.counters.orders = std::max(doc.counters.orders, maxId(doc.orders));
    doc.counters.comments = std::max(doc.counters.comments, maxId(doc.comments));
    doc.counters.vip_profiles = std::max(doc.counters.vip_profiles, maxId(doc.vip_profiles));
}

std::string toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::Unpaid: return "unpaid";
        case OrderStatus::Booked: return "booked";
    }
    return "unpaid";
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool containsIgnoreCase(const std::string& text, const std::string& needle) {
    return toLower(text).find(toLower(needle)) != std::string::npos;
}

std::string attachmentKindFor(const std::string& file_name) {
    auto dot = file_name.rfind('.');
    if (dot == std::string::npos) return "file";

    const std::string ext = toLower(file_name.substr(dot + 1));

    if (ext == "jpg" || ext == "jpeg" || ext == "png" || ext == "gif" || ext == "bmp" || ext == "webp") {
        return "image";
    }
    if (ext == "mp4" || ext == "avi" || ext == "mov" || ext == "mkv" || ext == "webm") return "video";
    return "file";
}
