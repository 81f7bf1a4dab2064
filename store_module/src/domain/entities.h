#pragma once

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "timestamps.h"

// Анкета. Создаётся и меняется только админом
struct Profile {
    long long id = 0;
    std::string name;
    int age = 0;
    std::string gender;
    std::string nationality;
    std::string city;
    std::vector<std::string> travel_cities;
    std::string description;
    std::vector<std::string> photos;
    int height = 0;
    int weight = 0;
    int chest = 0;
    bool visible = true;
    Timestamp created_at{};
};

// Чат уникален для пары (profile_id, telegram_user_id).
// telegram_user_id пустой у старых чатов, созданных до изоляции пользователей
struct Chat {
    long long id = 0;
    long long profile_id = 0;
    std::string profile_name;
    std::optional<std::string> telegram_user_id;
    Timestamp created_at{};
    long long last_read_message_id = 0;  // курсор прочтения на стороне пользователя
};

enum class Sender {
    User,
    Admin,
    System
};

struct Attachment {
    std::string url;
    std::string kind;  // image | video | file
    std::string file_name;
};

struct ChatMessage {
    long long id = 0;  // глобальный, не в пределах чата
    long long chat_id = 0;
    Sender sender = Sender::User;
    std::string text;
    std::optional<Attachment> attachment;
    bool is_read = false;  // имеет смысл только для сообщений пользователя
    Timestamp created_at{};
};

enum class OrderStatus {
    Unpaid,
    Booked
};

struct Order {
    long long id = 0;
    std::string order_number;  // 18 символов [A-Za-z0-9]
    long long profile_id = 0;
    std::optional<std::string> telegram_user_id;
    double amount = 0.0;
    double bonus_amount = 0.0;
    double total_amount = 0.0;
    std::string crypto_type;
    std::string currency = "USD";
    OrderStatus status = OrderStatus::Unpaid;
    Timestamp created_at{};
    Timestamp expires_at{};
    std::optional<Timestamp> booked_at;
    std::optional<std::string> promo_code;
};

struct Comment {
    long long id = 0;
    long long profile_id = 0;
    std::string user_name;
    std::string telegram_username;
    std::optional<std::string> promo_code;
    std::optional<std::string> telegram_user_id;
    std::string text;
    Timestamp created_at{};
};

struct Promocode {
    long long id = 0;
    std::string code;
    double discount = 0.0;
    bool is_active = true;
    std::vector<std::string> used_by;
    Timestamp created_at{};
};

// Превью для VIP каталогов. Отдельно от основных анкет: без чатов, заказов и отзывов
struct VipProfile {
    long long id = 0;
    std::string name;
    int age = 0;
    std::string city;
    std::string gender = "female";
    std::vector<std::string> photos;
    Timestamp created_at{};
};

struct Banner {
    std::string text;
    bool visible = false;
    std::string link;
    std::string link_text;
};

struct Settings {
    static constexpr double kDefaultBonusPercentage = 5.0;

    std::map<std::string, std::string> crypto_wallets;
    double bonus_percentage = kDefaultBonusPercentage;
    Banner banner;
    nlohmann::json app = nlohmann::json::object();           // витринные настройки
    nlohmann::json vip_catalogs = nlohmann::json::object();  // метаданные каталогов
};

// Последний выданный id каждой коллекции. Удаление записей счётчики не уменьшает
struct IdCounters {
    long long profiles = 0;
    long long chats = 0;
    long long messages = 0;
    long long orders = 0;
    long long comments = 0;
    long long vip_profiles = 0;
};

// Весь изменяемый state приложения. Сущности ссылаются друг на друга только по id
struct Document {
    std::uint64_t version = 0;
    IdCounters counters;
    std::vector<Profile> profiles;
    std::vector<Chat> chats;
    std::vector<ChatMessage> messages;
    std::vector<Order> orders;
    std::vector<Comment> comments;
    std::vector<Promocode> promocodes;
    std::vector<VipProfile> vip_profiles;
    Settings settings;
    nlohmann::json extra = nlohmann::json::object();  // неизвестные секции верхнего уровня
};

// Документ для нового файла: кошельки-заглушки, баннер, настройки витрины
Document defaultDocument();

std::string toString(OrderStatus status);
std::string attachmentKindFor(const std::string& file_name);

// ASCII, для ключевых слов и фильтров каталога
std::string toLower(std::string text);
bool containsIgnoreCase(const std::string& text, const std::string& needle);

// Подтягивает счётчики до максимальных id, например для файла без секции counters
void syncCounters(Document& doc);

template <typename T>
long long maxId(const std::vector<T>& items) {
    long long max_id = 0;
    for (const auto& item : items) {
        if (item.id > max_id) max_id = item.id;
    }
    return max_id;
}

// Выдаёт следующий id коллекции и сдвигает её счётчик
template <typename T>
long long nextId(long long& counter, const std::vector<T>& items) {
    counter = std::max(counter, maxId(items)) + 1;
    return counter;
}
