#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chat_registry.h"
#include "entities.h"

// Поля новой анкеты из админки
struct ProfileDraft {
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
};

// Фильтры публичного каталога. Пустая строка или "all" = без фильтра, 0 = без границы
struct ProfileFilter {
    std::string city;
    std::string nationality;
    std::string travel_city;
    std::string gender;
    int age_min = 0, age_max = 0;
    int height_min = 0, height_max = 0;
    int weight_min = 0, weight_max = 0;
    int chest_min = 0, chest_max = 0;
    int page = 0;
    int limit = 12;
};

struct ProfilePage {
    std::vector<Profile> profiles;
    bool has_more = false;
    std::size_t total = 0;
};

// Значения для выпадающих фильтров: уникальные, отсортированные, только по видимым анкетам
struct CatalogFacets {
    std::vector<std::string> cities;
    std::vector<std::string> nationalities;
    std::vector<std::string> travel_cities;
};

struct VipProfileDraft {
    std::string name;
    int age = 0;
    std::string city;
    std::string gender = "female";
    std::vector<std::string> photos;
};

// Кто оставляет отзыв
struct CommentAuthor {
    std::string telegram_user_id;
    std::string username;
    std::string first_name;
};

struct CatalogStats {
    std::size_t profiles = 0;
    std::size_t vip_profiles = 0;
    std::size_t chats = 0;
    std::size_t messages = 0;
    std::size_t comments = 0;
    std::size_t promocodes = 0;
    std::size_t unread_messages = 0;
};

class ProfileCatalog {
public:
    explicit ProfileCatalog(const ChatRegistry& chats);

    Profile create(Document& doc, const ProfileDraft& draft, Timestamp now) const;
    std::optional<Profile> find(const Document& doc, long long profile_id) const;
    std::vector<Profile> visible(const Document& doc) const;
    ProfilePage search(const Document& doc, const ProfileFilter& filter) const;
    bool setVisible(Document& doc, long long profile_id, bool visible) const;

    // Удаляет анкету вместе с её чатами, их сообщениями и отзывами. Заказы остаются
    bool remove(Document& doc, long long profile_id) const;

    std::vector<Comment> commentsOf(const Document& doc, long long profile_id) const;
    Comment addUserComment(Document& doc, long long profile_id, const CommentAuthor& author,
                           const std::string& text, Timestamp now) const;
    Comment addAdminComment(Document& doc, long long profile_id, const std::string& author_name,
                            const std::string& text, Timestamp now) const;
    bool removeComment(Document& doc, long long profile_id, long long comment_id) const;

    CatalogFacets facets(const Document& doc) const;
    static const std::vector<std::string>& genders();

    std::vector<VipProfile> vipProfiles(const Document& doc) const;
    VipProfile addVipProfile(Document& doc, const VipProfileDraft& draft, Timestamp now) const;
    bool removeVipProfile(Document& doc, long long vip_id) const;

    // Метаданные VIP каталогов (название, цена, ссылка) хранятся как есть
    const nlohmann::json& vipCatalogs(const Document& doc) const;
    void setVipCatalogs(Document& doc, const nlohmann::json& catalogs) const;

    CatalogStats stats(const Document& doc) const;

private:
    const ChatRegistry& chats_;
};
