#include "profile_catalog.h"

#include <algorithm>
#include <iterator>
#include <set>

#include "crow/logging.h"

#include "../db/store_errors.h"

ProfileCatalog::ProfileCatalog(const ChatRegistry& chats) : chats_(chats) {}

Profile ProfileCatalog::create(Document& doc, const ProfileDraft& draft, Timestamp now) const {
    if (draft.name.empty()) throw ValidationError("name is required");
    if (draft.age < 0 || draft.height < 0 || draft.weight < 0 || draft.chest < 0) {
        throw ValidationError("numeric attributes must not be negative");
    }

    Profile p;
    p.id = nextId(doc.counters.profiles, doc.profiles);
    p.name = draft.name;
    p.age = draft.age;
    p.gender = draft.gender;
    p.nationality = draft.nationality;
    p.city = draft.city;
    p.travel_cities = draft.travel_cities;
    p.description = draft.description;
    p.photos = draft.photos;
    p.height = draft.height;
    p.weight = draft.weight;
    p.chest = draft.chest;
    p.visible = true;
    p.created_at = now;
    doc.profiles.push_back(p);

    CROW_LOG_INFO << "[catalog] profile #" << p.id << " created: " << p.name;
    return p;
}

std::optional<Profile> ProfileCatalog::find(const Document& doc, long long profile_id) const {
    for (const auto& p : doc.profiles) {
        if (p.id == profile_id) return p;
    }
    return std::nullopt;
}

std::vector<Profile> ProfileCatalog::visible(const Document& doc) const {
    std::vector<Profile> result;
    std::copy_if(doc.profiles.begin(), doc.profiles.end(), std::back_inserter(result),
                 [](const Profile& p) { return p.visible; });
    return result;
}

static bool active(const std::string& value) {
    return !value.empty() && value != "all";
}

static bool inRange(int value, int min, int max) {
    if (min > 0 && value < min) return false;
    if (max > 0 && value > max) return false;
    return true;
}

ProfilePage ProfileCatalog::search(const Document& doc, const ProfileFilter& f) const {
    std::vector<Profile> matched;
    for (const auto& p : doc.profiles) {
        if (!p.visible) continue;
        if (active(f.city) && toLower(p.city) != toLower(f.city)) continue;
        if (active(f.nationality) && toLower(p.nationality) != toLower(f.nationality)) continue;
        if (active(f.gender) && toLower(p.gender) != toLower(f.gender)) continue;
        if (active(f.travel_city)) {
            const std::string wanted = toLower(f.travel_city);
            bool found = std::any_of(p.travel_cities.begin(), p.travel_cities.end(),
                                     [&](const std::string& c) { return toLower(c) == wanted; });
            if (!found) continue;
        }
        if (!inRange(p.age, f.age_min, f.age_max)) continue;
        if (!inRange(p.height, f.height_min, f.height_max)) continue;
        if (!inRange(p.weight, f.weight_min, f.weight_max)) continue;
        if (!inRange(p.chest, f.chest_min, f.chest_max)) continue;
        matched.push_back(p);
    }

    ProfilePage page;
    page.total = matched.size();

    const std::size_t limit = f.limit > 0 ? static_cast<std::size_t>(f.limit) : 12;
    const std::size_t start = f.page > 0 ? static_cast<std::size_t>(f.page) * limit : 0;
    const std::size_t end = start + limit;
    if (start < matched.size()) {
        page.profiles.assign(matched.begin() + start, matched.begin() + std::min(end, matched.size()));
    }
    page.has_more = end < matched.size();
    return page;
}

bool ProfileCatalog::setVisible(Document& doc, long long profile_id, bool visible) const {
    for (auto& p : doc.profiles) {
        if (p.id != profile_id) continue;
        p.visible = visible;
        return true;
    }
    return false;
}

bool ProfileCatalog::remove(Document& doc, long long profile_id) const {
    auto it = std::find_if(doc.profiles.begin(), doc.profiles.end(),
                           [profile_id](const Profile& p) { return p.id == profile_id; });
    if (it == doc.profiles.end()) return false;
    doc.profiles.erase(it);

    std::set<long long> chat_ids;
    for (const auto& c : doc.chats) {
        if (c.profile_id == profile_id) chat_ids.insert(c.id);
    }

    doc.chats.erase(std::remove_if(doc.chats.begin(), doc.chats.end(),
                                   [profile_id](const Chat& c) { return c.profile_id == profile_id; }),
                    doc.chats.end());
    doc.messages.erase(std::remove_if(doc.messages.begin(), doc.messages.end(),
                                      [&chat_ids](const ChatMessage& m) { return chat_ids.count(m.chat_id) > 0; }),
                       doc.messages.end());
    doc.comments.erase(std::remove_if(doc.comments.begin(), doc.comments.end(),
                                      [profile_id](const Comment& c) { return c.profile_id == profile_id; }),
                       doc.comments.end());

    CROW_LOG_INFO << "[catalog] profile #" << profile_id << " deleted with " << chat_ids.size() << " chats";
    return true;
}

std::vector<Comment> ProfileCatalog::commentsOf(const Document& doc, long long profile_id) const {
    std::vector<Comment> result;
    std::copy_if(doc.comments.begin(), doc.comments.end(), std::back_inserter(result),
                 [profile_id](const Comment& c) { return c.profile_id == profile_id; });
    return result;
}

Comment ProfileCatalog::addUserComment(Document& doc, long long profile_id, const CommentAuthor& author,
                                       const std::string& text, Timestamp now) const {
    if (text.empty()) throw ValidationError("text is required");
    if (!find(doc, profile_id)) throw NotFoundError("profile " + std::to_string(profile_id) + " not found");

    auto chat = chats_.find(doc, profile_id, author.telegram_user_id);
    if (!chat || !chats_.hasCompletedTransaction(doc, chat->id)) {
        throw ForbiddenError("You need to complete a transaction to leave comments");
    }

    // Промокод последнего оплаченного заказа этого пользователя
    std::optional<std::string> promo_code;
    for (auto it = doc.orders.rbegin(); it != doc.orders.rend(); ++it) {
        if (it->profile_id == profile_id && it->status == OrderStatus::Booked &&
            it->telegram_user_id == author.telegram_user_id) {
            promo_code = it->promo_code;
            break;
        }
    }

    Comment c;
    c.id = nextId(doc.counters.comments, doc.comments);
    c.profile_id = profile_id;
    c.user_name = !author.username.empty() ? author.username
                : !author.first_name.empty() ? author.first_name
                : "Anonymous";
    c.telegram_username = author.username;
    c.promo_code = promo_code;
    c.telegram_user_id = author.telegram_user_id;
    c.text = text;
    c.created_at = now;
    doc.comments.push_back(c);

    CROW_LOG_INFO << "[catalog] comment added by user " << author.telegram_user_id
                  << " to profile " << profile_id;
    return c;
}

Comment ProfileCatalog::addAdminComment(Document& doc, long long profile_id, const std::string& author_name,
                                        const std::string& text, Timestamp now) const {
    if (text.empty()) throw ValidationError("text is required");
    if (author_name.empty()) throw ValidationError("author_name is required");
    if (!find(doc, profile_id)) throw NotFoundError("profile " + std::to_string(profile_id) + " not found");

    Comment c;
    c.id = nextId(doc.counters.comments, doc.comments);
    c.profile_id = profile_id;
    c.user_name = author_name;
    c.text = text;
    c.created_at = now;
    doc.comments.push_back(c);
    return c;
}

bool ProfileCatalog::removeComment(Document& doc, long long profile_id, long long comment_id) const {
    auto it = std::find_if(doc.comments.begin(), doc.comments.end(), [&](const Comment& c) {
        return c.id == comment_id && c.profile_id == profile_id;
    });
    if (it == doc.comments.end()) return false;
    doc.comments.erase(it);
    return true;
}

CatalogFacets ProfileCatalog::facets(const Document& doc) const {
    std::set<std::string> cities, nationalities, travel_cities;
    for (const auto& p : doc.profiles) {
        if (!p.visible) continue;
        if (!p.city.empty()) cities.insert(p.city);
        if (!p.nationality.empty()) nationalities.insert(p.nationality);
        for (const auto& c : p.travel_cities) {
            if (!c.empty()) travel_cities.insert(c);
        }
    }

    CatalogFacets f;
    f.cities.assign(cities.begin(), cities.end());
    f.nationalities.assign(nationalities.begin(), nationalities.end());
    f.travel_cities.assign(travel_cities.begin(), travel_cities.end());
    return f;
}

const std::vector<std::string>& ProfileCatalog::genders() {
    static const std::vector<std::string> values = {"male", "female", "transgender"};
    return values;
}

std::vector<VipProfile> ProfileCatalog::vipProfiles(const Document& doc) const {
    return doc.vip_profiles;
}

VipProfile ProfileCatalog::addVipProfile(Document& doc, const VipProfileDraft& draft, Timestamp now) const {
    if (draft.name.empty()) throw ValidationError("name is required");
    if (draft.age < 0) throw ValidationError("age must not be negative");
    if (draft.photos.empty()) throw ValidationError("At least one photo is required");

    VipProfile p;
    p.id = nextId(doc.counters.vip_profiles, doc.vip_profiles);
    p.name = draft.name;
    p.age = draft.age;
    p.city = draft.city;
    p.gender = draft.gender.empty() ? "female" : draft.gender;
    p.photos = draft.photos;
    p.created_at = now;
    doc.vip_profiles.push_back(p);

    CROW_LOG_INFO << "[catalog] vip profile #" << p.id << " created: " << p.name;
    return p;
}

bool ProfileCatalog::removeVipProfile(Document& doc, long long vip_id) const {
    auto it = std::find_if(doc.vip_profiles.begin(), doc.vip_profiles.end(),
                           [vip_id](const VipProfile& p) { return p.id == vip_id; });
    if (it == doc.vip_profiles.end()) return false;
    doc.vip_profiles.erase(it);
    return true;
}

const nlohmann::json& ProfileCatalog::vipCatalogs(const Document& doc) const {
    return doc.settings.vip_catalogs;
}

void ProfileCatalog::setVipCatalogs(Document& doc, const nlohmann::json& catalogs) const {
    if (!catalogs.is_object()) throw ValidationError("vip catalogs must be a JSON object");
    for (auto it = catalogs.begin(); it != catalogs.end(); ++it) {
        if (!it.value().is_object()) throw ValidationError("catalog '" + it.key() + "' must be a JSON object");
    }
    doc.settings.vip_catalogs = catalogs;
    CROW_LOG_INFO << "[catalog] vip catalogs updated, " << catalogs.size() << " entries";
}

CatalogStats ProfileCatalog::stats(const Document& doc) const {
    CatalogStats s;
    s.profiles = doc.profiles.size();
    s.vip_profiles = doc.vip_profiles.size();
    s.chats = doc.chats.size();
    s.messages = doc.messages.size();
    s.comments = doc.comments.size();
    s.promocodes = doc.promocodes.size();
    s.unread_messages = std::count_if(doc.messages.begin(), doc.messages.end(), [](const ChatMessage& m) {
        return m.sender == Sender::User && !m.is_read;
    });
    return s;
}
