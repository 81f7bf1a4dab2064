#pragma once

#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>

// Кто стоит за сессией. Для админки заполнен только username
struct SessionIdentity {
    std::string telegram_id;
    std::string username;
    std::string first_name;
};

// Сессии живут в памяти процесса и теряются при перезапуске
class SessionRegistry {
public:
    SessionRegistry();

    std::string create(const SessionIdentity& identity);
    std::optional<SessionIdentity> find(const std::string& session_id) const;
    void destroy(const std::string& session_id);

private:
    std::string randomId();

    mutable std::mutex m_;
    std::unordered_map<std::string, SessionIdentity> sessions_;
    std::mt19937_64 rng_;
};
