#include "session_registry.h"

#include <iomanip>
#include <sstream>

SessionRegistry::SessionRegistry() : rng_(std::random_device{}()) {}

// 32 hex-символа
std::string SessionRegistry::randomId() {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << rng_() << std::setw(16) << rng_();
    return oss.str();
}

std::string SessionRegistry::create(const SessionIdentity& identity) {
    std::lock_guard<std::mutex> lk(m_);
    std::string id = randomId();
    while (sessions_.count(id)) id = randomId();
    sessions_[id] = identity;
    return id;
}

std::optional<SessionIdentity> SessionRegistry::find(const std::string& session_id) const {
    if (session_id.empty()) return std::nullopt;

    std::lock_guard<std::mutex> lk(m_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second;
}

void SessionRegistry::destroy(const std::string& session_id) {
    std::lock_guard<std::mutex> lk(m_);
    sessions_.erase(session_id);
}
