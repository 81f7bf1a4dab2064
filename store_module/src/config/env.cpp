#include "env.h"

#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include "crow/logging.h"

#include "../domain/entities.h"

std::string getenv_or(const char* key, const std::string& def) {
    if (const char* v = std::getenv(key)) return std::string(v);
    return def;
}

long long to_ll(const std::string& s, long long def) {
    try {
        std::size_t used = 0;
        long long value = std::stoll(s, &used);
        if (used != s.size()) return def;
        return value;
    } catch (const std::logic_error&) {
        return def;
    }
}

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::vector<long long> parseIdList(const std::string& csv) {
    std::vector<long long> out;
    std::istringstream iss(csv);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (item.empty()) continue;

        long long id = to_ll(item, 0);
        if (id == 0) {
            CROW_LOG_WARNING << "[config] ignoring malformed id '" << item << "'";
            continue;
        }
        out.push_back(id);
    }
    return out;
}

void configureLogging() {
    const std::string level = toLower(getenv_or("LOG_LEVEL", "info"));

    if (level == "debug") {
        crow::logger::setLogLevel(crow::LogLevel::Debug);
    } else if (level == "warning") {
        crow::logger::setLogLevel(crow::LogLevel::Warning);
    } else if (level == "error") {
        crow::logger::setLogLevel(crow::LogLevel::Error);
    } else {
        crow::logger::setLogLevel(crow::LogLevel::Info);
    }
}

std::map<std::string, std::string> walletsFromEnv() {
    static const char* const kNames[] = {
        "trc20", "erc20", "bnb", "btc", "zetcash", "doge", "dash",
        "ltc", "usdt_bep20", "eth", "usdc_erc20",
    };

    std::map<std::string, std::string> wallets;
    for (const char* name : kNames) {
        std::string key = "CRYPTO_WALLET_";
        for (const char* c = name; *c; ++c) {
            key.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(*c))));
        }
        std::string address = trim(getenv_or(key.c_str(), ""));
        if (!address.empty()) wallets[name] = address;
    }
    return wallets;
}

StoreConfig loadStoreConfig() {
    StoreConfig cfg;
    cfg.data_file = getenv_or("DATA_FILE", "data.json");

    long long ttl = to_ll(getenv_or("CACHE_TTL_SECONDS", "5"), 5);
    cfg.cache_ttl = std::chrono::seconds(ttl >= 0 ? ttl : 5);

    long long interval = to_ll(getenv_or("SWEEP_INTERVAL_SECONDS", "60"), 60);
    cfg.sweep_interval = std::chrono::seconds(interval > 0 ? interval : 60);
    return cfg;
}
