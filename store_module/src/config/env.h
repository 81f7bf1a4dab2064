#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

// Настройки берутся только из переменных окружения

std::string getenv_or(const char* key, const std::string& def);
long long to_ll(const std::string& s, long long def = 0);

// "123, 456,,789" -> {123, 456, 789}; нечисловые элементы пропускаются
std::vector<long long> parseIdList(const std::string& csv);

// LOG_LEVEL = debug | info | warning | error
void configureLogging();

// CRYPTO_WALLET_<NAME> -> {"<name>": address}, только непустые
std::map<std::string, std::string> walletsFromEnv();

// Общее для обоих процессов
struct StoreConfig {
    std::string data_file;
    std::chrono::seconds cache_ttl{5};
    std::chrono::seconds sweep_interval{60};
};

StoreConfig loadStoreConfig();
