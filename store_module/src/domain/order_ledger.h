#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "entities.h"

// Запрос на оплату от пользователя
struct QuoteRequest {
    long long profile_id = 0;
    std::optional<std::string> telegram_user_id;
    double amount = 0.0;
    std::string crypto_type;
    std::string currency = "USD";
};

enum class OrderFilter {
    All,
    Booked,
    Unpaid
};

// "all" | "booked" | "unpaid"; неизвестное значение -> All
OrderFilter parseOrderFilter(const std::string& text);

// Жизненный цикл заказа: unpaid -> booked, либо unpaid -> удалён по истечении часа.
// Все методы меняют только переданный Document, сохранение делает вызывающий.
class OrderLedger {
public:
    static constexpr std::chrono::hours kPaymentWindow{1};
    static constexpr std::size_t kOrderCodeLength = 18;

    OrderLedger();
    explicit OrderLedger(std::uint32_t seed);

    // Один неоплаченный заказ на пару (профиль, пользователь): повторный запрос
    // обновляет существующий и продлевает окно оплаты
    Order quote(Document& doc, const QuoteRequest& req, Timestamp now);

    // Последний неоплаченный заказ профиля. Без telegram_user_id подходит заказ любого пользователя
    std::optional<Order> book(Document& doc, long long profile_id,
                              const std::optional<std::string>& telegram_user_id, Timestamp now) const;

    // Подтверждение конкретного заказа админом. Уже оплаченный возвращается без изменений
    std::optional<Order> confirm(Document& doc, long long order_id, Timestamp now) const;

    std::size_t sweep(Document& doc, Timestamp now) const;

    std::vector<Order> ordersOf(const Document& doc, const std::string& telegram_user_id,
                                OrderFilter filter) const;

    bool remove(Document& doc, long long order_id, const std::string& telegram_user_id) const;

    std::string generateOrderCode();

    static double bonusFor(double amount, double bonus_percentage);

private:
    std::mutex rng_m_;
    std::mt19937 rng_;
};
