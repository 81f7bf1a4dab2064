#include "order_ledger.h"

#include <algorithm>
#include <cmath>

#include "crow/logging.h"

#include "../db/store_errors.h"

static const char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

OrderFilter parseOrderFilter(const std::string& text) {
    if (text == "booked") return OrderFilter::Booked;
    if (text == "unpaid") return OrderFilter::Unpaid;
    return OrderFilter::All;
}

OrderLedger::OrderLedger() : rng_(std::random_device{}()) {}

OrderLedger::OrderLedger(std::uint32_t seed) : rng_(seed) {}

std::string OrderLedger::generateOrderCode() {
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(kAlphabet) - 2);

    std::lock_guard<std::mutex> lk(rng_m_);
    std::string code;
    code.reserve(kOrderCodeLength);
    for (std::size_t i = 0; i < kOrderCodeLength; ++i) {
        code.push_back(kAlphabet[pick(rng_)]);
    }
    return code;
}

double OrderLedger::bonusFor(double amount, double bonus_percentage) {
    return amount * bonus_percentage / 100.0;
}

static bool sameUser(const std::optional<std::string>& a, const std::optional<std::string>& b) {
    return a == b;
}

Order OrderLedger::quote(Document& doc, const QuoteRequest& req, Timestamp now) {
    if (!std::isfinite(req.amount) || req.amount <= 0.0) {
        throw ValidationError("amount must be a positive number");
    }
    if (req.profile_id <= 0) {
        throw ValidationError("profile_id is required");
    }
    bool profile_exists = std::any_of(doc.profiles.begin(), doc.profiles.end(),
                                      [&](const Profile& p) { return p.id == req.profile_id; });
    if (!profile_exists) {
        throw NotFoundError("profile " + std::to_string(req.profile_id) + " not found");
    }

    const double pct = doc.settings.bonus_percentage;
    const double bonus = bonusFor(req.amount, pct);

    for (auto& order : doc.orders) {
        if (order.profile_id == req.profile_id &&
            order.status == OrderStatus::Unpaid &&
            sameUser(order.telegram_user_id, req.telegram_user_id)) {
            order.amount = req.amount;
            order.bonus_amount = bonus;
            order.total_amount = req.amount + bonus;
            order.crypto_type = req.crypto_type;
            order.currency = req.currency;
            order.expires_at = now + kPaymentWindow;
            CROW_LOG_INFO << "[ledger] updated order #" << order.id << ": " << req.amount
                          << " + " << pct << "% bonus = " << order.total_amount;
            return order;
        }
    }

    Order order;
    order.id = nextId(doc.counters.orders, doc.orders);
    order.order_number = generateOrderCode();
    order.profile_id = req.profile_id;
    order.telegram_user_id = req.telegram_user_id;
    order.amount = req.amount;
    order.bonus_amount = bonus;
    order.total_amount = req.amount + bonus;
    order.crypto_type = req.crypto_type;
    order.currency = req.currency;
    order.status = OrderStatus::Unpaid;
    order.created_at = now;
    order.expires_at = now + kPaymentWindow;
    doc.orders.push_back(order);

    CROW_LOG_INFO << "[ledger] new order " << order.order_number << " (#" << order.id << "): "
                  << req.amount << " + " << pct << "% bonus = " << order.total_amount;
    return order;
}

std::optional<Order> OrderLedger::book(Document& doc, long long profile_id,
                                       const std::optional<std::string>& telegram_user_id,
                                       Timestamp now) const {
    // Самый свежий по порядку добавления
    for (auto it = doc.orders.rbegin(); it != doc.orders.rend(); ++it) {
        if (it->profile_id != profile_id || it->status != OrderStatus::Unpaid) continue;
        if (telegram_user_id && it->telegram_user_id != telegram_user_id) continue;

        it->status = OrderStatus::Booked;
        it->booked_at = now;
        CROW_LOG_INFO << "[ledger] order #" << it->id << " booked for profile " << profile_id
                      << ", user " << telegram_user_id.value_or("-");
        return *it;
    }
    CROW_LOG_DEBUG << "[ledger] no unpaid order to book for profile " << profile_id;
    return std::nullopt;
}

std::optional<Order> OrderLedger::confirm(Document& doc, long long order_id, Timestamp now) const {
    for (auto& order : doc.orders) {
        if (order.id != order_id) continue;
        if (order.status == OrderStatus::Unpaid) {
            order.status = OrderStatus::Booked;
            order.booked_at = now;
            CROW_LOG_INFO << "[ledger] order #" << order.id << " confirmed by admin";
        }
        return order;
    }
    return std::nullopt;
}

std::size_t OrderLedger::sweep(Document& doc, Timestamp now) const {
    const auto before = doc.orders.size();
    doc.orders.erase(std::remove_if(doc.orders.begin(), doc.orders.end(),
                                    [now](const Order& o) {
                                        return o.status == OrderStatus::Unpaid && o.expires_at < now;
                                    }),
                     doc.orders.end());
    return before - doc.orders.size();
}

std::vector<Order> OrderLedger::ordersOf(const Document& doc, const std::string& telegram_user_id,
                                         OrderFilter filter) const {
    std::vector<Order> result;
    for (const auto& order : doc.orders) {
        if (order.telegram_user_id != telegram_user_id) continue;
        if (filter == OrderFilter::Booked && order.status != OrderStatus::Booked) continue;
        if (filter == OrderFilter::Unpaid && order.status != OrderStatus::Unpaid) continue;
        result.push_back(order);
    }
    std::stable_sort(result.begin(), result.end(), [](const Order& a, const Order& b) {
        return a.created_at > b.created_at;
    });
    return result;
}

bool OrderLedger::remove(Document& doc, long long order_id, const std::string& telegram_user_id) const {
    auto it = std::find_if(doc.orders.begin(), doc.orders.end(), [&](const Order& o) {
        return o.id == order_id && o.telegram_user_id == telegram_user_id;
    });
    if (it == doc.orders.end()) return false;

    doc.orders.erase(it);
    CROW_LOG_INFO << "[ledger] order #" << order_id << " deleted by user " << telegram_user_id;
    return true;
}
