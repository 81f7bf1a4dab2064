#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "../db/document_store.h"
#include "../domain/order_ledger.h"

// Фоновая очистка неоплаченных заказов, у которых истекло окно оплаты
class ExpirySweeper {
public:
    ExpirySweeper(DocumentStore& store, const OrderLedger& ledger,
                  std::chrono::seconds interval = std::chrono::seconds(60));
    ~ExpirySweeper();

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    // Один проход; документ сохраняется только если что-то удалено
    std::size_t runOnce(Timestamp now);

    void start();
    void stop();

private:
    void loop();

    DocumentStore& store_;
    const OrderLedger& ledger_;
    std::chrono::seconds interval_;

    std::atomic<bool> running_{false};
    std::mutex m_;
    std::condition_variable cv_;
    std::thread thread_;
};
