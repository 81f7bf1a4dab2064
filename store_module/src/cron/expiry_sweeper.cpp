#include "expiry_sweeper.h"

#include "crow/logging.h"

ExpirySweeper::ExpirySweeper(DocumentStore& store, const OrderLedger& ledger, std::chrono::seconds interval)
    : store_(store), ledger_(ledger), interval_(interval) {}

ExpirySweeper::~ExpirySweeper() {
    stop();
}

std::size_t ExpirySweeper::runOnce(Timestamp now) {
    std::size_t removed = 0;
    store_.tryUpdate([&](Document& doc) {
        removed = ledger_.sweep(doc, now);
        return removed > 0;
    });
    if (removed > 0) {
        CROW_LOG_INFO << "[sweeper] cleaned up " << removed << " expired unpaid orders";
    }
    return removed;
}

void ExpirySweeper::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread([this]() { loop(); });
    CROW_LOG_INFO << "[sweeper] started, interval " << interval_.count() << "s";
}

void ExpirySweeper::stop() {
    {
        std::lock_guard<std::mutex> lk(m_);
        if (!running_.exchange(false)) return;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    CROW_LOG_INFO << "[sweeper] stopped";
}

void ExpirySweeper::loop() {
    while (running_) {
        try {
            runOnce(nowUtc());
        } catch (const std::exception& e) {
            CROW_LOG_ERROR << "[sweeper] cleanup failed: " << e.what();
        }

        std::unique_lock<std::mutex> lk(m_);
        cv_.wait_for(lk, interval_, [this]() { return !running_.load(); });
    }
}
