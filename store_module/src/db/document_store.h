#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>

#include "../domain/entities.h"
#include "store_errors.h"

// DocumentStore = весь state приложения в одном JSON-файле.
//
// - load() отдаёт копию документа; в пределах freshness окна читается кэш без блокировки
// - save() пишет во временный файл и атомарно переименовывает его поверх основного
// - каждая запись увеличивает version; сохранение копии со старой версией отклоняется
//   StaleWriteError, в том числе если файл перезаписал другой процесс
//
// Обработчики работают через update(): load -> изменение -> save, с одной повторной
// попыткой на свежем документе при конфликте версий.

class DocumentStore {
public:
    explicit DocumentStore(std::string path,
                           std::chrono::milliseconds freshness = std::chrono::seconds(5));

    DocumentStore(const DocumentStore&) = delete;
    DocumentStore& operator=(const DocumentStore&) = delete;

    Document load();
    void save(Document& doc);
    void invalidate();

    template <typename Fn>
    auto update(Fn&& fn) -> std::invoke_result_t<Fn&, Document&> {
        using Result = std::invoke_result_t<Fn&, Document&>;
        std::lock_guard<std::mutex> lk(writer_m_);

        for (int attempt = 0;; ++attempt) {
            Document doc = load();
            if constexpr (std::is_void_v<Result>) {
                fn(doc);
                if (commit(doc, attempt)) return;
            } else {
                Result result = fn(doc);
                if (commit(doc, attempt)) return result;
            }
        }
    }

    // fn возвращает true, если документ изменился; иначе сохранения не будет
    template <typename Fn>
    bool tryUpdate(Fn&& fn) {
        std::lock_guard<std::mutex> lk(writer_m_);

        for (int attempt = 0;; ++attempt) {
            Document doc = load();
            if (!fn(doc)) return false;
            if (commit(doc, attempt)) return true;
        }
    }

    const std::string& path() const { return path_; }

private:
    struct CacheEntry {
        Document doc;
        std::chrono::steady_clock::time_point loaded_at;
    };

    std::shared_ptr<const CacheEntry> freshEntry() const;
    void remember(const Document& doc);

    bool commit(Document& doc, int attempt);

    Document readFromDisk() const;
    std::uint64_t diskVersion() const;
    void writeAtomically(const Document& doc) const;

    std::string path_;
    std::string tmp_path_;
    std::string lock_path_;
    std::chrono::milliseconds freshness_;

    // читается через std::atomic_load без m_
    std::shared_ptr<const CacheEntry> cache_;

    std::mutex m_;         // перечитывание кэша и запись файла
    std::mutex writer_m_;  // циклы update() внутри процесса идут строго по очереди
};
