#include "document_store.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include "crow/logging.h"

#include "../domain/document_json.h"

using json = nlohmann::json;

static std::string errno_text(const std::string& what, const std::string& path) {
    return what + " " + path + ": " + std::strerror(errno);
}

static std::string parent_dir(const std::string& path) {
    auto slash = path.rfind('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return path.substr(0, slash);
}

// Межпроцессная блокировка записи: flock на <path>.lock, снимается в деструкторе
class FileLock {
public:
    explicit FileLock(const std::string& path) {
        fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ < 0) throw StoreError(errno_text("cannot open lock file", path));

        while (::flock(fd_, LOCK_EX) != 0) {
            if (errno == EINTR) continue;
            std::string msg = errno_text("cannot lock", path);
            ::close(fd_);
            throw StoreError(msg);
        }
    }

    ~FileLock() {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_{-1};
};

DocumentStore::DocumentStore(std::string path, std::chrono::milliseconds freshness)
    : path_(std::move(path)),
      tmp_path_(path_ + ".tmp"),
      lock_path_(path_ + ".lock"),
      freshness_(freshness) {}

std::shared_ptr<const DocumentStore::CacheEntry> DocumentStore::freshEntry() const {
    auto entry = std::atomic_load(&cache_);
    if (!entry) return nullptr;
    if (std::chrono::steady_clock::now() - entry->loaded_at >= freshness_) return nullptr;
    return entry;
}

void DocumentStore::remember(const Document& doc) {
    auto entry = std::make_shared<const CacheEntry>(CacheEntry{doc, std::chrono::steady_clock::now()});
    std::atomic_store(&cache_, entry);
}

Document DocumentStore::load() {
    // Быстрый путь без блокировки
    if (auto entry = freshEntry()) return entry->doc;

    std::lock_guard<std::mutex> lk(m_);
    // Пока ждали блокировку, кэш мог обновить другой поток
    if (auto entry = freshEntry()) return entry->doc;

    Document doc = readFromDisk();
    remember(doc);
    return doc;
}

void DocumentStore::invalidate() {
    std::atomic_store(&cache_, std::shared_ptr<const CacheEntry>());
}

Document DocumentStore::readFromDisk() const {
    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        struct stat st{};
        if (::stat(path_.c_str(), &st) != 0 && errno == ENOENT) {
            CROW_LOG_INFO << "[store] " << path_ << " not found, starting with default document";
            return defaultDocument();
        }
        CROW_LOG_ERROR << "[store] " << errno_text("cannot read", path_) << ", using empty document";
        return Document{};
    }

    try {
        std::stringstream buf;
        buf << in.rdbuf();
        return json::parse(buf.str()).get<Document>();
    } catch (const std::exception& e) {
        // Доступность важнее: битый файл не роняет сервис, но данные в нём будут потеряны
        // при следующем сохранении
        CROW_LOG_ERROR << "[store] corrupt document " << path_ << ": " << e.what()
                       << ", using empty document";
        return Document{};
    }
}

std::uint64_t DocumentStore::diskVersion() const {
    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) return 0;

    try {
        std::stringstream buf;
        buf << in.rdbuf();
        auto j = json::parse(buf.str());
        if (!j.is_object()) return 0;
        return j.value("version", std::uint64_t{0});
    } catch (const std::exception& e) {
        CROW_LOG_WARNING << "[store] unreadable version in " << path_ << ": " << e.what();
        return 0;
    }
}

void DocumentStore::writeAtomically(const Document& doc) const {
    const std::string payload = json(doc).dump(2);

    int fd = ::open(tmp_path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) throw StoreError(errno_text("cannot create", tmp_path_));

    const char* data = payload.data();
    std::size_t left = payload.size();
    while (left > 0) {
        ssize_t n = ::write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string msg = errno_text("cannot write", tmp_path_);
            ::close(fd);
            ::unlink(tmp_path_.c_str());
            throw StoreError(msg);
        }
        data += n;
        left -= static_cast<std::size_t>(n);
    }

    if (::fsync(fd) != 0) {
        std::string msg = errno_text("cannot fsync", tmp_path_);
        ::close(fd);
        ::unlink(tmp_path_.c_str());
        throw StoreError(msg);
    }
    ::close(fd);

    // rename атомарен: читатель видит либо старый, либо новый файл целиком
    if (::rename(tmp_path_.c_str(), path_.c_str()) != 0) {
        std::string msg = errno_text("cannot replace", path_);
        ::unlink(tmp_path_.c_str());
        throw StoreError(msg);
    }

    int dir = ::open(parent_dir(path_).c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir >= 0) {
        ::fsync(dir);
        ::close(dir);
    }
}

void DocumentStore::save(Document& doc) {
    std::lock_guard<std::mutex> lk(m_);
    FileLock guard(lock_path_);

    const std::uint64_t on_disk = diskVersion();
    if (on_disk != doc.version) {
        std::ostringstream oss;
        oss << "stale write to " << path_ << ": document version " << doc.version
            << ", on disk " << on_disk;
        throw StaleWriteError(oss.str());
    }

    const std::uint64_t loaded_version = doc.version;
    doc.version = on_disk + 1;
    try {
        writeAtomically(doc);
    } catch (...) {
        doc.version = loaded_version;
        throw;
    }

    remember(doc);
    CROW_LOG_DEBUG << "[store] saved " << path_ << " version " << doc.version;
}

bool DocumentStore::commit(Document& doc, int attempt) {
    try {
        save(doc);
        return true;
    } catch (const StaleWriteError& e) {
        if (attempt > 0) {
            CROW_LOG_ERROR << "[store] conflict persisted after retry: " << e.what();
            throw ConflictError(e.what());
        }
        CROW_LOG_WARNING << "[store] " << e.what() << ", retrying on fresh document";
        invalidate();
        return false;
    }
}
