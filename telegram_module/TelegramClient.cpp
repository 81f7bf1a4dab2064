#include "TelegramClient.h"

#include <curl/curl.h>

#include "crow/logging.h"

using json = nlohmann::json;

static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

// Ненулевой результат обрывает передачу с CURLE_ABORTED_BY_CALLBACK
static int ProgressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* abort = static_cast<std::atomic<bool>*>(clientp);
    return abort->load() ? 1 : 0;
}

TelegramClient::TelegramClient(const std::string& botToken, const std::string& apiRoot)
    : apiBase(apiRoot + "/bot" + botToken) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

TelegramClient::~TelegramClient() {
    curl_global_cleanup();
}

void TelegramClient::abortPending() {
    abort_ = true;
}

json TelegramClient::call(const std::string& method, const json& body, long timeout_seconds) {
    if (abort_) throw TelegramError(method + ": client is shutting down");

    CURL* curl = curl_easy_init();
    if (!curl) throw TelegramError(method + ": curl_easy_init failed");

    std::string url = apiBase + "/" + method;
    std::string payload = body.dump();
    std::string response;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());

    // FIX: "HTTP2 framing layer" -> форсим HTTP/1.1
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);

    // VPN/прокси иногда ломают ALPN/HTTP2 negotiation
    curl_easy_setopt(curl, CURLOPT_SSL_ENABLE_ALPN, 0L);

    // чтобы libcurl не использовал сигналы (важно в многопоточке)
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds);

    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, ProgressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &abort_);

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT && method == "getUpdates") {
        // Для long-poll это нормальная ситуация (особенно с VPN): просто повторяем цикл
        CROW_LOG_DEBUG << "[telegram] long-poll timed out";
        return json{{"ok", true}, {"result", json::array()}};
    }
    if (res == CURLE_ABORTED_BY_CALLBACK) {
        throw TelegramError(method + ": request aborted");
    }
    if (res != CURLE_OK) {
        throw TelegramError(method + ": " + curl_easy_strerror(res));
    }

    json j = json::parse(response, nullptr, false);
    if (j.is_discarded()) {
        throw TelegramError(method + ": non-JSON response, HTTP " + std::to_string(http_code));
    }
    if (!j.value("ok", false)) {
        throw TelegramError(method + ": " + j.value("description", std::string("HTTP ") + std::to_string(http_code)));
    }
    return j;
}

std::vector<TelegramUpdate> TelegramClient::getUpdates(long long offset, int timeout_seconds) {
    json body;
    body["timeout"] = timeout_seconds;
    body["allowed_updates"] = json::array({"message", "callback_query"});
    if (offset > 0) body["offset"] = offset;

    // общий таймаут чуть больше server-side timeout
    return parseUpdates(call("getUpdates", body, timeout_seconds + 45L));
}

long long TelegramClient::sendMessage(long long chat_id, const std::string& text,
                                      const InlineKeyboard& keyboard, bool html) {
    std::lock_guard<std::mutex> lk(send_m);

    json body;
    body["chat_id"] = chat_id;
    body["text"] = text;
    if (html) body["parse_mode"] = "HTML";
    if (!keyboard.empty()) body["reply_markup"] = keyboardJson(keyboard);

    json j = call("sendMessage", body, 20L);
    if (!j.contains("result") || !j["result"].is_object()) return 0;
    return j["result"].value("message_id", 0LL);
}

void TelegramClient::answerCallback(const std::string& callback_id) {
    call("answerCallbackQuery", json{{"callback_query_id", callback_id}}, 10L);
}
