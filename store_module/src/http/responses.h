#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "crow.h"

#include "../db/store_errors.h"

// Общие куски HTTP-обработчиков обоих процессов

inline crow::response jsonResponse(int code, const nlohmann::json& body) {
    crow::response res(code);
    res.set_header("Content-Type", "application/json");
    res.body = body.dump();
    return res;
}

inline crow::response jsonResponse(const nlohmann::json& body) {
    return jsonResponse(200, body);
}

inline crow::response errorResponse(int code, const std::string& detail) {
    return jsonResponse(code, nlohmann::json{{"detail", detail}});
}

// Тело запроса обязано быть JSON-объектом
inline nlohmann::json parseBody(const crow::request& req) {
    nlohmann::json body = nlohmann::json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw ValidationError("Invalid JSON");
    }
    return body;
}

inline std::optional<std::string> queryParam(const crow::request& req, const char* name) {
    const char* v = req.url_params.get(name);
    if (!v) return std::nullopt;
    return std::string(v);
}

// Значение cookie из заголовка "Cookie: a=1; b=2"
inline std::string cookieValue(const crow::request& req, const std::string& name) {
    const std::string header = req.get_header_value("Cookie");
    std::size_t pos = 0;
    while (pos < header.size()) {
        std::size_t end = header.find(';', pos);
        if (end == std::string::npos) end = header.size();

        std::string pair = header.substr(pos, end - pos);
        auto first = pair.find_first_not_of(' ');
        if (first != std::string::npos) pair = pair.substr(first);

        auto eq = pair.find('=');
        if (eq != std::string::npos && pair.compare(0, eq, name) == 0) {
            return pair.substr(eq + 1);
        }
        pos = end + 1;
    }
    return "";
}

inline void setSessionCookie(crow::response& res, const std::string& name, const std::string& value) {
    res.add_header("Set-Cookie", name + "=" + value + "; Path=/; HttpOnly; SameSite=Lax");
}

inline void clearSessionCookie(crow::response& res, const std::string& name) {
    res.add_header("Set-Cookie", name + "=; Path=/; Max-Age=0; HttpOnly; SameSite=Lax");
}

// Ошибки домена -> HTTP-коды. Всё, что не распознано, логируется и отдаётся как 500
template <typename Fn>
crow::response guarded(const char* tag, Fn&& fn) {
    try {
        return fn();
    } catch (const ValidationError& e) {
        return errorResponse(400, e.what());
    } catch (const nlohmann::json::exception& e) {
        return errorResponse(400, std::string("Invalid request body: ") + e.what());
    } catch (const ForbiddenError& e) {
        return errorResponse(403, e.what());
    } catch (const NotFoundError& e) {
        return errorResponse(404, e.what());
    } catch (const ConflictError& e) {
        CROW_LOG_WARNING << "[" << tag << "] " << e.what();
        return errorResponse(409, "Document was modified concurrently, retry the request");
    } catch (const StoreError& e) {
        CROW_LOG_ERROR << "[" << tag << "] store failure: " << e.what();
        return errorResponse(500, "Storage error");
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << "[" << tag << "] unexpected error: " << e.what();
        return errorResponse(500, "Internal error");
    }
}
