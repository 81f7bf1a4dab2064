#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "../domain/chat_registry.h"
#include "../domain/entities.h"

// Тело сообщения: {"text": "...", "file_url": "...", "file_name": "..."}.
// Файл уже загружен, здесь только ссылка на него
inline MessageDraft messageDraftFrom(const nlohmann::json& body, Sender sender) {
    MessageDraft draft;
    draft.sender = sender;
    draft.text = body.value("text", std::string());

    auto trim_at = draft.text.find_last_not_of(" \t\r\n");
    draft.text = trim_at == std::string::npos ? "" : draft.text.substr(0, trim_at + 1);
    auto lead = draft.text.find_first_not_of(" \t\r\n");
    if (lead != std::string::npos) draft.text = draft.text.substr(lead);

    std::string url = body.value("file_url", std::string());
    if (!url.empty()) {
        Attachment a;
        a.url = url;
        a.file_name = body.value("file_name", std::string());
        if (a.file_name.empty()) {
            auto slash = url.rfind('/');
            a.file_name = slash == std::string::npos ? url : url.substr(slash + 1);
        }
        a.kind = attachmentKindFor(a.file_name);
        draft.attachment = a;
    }
    return draft;
}
