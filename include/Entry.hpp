//
// Created by Revhome on 28.09.2025.
//

#ifndef URL_SUCKER_APP_ENTRY_H
#define URL_SUCKER_APP_ENTRY_H

#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <cstdint>  // для uint64_t

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// 📦 Один перехваченный обмен запрос/ответ из HAR
struct Entry {
    uint64_t id = 0;                    // Порядковый номер записи в архиве
    std::string startedDateTime;        // Время начала запроса
    std::string method;                 // HTTP метод (GET, POST, PUT…)
    std::string url;                    // Полный URL запроса
    unsigned long long status = 0;      // HTTP статус ответа (200, 404…)
    HeaderList request_headers;         // Заголовки запроса в исходном порядке
    HeaderList response_headers;        // Заголовки ответа в исходном порядке
    std::string response_text;          // Тело ответа (JS, HTML, JSON…)
    std::string mime_type;              // response.content.mimeType
    std::string encoding;               // response.content.encoding ("" или "base64")
};

// 🔹 Поиск заголовка без учёта регистра имени, первое совпадение
std::optional<std::string> findHeader(const HeaderList &headers, const std::string &name);

#endif //URL_SUCKER_APP_ENTRY_H
