//
// Created by Revhome on 14.10.2026.
//

#ifndef URL_SUCKER_APP_REQUEST_CONTEXT_HPP
#define URL_SUCKER_APP_REQUEST_CONTEXT_HPP

#include <string>
#include <optional>

// 🌐 Контекст исходного запроса: нужен только на время разрешения относительных ссылок
struct RequestContext {
    std::string scheme;  // "http" или "https"
    std::string host;    // Хост без порта
    int port = 80;       // Порт сервиса (явный или по умолчанию для схемы)
    std::string path;    // Путь запроса вместе с query

    bool secure() const;

    // 🔹 Строит контекст из абсолютного URL запроса, nullopt если URL не http(s)
    static std::optional<RequestContext> fromUrl(const std::string &url);
};

#endif //URL_SUCKER_APP_REQUEST_CONTEXT_HPP
