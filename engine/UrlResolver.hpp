//
// Created by Revhome on 14.10.2026.
//

#ifndef URL_SUCKER_APP_URL_RESOLVER_HPP
#define URL_SUCKER_APP_URL_RESOLVER_HPP

#include <string>
#include <optional>
#include "../include/RequestContext.hpp"

// 🔹 Превращает кандидата в абсолютный URL с учётом контекста исходного запроса.
//
//  - короче 3 символов после trim: отказ
//  - http:// и https:// возвращаются как есть
//  - "//host/x": схема берётся из ctx (https если запрос защищённый), без ctx "http:"
//  - "/path": разрешается от scheme://host; без ctx возвращается без изменений
//  - "rel/x": разрешается от scheme://host[:port]/ (порт 80 и 443 опускается); без ctx отказ
//  - синтаксически некорректная ссылка: отказ
std::optional<std::string> resolveUrl(const std::string &candidate, const std::optional<RequestContext> &ctx);

#endif //URL_SUCKER_APP_URL_RESOLVER_HPP
