//
// Created by Revhome on 14.10.2026.
//

#ifndef URL_SUCKER_APP_RESPONSE_CLASSIFIER_HPP
#define URL_SUCKER_APP_RESPONSE_CLASSIFIER_HPP

#include <string>
#include <optional>

// 🔹 Похож ли ответ на JavaScript: по Content-Type или по суффиксу ".js" у URL.
// Отсутствующие значения просто не совпадают.
bool isJsLike(const std::optional<std::string> &contentType, const std::optional<std::string> &sourceUrl);

#endif //URL_SUCKER_APP_RESPONSE_CLASSIFIER_HPP
