//
// Created by Revhome on 15.10.2026.
//

#ifndef URL_SUCKER_APP_REQUEST_BUILDER_HPP
#define URL_SUCKER_APP_REQUEST_BUILDER_HPP

#include <string>
#include <optional>
#include "ToolActions.hpp"
#include "../include/DiscoveredUrl.hpp"

// 🔹 Простой GET по абсолютному http(s) URL; nullopt если URL не годится для запроса
std::optional<OutboundRequest> buildGetRequest(const std::string &url);

// 🔹 Полный URL строки таблицы: host + path
std::string rowUrl(const SnapshotRow &row);

#endif //URL_SUCKER_APP_REQUEST_BUILDER_HPP
