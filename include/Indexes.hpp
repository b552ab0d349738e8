//
// Created by Revhome on 28.09.2025.
//

#ifndef URL_SUCKER_APP_INDEXES_HPP
#define URL_SUCKER_APP_INDEXES_HPP

#include <string>
#include <memory>
#include <tbb/concurrent_unordered_map.h>
#include <tbb/concurrent_unordered_set.h>
#include "DiscoveredUrl.hpp"

// 🔑 Множество находок одного origin, вставка и обход потокобезопасны
using UrlSet = tbb::concurrent_unordered_set<DiscoveredUrl, DiscoveredUrlHash>;

// origin ("https://example.com" или "unknown") -> множество находок
using OriginIndex = tbb::concurrent_unordered_map<std::string, std::shared_ptr<UrlSet>>;

#endif //URL_SUCKER_APP_INDEXES_HPP
