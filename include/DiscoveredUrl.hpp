//
// Created by Revhome on 14.10.2026.
//

#ifndef URL_SUCKER_APP_DISCOVERED_URL_HPP
#define URL_SUCKER_APP_DISCOVERED_URL_HPP

#include <string>
#include <cstddef>
#include <functional>

// 🕵️‍♂️ Найденный URL и JS-файл, в котором он встретился
struct DiscoveredUrl {
    std::string url;         // Абсолютный URL
    std::string sourceFile;  // Имя файла-источника или "unknown"

    bool operator==(const DiscoveredUrl &other) const {
        return url == other.url && sourceFile == other.sourceFile;
    }
    bool operator!=(const DiscoveredUrl &other) const { return !(*this == other); }
};

struct DiscoveredUrlHash {
    std::size_t operator()(const DiscoveredUrl &d) const {
        const std::size_t h1 = std::hash<std::string>{}(d.url);
        const std::size_t h2 = std::hash<std::string>{}(d.sourceFile);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

// 📋 Строка представления: то, что показывает таблица
struct SnapshotRow {
    std::string host;        // scheme://host или "unknown"
    std::string path;        // Путь + "?" + query
    std::string sourceFile;
    std::string url;         // Исходный сохранённый URL
};

#endif //URL_SUCKER_APP_DISCOVERED_URL_HPP
