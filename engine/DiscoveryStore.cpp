//
// Created by Revhome on 14.10.2026.
//

#include "DiscoveryStore.hpp"
#include "UrlHandle.hpp"
#include <algorithm>

DiscoveryStore::DiscoveryStore() : index(std::make_shared<OriginIndex>()) {}

std::shared_ptr<OriginIndex> DiscoveryStore::current() const {
    tbb::spin_rw_mutex::scoped_lock lock(indexMutex, /*write=*/false);
    return index;
}

bool DiscoveryStore::insert(const std::string &origin, const DiscoveredUrl &url) {
    // Замок на чтение держится всю вставку: clear() не может проскочить между
    // выбором индекса и записью в него
    tbb::spin_rw_mutex::scoped_lock lock(indexMutex, /*write=*/false);
    auto it = index->find(origin);
    if (it == index->end()) {
        // При гонке выигрывает одна вставка, вторая получает уже существующий элемент
        it = index->emplace(origin, std::make_shared<UrlSet>()).first;
    }
    return it->second->insert(url).second;
}

void DiscoveryStore::clear() {
    auto fresh = std::make_shared<OriginIndex>();
    {
        tbb::spin_rw_mutex::scoped_lock lock(indexMutex, /*write=*/true);
        index.swap(fresh);
    }
    // Старый индекс освобождается вне замка (или позже, последним snapshot)
}

size_t DiscoveryStore::size() const {
    const auto idx = current();
    size_t total = 0;
    for (const auto &kv : *idx) {
        total += kv.second->size();
    }
    return total;
}

std::vector<std::string> DiscoveryStore::origins() const {
    const auto idx = current();
    std::vector<std::string> keys;
    for (const auto &kv : *idx) {
        keys.push_back(kv.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

SnapshotRow makeRow(const DiscoveredUrl &url) {
    SnapshotRow row;
    row.sourceFile = url.sourceFile;
    row.url = url.url;

    const auto h = UrlHandle::parse(url.url);
    if (!h) {
        row.host = "unknown";
        row.path = url.url;
        return row;
    }
    const auto scheme = h->scheme();
    row.host = scheme ? *scheme + "://" : "";
    row.host += h->host().value_or("unknown");
    row.path = h->path().value_or("/");
    if (const auto query = h->query()) {
        row.path += "?";
        row.path += *query;
    }
    return row;
}

std::vector<SnapshotRow> DiscoveryStore::snapshot(const std::string &filter) const {
    const auto idx = current();

    std::vector<DiscoveredUrl> all;
    for (const auto &kv : *idx) {
        for (const auto &found : *kv.second) {
            all.push_back(found);
        }
    }

    std::sort(all.begin(), all.end(), [](const DiscoveredUrl &a, const DiscoveredUrl &b) {
        if (a.url != b.url) return a.url < b.url;
        return a.sourceFile < b.sourceFile;
    });

    const std::string needle = toLowerAscii(filter);

    std::vector<SnapshotRow> rows;
    rows.reserve(all.size());
    for (const auto &found : all) {
        SnapshotRow row = makeRow(found);
        if (!needle.empty()) {
            const std::string haystack =
                toLowerAscii(row.url + " " + row.sourceFile + " " + row.host + " " + row.path);
            if (haystack.find(needle) == std::string::npos) continue;
        }
        rows.push_back(std::move(row));
    }
    return rows;
}
