//
// Created by Revhome on 14.10.2026.
//

#ifndef URL_SUCKER_APP_DISCOVERY_STORE_HPP
#define URL_SUCKER_APP_DISCOVERY_STORE_HPP

#include <string>
#include <vector>
#include <memory>
#include "../include/DiscoveredUrl.hpp"
#include "../include/Indexes.hpp"
#include <tbb/spin_rw_mutex.h>

// 🗂 Потокобезопасное хранилище находок, сгруппированных по origin.
//
// Вставки в разные origin не сериализуются общим замком: индекс и множества
// построены на конкурентных контейнерах TBB. insert и snapshot берут замок индекса
// только на чтение; clear() под замком на запись подменяет индекс целиком,
// поэтому snapshot видит либо состояние до очистки, либо после.
class DiscoveryStore {
public:
    DiscoveryStore();

    // 🔹 true если пара (url, sourceFile) для этого origin новая
    bool insert(const std::string &origin, const DiscoveredUrl &url);

    void clear();

    // 🔹 Плоская проекция: сортировка по url, затем sourceFile; фильтр без учёта регистра
    // по строке "url sourceFile host path". Пустой фильтр пропускает всё.
    std::vector<SnapshotRow> snapshot(const std::string &filter) const;

    size_t size() const;

    // 🔹 Отсортированный список ключей origin
    std::vector<std::string> origins() const;

private:
    std::shared_ptr<OriginIndex> current() const;

    mutable tbb::spin_rw_mutex indexMutex;
    std::shared_ptr<OriginIndex> index;
};

// 🔹 Разбивка сохранённого URL на колонки host и path; "unknown" + сырой url если не парсится
SnapshotRow makeRow(const DiscoveredUrl &url);

#endif //URL_SUCKER_APP_DISCOVERY_STORE_HPP
