//
// Created by Revhome on 28.09.2025.
//

#ifndef URL_SUCKER_APP_PARCER_H
#define URL_SUCKER_APP_PARCER_H

#include <string>
#include <vector>
#include <optional>
#include <simdjson.h>
#include "../include/Entry.hpp"
#include "../engine/IngestionPipeline.hpp"

class Parser {
public:
    Parser() = default;

    // 🔹 Загружает HAR-файл в память (DOM)
    bool loadHarFile(const std::string &filename);

    // 🔹 То же для уже прочитанного JSON
    bool loadHarString(const std::string &json);

    // 🔹 Возвращает все Entry после разбора
    const std::vector<Entry> &getEntries() const { return entries; }

    // 🔹 Entry -> ответ для конвейера; nullopt для бинарного (base64) тела
    static std::optional<InterceptedResponse> toResponse(const Entry &entry);

private:
    std::vector<Entry> entries; // Все Entry из HAR

    bool loadDocument(const simdjson::dom::element &doc);

    // 🔹 Разбор одного Entry
    void parseEntry(const simdjson::dom::element &elem, uint64_t id);
};

#endif //URL_SUCKER_APP_PARCER_H
