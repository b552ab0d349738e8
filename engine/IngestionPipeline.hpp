//
// Created by Revhome on 14.10.2026.
//

#ifndef URL_SUCKER_APP_INGESTION_PIPELINE_HPP
#define URL_SUCKER_APP_INGESTION_PIPELINE_HPP

#include <string>
#include <optional>
#include "../include/RequestContext.hpp"
#include "DiscoveryStore.hpp"

// 📨 Ответ в том виде, в каком его отдаёт перехватчик трафика
struct InterceptedResponse {
    std::string body;
    std::optional<std::string> contentType;  // значение заголовка Content-Type
    std::optional<RequestContext> context;   // нет, если исходный запрос неизвестен
    std::optional<std::string> requestUrl;   // полный URL исходного запроса
};

// Classifier -> Extractor -> Resolver -> Store для каждого ответа
class IngestionPipeline {
public:
    explicit IngestionPipeline(DiscoveryStore &store);

    // 🔹 Возвращает число новых записей в хранилище. Исключения наружу не выходят.
    size_t ingest(const InterceptedResponse &response, bool greedy);

    size_t ingest(const std::string &body,
                  const std::optional<std::string> &contentType,
                  const std::optional<RequestContext> &context,
                  const std::optional<std::string> &requestUrl,
                  bool greedy);

private:
    size_t ingestCandidates(const InterceptedResponse &response, bool greedy);

    DiscoveryStore &store;
};

// 🔹 Последний сегмент пути без query, "unknown" если его нет
std::string sourceFileLabel(const std::optional<std::string> &requestUrl);

// 🔹 scheme://host для разрешённого URL; "unknown" для пути без схемы и хоста,
// nullopt если абсолютный URL не разбирается
std::optional<std::string> originKey(const std::string &resolved);

#endif //URL_SUCKER_APP_INGESTION_PIPELINE_HPP
