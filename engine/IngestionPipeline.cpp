//
// Created by Revhome on 14.10.2026.
//

#include "IngestionPipeline.hpp"
#include "ResponseClassifier.hpp"
#include "UrlExtractor.hpp"
#include "UrlResolver.hpp"
#include "UrlHandle.hpp"
#include <iostream>

std::string sourceFileLabel(const std::optional<std::string> &requestUrl) {
    if (!requestUrl) return "unknown";

    const auto slash = requestUrl->rfind('/');
    std::string segment = slash == std::string::npos ? *requestUrl : requestUrl->substr(slash + 1);
    if (const auto q = segment.find('?'); q != std::string::npos) {
        segment.erase(q);
    }
    return segment.empty() ? "unknown" : segment;
}

std::optional<std::string> originKey(const std::string &resolved) {
    // Без контекста путь "/x" остаётся относительным, libcurl такой не примет
    if (!resolved.empty() && resolved[0] == '/') return std::string("unknown");

    const auto h = UrlHandle::parse(resolved);
    if (!h) return std::nullopt;
    const auto scheme = h->scheme();
    const auto host = h->host();
    if (!scheme || !host) return std::string("unknown");
    return *scheme + "://" + *host;
}

IngestionPipeline::IngestionPipeline(DiscoveryStore &store) : store(store) {}

size_t IngestionPipeline::ingest(const std::string &body,
                                 const std::optional<std::string> &contentType,
                                 const std::optional<RequestContext> &context,
                                 const std::optional<std::string> &requestUrl,
                                 const bool greedy) {
    InterceptedResponse response;
    response.body = body;
    response.contentType = contentType;
    response.context = context;
    response.requestUrl = requestUrl;
    return ingest(response, greedy);
}

size_t IngestionPipeline::ingest(const InterceptedResponse &response, const bool greedy) {
    if (!isJsLike(response.contentType, response.requestUrl)) return 0;
    if (response.body.empty()) return 0;

    try {
        return ingestCandidates(response, greedy);
    } catch (const std::exception &e) {
        std::cerr << "Ingest: failed for " << response.requestUrl.value_or("unknown") << ": " << e.what() << "\n";
        return 0;
    }
}

size_t IngestionPipeline::ingestCandidates(const InterceptedResponse &response, const bool greedy) {
    const std::string sourceFile = sourceFileLabel(response.requestUrl);
    const auto candidates = extractCandidates(response.body, greedy);

    size_t added = 0;
    for (const auto &candidate : candidates) {
        try {
            const auto resolved = resolveUrl(candidate, response.context);
            if (!resolved) continue;

            const auto origin = originKey(*resolved);
            if (!origin) continue;

            if (store.insert(*origin, DiscoveredUrl{*resolved, sourceFile})) {
                ++added;
            }
        } catch (const std::exception &e) {
            // Ошибка одного кандидата не прерывает обработку остальных
            std::cerr << "Ingest: skipping candidate \"" << candidate << "\": " << e.what() << "\n";
        }
    }
    return added;
}
