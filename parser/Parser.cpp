//
// Created by Revhome on 28.09.2025.
//

#include "Parser.hpp"
#include "../engine/UrlHandle.hpp"
#include <iostream>
#include <string_view>

namespace {

std::string stringAt(const simdjson::dom::element &elem, const char *pointer) {
    std::string_view value;
    if (elem.at_pointer(pointer).get(value)) return {};
    return std::string(value);
}

void readHeaders(const simdjson::dom::element &elem, const char *pointer, HeaderList &out) {
    simdjson::dom::array headers;
    if (elem.at_pointer(pointer).get(headers)) return;

    for (auto h : headers) {
        std::string_view name;
        std::string_view value;
        if (h["name"].get(name) || h["value"].get(value)) continue;
        out.emplace_back(std::string(name), std::string(value));
    }
}

} // namespace

std::optional<std::string> findHeader(const HeaderList &headers, const std::string &name) {
    const std::string wanted = toLowerAscii(name);
    for (const auto &[key, value] : headers) {
        if (toLowerAscii(key) == wanted) return value;
    }
    return std::nullopt;
}

bool Parser::loadHarFile(const std::string &filename) {
    try {
        simdjson::dom::parser parser;
        const simdjson::dom::element doc = parser.load(filename);
        return loadDocument(doc);
    } catch (const simdjson::simdjson_error &e) {
        std::cerr << "Error parsing HAR: " << e.what() << "\n";
        return false;
    }
}

bool Parser::loadHarString(const std::string &json) {
    try {
        simdjson::dom::parser parser;
        const simdjson::padded_string padded(json);
        const simdjson::dom::element doc = parser.parse(padded);
        return loadDocument(doc);
    } catch (const simdjson::simdjson_error &e) {
        std::cerr << "Error parsing HAR: " << e.what() << "\n";
        return false;
    }
}

bool Parser::loadDocument(const simdjson::dom::element &doc) {
    simdjson::dom::array entriesArray;
    if (doc.at_pointer("/log/entries").get(entriesArray)) {
        std::cerr << "No entries found in HAR\n";
        return false;
    }

    uint64_t id = entries.size();
    for (auto elem : entriesArray) {
        parseEntry(elem, id++);
    }
    return true;
}

void Parser::parseEntry(const simdjson::dom::element &elem, const uint64_t id) {
    Entry entry;
    entry.id = id;

    // Время начала запроса
    entry.startedDateTime = stringAt(elem, "/startedDateTime");

    // URL и метод
    entry.url = stringAt(elem, "/request/url");
    entry.method = stringAt(elem, "/request/method");
    if (entry.url.empty()) {
        std::cerr << "HAR entry " << id << " has no request URL, skipped\n";
        return;
    }

    // HTTP статус
    int64_t status = 0;
    if (!elem.at_pointer("/response/status").get(status) && status > 0) {
        entry.status = static_cast<unsigned long long>(status);
    }

    // Тело ответа и его тип
    entry.response_text = stringAt(elem, "/response/content/text");
    entry.mime_type = stringAt(elem, "/response/content/mimeType");
    entry.encoding = stringAt(elem, "/response/content/encoding");

    // Заголовки request и response
    readHeaders(elem, "/request/headers", entry.request_headers);
    readHeaders(elem, "/response/headers", entry.response_headers);

    entries.push_back(std::move(entry));
}

std::optional<InterceptedResponse> Parser::toResponse(const Entry &entry) {
    if (toLowerAscii(entry.encoding) == "base64") {
        std::cerr << "HAR entry " << entry.id << ": base64 body skipped (" << entry.url << ")\n";
        return std::nullopt;
    }

    InterceptedResponse response;
    response.body = entry.response_text;
    response.contentType = findHeader(entry.response_headers, "Content-Type");
    if (!response.contentType && !entry.mime_type.empty()) {
        response.contentType = entry.mime_type;
    }
    response.context = RequestContext::fromUrl(entry.url);
    response.requestUrl = entry.url;
    return response;
}
