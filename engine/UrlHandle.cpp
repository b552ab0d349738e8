//
// Created by Revhome on 14.10.2026.
//

#include "UrlHandle.hpp"
#include <cctype>
#include <utility>

UrlHandle::UrlHandle() : handle(curl_url(), &curl_url_cleanup) {}

bool UrlHandle::set(const std::string &url) {
    if (!handle) return false;
    return curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) == CURLUE_OK;
}

std::optional<std::string> UrlHandle::get(const CURLUPart part, const unsigned int flags) const {
    if (!handle) return std::nullopt;
    char *value = nullptr;
    if (curl_url_get(handle.get(), part, &value, flags) != CURLUE_OK || !value) {
        return std::nullopt;
    }
    std::string out(value);
    curl_free(value);
    return out;
}

std::optional<std::string> UrlHandle::url() const { return get(CURLUPART_URL); }
std::optional<std::string> UrlHandle::scheme() const { return get(CURLUPART_SCHEME); }
std::optional<std::string> UrlHandle::path() const { return get(CURLUPART_PATH); }
std::optional<std::string> UrlHandle::query() const { return get(CURLUPART_QUERY); }

std::optional<std::string> UrlHandle::host() const {
    auto host = get(CURLUPART_HOST);
    if (host && host->empty()) return std::nullopt;
    return host;
}

std::optional<int> UrlHandle::port() const {
    const auto port = get(CURLUPART_PORT);
    if (!port) return std::nullopt;
    return std::stoi(*port);
}

int UrlHandle::portOrDefault() const {
    if (const auto explicitPort = port()) return *explicitPort;
    return toLowerAscii(scheme().value_or("")) == "https" ? 443 : 80;
}

std::optional<UrlHandle> UrlHandle::parse(const std::string &url) {
    UrlHandle h;
    if (!h.set(url)) return std::nullopt;
    return std::optional<UrlHandle>(std::move(h));
}

std::optional<std::string> resolveAgainstBase(const std::string &base, const std::string &reference) {
    UrlHandle h;
    if (!h.set(base) || !h.set(reference)) return std::nullopt;
    return h.url();
}

std::string toLowerAscii(std::string s) {
    for (auto &ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return s;
}
