//
// Created by Revhome on 14.10.2026.
//

#include "UrlResolver.hpp"
#include "UrlHandle.hpp"
#include <cctype>

namespace {

std::string trim(const std::string &s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

bool startsWith(const std::string &s, const char *prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // namespace

std::optional<std::string> resolveUrl(const std::string &rawCandidate, const std::optional<RequestContext> &ctx) {
    const std::string candidate = trim(rawCandidate);
    if (candidate.size() < 3) return std::nullopt;

    if (startsWith(candidate, "http://") || startsWith(candidate, "https://")) {
        return candidate;
    }

    // scheme-relative: //host/path
    if (startsWith(candidate, "//")) {
        const char *scheme = ctx && ctx->secure() ? "https:" : "http:";
        return scheme + candidate;
    }

    const std::string scheme = ctx && ctx->secure() ? "https" : "http";

    if (candidate[0] == '/') {
        if (!ctx) return candidate;  // best effort, остаётся относительным
        return resolveAgainstBase(scheme + "://" + ctx->host, candidate);
    }

    if (!ctx) return std::nullopt;

    std::string base = scheme + "://" + ctx->host;
    if (ctx->port != 80 && ctx->port != 443) {
        base += ":" + std::to_string(ctx->port);
    }
    base += "/";
    return resolveAgainstBase(base, candidate);
}
