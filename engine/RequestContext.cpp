//
// Created by Revhome on 14.10.2026.
//

#include "../include/RequestContext.hpp"
#include "UrlHandle.hpp"

bool RequestContext::secure() const {
    return toLowerAscii(scheme) == "https";
}

std::optional<RequestContext> RequestContext::fromUrl(const std::string &url) {
    const auto h = UrlHandle::parse(url);
    if (!h) return std::nullopt;

    const std::string scheme = toLowerAscii(h->scheme().value_or(""));
    const auto host = h->host();
    if ((scheme != "http" && scheme != "https") || !host) return std::nullopt;

    RequestContext ctx;
    ctx.scheme = scheme;
    ctx.host = *host;
    ctx.port = h->portOrDefault();
    ctx.path = h->path().value_or("/");
    if (const auto query = h->query()) {
        ctx.path += "?";
        ctx.path += *query;
    }
    return ctx;
}
