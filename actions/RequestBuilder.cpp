//
// Created by Revhome on 15.10.2026.
//

#include "RequestBuilder.hpp"
#include "../engine/UrlHandle.hpp"

std::optional<OutboundRequest> buildGetRequest(const std::string &url) {
    const auto h = UrlHandle::parse(url);
    if (!h) return std::nullopt;

    const std::string scheme = toLowerAscii(h->scheme().value_or(""));
    const auto host = h->host();
    if ((scheme != "http" && scheme != "https") || !host) return std::nullopt;

    OutboundRequest request;
    request.url = url;
    request.host = *host;
    request.secure = scheme == "https";
    const int defaultPort = request.secure ? 443 : 80;
    request.port = h->port().value_or(defaultPort);

    std::string target = h->path().value_or("/");
    if (const auto query = h->query()) {
        target += "?";
        target += *query;
    }

    std::string hostHeader = request.host;
    if (request.port != defaultPort) {
        hostHeader += ":" + std::to_string(request.port);
    }

    request.raw = "GET " + target + " HTTP/1.1\r\n"
                  "Host: " + hostHeader + "\r\n"
                  "\r\n";
    return request;
}

std::string rowUrl(const SnapshotRow &row) {
    return row.host + row.path;
}
