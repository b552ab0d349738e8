//
// Created by Revhome on 14.10.2026.
//

#include "ResponseClassifier.hpp"
#include "UrlHandle.hpp"

namespace {

const char *const kJsContentTypes[] = {
    "javascript",
    "application/x-javascript",
    "text/javascript",
};

bool endsWith(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

bool isJsLike(const std::optional<std::string> &contentType, const std::optional<std::string> &sourceUrl) {
    if (contentType) {
        const std::string type = toLowerAscii(*contentType);
        for (const char *marker : kJsContentTypes) {
            if (type.find(marker) != std::string::npos) return true;
        }
    }
    return sourceUrl && endsWith(toLowerAscii(*sourceUrl), ".js");
}
