//
// Created by Revhome on 14.10.2026.
//

#ifndef URL_SUCKER_APP_URL_HANDLE_HPP
#define URL_SUCKER_APP_URL_HANDLE_HPP

#include <string>
#include <memory>
#include <optional>
#include <curl/curl.h>

// 🔗 Владеющая обёртка над CURLU (URL API libcurl)
class UrlHandle {
public:
    UrlHandle();

    // 🔹 Разбор абсолютного URL; если в handle уже есть URL, относительная
    // ссылка разрешается относительно него (точки в пути схлопываются)
    bool set(const std::string &url);

    std::optional<std::string> url() const;
    std::optional<std::string> scheme() const;
    std::optional<std::string> host() const;
    std::optional<std::string> path() const;   // libcurl отдаёт минимум "/"
    std::optional<std::string> query() const;
    std::optional<int> port() const;            // только явно указанный порт
    int portOrDefault() const;                  // явный порт или 80/443 по схеме

    // 🔹 Разобранный URL или nullopt
    static std::optional<UrlHandle> parse(const std::string &url);

private:
    std::optional<std::string> get(CURLUPart part, unsigned int flags = 0) const;

    std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> handle;
};

// 🔹 Абсолютный URL из ссылки и базы; nullopt если libcurl не принимает одно из двух
std::optional<std::string> resolveAgainstBase(const std::string &base, const std::string &reference);

std::string toLowerAscii(std::string s);

#endif //URL_SUCKER_APP_URL_HANDLE_HPP
