//
// Created by Revhome on 14.10.2026.
//

#ifndef URL_SUCKER_APP_URL_EXTRACTOR_HPP
#define URL_SUCKER_APP_URL_EXTRACTOR_HPP

#include <string>
#include <vector>

// 🔹 Извлекает строки-кандидаты в URL из текста, построчно.
// greedy: строка в кавычках с хотя бы одним '/' и без "'()пробелов:;,
// conservative: содержимое кавычек или скобок из [-\w./:?=]
// Результат в порядке первого появления, без повторов. Многострочные литералы не ищутся.
std::vector<std::string> extractCandidates(const std::string &text, bool greedy);

#endif //URL_SUCKER_APP_URL_EXTRACTOR_HPP
