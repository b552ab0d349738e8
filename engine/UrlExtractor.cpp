//
// Created by Revhome on 14.10.2026.
//

#include "UrlExtractor.hpp"
#include <regex>
#include <iostream>
#include <unordered_set>
#include <cstddef>

namespace {

// Длиннее этого содержимое между кавычками/скобками не сканируется:
// std::regex уходит в рекурсию на каждый символ совпадения
constexpr size_t kMaxLiteralLength = 4096;

const std::regex &greedyPattern() {
    static const std::regex re(
        R"re("([^"'()\s:;,]+/[^"'()\s:;,]+)"|'([^"'()\s:;,]+/[^"'()\s:;,]+)')re");
    return re;
}

const std::regex &conservativePattern() {
    static const std::regex re(
        R"re("([-\w./:?=]+)"|'([-\w./:?=]+)'|\(([-\w./:?=]+)\))re");
    return re;
}

bool isDelimiter(const char c) {
    return c == '"' || c == '\'' || c == '(' || c == ')';
}

class CandidateCollector {
public:
    CandidateCollector(const std::string &text, const std::regex &re) : text(text), re(re) {}

    // Совпадение обоих шаблонов лежит между двумя соседними разделителями ("'()),
    // поэтому строка режется на окна по промежуткам длиннее kMaxLiteralLength
    void scanLine(const size_t begin, const size_t end, const size_t lineNo) {
        size_t windowStart = std::string::npos;
        size_t prev = std::string::npos;
        for (size_t i = begin; i < end; ++i) {
            if (!isDelimiter(text[i])) continue;
            if (prev != std::string::npos && i - prev > kMaxLiteralLength) {
                scanWindow(windowStart, prev + 1, lineNo);
                std::cerr << "Extractor: line " << lineNo << ": skipping literal of "
                          << (i - prev - 1) << " bytes\n";
                windowStart = i;
            }
            if (windowStart == std::string::npos) windowStart = i;
            prev = i;
        }
        if (windowStart != std::string::npos) {
            scanWindow(windowStart, prev + 1, lineNo);
        }
    }

    std::vector<std::string> take() { return std::move(candidates); }

private:
    void scanWindow(const size_t begin, const size_t end, const size_t lineNo) {
        try {
            const auto first = text.begin() + static_cast<std::ptrdiff_t>(begin);
            const auto last = text.begin() + static_cast<std::ptrdiff_t>(end);
            for (std::sregex_iterator it(first, last, re), done; it != done; ++it) {
                const std::smatch &match = *it;
                for (size_t g = 1; g < match.size(); ++g) {
                    if (!match[g].matched) continue;
                    std::string value = match[g].str();
                    if (seen.insert(value).second) {
                        candidates.push_back(std::move(value));
                    }
                }
            }
        } catch (const std::regex_error &e) {
            std::cerr << "Extractor: skipping line " << lineNo << ": " << e.what() << "\n";
        }
    }

    const std::string &text;
    const std::regex &re;
    std::vector<std::string> candidates;
    std::unordered_set<std::string> seen;
};

} // namespace

std::vector<std::string> extractCandidates(const std::string &text, const bool greedy) {
    CandidateCollector collector(text, greedy ? greedyPattern() : conservativePattern());

    size_t lineNo = 0;
    size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        ++lineNo;

        // Каждая строка сканируется отдельно: совпадения не пересекают перевод строки
        collector.scanLine(start, end, lineNo);

        start = end + 1;
    }
    return collector.take();
}
