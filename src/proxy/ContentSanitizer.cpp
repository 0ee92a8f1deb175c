// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * Ferry a resilient forwarding and transfer-scheduling service.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */

#include "proxy/ContentSanitizer.hpp"
#include "common/Util.hpp"
#include <iterator>
#include <regex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace ferry {

namespace {

constexpr size_t kMaxHeaderValue = 1000;

struct SensitivePattern {
    const char* name;
    std::regex re;
    const char* replacement;
};

const std::vector<SensitivePattern>& sensitivePatterns() {
    static const std::vector<SensitivePattern> patterns {
        {"token", std::regex {R"((token)\s*[=:]\s*[A-Za-z0-9_-]+)", std::regex::icase}, "$1=***"},
        {"api_key", std::regex {R"((api[_-]?key)\s*[=:]\s*[A-Za-z0-9_-]+)", std::regex::icase}, "$1=***"},
        {"password", std::regex {R"((password)\s*[=:]\s*[^\s&"'<>]+)", std::regex::icase}, "$1=***"},
        {"secret", std::regex {R"((secret)\s*[=:]\s*[^\s&"'<>]+)", std::regex::icase}, "$1=***"},
        {"authorization", std::regex {R"((authorization)\s*[=:]\s*[^\s&"'<>]+)", std::regex::icase}, "$1=***"},
        {"bearer", std::regex {R"((bearer)\s+[A-Za-z0-9_-]+)", std::regex::icase}, "$1 ***"},
        {"session_id", std::regex {R"((session[_-]?id)\s*[=:]\s*[^\s&"'<>]+)", std::regex::icase}, "$1=***"}
    };
    return patterns;
}

const std::regex& eventHandlerPattern() {
    static const std::regex re {R"(\bon[a-z]+\s*=)", std::regex::icase};
    return re;
}

// Removes <script> elements, matching the tag name case-insensitively.
size_t removeScripts(std::string& text) {
    static constexpr std::string_view open = "<script";
    static constexpr std::string_view close = "</script>";
    size_t removed = 0;
    auto lower = ferry_to_lower(text);
    size_t pos = 0;
    while ((pos = lower.find(open, pos)) != std::string::npos) {
        const auto after = pos + open.size();
        if (after < lower.size() && lower[after] != '>' && lower[after] != ' ' && lower[after] != '\t'
            && lower[after] != '\n' && lower[after] != '\r' && lower[after] != '/') {
            pos = after;
            continue;
        }
        auto end = lower.find(close, after);
        if (end == std::string::npos) {
            break;
        }
        end += close.size();
        text.erase(pos, end - pos);
        lower.erase(pos, end - pos);
        removed++;
    }
    return removed;
}

size_t neutraliseJavascriptLinks(std::string& text) {
    static constexpr std::string_view scheme = "javascript:";
    static constexpr std::string_view blocked = "javascript-blocked:";
    size_t count = 0;
    auto lower = ferry_to_lower(text);
    size_t pos = 0;
    while ((pos = lower.find(scheme, pos)) != std::string::npos) {
        text.replace(pos, scheme.size(), blocked);
        lower.replace(pos, scheme.size(), blocked);
        pos += blocked.size();
        count++;
    }
    return count;
}

size_t countMatches(const std::string& text, const std::regex& re) {
    return static_cast<size_t>(std::distance(std::sregex_iterator(text.begin(), text.end(), re), std::sregex_iterator()));
}

} // namespace

SanitizeReport sanitizeContent(std::string_view content) {
    SanitizeReport report {false, std::string {content}, {}};
    if (content.empty()) {
        return report;
    }
    auto& text = report.sanitized;
    for (const auto& p : sensitivePatterns()) {
        if (const auto n = countMatches(text, p.re); n > 0) {
            report.hits.push_back(PatternHit {p.name, n});
            text = std::regex_replace(text, p.re, p.replacement);
        }
    }
    if (const auto n = removeScripts(text); n > 0) {
        report.hits.push_back(PatternHit {"script tags", n});
    }
    if (const auto n = neutraliseJavascriptLinks(text); n > 0) {
        report.hits.push_back(PatternHit {"javascript protocol", n});
    }
    if (const auto n = countMatches(text, eventHandlerPattern()); n > 0) {
        report.hits.push_back(PatternHit {"event handlers", n});
        text = std::regex_replace(text, eventHandlerPattern(), "on-event-blocked=");
    }
    report.modified = !report.hits.empty();
    return report;
}

bool containsCredentials(std::string_view content) {
    const std::string text {content};
    for (const auto& p : sensitivePatterns()) {
        if (std::regex_search(text, p.re)) {
            return true;
        }
    }
    return false;
}

std::map<std::string, std::string> sanitizeHeaders(const std::map<std::string, std::string>& headers) {
    static const std::set<std::string> allowed {
        "accept",
        "accept-language",
        "content-type",
        "user-agent",
        "referer"
    };
    std::map<std::string, std::string> result;
    for (const auto& [name, value] : headers) {
        if (allowed.contains(ferry_to_lower(name))) {
            result.emplace(name, sanitizeHeaderValue(value));
        }
    }
    return result;
}

std::string sanitizeHeaderValue(std::string_view value) {
    std::string cleaned;
    cleaned.reserve(value.size());
    for (const auto c : value) {
        const auto u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7f) {
            continue;
        }
        cleaned.push_back(c);
    }
    auto trimmed = ferry_trim(cleaned);
    if (trimmed.size() > kMaxHeaderValue) {
        trimmed.resize(kMaxHeaderValue);
    }
    return trimmed;
}

} // namespace ferry
