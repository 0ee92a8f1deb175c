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

#include "proxy/Url.hpp"
#include "common/Error.hpp"
#include "common/Util.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <array>
#include <memory>
#include <new>
#include <string>
#include <string_view>

namespace ferry {

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* u) const noexcept { curl_url_cleanup(u); }
};

struct CurlStringDeleter {
    void operator()(char* s) const noexcept { curl_free(s); }
};

using CurlUrl = std::unique_ptr<CURLU, CurlUrlDeleter>;
using CurlString = std::unique_ptr<char, CurlStringDeleter>;

constexpr std::array<std::string_view, 4> kBlockedPatterns {
    "javascript:",
    "data:text/html",
    "vbscript:",
    "file:"
};

std::expected<std::string, Error> part(CURLU* u, CURLUPart p, const char* what) {
    char* raw = nullptr;
    const auto rc = curl_url_get(u, p, &raw, 0);
    CurlString value {raw};
    if (rc != CURLUE_OK || value == nullptr) {
        return std::unexpected {Error {ErrorCode::UnsafeTarget, std::string {"URL has no "} + what}};
    }
    return std::string {value.get()};
}

bool isLoopback(const std::string& host) {
    return host == "localhost" || host == "127.0.0.1";
}

} // namespace

std::expected<UrlParts, Error> parseUrl(const std::string& url) {
    CurlUrl u {curl_url()};
    if (!u) {
        return std::unexpected {Error {ErrorCode::Unknown, "failed to allocate URL handle"}};
    }
    const auto rc = curl_url_set(u.get(), CURLUPART_URL, url.c_str(), CURLU_NON_SUPPORT_SCHEME);
    if (rc != CURLUE_OK) {
        return std::unexpected {Error {ErrorCode::UnsafeTarget, std::string {"invalid URL: "} + curl_url_strerror(rc)}};
    }
    auto scheme = part(u.get(), CURLUPART_SCHEME, "scheme");
    if (!scheme.has_value()) {
        return std::unexpected {scheme.error()};
    }
    auto host = part(u.get(), CURLUPART_HOST, "host");
    if (!host.has_value()) {
        return std::unexpected {host.error()};
    }
    return UrlParts {ferry_to_lower(scheme.value()), ferry_to_lower(host.value())};
}

std::expected<std::monostate, Error> validateUrlSafety(const std::string& url) {
    if (url.empty()) {
        return std::unexpected {Error {ErrorCode::UnsafeTarget, "URL must not be empty"}};
    }
    const auto lower = ferry_to_lower(url);
    for (const auto& pattern : kBlockedPatterns) {
        if (ferry_contains(lower, pattern)) {
            spdlog::warn("Blocked URL with dangerous pattern {}", pattern);
            return std::unexpected {Error {ErrorCode::UnsafeTarget, "URL contains blocked pattern " + std::string {pattern}}};
        }
    }
    if (url.size() > kMaxUrlLength) {
        return std::unexpected {Error {ErrorCode::UnsafeTarget, "URL exceeds " + std::to_string(kMaxUrlLength) + " characters"}};
    }
    auto parts = parseUrl(url);
    if (!parts.has_value()) {
        return std::unexpected {parts.error()};
    }
    if (parts->scheme != "http" && parts->scheme != "https") {
        return std::unexpected {Error {ErrorCode::UnsafeTarget, "unsupported scheme " + parts->scheme}};
    }
    if (parts->host.empty()) {
        return std::unexpected {Error {ErrorCode::UnsafeTarget, "URL has no host"}};
    }
    return {};
}

std::expected<std::string, Error> upgradeToHttps(const std::string& url) {
    CurlUrl u {curl_url()};
    if (!u) {
        return std::unexpected {Error {ErrorCode::Unknown, "failed to allocate URL handle"}};
    }
    if (const auto rc = curl_url_set(u.get(), CURLUPART_URL, url.c_str(), CURLU_NON_SUPPORT_SCHEME); rc != CURLUE_OK) {
        return std::unexpected {Error {ErrorCode::UnsafeTarget, std::string {"invalid URL: "} + curl_url_strerror(rc)}};
    }
    auto scheme = part(u.get(), CURLUPART_SCHEME, "scheme");
    auto host = part(u.get(), CURLUPART_HOST, "host");
    if (!scheme.has_value() || !host.has_value()) {
        return std::unexpected {Error {ErrorCode::UnsafeTarget, "URL must have a scheme and a host"}};
    }
    const auto s = ferry_to_lower(scheme.value());
    if (s == "https" || isLoopback(ferry_to_lower(host.value()))) {
        return url;
    }
    if (s != "http") {
        return std::unexpected {Error {ErrorCode::UnsafeTarget, "unsupported scheme " + s}};
    }
    if (curl_url_set(u.get(), CURLUPART_SCHEME, "https", 0) != CURLUE_OK) {
        return std::unexpected {Error {ErrorCode::UnsafeTarget, "cannot upgrade URL to https"}};
    }
    auto upgraded = part(u.get(), CURLUPART_URL, "URL");
    if (!upgraded.has_value()) {
        return std::unexpected {upgraded.error()};
    }
    // A default port belonged to the old scheme.
    if (auto port = part(u.get(), CURLUPART_PORT, "port"); port.has_value() && port.value() == "80") {
        if (curl_url_set(u.get(), CURLUPART_PORT, nullptr, 0) != CURLUE_OK) {
            return std::unexpected {Error {ErrorCode::UnsafeTarget, "cannot clear the http port"}};
        }
        upgraded = part(u.get(), CURLUPART_URL, "URL");
        if (!upgraded.has_value()) {
            return std::unexpected {upgraded.error()};
        }
    }
    spdlog::info("Upgraded target to https on host {}", host.value());
    return upgraded.value();
}

bool isHttps(const std::string& url) {
    auto parts = parseUrl(url);
    return parts.has_value() && parts->scheme == "https";
}

std::string encodeComponent(std::string_view s) {
    CurlString escaped {curl_easy_escape(nullptr, s.data(), static_cast<int>(s.size()))};
    if (!escaped) {
        throw std::bad_alloc();
    }
    return std::string {escaped.get()};
}

} // namespace ferry
