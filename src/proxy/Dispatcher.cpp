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

#include "proxy/Dispatcher.hpp"
#include "common/Error.hpp"
#include "common/Redaction.hpp"
#include "common/Util.hpp"
#include "proxy/Url.hpp"
#include <spdlog/spdlog.h>
#include <optional>
#include <string>
#include <utility>

namespace ferry {

namespace {

struct FixedHeaders {
    static constexpr const char* USER_AGENT = "Ferry/1.0";
    static constexpr const char* ACCEPT = "application/json, text/html, */*";
    static constexpr const char* NO_CACHE = "no-cache";
};

} // namespace

Dispatcher::Dispatcher(EndpointRegistry& r, HttpTransport& t, NetworkMonitor& n, uint64_t maxResponseBytes)
    : registry {r},
      transport {t},
      network {n},
      maxBytes {maxResponseBytes} {}

std::map<std::string, std::string> Dispatcher::requestHeaders(const ForwardOptions& options) const {
    std::map<std::string, std::string> headers;
    for (auto& [name, value] : sanitizeHeaders(options.headers)) {
        const auto lower = ferry_to_lower(name);
        if (lower != "user-agent" && lower != "accept") {
            headers.emplace(name, value);
        }
    }
    headers["User-Agent"] = FixedHeaders::USER_AGENT;
    headers["Accept"] = FixedHeaders::ACCEPT;
    headers["Cache-Control"] = FixedHeaders::NO_CACHE;
    headers["Pragma"] = FixedHeaders::NO_CACHE;
    return headers;
}

std::expected<std::monostate, Error> Dispatcher::validate(const HttpResponse& response) const {
    if ((response.contentLength.has_value() && response.contentLength.value() > maxBytes)
        || response.body.size() > maxBytes) {
        return std::unexpected {Error {ErrorCode::ResponseTooLarge,
            "response exceeds " + std::to_string(maxBytes) + " bytes", response.status}};
    }
    return {};
}

std::expected<ForwardResponse, Error> Dispatcher::forward(const std::string& target, const ForwardOptions& options) {
    if (auto safe = validateUrlSafety(target); !safe.has_value()) {
        return std::unexpected {safe.error()};
    }
    auto upgraded = upgradeToHttps(target);
    if (!upgraded.has_value()) {
        return std::unexpected {upgraded.error()};
    }
    if (auto safe = validateUrlSafety(upgraded.value()); !safe.has_value()) {
        return std::unexpected {safe.error()};
    }
    const auto& secureTarget = upgraded.value();
    const auto headers = requestHeaders(options);

    std::optional<Error> lastError;
    const auto attempts = registry.size();
    for (size_t i = 0; i < attempts; ++i) {
        auto endpoint = registry.acquire();
        if (!endpoint.has_value()) {
            spdlog::warn("Dispatcher: no endpoint available for {}", redact(secureTarget));
            return std::unexpected {endpoint.error()};
        }
        const auto& e = endpoint.value();
        HttpRequest request {e.forwardUrl(secureTarget), headers, e.timeout, maxBytes, options.onProgress};
        auto response = transport.get(request);
        if (!response.has_value()) {
            if (response.error().code == ErrorCode::Cancelled) {
                registry.recordAbandoned(e.name);
                return std::unexpected {response.error()};
            }
            registry.recordFailure(e.name);
            spdlog::warn("Dispatcher: endpoint {} failed: {}", e.name, redact(response.error().what));
            lastError = response.error();
            continue;
        }
        auto& r = response.value();
        network.setOnline(true);
        if (r.status < 200 || r.status >= 300) {
            registry.recordFailure(e.name);
            spdlog::warn("Dispatcher: endpoint {} answered HTTP {}", e.name, r.status);
            lastError = Error {ErrorCode::HttpStatus, "HTTP " + std::to_string(r.status) + " from " + e.name, r.status};
            continue;
        }
        if (auto valid = validate(r); !valid.has_value()) {
            registry.recordFailure(e.name);
            spdlog::warn("Dispatcher: endpoint {} response rejected: {}", e.name, valid.error().what);
            lastError = valid.error();
            continue;
        }
        registry.recordSuccess(e.name);
        ForwardResponse result {std::move(r), e.name, std::nullopt};
        if (ferry_contains(ferry_to_lower(result.response.contentType), "text/html")) {
            auto report = sanitizeContent(result.response.body);
            if (report.modified) {
                spdlog::warn("Dispatcher: markup from {} flagged with {} suspicious pattern kinds", e.name, report.hits.size());
                result.sanitized = std::move(report);
            }
        }
        return result;
    }
    if (!lastError.has_value()) {
        return std::unexpected {Error {ErrorCode::NoEndpointsAvailable, "no forwarding endpoint is available"}};
    }
    return std::unexpected {Error {ErrorCode::AllEndpointsFailed,
        "all forwarding endpoints failed, last error: " + lastError->what, lastError.value()}};
}

uint64_t Dispatcher::maxResponseBytes() const {
    return maxBytes;
}

} // namespace ferry
