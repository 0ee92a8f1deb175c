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

#ifndef SRC_PROXY_DISPATCHER_HPP
#define SRC_PROXY_DISPATCHER_HPP

#include "common/Error.hpp"
#include "common/NetworkMonitor.hpp"
#include "proxy/ContentSanitizer.hpp"
#include "proxy/EndpointRegistry.hpp"
#include "proxy/HttpTransport.hpp"
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace ferry {

inline constexpr uint64_t kDefaultMaxResponseBytes = 50ULL * 1024 * 1024;

struct ForwardOptions {
    // Caller headers; only the sanitized subset is forwarded.
    std::map<std::string, std::string> headers;
    std::function<bool(uint64_t loaded, uint64_t total)> onProgress;
};

struct ForwardResponse {
    HttpResponse response;
    // Name of the endpoint that served the response.
    std::string endpoint;
    // Set when a markup body carried credentials, scripts or handlers.
    std::optional<SanitizeReport> sanitized;
};

class Dispatcher {
public:
    // Any response from an endpoint, whatever its status, marks the network online.
    Dispatcher(EndpointRegistry& r, HttpTransport& t, NetworkMonitor& n, uint64_t maxResponseBytes = kDefaultMaxResponseBytes);
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Forwards a GET for target through the best available endpoint, rotating to the
    // next one on failure, at most once per configured endpoint.
    std::expected<ForwardResponse, Error> forward(const std::string& target, const ForwardOptions& options = {});

    [[nodiscard]] std::expected<std::monostate, Error> validate(const HttpResponse& response) const;
    [[nodiscard]] uint64_t maxResponseBytes() const;
private:
    std::map<std::string, std::string> requestHeaders(const ForwardOptions& options) const;

    EndpointRegistry& registry;
    HttpTransport& transport;
    NetworkMonitor& network;
    uint64_t maxBytes;
};

} // namespace ferry

#endif // SRC_PROXY_DISPATCHER_HPP
