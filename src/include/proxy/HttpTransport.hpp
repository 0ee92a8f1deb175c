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

#ifndef SRC_PROXY_HTTPTRANSPORT_HPP
#define SRC_PROXY_HTTPTRANSPORT_HPP

#include "common/Error.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace ferry {

struct HttpRequest {
    std::string url;
    std::map<std::string, std::string> headers;
    std::chrono::milliseconds timeout;
    uint64_t maxBytes;
    // Called on every progress tick, also while no bytes arrive; returning false aborts
    // the transfer with Cancelled.
    std::function<bool(uint64_t loaded, uint64_t total)> onProgress;
};

struct HttpResponse {
    long status;
    std::string body;
    std::string contentType;
    // Declared Content-Length, when the server sent one.
    std::optional<uint64_t> contentLength;
    std::string effectiveUrl;
};

// Network seam of the dispatcher. Non-2xx responses are returned, not errors; an
// error means no complete response was received.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual std::expected<HttpResponse, Error> get(const HttpRequest& request) = 0;
};

} // namespace ferry

#endif // SRC_PROXY_HTTPTRANSPORT_HPP
