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

#ifndef SRC_PROXY_CURLTRANSPORT_HPP
#define SRC_PROXY_CURLTRANSPORT_HPP

#include "proxy/HttpTransport.hpp"
#include <curl/curl.h>
#include <expected>

namespace ferry {

// Blocking libcurl GET with one easy handle per call, so it is safe to use from
// several threads at once.
class CurlTransport : public HttpTransport {
public:
    CurlTransport() = default;
    std::expected<HttpResponse, Error> get(const HttpRequest& request) override;
};

Error curlError(CURLcode code, const char* detail);

} // namespace ferry

#endif // SRC_PROXY_CURLTRANSPORT_HPP
