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

#ifndef SRC_PROXY_URL_HPP
#define SRC_PROXY_URL_HPP

#include "common/Error.hpp"
#include <expected>
#include <string>
#include <string_view>
#include <variant>

namespace ferry {

inline constexpr size_t kMaxUrlLength = 2048;

struct UrlParts {
    std::string scheme;
    std::string host;
};

// Splits an absolute URL with libcurl's URL parser.
std::expected<UrlParts, Error> parseUrl(const std::string& url);

// Rejects empty, oversized and script-bearing URLs, schemes other than http and
// https, and URLs without a host.
std::expected<std::monostate, Error> validateUrlSafety(const std::string& url);

// https and loopback hosts pass unchanged, http is rewritten to https on the same
// host, anything else is an UnsafeTarget.
std::expected<std::string, Error> upgradeToHttps(const std::string& url);

[[nodiscard]] bool isHttps(const std::string& url);

std::string encodeComponent(std::string_view s);

} // namespace ferry

#endif // SRC_PROXY_URL_HPP
