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

#ifndef SRC_PROXY_CONTENTSANITIZER_HPP
#define SRC_PROXY_CONTENTSANITIZER_HPP

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace ferry {

struct PatternHit {
    std::string pattern;
    size_t count;
};

struct SanitizeReport {
    bool modified;
    std::string sanitized;
    std::vector<PatternHit> hits;
};

// Masks credential values with ***, removes script elements and neutralises
// javascript: links and inline event handlers.
SanitizeReport sanitizeContent(std::string_view content);

[[nodiscard]] bool containsCredentials(std::string_view content);

// Keeps only the headers a forwarded request may carry, with cleaned values.
std::map<std::string, std::string> sanitizeHeaders(const std::map<std::string, std::string>& headers);

// Drops control characters, trims, and caps the value at 1000 characters.
std::string sanitizeHeaderValue(std::string_view value);

} // namespace ferry

#endif // SRC_PROXY_CONTENTSANITIZER_HPP
