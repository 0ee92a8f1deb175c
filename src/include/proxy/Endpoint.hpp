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

#ifndef SRC_PROXY_ENDPOINT_HPP
#define SRC_PROXY_ENDPOINT_HPP

#include <chrono>
#include <string>
#include <vector>

namespace ferry {

// How the target travels inside the forwarded address.
enum class EmbedMode : char {
    Query,
    Path
};

std::string toString(const EmbedMode& mode);

struct Endpoint {
    std::string name;
    // Base address. A {target} placeholder marks where the target goes, otherwise it is appended.
    std::string url;
    EmbedMode embed;
    std::chrono::milliseconds timeout;
    int rateLimitPerMinute;

    // Query embedding percent-encodes the target, path embedding appends it verbatim.
    [[nodiscard]] std::string forwardUrl(const std::string& target) const;
};

std::vector<Endpoint> defaultEndpoints();

} // namespace ferry

#endif // SRC_PROXY_ENDPOINT_HPP
