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

#include "proxy/Endpoint.hpp"
#include "proxy/Url.hpp"
#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ferry {

namespace {
constexpr std::string_view kPlaceholder = "{target}";
} // namespace

std::string toString(const EmbedMode& mode) {
    switch (mode) {
        case EmbedMode::Query: return "query";
        case EmbedMode::Path: return "path";
    }
    std::unreachable();
}

std::string Endpoint::forwardUrl(const std::string& target) const {
    const auto embedded = embed == EmbedMode::Query ? encodeComponent(target) : target;
    auto result = url;
    if (auto pos = result.find(kPlaceholder); pos != std::string::npos) {
        result.replace(pos, kPlaceholder.size(), embedded);
        return result;
    }
    return result + embedded;
}

std::vector<Endpoint> defaultEndpoints() {
    return {
        Endpoint {"AllOrigins", "https://api.allorigins.win/get?url=", EmbedMode::Query, std::chrono::milliseconds{10000L}, 100},
        Endpoint {"CORS.SH", "https://cors.sh/", EmbedMode::Path, std::chrono::milliseconds{8000L}, 50},
        Endpoint {"CORSProxy.io", "https://corsproxy.io/?", EmbedMode::Query, std::chrono::milliseconds{12000L}, 80}
    };
}

} // namespace ferry
