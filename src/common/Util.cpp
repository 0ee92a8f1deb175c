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

#include "common/Util.hpp"
#include <algorithm>
#include <random>
#include <string_view>
#include <chrono>
#include <cstdint>
#include <cctype>

std::array<uint8_t, 16> generate_uuid_v7() {
    thread_local auto rng = random_generator<>();
    auto dist = std::uniform_int_distribution<unsigned int>{0, 255};

    std::array<uint8_t, 16> uuid{};

    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    auto timestamp = static_cast<uint64_t>(ms);

    // 48-bit big-endian millisecond timestamp
    for (size_t i = 0; i < 6; ++i) {
        uuid[i] = static_cast<uint8_t>((timestamp >> (40 - 8 * i)) & 0xFF);
    }
    for (size_t i = 6; i < 16; ++i) {
        uuid[i] = static_cast<uint8_t>(dist(rng));
    }

    uuid[6] = static_cast<uint8_t>((uuid[6] & 0x0F) | 0x70);
    uuid[8] = static_cast<uint8_t>((uuid[8] & 0x3F) | 0x80);

    return uuid;
}

std::string uuid_v7_to_string(const std::array<uint8_t, 16>& uuid) {
    static constexpr auto hex = "0123456789abcdef";
    std::string result;
    result.reserve(36);
    for (size_t i = 0; i < uuid.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            result.push_back('-');
        }
        result.push_back(hex[uuid[i] >> 4]);
        result.push_back(hex[uuid[i] & 0x0F]);
    }
    return result;
}

std::string ferry_to_lower(std::string_view s) {
    std::string result{s};
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string ferry_trim(std::string_view s) {
    const auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    auto first = std::find_if_not(s.begin(), s.end(), isSpace);
    auto last = std::find_if_not(s.rbegin(), s.rend(), isSpace).base();
    if (first >= last) {
        return {};
    }
    return std::string{first, last};
}

bool ferry_contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}
