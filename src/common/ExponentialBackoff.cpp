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

#include "common/ExponentialBackoff.hpp"
#include "common/RetryPolicy.hpp"

#include <algorithm>
#include <optional>
#include <chrono>
#include <cstdint>
#include <spdlog/spdlog.h>

namespace ferry {

ExponentialBackoff::ExponentialBackoff(const RetryPolicy p)
    : policy {p} {}

std::optional<std::chrono::microseconds> ExponentialBackoff::nextDelay() {
    if (attempt >= policy.maxRetries) {
        return std::nullopt;
    }
    const auto baseCount = static_cast<uint64_t>(policy.baseDelay.count());
    const auto maxCount = static_cast<uint64_t>(policy.maxDelay.count());
    const auto shift = static_cast<unsigned int>(std::min(attempt, 62));
    auto delay = maxCount;
    if (baseCount == 0 || (maxCount >> shift) >= baseCount) {
        delay = std::min(baseCount << shift, maxCount);
    }
    attempt++;
    spdlog::debug("ExponentialBackoff: attempt {}, delay: {}us, maxDelay: {}us", attempt, delay, maxCount);
    return std::chrono::microseconds(static_cast<int64_t>(delay));
}

int ExponentialBackoff::attempts() const {
    return attempt;
}

void ExponentialBackoff::reset() {
    attempt = 0;
}

} // namespace ferry
