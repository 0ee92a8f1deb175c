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

#ifndef EXPONENTIAL_BACKOFF_H
#define EXPONENTIAL_BACKOFF_H

#include "common/RetryPolicy.hpp"
#include <optional>
#include <chrono>

namespace ferry {

// Yields base * 2^(n-1) for the n-th retry, capped at maxDelay, and nothing once
// maxRetries delays have been handed out.
class ExponentialBackoff {
public:
    explicit ExponentialBackoff(const RetryPolicy policy);
    std::optional<std::chrono::microseconds> nextDelay();
    [[nodiscard]] int attempts() const;
    void reset();
private:
    RetryPolicy policy;
    int attempt{0};
};

} // namespace ferry

#endif // EXPONENTIAL_BACKOFF_H
