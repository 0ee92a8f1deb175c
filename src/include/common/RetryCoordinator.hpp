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

#ifndef SRC_COMMON_RETRYCOORDINATOR_HPP
#define SRC_COMMON_RETRYCOORDINATOR_HPP

#include "common/Error.hpp"
#include "common/ExponentialBackoff.hpp"
#include "common/LockedUnorderedMap.hpp"
#include "common/NetworkMonitor.hpp"
#include "common/RetryPolicy.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>

namespace ferry {

struct RetryStats {
    // Retries already spent by operations that are still in flight.
    uint64_t totalRetries;
    size_t activeOperations;
    bool online;
};

// Re-invokes a failing operation with exponential backoff while its classified
// error stays retryable and its per-operation budget lasts.
class RetryCoordinator {
public:
    using RetryObserver = std::function<void(int attempt, std::chrono::microseconds delay, const Error& error)>;

    RetryCoordinator(std::string name, const RetryPolicy p, NetworkMonitor& n);
    RetryCoordinator(const RetryCoordinator&) = delete;
    RetryCoordinator& operator=(const RetryCoordinator&) = delete;

    template<typename T>
    std::expected<T, Error> run(
        const std::string& op,
        const std::function<std::expected<T, Error>()>& work,
        const RetryObserver& onRetry = {});

    // Cuts short the backoff wait of op; its pending failure propagates.
    void interrupt(const std::string& op);
    // Wakes every waiting operation and stops scheduling new retries.
    void stop();
    void reset();

    [[nodiscard]] int attemptCount(const std::string& op) const;
    [[nodiscard]] RetryStats stats() const;
    [[nodiscard]] const RetryPolicy& retryPolicy() const;
private:
    struct Retry {
        int attempt;
        std::chrono::microseconds delay;
    };
    void begin(const std::string& op);
    std::optional<Retry> schedule(const std::string& op, const Error& error);
    void clear(const std::string& op);
    // False when the wait was cut short.
    bool pause(const std::string& op, std::chrono::microseconds delay);
    Error offline(const std::string& op);

    std::string name;
    RetryPolicy policy;
    NetworkMonitor& network;
    LockedUnorderedMap<std::string, ExponentialBackoff> backoffs;
    mutable std::mutex m;
    std::condition_variable cv;
    std::set<std::string> interrupted;
    bool stopped;
};

template<typename T>
std::expected<T, Error> RetryCoordinator::run(
    const std::string& op,
    const std::function<std::expected<T, Error>()>& work,
    const RetryObserver& onRetry) {
    begin(op);
    while (true) {
        if (!network.online()) {
            return std::unexpected {offline(op)};
        }
        auto result = work();
        if (result.has_value()) {
            clear(op);
            return result;
        }
        auto retry = schedule(op, result.error());
        if (!retry.has_value()) {
            return result;
        }
        if (onRetry) {
            onRetry(retry->attempt, retry->delay, result.error());
        }
        if (!pause(op, retry->delay)) {
            clear(op);
            return result;
        }
    }
}

} // namespace ferry

#endif // SRC_COMMON_RETRYCOORDINATOR_HPP
