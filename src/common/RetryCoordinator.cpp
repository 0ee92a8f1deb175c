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

#include "common/RetryCoordinator.hpp"
#include "common/ErrorClassifier.hpp"
#include "common/Redaction.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <mutex>
#include <string>
#include <utility>

namespace ferry {

RetryCoordinator::RetryCoordinator(std::string n, const RetryPolicy p, NetworkMonitor& net)
    : name {std::move(n)},
      policy {p},
      network {net},
      backoffs {},
      stopped {false} {}

void RetryCoordinator::begin(const std::string& op) {
    std::lock_guard lock{m};
    interrupted.erase(op);
}

std::optional<RetryCoordinator::Retry> RetryCoordinator::schedule(const std::string& op, const Error& error) {
    const auto c = classify(error);
    if (!c.retryable) {
        spdlog::debug("RetryCoordinator {}: {} failed with non-retryable {} error: {}",
            name, op, toString(c.kind), redact(error.what));
        clear(op);
        return std::nullopt;
    }
    {
        std::lock_guard lock{m};
        if (stopped) {
            clear(op);
            return std::nullopt;
        }
    }
    auto retry = backoffs.upsert(op, ExponentialBackoff {policy}, [](ExponentialBackoff& b) -> std::optional<Retry> {
        auto delay = b.nextDelay();
        if (!delay.has_value()) {
            return std::nullopt;
        }
        return Retry {b.attempts(), delay.value()};
    });
    if (!retry.has_value()) {
        spdlog::warn("RetryCoordinator {}: {} exhausted {} retries: {}", name, op, policy.maxRetries, redact(error.what));
        clear(op);
        return std::nullopt;
    }
    spdlog::info("RetryCoordinator {}: {} failed with {} error, retry {}/{} in {}ms",
        name, op, toString(c.kind), retry->attempt, policy.maxRetries,
        std::chrono::duration_cast<std::chrono::milliseconds>(retry->delay).count());
    return retry;
}

void RetryCoordinator::clear(const std::string& op) {
    backoffs.erase(op);
    std::lock_guard lock{m};
    interrupted.erase(op);
}

bool RetryCoordinator::pause(const std::string& op, std::chrono::microseconds delay) {
    std::unique_lock lock{m};
    return !cv.wait_for(lock, delay, [this, &op] { return stopped || interrupted.contains(op); });
}

Error RetryCoordinator::offline(const std::string& op) {
    spdlog::warn("RetryCoordinator {}: {} not attempted, network is offline", name, op);
    clear(op);
    return Error {ErrorCode::Offline, "network connection is offline"};
}

void RetryCoordinator::interrupt(const std::string& op) {
    {
        std::lock_guard lock{m};
        interrupted.insert(op);
    }
    cv.notify_all();
}

void RetryCoordinator::stop() {
    {
        std::lock_guard lock{m};
        stopped = true;
    }
    cv.notify_all();
}

void RetryCoordinator::reset() {
    backoffs.clear();
    std::lock_guard lock{m};
    interrupted.clear();
    stopped = false;
}

int RetryCoordinator::attemptCount(const std::string& op) const {
    auto b = backoffs.get(op);
    return b.has_value() ? b->attempts() : 0;
}

RetryStats RetryCoordinator::stats() const {
    uint64_t total = 0;
    backoffs.forEach([&total](const std::string&, const ExponentialBackoff& b) {
        total += static_cast<uint64_t>(b.attempts());
    });
    return RetryStats {total, backoffs.size(), network.online()};
}

const RetryPolicy& RetryCoordinator::retryPolicy() const {
    return policy;
}

} // namespace ferry
