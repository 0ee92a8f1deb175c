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

#ifndef CIRCUIT_BREAKER_H
#define CIRCUIT_BREAKER_H

#include <chrono>
#include <optional>
#include <string>

namespace ferry {

struct CircuitPolicy {
    CircuitPolicy(int threshold, std::chrono::microseconds cooldown);
    int failureThreshold;
    std::chrono::microseconds cooldown;
};

// Availability gate of a single endpoint. Not synchronized; the owning registry
// serializes access.
class CircuitBreaker {
public:
    enum class State : char {
        Open,
        Closed,
        HalfOpen
    };
    CircuitBreaker(std::string endpoint, const CircuitPolicy p);

    // Moves an expired Open circuit to HalfOpen, then reports whether it is still open.
    [[nodiscard]] bool open();
    // True when an attempt may go through: closed, or half-open with no probe in flight.
    [[nodiscard]] bool allows();
    // Called when an attempt is dispatched; in HalfOpen it claims the single probe slot.
    void onAttempt();
    // Frees a claimed probe slot whose attempt ended without an outcome.
    void abandonProbe();
    void recordSuccess();
    void recordFailure();

    [[nodiscard]] State state() const;
    [[nodiscard]] int consecutiveFailures() const;
    [[nodiscard]] std::optional<std::chrono::steady_clock::time_point> openedAt() const;
private:
    void trip();
    std::string name;
    CircuitPolicy policy;
    State current;
    int failures;
    bool probeInFlight;
    std::chrono::steady_clock::time_point lastOpened;
};

std::string toString(const CircuitBreaker::State& state);

} // namespace ferry

#endif // CIRCUIT_BREAKER_H
