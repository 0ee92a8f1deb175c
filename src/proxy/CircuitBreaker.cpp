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

#include "proxy/CircuitBreaker.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>
#include <utility>
#include <string>

namespace ferry {

CircuitPolicy::CircuitPolicy(int threshold, std::chrono::microseconds c)
    : failureThreshold {threshold},
      cooldown {c} {
    if (threshold <= 0) {
        throw std::invalid_argument("Failure threshold must be > zero.");
    }
    if (c < std::chrono::microseconds::zero()) {
        throw std::invalid_argument("Cooldown must be >= zero.");
    }
}

std::string toString(const CircuitBreaker::State& state) {
    switch (state) {
        case CircuitBreaker::State::Open: return "open";
        case CircuitBreaker::State::Closed: return "closed";
        case CircuitBreaker::State::HalfOpen: return "half-open";
    }
    std::unreachable();
}

CircuitBreaker::CircuitBreaker(std::string endpoint, const CircuitPolicy p)
    : name {std::move(endpoint)},
      policy {p},
      current {State::Closed},
      failures {0},
      probeInFlight {false},
      lastOpened {} {}

bool CircuitBreaker::open() {
    if (current == State::Open && std::chrono::steady_clock::now() - lastOpened >= policy.cooldown) {
        current = State::HalfOpen;
        probeInFlight = false;
        spdlog::info("CircuitBreaker {}: cooldown elapsed, half-open", name);
    }
    return current == State::Open;
}

bool CircuitBreaker::allows() {
    if (open()) {
        return false;
    }
    return current == State::Closed || !probeInFlight;
}

void CircuitBreaker::onAttempt() {
    if (current == State::HalfOpen) {
        probeInFlight = true;
    }
}

void CircuitBreaker::abandonProbe() {
    probeInFlight = false;
}

void CircuitBreaker::recordSuccess() {
    if (current != State::Closed) {
        spdlog::info("CircuitBreaker {}: {} -> closed", name, toString(current));
    }
    current = State::Closed;
    failures = 0;
    probeInFlight = false;
}

void CircuitBreaker::recordFailure() {
    failures++;
    if (current == State::HalfOpen) {
        spdlog::warn("CircuitBreaker {}: probe failed, reopening", name);
        trip();
        return;
    }
    if (current == State::Closed && failures >= policy.failureThreshold) {
        spdlog::warn("CircuitBreaker {}: {} consecutive failures, opening for {}ms",
            name, failures, std::chrono::duration_cast<std::chrono::milliseconds>(policy.cooldown).count());
        trip();
    }
}

void CircuitBreaker::trip() {
    current = State::Open;
    probeInFlight = false;
    lastOpened = std::chrono::steady_clock::now();
}

CircuitBreaker::State CircuitBreaker::state() const {
    return current;
}

int CircuitBreaker::consecutiveFailures() const {
    return failures;
}

std::optional<std::chrono::steady_clock::time_point> CircuitBreaker::openedAt() const {
    if (current != State::Open) {
        return std::nullopt;
    }
    return lastOpened;
}

} // namespace ferry
