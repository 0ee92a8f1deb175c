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

#include "common/AsyncTimer.hpp"
#include <spdlog/spdlog.h>
#include <exception>
#include <stdexcept>
#include <thread>
#include <chrono>
#include <functional>
#include <mutex>
#include <utility>

namespace ferry {

AsyncTimer::AsyncTimer(std::string n) : name {std::move(n)}, active(false), mtx{}, cv{} {}

void AsyncTimer::start(std::chrono::milliseconds interval, std::function<void()> callback) {
    if (interval <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Timer interval must be > zero.");
    }
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (active) {
            throw std::logic_error("Timer " + name + " is already running");
        }
        active = true;
    }
    worker = std::thread([this, interval, callback = std::move(callback)]() {
        while (true) {
            std::unique_lock<std::mutex> lock(mtx);
            if (cv.wait_for(lock, interval, [this]{ return !active; })) break;
            lock.unlock();
            try {
                callback();
            } catch (const std::exception& e) {
                spdlog::error("AsyncTimer {}: tick failed: {}", name, e.what());
            }
        }
    });
}

void AsyncTimer::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        active = false;
    }
    cv.notify_all();
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) worker.join();
}

bool AsyncTimer::running() const {
    std::lock_guard<std::mutex> lock(mtx);
    return active;
}

AsyncTimer::~AsyncTimer() {
    stop();
}

} // namespace ferry
