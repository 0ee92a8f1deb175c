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

#ifndef FERRY_CHANNEL_H
#define FERRY_CHANNEL_H

#include <mutex>
#include <deque>
#include <optional>
#include <chrono>
#include <condition_variable>

namespace ferry {

// Unbounded multi-producer multi-consumer queue. After close() senders are ignored
// and receivers drain what is left before getting nullopt.
template<typename T>
class Channel {
public:
    Channel() = default;
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;
    bool send(T);
    std::optional<T> receive();
    std::optional<T> receiveUntil(std::chrono::system_clock::time_point t);
    void close();
    [[nodiscard]] bool isClosed() const;
    [[nodiscard]] size_t size() const;
    ~Channel();
private:
    void doClose() noexcept;
    mutable std::mutex m;
    std::condition_variable cv;
    std::deque<T> values;
    bool closed = false;
};

template<typename T>
bool Channel<T>::send(T v) {
    {
        std::lock_guard<std::mutex> lock(m);
        if (closed) {
            return false;
        }
        values.push_back(std::move(v));
    }
    cv.notify_one();
    return true;
}

template<typename T>
std::optional<T> Channel<T>::receive() {
    std::unique_lock<std::mutex> lock(m);
    cv.wait(lock, [this] { return !values.empty() || closed; });
    if (values.empty()) {
        return std::nullopt;
    }
    T v = std::move(values.front());
    values.pop_front();
    return v;
}

template<typename T>
std::optional<T> Channel<T>::receiveUntil(std::chrono::system_clock::time_point t) {
    std::unique_lock<std::mutex> lock(m);
    if (!cv.wait_until(lock, t, [this] { return !values.empty() || closed; })) {
        return std::nullopt;
    }
    if (values.empty()) {
        return std::nullopt;
    }
    T v = std::move(values.front());
    values.pop_front();
    return v;
}

template<typename T>
void Channel<T>::doClose() noexcept {
    {
        std::lock_guard<std::mutex> lock(m);
        closed = true;
    }
    cv.notify_all();
}

template<typename T>
void Channel<T>::close() {
    doClose();
}

template<typename T>
bool Channel<T>::isClosed() const {
    std::lock_guard<std::mutex> lock(m);
    return closed;
}

template<typename T>
size_t Channel<T>::size() const {
    std::lock_guard<std::mutex> lock(m);
    return values.size();
}

template<typename T>
Channel<T>::~Channel() {
    doClose();
}

} // namespace ferry

#endif // FERRY_CHANNEL_H
