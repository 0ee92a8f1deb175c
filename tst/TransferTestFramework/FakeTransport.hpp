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

#ifndef TST_TRANSFERTESTFRAMEWORK_FAKETRANSPORT_HPP
#define TST_TRANSFERTESTFRAMEWORK_FAKETRANSPORT_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <expected>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "common/Error.hpp"
#include "proxy/HttpTransport.hpp"

namespace ferry::test {

// Thread-safe scripted transport. While a gate is closed every request blocks,
// reporting progress so a cancelled transfer aborts as the real transport does.
class FakeTransport : public HttpTransport {
public:
    using Handler = std::function<std::expected<HttpResponse, Error>(const HttpRequest&)>;

    explicit FakeTransport(Handler h) : handler {std::move(h)} {}

    std::expected<HttpResponse, Error> get(const HttpRequest& request) override {
        {
            std::lock_guard lock{m};
            urls.push_back(request.url);
            inFlight++;
        }
        cv.notify_all();
        auto result = waitForGate(request);
        {
            std::lock_guard lock{m};
            inFlight--;
        }
        if (!result.has_value()) {
            return result;
        }
        return handler(request);
    }

    void close() {
        std::lock_guard lock{m};
        gateOpen = false;
    }

    void open() {
        {
            std::lock_guard lock{m};
            gateOpen = true;
        }
        cv.notify_all();
    }

    // Blocks until n requests are waiting at the gate.
    bool awaitInFlight(size_t n, std::chrono::milliseconds timeout = std::chrono::milliseconds{2000L}) {
        std::unique_lock lock{m};
        return cv.wait_for(lock, timeout, [this, n] { return inFlight >= n; });
    }

    [[nodiscard]] size_t calls() const {
        std::lock_guard lock{m};
        return urls.size();
    }

    [[nodiscard]] size_t blocked() const {
        std::lock_guard lock{m};
        return inFlight;
    }

private:
    std::expected<HttpResponse, Error> waitForGate(const HttpRequest& request) {
        std::unique_lock lock{m};
        while (!gateOpen) {
            cv.wait_for(lock, std::chrono::milliseconds{2L});
            if (gateOpen) {
                break;
            }
            lock.unlock();
            const bool keepGoing = !request.onProgress || request.onProgress(0, 0);
            lock.lock();
            if (!keepGoing) {
                return std::unexpected {Error {ErrorCode::Cancelled, "transfer aborted by caller"}};
            }
        }
        return HttpResponse {};
    }

    Handler handler;
    mutable std::mutex m;
    std::condition_variable cv;
    std::vector<std::string> urls;
    size_t inFlight {0};
    bool gateOpen {true};
};

} // namespace ferry::test

#endif // TST_TRANSFERTESTFRAMEWORK_FAKETRANSPORT_HPP
