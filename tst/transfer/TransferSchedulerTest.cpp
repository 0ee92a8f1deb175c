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

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <expected>
#include <functional>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "common/Error.hpp"
#include "common/ErrorClassifier.hpp"
#include "common/NetworkMonitor.hpp"
#include "common/RetryCoordinator.hpp"
#include "common/RetryPolicy.hpp"
#include "proxy/CircuitBreaker.hpp"
#include "proxy/Dispatcher.hpp"
#include "proxy/Endpoint.hpp"
#include "proxy/EndpointRegistry.hpp"
#include "transfer/Task.hpp"
#include "transfer/TransferScheduler.hpp"
#include "TransferTestFramework/FakeTransport.hpp"

using ferry::CircuitPolicy;
using ferry::Dispatcher;
using ferry::EmbedMode;
using ferry::Endpoint;
using ferry::EndpointRegistry;
using ferry::Error;
using ferry::ErrorCode;
using ferry::ErrorKind;
using ferry::HttpRequest;
using ferry::HttpResponse;
using ferry::NetworkMonitor;
using ferry::RetryCoordinator;
using ferry::RetryPolicy;
using ferry::TaskEvent;
using ferry::TaskKind;
using ferry::TaskRequest;
using ferry::TaskStatus;
using ferry::TransferScheduler;
using ferry::test::FakeTransport;

using Result = std::expected<HttpResponse, Error>;

class TransferSchedulerTest : public ::testing::Test {
protected:
    std::mutex eventsMutex;
    std::vector<TaskEvent> events;
    std::function<Result(const HttpRequest&)> respond = [](const HttpRequest&) {
        return Result {HttpResponse {200, "payload", "application/octet-stream", 7, ""}};
    };
    FakeTransport transport {[this](const HttpRequest& r) { return respond(r); }};
    NetworkMonitor network {};
    EndpointRegistry registry {{
        Endpoint {"A", "https://a.example/?u=", EmbedMode::Query, std::chrono::milliseconds{1000L}, 10000}
    }, CircuitPolicy {1000, std::chrono::milliseconds{1L}}};
    Dispatcher dispatcher {registry, transport, network};
    RetryCoordinator retries {"task", RetryPolicy {std::chrono::microseconds{100L}, std::chrono::microseconds{1000L}, 3}, network};
    TransferScheduler scheduler {dispatcher, retries, 2, std::chrono::hours{24}};

    void record() {
        scheduler.subscribe([this](const TaskEvent& e) {
            std::lock_guard lock{eventsMutex};
            events.push_back(e);
        });
    }

    std::vector<TaskEvent> eventsFor(const std::string& id) {
        std::lock_guard lock{eventsMutex};
        std::vector<TaskEvent> result;
        std::copy_if(events.begin(), events.end(), std::back_inserter(result),
            [&id](const TaskEvent& e) { return e.taskId == id; });
        return result;
    }

    std::string submit(const std::string& target = "https://site.example/file") {
        return scheduler.submit(TaskRequest {TaskKind::ByteTransfer, target, "file.bin"});
    }

    TaskStatus statusOf(const std::string& id) {
        auto task = scheduler.get(id);
        EXPECT_TRUE(task.has_value());
        return task.has_value() ? task->status : TaskStatus::Pending;
    }

    bool waitFor(const std::function<bool()>& condition, std::chrono::milliseconds timeout = std::chrono::milliseconds{3000L}) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (condition()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{1L});
        }
        return condition();
    }

    bool waitForStatus(const std::string& id, TaskStatus status) {
        return waitFor([&] { return statusOf(id) == status; });
    }
};

TEST_F(TransferSchedulerTest, SubmittedTaskReadsBack) {
    transport.close();
    const auto id = scheduler.submit(TaskRequest {TaskKind::ContentFetch, "https://site.example/page", "page.html"});
    auto task = scheduler.get(id);
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->id, id);
    EXPECT_EQ(task->target, "https://site.example/page");
    EXPECT_EQ(task->destinationName, "page.html");
    EXPECT_EQ(task->kind, TaskKind::ContentFetch);
    transport.open();
    ASSERT_TRUE(waitForStatus(id, TaskStatus::Completed));
    task = scheduler.get(id);
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->id, id);
    EXPECT_EQ(task->target, "https://site.example/page");
    EXPECT_EQ(task->destinationName, "page.html");
    EXPECT_EQ(task->progress, 100);
    ASSERT_NE(task->content, nullptr);
    EXPECT_EQ(*task->content, "payload");
    EXPECT_EQ(task->contentType, "application/octet-stream");
}

TEST_F(TransferSchedulerTest, UnknownTaskIsNotFound) {
    auto task = scheduler.get("missing");
    ASSERT_FALSE(task.has_value());
    EXPECT_EQ(task.error().code, ErrorCode::NotFound);
    EXPECT_EQ(scheduler.cancel("missing").error().code, ErrorCode::NotFound);
    EXPECT_EQ(scheduler.retry("missing").error().code, ErrorCode::NotFound);
}

TEST_F(TransferSchedulerTest, ConcurrencyLimitQueuesExtraTasks) {
    std::atomic<bool> overLimit {false};
    const auto watcher = scheduler.subscribe([this, &overLimit](const TaskEvent&) {
        if (scheduler.activeCount() > scheduler.maxConcurrent()) {
            overLimit = true;
        }
    });
    transport.close();
    std::vector<std::string> ids;
    for (int i = 0; i < 4; ++i) {
        ids.push_back(submit("https://site.example/" + std::to_string(i)));
    }
    EXPECT_EQ(statusOf(ids[0]), TaskStatus::Downloading);
    EXPECT_EQ(statusOf(ids[1]), TaskStatus::Downloading);
    EXPECT_EQ(statusOf(ids[2]), TaskStatus::Queued);
    EXPECT_EQ(statusOf(ids[3]), TaskStatus::Queued);
    EXPECT_EQ(scheduler.activeCount(), 2U);
    ASSERT_TRUE(transport.awaitInFlight(2));

    ASSERT_TRUE(scheduler.cancel(ids[0]).has_value());
    ASSERT_TRUE(waitForStatus(ids[2], TaskStatus::Downloading));
    EXPECT_EQ(statusOf(ids[3]), TaskStatus::Queued);
    EXPECT_EQ(scheduler.activeCount(), 2U);

    transport.open();
    for (size_t i = 1; i < ids.size(); ++i) {
        ASSERT_TRUE(waitForStatus(ids[i], TaskStatus::Completed));
    }
    EXPECT_TRUE(waitFor([this] { return scheduler.activeCount() == 0; }));
    EXPECT_EQ(statusOf(ids[0]), TaskStatus::Cancelled);
    EXPECT_FALSE(overLimit.load());
    scheduler.unsubscribe(watcher);
}

TEST_F(TransferSchedulerTest, TransientFailuresAreRetried) {
    std::atomic<int> calls {0};
    respond = [&calls](const HttpRequest&) -> Result {
        if (calls++ < 2) {
            return std::unexpected {Error {ErrorCode::Network, "connection reset"}};
        }
        return HttpResponse {200, "done", "text/plain", std::nullopt, ""};
    };
    record();
    const auto id = submit();
    ASSERT_TRUE(waitForStatus(id, TaskStatus::Completed));
    auto task = scheduler.get(id);
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->retryCount, 2);
    EXPECT_FALSE(task->lastError.has_value());
    EXPECT_EQ(calls.load(), 3);
    const auto seen = eventsFor(id);
    const auto retrying = std::count_if(seen.begin(), seen.end(), [](const TaskEvent& e) {
        return e.type == TaskEvent::Type::StatusChanged && e.status == TaskStatus::Retrying;
    });
    EXPECT_EQ(retrying, 2);
}

TEST_F(TransferSchedulerTest, CancelQueuedTaskKeepsActiveCount) {
    record();
    transport.close();
    const auto first = submit();
    const auto second = submit();
    const auto queued = submit();
    ASSERT_EQ(statusOf(queued), TaskStatus::Queued);
    auto cancelled = scheduler.cancel(queued);
    ASSERT_TRUE(cancelled.has_value());
    EXPECT_EQ(cancelled->status, TaskStatus::Cancelled);
    EXPECT_EQ(scheduler.activeCount(), 2U);

    transport.open();
    ASSERT_TRUE(waitForStatus(first, TaskStatus::Completed));
    ASSERT_TRUE(waitForStatus(second, TaskStatus::Completed));
    EXPECT_EQ(statusOf(queued), TaskStatus::Cancelled);
    for (const auto& e : eventsFor(queued)) {
        EXPECT_NE(e.status, TaskStatus::Downloading);
    }
    EXPECT_EQ(scheduler.stats().cancelled, 1U);
}

TEST_F(TransferSchedulerTest, CancelRunningTaskAbortsTransfer) {
    transport.close();
    const auto id = submit();
    ASSERT_TRUE(transport.awaitInFlight(1));
    ASSERT_TRUE(scheduler.cancel(id).has_value());
    ASSERT_TRUE(waitFor([this] { return scheduler.activeCount() == 0; }));
    auto task = scheduler.get(id);
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->status, TaskStatus::Cancelled);
    EXPECT_EQ(task->content, nullptr);
    EXPECT_EQ(transport.blocked(), 0U);
    EXPECT_EQ(registry.stats().endpoints[0].consecutiveFailures, 0);
}

TEST_F(TransferSchedulerTest, CancelTerminalTaskIsRejected) {
    const auto id = submit();
    ASSERT_TRUE(waitForStatus(id, TaskStatus::Completed));
    auto result = scheduler.cancel(id);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidState);
}

TEST_F(TransferSchedulerTest, NonRetryableFailureFails) {
    std::atomic<int> calls {0};
    respond = [&calls](const HttpRequest&) -> Result {
        calls++;
        return HttpResponse {404, "", "text/plain", std::nullopt, ""};
    };
    record();
    const auto id = submit();
    ASSERT_TRUE(waitForStatus(id, TaskStatus::Failed));
    auto task = scheduler.get(id);
    ASSERT_TRUE(task.has_value());
    ASSERT_TRUE(task->lastError.has_value());
    EXPECT_EQ(task->lastError->classification.kind, ErrorKind::NotFound);
    EXPECT_EQ(task->lastError->message, ferry::userMessage(ErrorKind::NotFound));
    EXPECT_EQ(task->retryCount, 0);
    EXPECT_EQ(calls.load(), 1);
    ASSERT_TRUE(waitFor([&] {
        const auto seen = eventsFor(id);
        return std::any_of(seen.begin(), seen.end(), [](const TaskEvent& e) { return e.type == TaskEvent::Type::Failed; });
    }));
}

TEST_F(TransferSchedulerTest, RetryRestartsFailedTask) {
    std::atomic<bool> broken {true};
    respond = [&broken](const HttpRequest&) -> Result {
        if (broken.load()) {
            return HttpResponse {403, "", "text/plain", std::nullopt, ""};
        }
        return HttpResponse {200, "fixed", "text/plain", std::nullopt, ""};
    };
    const auto id = submit();
    ASSERT_TRUE(waitForStatus(id, TaskStatus::Failed));
    broken = false;
    auto retried = scheduler.retry(id);
    ASSERT_TRUE(retried.has_value());
    EXPECT_FALSE(retried->lastError.has_value());
    ASSERT_TRUE(waitForStatus(id, TaskStatus::Completed));
    auto again = scheduler.retry(id);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::InvalidState);
}

TEST_F(TransferSchedulerTest, ProgressIsReported) {
    respond = [](const HttpRequest& r) -> Result {
        if (r.onProgress) {
            r.onProgress(50, 100);
        }
        return HttpResponse {200, "x", "text/plain", std::nullopt, ""};
    };
    record();
    const auto id = submit();
    ASSERT_TRUE(waitForStatus(id, TaskStatus::Completed));
    ASSERT_TRUE(waitFor([&] {
        const auto seen = eventsFor(id);
        return std::any_of(seen.begin(), seen.end(), [](const TaskEvent& e) { return e.type == TaskEvent::Type::Completed; });
    }));
    const auto seen = eventsFor(id);
    auto progress = std::find_if(seen.begin(), seen.end(), [](const TaskEvent& e) { return e.type == TaskEvent::Type::Progress; });
    ASSERT_NE(progress, seen.end());
    EXPECT_EQ(progress->progress, 50);
    EXPECT_EQ(progress->loaded, 50U);
    EXPECT_EQ(progress->total, 100U);
    auto completed = std::find_if(seen.begin(), seen.end(), [](const TaskEvent& e) { return e.type == TaskEvent::Type::Completed; });
    ASSERT_NE(completed->content, nullptr);
    EXPECT_EQ(*completed->content, "x");
}

TEST_F(TransferSchedulerTest, LateSubscriberSeesOnlyNewEvents) {
    const auto first = submit();
    ASSERT_TRUE(waitForStatus(first, TaskStatus::Completed));
    record();
    EXPECT_TRUE(eventsFor(first).empty());
    const auto second = submit();
    ASSERT_TRUE(waitForStatus(second, TaskStatus::Completed));
    EXPECT_TRUE(waitFor([&] { return !eventsFor(second).empty(); }));
    EXPECT_TRUE(eventsFor(first).empty());
}

TEST_F(TransferSchedulerTest, ListIsOrderedBySubmission) {
    transport.close();
    const auto a = submit("https://site.example/a");
    const auto b = submit("https://site.example/b");
    const auto c = submit("https://site.example/c");
    const auto tasks = scheduler.list();
    ASSERT_EQ(tasks.size(), 3U);
    EXPECT_EQ(tasks[0].id, a);
    EXPECT_EQ(tasks[1].id, b);
    EXPECT_EQ(tasks[2].id, c);
    const auto stats = scheduler.stats();
    EXPECT_EQ(stats.total, 3U);
    EXPECT_EQ(stats.downloading, 2U);
    EXPECT_EQ(stats.queued, 1U);
    EXPECT_EQ(stats.queueLength, 1U);
    transport.open();
}

TEST_F(TransferSchedulerTest, PurgeDropsExpiredTerminalTasks) {
    const auto done = submit();
    ASSERT_TRUE(waitForStatus(done, TaskStatus::Completed));
    transport.close();
    const auto running = submit();
    const auto now = std::chrono::system_clock::now();
    EXPECT_EQ(scheduler.purgeExpired(now), 0U);
    EXPECT_EQ(scheduler.purgeExpired(now + std::chrono::hours{25}), 1U);
    EXPECT_EQ(scheduler.get(done).error().code, ErrorCode::NotFound);
    EXPECT_TRUE(scheduler.get(running).has_value());
    transport.open();
}

TEST_F(TransferSchedulerTest, ShutdownCancelsOutstandingTasks) {
    transport.close();
    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i) {
        ids.push_back(submit());
    }
    ASSERT_TRUE(transport.awaitInFlight(2));
    scheduler.shutdown();
    for (const auto& id : ids) {
        EXPECT_EQ(statusOf(id), TaskStatus::Cancelled);
    }
    EXPECT_EQ(scheduler.activeCount(), 0U);
    const auto late = submit();
    EXPECT_EQ(statusOf(late), TaskStatus::Cancelled);
}

TEST(TransferSchedulerConstructionTest, ZeroConcurrencyThrows) {
    FakeTransport transport {[](const HttpRequest&) { return Result {HttpResponse {}}; }};
    NetworkMonitor network {};
    EndpointRegistry registry {{Endpoint {"A", "https://a.example/", EmbedMode::Path, std::chrono::milliseconds{1000L}, 1}},
        CircuitPolicy {3, std::chrono::seconds{1}}};
    Dispatcher dispatcher {registry, transport, network};
    RetryCoordinator retries {"task", RetryPolicy {std::chrono::microseconds{1L}, std::chrono::microseconds{1L}, 0}, network};
    EXPECT_THROW(TransferScheduler(dispatcher, retries, 0, std::chrono::hours{1}), std::invalid_argument);
}
