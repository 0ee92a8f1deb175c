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

#ifndef SRC_TRANSFER_TRANSFERSCHEDULER_HPP
#define SRC_TRANSFER_TRANSFERSCHEDULER_HPP

#include "common/AsyncTimer.hpp"
#include "common/Channel.hpp"
#include "common/Error.hpp"
#include "common/ObserverList.hpp"
#include "common/RetryCoordinator.hpp"
#include "proxy/Dispatcher.hpp"
#include "transfer/Task.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <expected>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ferry {

struct SchedulerStats {
    size_t total;
    size_t pending;
    size_t queued;
    size_t downloading;
    size_t retrying;
    size_t completed;
    size_t failed;
    size_t cancelled;
    size_t active;
    size_t queueLength;
};

// Runs at most maxConcurrent transfers at once on a fixed pool of workers and
// admits queued tasks in FIFO order as slots free up. A task holds its slot from
// admission until its worker finishes with it, retries included.
class TransferScheduler {
public:
    using Observer = ObserverList<TaskEvent>::Observer;
    using Id = ObserverList<TaskEvent>::Id;

    TransferScheduler(Dispatcher& d, RetryCoordinator& r, size_t maxConcurrent, std::chrono::milliseconds retention);
    TransferScheduler(const TransferScheduler&) = delete;
    TransferScheduler& operator=(const TransferScheduler&) = delete;
    ~TransferScheduler();

    std::string submit(const TaskRequest& request);
    [[nodiscard]] std::expected<TransferTask, Error> get(const std::string& id) const;
    [[nodiscard]] std::vector<TransferTask> list() const;
    std::expected<TransferTask, Error> cancel(const std::string& id);
    // Only valid from Failed; resets the retry count and progress and resubmits.
    std::expected<TransferTask, Error> retry(const std::string& id);

    Id subscribe(Observer o);
    bool unsubscribe(Id id);

    // Drops terminal tasks last updated before now - retention; returns how many.
    size_t purgeExpired(std::chrono::system_clock::time_point now);
    void startHousekeeping(std::chrono::milliseconds interval);

    [[nodiscard]] SchedulerStats stats() const;
    [[nodiscard]] size_t activeCount() const;
    [[nodiscard]] size_t maxConcurrent() const;

    // Cancels queued and running tasks and joins the workers.
    void shutdown();
private:
    void work();
    void runTask(const std::string& id);
    std::expected<ForwardResponse, Error> attempt(const std::string& id);
    // False once the task is cancelled. Emits a Progress event only when notify is set.
    bool onProgress(const std::string& id, uint64_t loaded, uint64_t total, bool notify);
    void onRetry(const std::string& id, int attemptNumber, const Error& error);
    void finish(const std::string& id, std::expected<ForwardResponse, Error> result);
    // Starts the task now or queues it; caller holds the lock.
    void admit(TransferTask& task, std::vector<TaskEvent>& events);
    // Frees one slot and starts the next queued task; caller holds the lock.
    void release(std::vector<TaskEvent>& events);
    void transition(TransferTask& task, TaskStatus status, std::vector<TaskEvent>& events);
    void emit(const std::vector<TaskEvent>& events) const;
    static std::string operationId(const std::string& id);

    Dispatcher& dispatcher;
    RetryCoordinator& retries;
    size_t limit;
    std::chrono::milliseconds retentionWindow;
    mutable std::mutex m;
    std::unordered_map<std::string, TransferTask> tasks;
    std::deque<std::string> queue;
    size_t active;
    bool stopped;
    ObserverList<TaskEvent> observers;
    Channel<std::string> ready;
    std::vector<std::thread> workers;
    AsyncTimer housekeeping;
};

} // namespace ferry

#endif // SRC_TRANSFER_TRANSFERSCHEDULER_HPP
