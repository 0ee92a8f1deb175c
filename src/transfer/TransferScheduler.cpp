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

#include "transfer/TransferScheduler.hpp"
#include "common/Error.hpp"
#include "common/Redaction.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ferry {

namespace {

TaskEvent statusEvent(const TransferTask& task) {
    return TaskEvent {TaskEvent::Type::StatusChanged, task.id, task.status, task.progress, 0, 0, std::nullopt, nullptr, {}};
}

} // namespace

TransferScheduler::TransferScheduler(Dispatcher& d, RetryCoordinator& r, size_t maxConcurrent, std::chrono::milliseconds retention)
    : dispatcher {d},
      retries {r},
      limit {maxConcurrent},
      retentionWindow {retention},
      m {},
      tasks {},
      queue {},
      active {0},
      stopped {false},
      observers {"TransferScheduler"},
      ready {},
      workers {},
      housekeeping {"task-housekeeping"} {
    if (maxConcurrent == 0) {
        throw std::invalid_argument("Max concurrent transfers must be > zero.");
    }
    if (retention < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Task retention must be >= zero.");
    }
    workers.reserve(limit);
    for (size_t i = 0; i < limit; ++i) {
        workers.emplace_back([this] { work(); });
    }
}

TransferScheduler::~TransferScheduler() {
    shutdown();
}

std::string TransferScheduler::operationId(const std::string& id) {
    return "transfer-" + id;
}

void TransferScheduler::transition(TransferTask& task, TaskStatus status, std::vector<TaskEvent>& events) {
    spdlog::debug("TransferScheduler: task {} {} -> {}", task.id, toString(task.status), toString(status));
    task.status = status;
    task.updatedAt = std::chrono::system_clock::now();
    events.push_back(statusEvent(task));
}

void TransferScheduler::admit(TransferTask& task, std::vector<TaskEvent>& events) {
    if (active < limit) {
        active++;
        transition(task, TaskStatus::Downloading, events);
        if (!ready.send(task.id)) {
            throw std::logic_error("Transfer channel closed while admitting " + task.id);
        }
        return;
    }
    queue.push_back(task.id);
    transition(task, TaskStatus::Queued, events);
}

void TransferScheduler::release(std::vector<TaskEvent>& events) {
    active--;
    while (!queue.empty() && !stopped) {
        const auto next = queue.front();
        queue.pop_front();
        auto it = tasks.find(next);
        if (it == tasks.end() || it->second.status != TaskStatus::Queued) {
            continue;
        }
        admit(it->second, events);
        break;
    }
}

void TransferScheduler::emit(const std::vector<TaskEvent>& events) const {
    for (const auto& e : events) {
        observers.notify(e);
    }
}

std::string TransferScheduler::submit(const TaskRequest& request) {
    std::vector<TaskEvent> events;
    std::string id = uuid_v7_to_string(generate_uuid_v7());
    {
        std::lock_guard lock{m};
        const auto now = std::chrono::system_clock::now();
        auto [it, inserted] = tasks.emplace(id, TransferTask {
            id, request.kind, request.target, request.destinationName,
            TaskStatus::Pending, 0, now, now, 0, std::nullopt, nullptr, {}});
        if (!inserted) {
            throw std::logic_error("Duplicate task id " + id);
        }
        spdlog::info("TransferScheduler: task {} submitted ({}) for {}", id, toString(request.kind), redact(request.target));
        if (stopped) {
            transition(it->second, TaskStatus::Cancelled, events);
        } else {
            admit(it->second, events);
        }
    }
    emit(events);
    return id;
}

std::expected<TransferTask, Error> TransferScheduler::get(const std::string& id) const {
    std::lock_guard lock{m};
    auto it = tasks.find(id);
    if (it == tasks.end()) {
        return std::unexpected {Error {ErrorCode::NotFound, "task " + id + " not found"}};
    }
    return it->second;
}

std::vector<TransferTask> TransferScheduler::list() const {
    std::vector<TransferTask> result;
    {
        std::lock_guard lock{m};
        result.reserve(tasks.size());
        for (const auto& [id, task] : tasks) {
            result.push_back(task);
        }
    }
    std::sort(result.begin(), result.end(), [](const TransferTask& a, const TransferTask& b) {
        return a.createdAt < b.createdAt || (a.createdAt == b.createdAt && a.id < b.id);
    });
    return result;
}

std::expected<TransferTask, Error> TransferScheduler::cancel(const std::string& id) {
    std::vector<TaskEvent> events;
    TransferTask snapshot;
    bool running = false;
    {
        std::lock_guard lock{m};
        auto it = tasks.find(id);
        if (it == tasks.end()) {
            return std::unexpected {Error {ErrorCode::NotFound, "task " + id + " not found"}};
        }
        auto& task = it->second;
        if (isTerminal(task.status)) {
            return std::unexpected {Error {ErrorCode::InvalidState, "task " + id + " is already " + toString(task.status)}};
        }
        if (task.status == TaskStatus::Queued || task.status == TaskStatus::Pending) {
            std::erase(queue, id);
        } else {
            running = true;
        }
        // A running task keeps its slot until its worker sees the flag and finishes.
        transition(task, TaskStatus::Cancelled, events);
        snapshot = task;
    }
    if (running) {
        retries.interrupt(operationId(id));
    }
    spdlog::info("TransferScheduler: task {} cancelled", id);
    emit(events);
    return snapshot;
}

std::expected<TransferTask, Error> TransferScheduler::retry(const std::string& id) {
    std::vector<TaskEvent> events;
    TransferTask snapshot;
    {
        std::lock_guard lock{m};
        auto it = tasks.find(id);
        if (it == tasks.end()) {
            return std::unexpected {Error {ErrorCode::NotFound, "task " + id + " not found"}};
        }
        auto& task = it->second;
        if (task.status != TaskStatus::Failed) {
            return std::unexpected {Error {ErrorCode::InvalidState, "only failed tasks can be retried, task " + id + " is " + toString(task.status)}};
        }
        if (stopped) {
            return std::unexpected {Error {ErrorCode::InvalidState, "scheduler is shut down"}};
        }
        task.retryCount = 0;
        task.progress = 0;
        task.lastError.reset();
        task.content.reset();
        task.contentType.clear();
        transition(task, TaskStatus::Pending, events);
        admit(task, events);
        snapshot = task;
    }
    spdlog::info("TransferScheduler: task {} resubmitted", id);
    emit(events);
    return snapshot;
}

TransferScheduler::Id TransferScheduler::subscribe(Observer o) {
    return observers.subscribe(std::move(o));
}

bool TransferScheduler::unsubscribe(Id id) {
    return observers.unsubscribe(id);
}

void TransferScheduler::work() {
    while (auto id = ready.receive()) {
        runTask(id.value());
    }
}

void TransferScheduler::runTask(const std::string& id) {
    const std::function<std::expected<ForwardResponse, Error>()> work = [this, &id] { return attempt(id); };
    auto result = retries.run<ForwardResponse>(operationId(id), work,
        [this, &id](int attemptNumber, std::chrono::microseconds, const Error& error) { onRetry(id, attemptNumber, error); });
    finish(id, std::move(result));
}

std::expected<ForwardResponse, Error> TransferScheduler::attempt(const std::string& id) {
    std::vector<TaskEvent> events;
    std::string target;
    {
        std::lock_guard lock{m};
        auto it = tasks.find(id);
        if (it == tasks.end() || it->second.status == TaskStatus::Cancelled) {
            return std::unexpected {Error {ErrorCode::Cancelled, "task " + id + " was cancelled"}};
        }
        if (it->second.status != TaskStatus::Downloading) {
            transition(it->second, TaskStatus::Downloading, events);
        }
        target = it->second.target;
    }
    emit(events);
    uint64_t reported = 0;
    ForwardOptions options {{}, [this, &id, &reported](uint64_t loaded, uint64_t total) {
        const bool advanced = loaded != reported;
        reported = loaded;
        return onProgress(id, loaded, total, advanced);
    }};
    auto result = dispatcher.forward(target, options);
    std::lock_guard lock{m};
    auto it = tasks.find(id);
    if (it == tasks.end() || it->second.status == TaskStatus::Cancelled) {
        return std::unexpected {Error {ErrorCode::Cancelled, "task " + id + " was cancelled"}};
    }
    return result;
}

bool TransferScheduler::onProgress(const std::string& id, uint64_t loaded, uint64_t total, bool notify) {
    TaskEvent event {TaskEvent::Type::Progress, id, TaskStatus::Downloading, 0, loaded, total, std::nullopt, nullptr, {}};
    {
        std::lock_guard lock{m};
        auto it = tasks.find(id);
        if (it == tasks.end() || it->second.status == TaskStatus::Cancelled) {
            return false;
        }
        if (!notify) {
            return true;
        }
        auto& task = it->second;
        if (total > 0) {
            task.progress = static_cast<int>(std::min<uint64_t>(99, loaded * 100 / total));
        }
        task.updatedAt = std::chrono::system_clock::now();
        event.status = task.status;
        event.progress = task.progress;
    }
    observers.notify(event);
    return true;
}

void TransferScheduler::onRetry(const std::string& id, int attemptNumber, const Error& error) {
    std::vector<TaskEvent> events;
    {
        std::lock_guard lock{m};
        auto it = tasks.find(id);
        if (it == tasks.end() || it->second.status == TaskStatus::Cancelled) {
            return;
        }
        auto& task = it->second;
        task.retryCount = attemptNumber;
        task.lastError.emplace(error);
        transition(task, TaskStatus::Retrying, events);
    }
    spdlog::info("TransferScheduler: task {} retry {} after {}", id, attemptNumber, redact(error.what));
    emit(events);
}

void TransferScheduler::finish(const std::string& id, std::expected<ForwardResponse, Error> result) {
    std::vector<TaskEvent> events;
    {
        std::lock_guard lock{m};
        auto it = tasks.find(id);
        if (it != tasks.end()) {
            auto& task = it->second;
            if (task.status == TaskStatus::Cancelled) {
                spdlog::info("TransferScheduler: discarding result of cancelled task {}", id);
            } else if (result.has_value()) {
                task.progress = 100;
                task.lastError.reset();
                task.content = std::make_shared<const std::string>(std::move(result->response.body));
                task.contentType = result->response.contentType;
                transition(task, TaskStatus::Completed, events);
                events.push_back(TaskEvent {TaskEvent::Type::Completed, id, task.status, task.progress,
                    task.content->size(), task.content->size(), std::nullopt, task.content, task.contentType});
                spdlog::info("TransferScheduler: task {} completed via {} ({} bytes)", id, result->endpoint, task.content->size());
            } else {
                task.lastError.emplace(result.error());
                transition(task, TaskStatus::Failed, events);
                events.push_back(TaskEvent {TaskEvent::Type::Failed, id, task.status, task.progress, 0, 0, task.lastError, nullptr, {}});
                spdlog::warn("TransferScheduler: task {} failed ({}): {}", id,
                    toString(task.lastError->classification.kind), redact(result.error().what));
            }
        }
        release(events);
    }
    emit(events);
}

size_t TransferScheduler::purgeExpired(std::chrono::system_clock::time_point now) {
    std::lock_guard lock{m};
    const auto purged = std::erase_if(tasks, [this, now](const auto& entry) {
        const auto& task = entry.second;
        return isTerminal(task.status) && now - task.updatedAt >= retentionWindow;
    });
    if (purged > 0) {
        spdlog::info("TransferScheduler: purged {} expired tasks", purged);
    }
    return purged;
}

void TransferScheduler::startHousekeeping(std::chrono::milliseconds interval) {
    housekeeping.start(interval, [this] { purgeExpired(std::chrono::system_clock::now()); });
}

SchedulerStats TransferScheduler::stats() const {
    std::lock_guard lock{m};
    SchedulerStats s {tasks.size(), 0, 0, 0, 0, 0, 0, 0, active, queue.size()};
    for (const auto& [id, task] : tasks) {
        switch (task.status) {
            case TaskStatus::Pending: s.pending++; break;
            case TaskStatus::Queued: s.queued++; break;
            case TaskStatus::Downloading: s.downloading++; break;
            case TaskStatus::Retrying: s.retrying++; break;
            case TaskStatus::Completed: s.completed++; break;
            case TaskStatus::Failed: s.failed++; break;
            case TaskStatus::Cancelled: s.cancelled++; break;
        }
    }
    return s;
}

size_t TransferScheduler::activeCount() const {
    std::lock_guard lock{m};
    return active;
}

size_t TransferScheduler::maxConcurrent() const {
    return limit;
}

void TransferScheduler::shutdown() {
    housekeeping.stop();
    std::vector<TaskEvent> events;
    std::vector<std::string> running;
    {
        std::lock_guard lock{m};
        if (stopped) {
            return;
        }
        stopped = true;
        queue.clear();
        for (auto& [id, task] : tasks) {
            if (isTerminal(task.status)) {
                continue;
            }
            if (task.status == TaskStatus::Downloading || task.status == TaskStatus::Retrying) {
                running.push_back(id);
            }
            transition(task, TaskStatus::Cancelled, events);
        }
    }
    for (const auto& id : running) {
        retries.interrupt(operationId(id));
    }
    emit(events);
    ready.close();
    for (auto& w : workers) {
        if (w.joinable()) {
            w.join();
        }
    }
    spdlog::info("TransferScheduler: shut down");
}

} // namespace ferry
