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

#ifndef SRC_TRANSFER_TASK_HPP
#define SRC_TRANSFER_TASK_HPP

#include "common/Error.hpp"
#include "common/ErrorClassifier.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace ferry {

enum class TaskKind : char {
    ContentFetch,
    ByteTransfer
};

// pending -> queued -> downloading -> {completed | retrying -> downloading | failed | cancelled}
enum class TaskStatus : char {
    Pending,
    Queued,
    Downloading,
    Retrying,
    Completed,
    Failed,
    Cancelled
};

std::string toString(const TaskKind& kind);
std::string toString(const TaskStatus& status);
std::ostream& operator<<(std::ostream& os, const TaskStatus& status);

[[nodiscard]] bool isTerminal(const TaskStatus& status);

struct TaskError {
    explicit TaskError(const Error& e);
    Error error;
    Classification classification;
    std::string message;
};

struct TaskRequest {
    TaskKind kind;
    std::string target;
    std::string destinationName;
};

struct TransferTask {
    std::string id;
    TaskKind kind;
    std::string target;
    std::string destinationName;
    TaskStatus status;
    // 0..100
    int progress;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point updatedAt;
    int retryCount;
    std::optional<TaskError> lastError;
    // Body of a completed task.
    std::shared_ptr<const std::string> content;
    std::string contentType;
};

struct TaskEvent {
    enum class Type : char {
        Progress,
        StatusChanged,
        Completed,
        Failed
    };
    Type type;
    std::string taskId;
    TaskStatus status;
    int progress;
    uint64_t loaded;
    uint64_t total;
    std::optional<TaskError> error;
    std::shared_ptr<const std::string> content;
    std::string contentType;
};

std::string toString(const TaskEvent::Type& type);

} // namespace ferry

#endif // SRC_TRANSFER_TASK_HPP
