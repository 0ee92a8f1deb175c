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

#include "server/ProtoConvert.hpp"
#include "common/ErrorConverter.hpp"
#include <proto/ferry.pb.h>
#include <chrono>
#include <utility>

namespace ferry {

namespace {

int64_t epochMillis(std::chrono::system_clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

proto::TaskEvent::Type toProto(const TaskEvent::Type& type) {
    switch (type) {
        case TaskEvent::Type::Progress: return proto::TaskEvent::PROGRESS;
        case TaskEvent::Type::StatusChanged: return proto::TaskEvent::STATUS_CHANGED;
        case TaskEvent::Type::Completed: return proto::TaskEvent::COMPLETED;
        case TaskEvent::Type::Failed: return proto::TaskEvent::FAILED;
    }
    std::unreachable();
}

} // namespace

proto::TaskKind toProto(const TaskKind& kind) {
    switch (kind) {
        case TaskKind::ContentFetch: return proto::CONTENT_FETCH;
        case TaskKind::ByteTransfer: return proto::BYTE_TRANSFER;
    }
    std::unreachable();
}

TaskKind fromProto(const proto::TaskKind& kind) {
    return kind == proto::BYTE_TRANSFER ? TaskKind::ByteTransfer : TaskKind::ContentFetch;
}

proto::TaskStatus toProto(const TaskStatus& status) {
    switch (status) {
        case TaskStatus::Pending: return proto::PENDING;
        case TaskStatus::Queued: return proto::QUEUED;
        case TaskStatus::Downloading: return proto::DOWNLOADING;
        case TaskStatus::Retrying: return proto::RETRYING;
        case TaskStatus::Completed: return proto::COMPLETED;
        case TaskStatus::Failed: return proto::FAILED;
        case TaskStatus::Cancelled: return proto::CANCELLED;
    }
    std::unreachable();
}

proto::ClassifiedError toProto(const TaskError& error) {
    proto::ClassifiedError result;
    *result.mutable_details() = toProto(error.error);
    result.set_kind(toString(error.classification.kind));
    result.set_retryable(error.classification.retryable);
    result.set_severity(toString(error.classification.severity));
    result.set_message(error.message);
    return result;
}

proto::TaskInfo toProto(const TransferTask& task, bool includeContent) {
    proto::TaskInfo info;
    info.set_id(task.id);
    info.set_kind(toProto(task.kind));
    info.set_target(task.target);
    info.set_destination_name(task.destinationName);
    info.set_status(toProto(task.status));
    info.set_progress(task.progress);
    info.set_created_at_ms(epochMillis(task.createdAt));
    info.set_updated_at_ms(epochMillis(task.updatedAt));
    info.set_retry_count(task.retryCount);
    if (task.lastError.has_value()) {
        *info.mutable_last_error() = toProto(task.lastError.value());
    }
    if (includeContent && task.content) {
        info.set_content(*task.content);
    }
    info.set_content_type(task.contentType);
    return info;
}

proto::TaskEvent toProto(const TaskEvent& event) {
    proto::TaskEvent result;
    result.set_type(toProto(event.type));
    result.set_task_id(event.taskId);
    result.set_status(toProto(event.status));
    result.set_progress(event.progress);
    result.set_loaded(event.loaded);
    result.set_total(event.total);
    if (event.error.has_value()) {
        *result.mutable_error() = toProto(event.error.value());
    }
    if (event.content) {
        result.set_content(*event.content);
    }
    result.set_content_type(event.contentType);
    return result;
}

proto::StatsReply toProto(const RegistryStats& endpoints, const RetryStats& retries, const SchedulerStats& scheduler) {
    proto::StatsReply reply;
    for (const auto& e : endpoints.endpoints) {
        auto* s = reply.add_endpoints();
        s->set_name(e.name);
        s->set_requests(e.requests);
        s->set_limit(e.limit);
        s->set_circuit(toString(e.circuit));
        s->set_consecutive_failures(e.consecutiveFailures);
    }
    reply.set_available_endpoints(static_cast<uint32_t>(endpoints.available));
    reply.set_total_retries(retries.totalRetries);
    reply.set_active_operations(retries.activeOperations);
    reply.set_network_status(retries.online ? "online" : "offline");
    reply.set_pending(scheduler.pending);
    reply.set_queued(scheduler.queued);
    reply.set_downloading(scheduler.downloading);
    reply.set_retrying(scheduler.retrying);
    reply.set_completed(scheduler.completed);
    reply.set_failed(scheduler.failed);
    reply.set_cancelled(scheduler.cancelled);
    reply.set_active(scheduler.active);
    reply.set_queue_length(scheduler.queueLength);
    return reply;
}

} // namespace ferry
