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

#include "server/TransferServiceImpl.hpp"
#include "server/ProtoConvert.hpp"
#include "common/Channel.hpp"
#include "common/Error.hpp"
#include "common/ErrorConverter.hpp"
#include "proxy/Url.hpp"
#include <grpcpp/support/status.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <memory>
#include <tuple>

namespace ferry {

namespace {

bool endsStream(const TaskEvent& e) {
    return e.type == TaskEvent::Type::Completed
        || e.type == TaskEvent::Type::Failed
        || (e.type == TaskEvent::Type::StatusChanged && e.status == TaskStatus::Cancelled);
}

} // namespace

TransferServiceImpl::TransferServiceImpl(FerryContext& c, std::chrono::milliseconds watchPoll)
    : ctx {c},
      poll {watchPoll} {}

grpc::Status TransferServiceImpl::submit(
    grpc::ServerContext* context,
    const proto::SubmitRequest* request,
    proto::SubmitReply* reply) {
    std::ignore = context;
    if (request->target().empty()) {
        return toGrpcStatus(Error {ErrorCode::InvalidArg, "target must not be empty"});
    }
    if (auto safe = validateUrlSafety(request->target()); !safe.has_value()) {
        return toGrpcStatus(safe.error());
    }
    auto id = ctx.scheduler().submit(TaskRequest {fromProto(request->kind()), request->target(), request->destination_name()});
    reply->set_task_id(id);
    return grpc::Status::OK;
}

grpc::Status TransferServiceImpl::get(
    grpc::ServerContext* context,
    const proto::GetRequest* request,
    proto::TaskInfo* reply) {
    std::ignore = context;
    auto task = ctx.scheduler().get(request->task_id());
    if (!task.has_value()) {
        return toGrpcStatus(task.error());
    }
    *reply = toProto(task.value(), request->include_content());
    return grpc::Status::OK;
}

grpc::Status TransferServiceImpl::list(
    grpc::ServerContext* context,
    const proto::ListRequest* request,
    proto::ListReply* reply) {
    std::ignore = context;
    std::ignore = request;
    for (const auto& task : ctx.scheduler().list()) {
        *reply->add_tasks() = toProto(task, false);
    }
    return grpc::Status::OK;
}

grpc::Status TransferServiceImpl::cancel(
    grpc::ServerContext* context,
    const proto::CancelRequest* request,
    proto::TaskInfo* reply) {
    std::ignore = context;
    auto task = ctx.scheduler().cancel(request->task_id());
    if (!task.has_value()) {
        return toGrpcStatus(task.error());
    }
    *reply = toProto(task.value(), false);
    return grpc::Status::OK;
}

grpc::Status TransferServiceImpl::retry(
    grpc::ServerContext* context,
    const proto::RetryRequest* request,
    proto::TaskInfo* reply) {
    std::ignore = context;
    auto task = ctx.scheduler().retry(request->task_id());
    if (!task.has_value()) {
        return toGrpcStatus(task.error());
    }
    *reply = toProto(task.value(), false);
    return grpc::Status::OK;
}

grpc::Status TransferServiceImpl::watch(
    grpc::ServerContext* context,
    const proto::WatchRequest* request,
    grpc::ServerWriter<proto::TaskEvent>* writer) {
    const auto filter = request->task_id();
    // Shared with the observer, which may still run once after unsubscribe.
    auto events = std::make_shared<Channel<TaskEvent>>();
    const auto id = ctx.scheduler().subscribe([events, filter](const TaskEvent& e) {
        if (filter.empty() || e.taskId == filter) {
            events->send(e);
        }
    });
    // Checked only after subscribing, so a terminal event cannot slip in between.
    if (!filter.empty()) {
        auto task = ctx.scheduler().get(filter);
        if (!task.has_value() || isTerminal(task->status)) {
            ctx.scheduler().unsubscribe(id);
            events->close();
            return task.has_value() ? grpc::Status::OK : toGrpcStatus(task.error());
        }
    }
    spdlog::debug("TransferService: watch opened for {}", filter.empty() ? "all tasks" : filter);
    while (!context->IsCancelled()) {
        auto e = events->receiveUntil(std::chrono::system_clock::now() + poll);
        if (!e.has_value()) {
            continue;
        }
        if (!writer->Write(toProto(e.value()))) {
            break;
        }
        if (!filter.empty() && endsStream(e.value())) {
            break;
        }
    }
    ctx.scheduler().unsubscribe(id);
    events->close();
    spdlog::debug("TransferService: watch closed for {}", filter.empty() ? "all tasks" : filter);
    return grpc::Status::OK;
}

grpc::Status TransferServiceImpl::stats(
    grpc::ServerContext* context,
    const proto::StatsRequest* request,
    proto::StatsReply* reply) {
    std::ignore = context;
    std::ignore = request;
    *reply = toProto(ctx.registry().stats(), ctx.retryStats(), ctx.scheduler().stats());
    return grpc::Status::OK;
}

} // namespace ferry
