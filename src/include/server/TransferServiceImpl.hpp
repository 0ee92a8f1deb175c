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

#ifndef SRC_SERVER_TRANSFERSERVICEIMPL_HPP
#define SRC_SERVER_TRANSFERSERVICEIMPL_HPP

#include <chrono>
#include <grpcpp/grpcpp.h>
#include "proto/ferry.grpc.pb.h"
#include "server/RPCServer.hpp"
#include "context/FerryContext.hpp"

namespace ferry {

class TransferServiceImpl final : public proto::TransferService::Service {
public:
    explicit TransferServiceImpl(FerryContext& c, std::chrono::milliseconds watchPoll = std::chrono::milliseconds{200L});
    grpc::Status submit(
        grpc::ServerContext* context,
        const proto::SubmitRequest* request,
        proto::SubmitReply* reply) override;
    grpc::Status get(
        grpc::ServerContext* context,
        const proto::GetRequest* request,
        proto::TaskInfo* reply) override;
    grpc::Status list(
        grpc::ServerContext* context,
        const proto::ListRequest* request,
        proto::ListReply* reply) override;
    grpc::Status cancel(
        grpc::ServerContext* context,
        const proto::CancelRequest* request,
        proto::TaskInfo* reply) override;
    grpc::Status retry(
        grpc::ServerContext* context,
        const proto::RetryRequest* request,
        proto::TaskInfo* reply) override;
    grpc::Status watch(
        grpc::ServerContext* context,
        const proto::WatchRequest* request,
        grpc::ServerWriter<proto::TaskEvent>* writer) override;
    grpc::Status stats(
        grpc::ServerContext* context,
        const proto::StatsRequest* request,
        proto::StatsReply* reply) override;
private:
    FerryContext& ctx;
    std::chrono::milliseconds poll;
};

using TransferServer = RPCServer<TransferServiceImpl>;

} // namespace ferry

#endif // SRC_SERVER_TRANSFERSERVICEIMPL_HPP
