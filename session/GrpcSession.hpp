/**
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 **/

#ifndef TABSQL_SESSION_GRPC_SESSION_HPP_
#define TABSQL_SESSION_GRPC_SESSION_HPP_

#include <grpc++/grpc++.h>

#include <map>
#include <memory>
#include <string>

#include "session/CellValue.hpp"
#include "session/Session.hpp"
#include "session/TabularSession.grpc.pb.h"
#include "session/TabularSession.pb.h"
#include "utility/Macros.hpp"

namespace tabsql {

class CancellationToken;

/** \addtogroup Session
 *  @{
 */

/**
 * @brief Metadata key carrying the id Connect assigned to this session.
 **/
extern const char kSessionIdMetadataKey[];

/**
 * @brief Login and timeout settings of a GrpcSession.
 **/
struct GrpcSessionOptions {
  GrpcSessionOptions()
      : chained(false),
        login_timeout_seconds(0),
        command_timeout_seconds(0) {}

  std::string server;
  std::string user_name;
  std::string database;
  std::string client_hostname;
  bool chained;
  // 0 selects the default of 60 seconds.
  int login_timeout_seconds;
  // 0 means batches run without a deadline.
  int command_timeout_seconds;
};

/**
 * @brief A Session talking to a tabsql.wire.TabularSession gRPC service.
 **/
class GrpcSession : public Session {
 public:
  /**
   * @brief Create a session over an insecure channel to options.server. The
   *        session is not usable until connect() succeeds.
   **/
  static std::unique_ptr<GrpcSession> Create(const GrpcSessionOptions &options);

  GrpcSession(std::shared_ptr<grpc::Channel> channel,
              const GrpcSessionOptions &options);

  ~GrpcSession() override {}

  /**
   * @brief Wait for the channel (bounded by the login timeout) and log in.
   *        Diagnostics sent at login go through the error handler, so install
   *        it first.
   *
   * @exception SessionError The service is unreachable or refused the login.
   **/
  void connect();

  std::unique_ptr<ResultSet> submit(const std::string &batch,
                                    CancellationToken *token) override;

  void begin() override;

  void commit() override;

  void rollback() override;

  CellValue selectValue(const std::string &query) override;

  std::string getEnvironment(const std::string &key) const override;

  void setErrorHandler(const ErrorHandler &handler) override {
    error_handler_ = handler;
  }

 private:
  std::unique_ptr<grpc::ClientContext> makeContext(const bool with_command_deadline) const;

  typedef grpc::Status (wire::TabularSession::Stub::*TransactionCall)(
      grpc::ClientContext*,
      const wire::TransactionRequest&,
      wire::TransactionResponse*);

  void runTransactionCall(TransactionCall call, const char *name);

  std::shared_ptr<grpc::Channel> channel_;
  std::unique_ptr<wire::TabularSession::Stub> stub_;
  const GrpcSessionOptions options_;

  std::string session_id_;
  std::map<std::string, std::string> environment_;
  ErrorHandler error_handler_;

  DISALLOW_COPY_AND_ASSIGN(GrpcSession);
};

/** @} */

}  // namespace tabsql

#endif  // TABSQL_SESSION_GRPC_SESSION_HPP_
