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

#include "session/GrpcSession.hpp"

#include <grpc++/grpc++.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "session/CellValue.hpp"
#include "session/Session.hpp"
#include "session/SessionError.hpp"
#include "session/TabularSession.grpc.pb.h"
#include "session/TabularSession.pb.h"
#include "threading/CancellationToken.hpp"
#include "utility/Macros.hpp"

#include "glog/logging.h"

namespace tabsql {

const char kSessionIdMetadataKey[] = "tabsql-session-id";

namespace {

constexpr int kDefaultLoginTimeoutSeconds = 60;

CellValue ToCellValue(const wire::Value &value) {
  switch (value.kind_case()) {
    case wire::Value::kText:
      return CellValue::Text(value.text());
    case wire::Value::kInteger:
      return CellValue::Integer(value.integer());
    case wire::Value::kReal:
      return CellValue::Real(value.real());
    case wire::Value::kTimestampSeconds:
      return CellValue::Timestamp(value.timestamp_seconds());
    case wire::Value::kBinary:
      return CellValue::Binary(value.binary());
    case wire::Value::KIND_NOT_SET:
      return CellValue::Null();
  }
  return CellValue::Null();
}

void ApplyEnvironmentChange(const wire::EnvironmentChange &change,
                            std::map<std::string, std::string> *environment) {
  VLOG(1) << "Environment change: " << change.key() << " = '" << change.value() << "'";
  (*environment)[change.key()] = change.value();
}

std::string DescribeStatus(const grpc::Status &status) {
  return "RPC failed (" + std::to_string(static_cast<int>(status.error_code()))
         + "): " + status.error_message();
}

/**
 * Routes engine diagnostics through the error handler and remembers the last
 * one the handler reported as a failure.
 */
class DiagnosticRouter {
 public:
  explicit DiagnosticRouter(const ErrorHandler &handler)
      : handler_(handler),
        failed_(false) {}

  void route(const wire::Diagnostic &message) {
    Diagnostic diagnostic;
    diagnostic.severity = message.severity();
    diagnostic.code = message.code();
    diagnostic.text = message.text();

    const bool failed = handler_ ? handler_(diagnostic)
                                 : diagnostic.severity > kInformationalSeverity;
    if (failed) {
      failed_ = true;
      failure_ = diagnostic;
    }
  }

  template <typename DiagnosticList>
  void routeAll(const DiagnosticList &messages) {
    for (const wire::Diagnostic &message : messages) {
      route(message);
    }
  }

  bool failed() const {
    return failed_;
  }

  EngineError error() const {
    return EngineError(failure_.severity, failure_.code, failure_.text);
  }

 private:
  ErrorHandler handler_;
  bool failed_;
  Diagnostic failure_;
};

/**
 * Result sets of one Execute stream. Events are pulled lazily as rows are
 * requested.
 */
class GrpcResultSet : public ResultSet {
 public:
  GrpcResultSet(const ErrorHandler &handler,
                std::map<std::string, std::string> *environment,
                std::unique_ptr<grpc::ClientContext> context,
                std::unique_ptr<grpc::ClientReader<wire::ExecuteEvent>> reader,
                const wire::ResultSetHeader &header)
      : router_(handler),
        environment_(environment),
        context_(std::move(context)),
        reader_(std::move(reader)),
        stream_ended_(false),
        status_reported_(false),
        current_exhausted_(false),
        has_pending_header_(false),
        has_rows_affected_(false),
        rows_affected_(0),
        has_return_status_(false),
        return_status_(0) {
    installHeader(header);
  }

  ~GrpcResultSet() override {
    if (!stream_ended_) {
      // Abandoned before the end of the stream; stop the server side.
      context_->TryCancel();
      const grpc::Status status = reader_->Finish();
      VLOG(2) << "Abandoned Execute stream finished with code "
              << static_cast<int>(status.error_code());
    }
  }

  const std::vector<std::string>& columns() const override {
    return columns_;
  }

  bool nextRow(std::vector<CellValue> *values) override {
    if (current_exhausted_) {
      return false;
    }

    wire::ExecuteEvent event;
    while (!stream_ended_ && reader_->Read(&event)) {
      switch (event.event_case()) {
        case wire::ExecuteEvent::kRow:
          values->clear();
          for (const wire::Value &value : event.row().values()) {
            values->push_back(ToCellValue(value));
          }
          values->resize(columns_.size());
          return true;
        case wire::ExecuteEvent::kDone:
          recordDone(event.done());
          current_exhausted_ = true;
          return false;
        case wire::ExecuteEvent::kHeader:
          LOG(WARNING) << "Result set header received before the previous "
                       << "result set was done";
          pending_header_ = event.header();
          has_pending_header_ = true;
          current_exhausted_ = true;
          return false;
        case wire::ExecuteEvent::kDiagnostic:
          router_.route(event.diagnostic());
          break;
        case wire::ExecuteEvent::kEnvironmentChange:
          ApplyEnvironmentChange(event.environment_change(), environment_);
          break;
        case wire::ExecuteEvent::EVENT_NOT_SET:
          break;
      }
    }

    current_exhausted_ = true;
    finishStream();
    if (!final_status_.ok() && !router_.failed()) {
      status_reported_ = true;
      throw SessionError(DescribeStatus(final_status_));
    }
    return false;
  }

  bool rowsAffected(std::int64_t *count) const override {
    if (has_rows_affected_) {
      *count = rows_affected_;
    }
    return has_rows_affected_;
  }

  bool returnStatus(std::int32_t *status) const override {
    if (has_return_status_) {
      *status = return_status_;
    }
    return has_return_status_;
  }

  bool hasNextResultSet() override {
    if (has_pending_header_ || !pending_error_.empty()) {
      return true;
    }

    wire::ExecuteEvent event;
    while (!stream_ended_ && reader_->Read(&event)) {
      switch (event.event_case()) {
        case wire::ExecuteEvent::kHeader:
          pending_header_ = event.header();
          has_pending_header_ = true;
          return true;
        case wire::ExecuteEvent::kDiagnostic:
          router_.route(event.diagnostic());
          break;
        case wire::ExecuteEvent::kEnvironmentChange:
          ApplyEnvironmentChange(event.environment_change(), environment_);
          break;
        case wire::ExecuteEvent::kDone:
          // Summary of a result set whose rows were abandoned.
          recordDone(event.done());
          break;
        case wire::ExecuteEvent::kRow:
        case wire::ExecuteEvent::EVENT_NOT_SET:
          break;
      }
    }

    finishStream();
    if (final_status_.ok() || router_.failed() || status_reported_) {
      // Engine failures were already reported through the error handler.
      return false;
    }
    pending_error_ = DescribeStatus(final_status_);
    return true;
  }

  void advanceToNextResultSet() override {
    if (!pending_error_.empty()) {
      throw SessionError(pending_error_);
    }
    if (!has_pending_header_) {
      throw SessionError("No further result set to advance to");
    }
    installHeader(pending_header_);
    has_pending_header_ = false;
  }

 private:
  void installHeader(const wire::ResultSetHeader &header) {
    columns_.clear();
    for (const wire::Column &column : header.columns()) {
      columns_.push_back(column.name());
    }
    current_exhausted_ = false;
    has_rows_affected_ = false;
    rows_affected_ = 0;
    has_return_status_ = false;
    return_status_ = 0;
  }

  void recordDone(const wire::ResultSetDone &done) {
    has_rows_affected_ = done.has_rows_affected();
    rows_affected_ = done.rows_affected();
    has_return_status_ = done.has_return_status();
    return_status_ = done.return_status();
  }

  void finishStream() {
    if (stream_ended_) {
      return;
    }
    stream_ended_ = true;
    final_status_ = reader_->Finish();
    VLOG(2) << "Execute stream finished with code "
            << static_cast<int>(final_status_.error_code());
  }

  DiagnosticRouter router_;
  std::map<std::string, std::string> *environment_;
  std::unique_ptr<grpc::ClientContext> context_;
  std::unique_ptr<grpc::ClientReader<wire::ExecuteEvent>> reader_;

  bool stream_ended_;
  grpc::Status final_status_;
  bool status_reported_;

  std::vector<std::string> columns_;
  bool current_exhausted_;

  bool has_pending_header_;
  wire::ResultSetHeader pending_header_;
  std::string pending_error_;

  bool has_rows_affected_;
  std::int64_t rows_affected_;
  bool has_return_status_;
  std::int32_t return_status_;

  DISALLOW_COPY_AND_ASSIGN(GrpcResultSet);
};

}  // namespace

std::unique_ptr<GrpcSession> GrpcSession::Create(const GrpcSessionOptions &options) {
  return std::make_unique<GrpcSession>(
      grpc::CreateChannel(options.server, grpc::InsecureChannelCredentials()),
      options);
}

GrpcSession::GrpcSession(std::shared_ptr<grpc::Channel> channel,
                         const GrpcSessionOptions &options)
    : channel_(std::move(channel)),
      stub_(wire::TabularSession::NewStub(channel_)),
      options_(options) {}

void GrpcSession::connect() {
  const int login_timeout = options_.login_timeout_seconds > 0
                                ? options_.login_timeout_seconds
                                : kDefaultLoginTimeoutSeconds;
  const std::chrono::system_clock::time_point deadline =
      std::chrono::system_clock::now() + std::chrono::seconds(login_timeout);

  if (!channel_->WaitForConnected(deadline)) {
    throw SessionError("Unable to reach " + options_.server + " within "
                       + std::to_string(login_timeout) + " seconds");
  }

  wire::LoginRequest request;
  request.set_user_name(options_.user_name);
  request.set_database(options_.database);
  request.set_client_hostname(options_.client_hostname);
  request.set_chained(options_.chained);

  grpc::ClientContext context;
  context.set_deadline(deadline);
  wire::LoginResponse response;
  const grpc::Status status = stub_->Connect(&context, request, &response);

  DiagnosticRouter router(error_handler_);
  router.routeAll(response.diagnostics());
  if (router.failed()) {
    throw router.error();
  }
  if (!status.ok()) {
    throw SessionError("Login failed: " + DescribeStatus(status));
  }

  session_id_ = response.session_id();
  environment_.clear();
  for (const auto &entry : response.environment()) {
    environment_[entry.first] = entry.second;
  }
  LOG(INFO) << "Connected to " << options_.server << " as '"
            << options_.user_name << "', session " << session_id_
            << ", server type '" << getEnvironment(kEnvServerType) << "'";
}

std::unique_ptr<grpc::ClientContext> GrpcSession::makeContext(
    const bool with_command_deadline) const {
  std::unique_ptr<grpc::ClientContext> context(new grpc::ClientContext());
  context->AddMetadata(kSessionIdMetadataKey, session_id_);
  if (with_command_deadline && options_.command_timeout_seconds > 0) {
    context->set_deadline(std::chrono::system_clock::now()
                          + std::chrono::seconds(options_.command_timeout_seconds));
  }
  return context;
}

std::unique_ptr<ResultSet> GrpcSession::submit(const std::string &batch,
                                               CancellationToken *token) {
  DCHECK(token != nullptr);
  std::unique_ptr<grpc::ClientContext> context = makeContext(true);
  grpc::ClientContext *raw_context = context.get();
  token->setCancelHandler([raw_context]() { raw_context->TryCancel(); });

  wire::ExecuteRequest request;
  request.set_batch(batch);
  std::unique_ptr<grpc::ClientReader<wire::ExecuteEvent>> reader =
      stub_->Execute(raw_context, request);

  DiagnosticRouter router(error_handler_);
  wire::ExecuteEvent event;
  while (reader->Read(&event)) {
    switch (event.event_case()) {
      case wire::ExecuteEvent::kHeader:
        token->clearCancelHandler();
        return std::make_unique<GrpcResultSet>(error_handler_,
                                               &environment_,
                                               std::move(context),
                                               std::move(reader),
                                               event.header());
      case wire::ExecuteEvent::kDiagnostic:
        router.route(event.diagnostic());
        break;
      case wire::ExecuteEvent::kEnvironmentChange:
        ApplyEnvironmentChange(event.environment_change(), &environment_);
        break;
      default:
        LOG(WARNING) << "Ignoring Execute event " << event.event_case()
                     << " received before any result set header";
        break;
    }
  }

  token->clearCancelHandler();
  const grpc::Status status = reader->Finish();
  if (router.failed()) {
    throw router.error();
  }
  if (!status.ok()) {
    if (status.error_code() == grpc::StatusCode::CANCELLED && token->isCancelled()) {
      throw SessionError("Batch cancelled");
    }
    throw SessionError(DescribeStatus(status));
  }
  return nullptr;
}

void GrpcSession::runTransactionCall(TransactionCall call, const char *name) {
  std::unique_ptr<grpc::ClientContext> context = makeContext(true);
  wire::TransactionRequest request;
  wire::TransactionResponse response;
  const grpc::Status status = ((*stub_).*call)(context.get(), request, &response);

  DiagnosticRouter router(error_handler_);
  router.routeAll(response.diagnostics());
  if (router.failed()) {
    throw router.error();
  }
  if (!status.ok()) {
    throw SessionError(std::string(name) + " failed: " + DescribeStatus(status));
  }
  VLOG(1) << name << " succeeded";
}

void GrpcSession::begin() {
  runTransactionCall(&wire::TabularSession::Stub::Begin, "Begin");
}

void GrpcSession::commit() {
  runTransactionCall(&wire::TabularSession::Stub::Commit, "Commit");
}

void GrpcSession::rollback() {
  runTransactionCall(&wire::TabularSession::Stub::Rollback, "Rollback");
}

CellValue GrpcSession::selectValue(const std::string &query) {
  std::unique_ptr<grpc::ClientContext> context = makeContext(true);
  wire::ExecuteRequest request;
  request.set_batch(query);
  wire::ScalarResponse response;
  const grpc::Status status = stub_->SelectValue(context.get(), request, &response);

  DiagnosticRouter router(error_handler_);
  router.routeAll(response.diagnostics());
  if (router.failed()) {
    throw router.error();
  }
  if (!status.ok()) {
    throw SessionError(DescribeStatus(status));
  }
  return ToCellValue(response.value());
}

std::string GrpcSession::getEnvironment(const std::string &key) const {
  const std::map<std::string, std::string>::const_iterator it = environment_.find(key);
  return it == environment_.end() ? std::string() : it->second;
}

}  // namespace tabsql
