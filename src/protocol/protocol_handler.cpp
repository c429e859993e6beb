//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// protocol/protocol_handler.cpp
//
// Protocol handler implementation
//===----------------------------------------------------------------------===//

#include "protocol/protocol_handler.hpp"
#include "executor/cancellation.hpp"
#include "executor/executor_pool.hpp"
#include "metrics/metrics.hpp"
#include "tools/tool_executor.hpp"
#include "logging/logger.hpp"
#include "version.hpp"

namespace mcpd_server {

ProtocolHandler::Config::Config()
    : call_timeout(DEFAULT_CALL_TIMEOUT_MS)
    , server_name(MCPD_SERVER_NAME)
    , server_version(MCPD_VERSION) {
}

ProtocolHandler::ProtocolHandler(std::shared_ptr<ToolExecutor> tool_executor,
                                 std::shared_ptr<ExecutorPool> executor_pool,
                                 std::shared_ptr<Metrics> metrics,
                                 const Config& config)
    : tool_executor_(std::move(tool_executor))
    , executor_pool_(std::move(executor_pool))
    , metrics_(std::move(metrics))
    , config_(config) {
}

void ProtocolHandler::OpenSession(const SessionPtr& session) {
    if (!session->Open(BuildIdentityResult(config_.server_name, config_.server_version))) {
        LOG_WARN("protocol", "Session " + std::to_string(session->GetSessionId()) +
                 " could not be opened");
        return;
    }
    LOG_INFO("protocol", "Session " + std::to_string(session->GetSessionId()) + " opened");
}

bool ProtocolHandler::HandleMessage(const std::string& frame, const SessionPtr& session) {
    if (!session->IsServing()) {
        return false;
    }

    Envelope envelope;
    try {
        envelope = Envelope::Parse(frame);
    } catch (const ProtocolError& e) {
        LOG_WARN("protocol", "Session " + std::to_string(session->GetSessionId()) +
                 " sent a malformed envelope: " + std::string(e.what()));
        session->Close(std::string("malformed envelope: ") + e.what());
        return false;
    }

    session->MarkRequestReceived();
    LOG_DEBUG("protocol", envelope.method + " (id=" + envelope.IdString() +
              ", session=" + std::to_string(session->GetSessionId()) + ")");

    // The call deadline counts from arrival, time queued for a worker included
    auto call_source = std::make_shared<CancellationSource>(config_.call_timeout);

    // Fire and forget: the read loop never waits for the request
    auto self = shared_from_this();
    bool submitted = executor_pool_->Submit([self, session, envelope, call_source]() {
        Metrics::InFlightGuard in_flight(*self->metrics_);
        session->Send(self->Dispatch(envelope, call_source->Token()));
    });

    if (!submitted) {
        LOG_WARN("protocol", "Executor pool stopped, rejecting " + envelope.method);
        session->Send(Response::Failure(envelope.id, ErrorCode::INTERNAL_ERROR, "server shutting down"));
    }
    return true;
}

Response ProtocolHandler::Dispatch(const Envelope& envelope) {
    CancellationSource call_source(config_.call_timeout);
    return Dispatch(envelope, call_source.Token());
}

Response ProtocolHandler::Dispatch(const Envelope& envelope, const CancellationToken& call_token) {
    if (envelope.method == methods::TOOLS_LIST) {
        return HandleToolsList(envelope);
    }
    if (envelope.method == methods::TOOLS_CALL) {
        return HandleToolsCall(envelope, call_token);
    }

    LOG_DEBUG("protocol", "Method not found: " + envelope.method);
    return Response::Failure(envelope.id, ErrorCode::METHOD_NOT_FOUND,
                             "Method not found: " + envelope.method);
}

Response ProtocolHandler::HandleToolsList(const Envelope& envelope) {
    return Response::Success(envelope.id, tool_executor_->GetRegistry().ToJson());
}

Response ProtocolHandler::HandleToolsCall(const Envelope& envelope, const CancellationToken& call_token) {
    CallParams params;
    try {
        params = CallParams::Parse(envelope.params);
    } catch (const ProtocolError& e) {
        return Response::Failure(envelope.id, ErrorCode::INVALID_PARAMS,
                                 std::string("Invalid params: ") + e.what());
    }

    ToolInvocation invocation;
    invocation.name = std::move(params.name);
    invocation.arguments = std::move(params.arguments);

    ToolOutcome outcome = tool_executor_->Invoke(invocation, call_token);
    if (outcome.is_error) {
        return Response::Failure(envelope.id, outcome.error_code, outcome.message);
    }
    return Response::Success(envelope.id, std::move(outcome.payload));
}

} // namespace mcpd_server
