//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// protocol/protocol_handler.hpp
//
// Envelope decoding and method dispatch for a session
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "executor/cancellation.hpp"
#include "protocol/message.hpp"
#include "session/session.hpp"

namespace mcpd_server {

class ProtocolHandler : public std::enable_shared_from_this<ProtocolHandler> {
public:
    struct Config {
        std::chrono::milliseconds call_timeout;
        std::string server_name;
        std::string server_version;

        Config();
    };

    ProtocolHandler(std::shared_ptr<ToolExecutor> tool_executor,
                    std::shared_ptr<ExecutorPool> executor_pool,
                    std::shared_ptr<Metrics> metrics,
                    const Config& config = Config{});
    ~ProtocolHandler() = default;

    // Send the identity message; the session starts serving
    void OpenSession(const SessionPtr& session);

    // Decode one frame and submit it to the executor pool without waiting.
    // Returns false if the frame was malformed; the session is then closed.
    bool HandleMessage(const std::string& frame, const SessionPtr& session);

    // Resolve and run one request on the calling thread, under a fresh
    // call deadline
    Response Dispatch(const Envelope& envelope);

    // Same, under a deadline the caller already started
    Response Dispatch(const Envelope& envelope, const CancellationToken& call_token);

    const Config& GetConfig() const { return config_; }

private:
    Response HandleToolsList(const Envelope& envelope);
    Response HandleToolsCall(const Envelope& envelope, const CancellationToken& call_token);

private:
    std::shared_ptr<ToolExecutor> tool_executor_;
    std::shared_ptr<ExecutorPool> executor_pool_;
    std::shared_ptr<Metrics> metrics_;
    Config config_;
};

} // namespace mcpd_server
