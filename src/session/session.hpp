//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// session/session.hpp
//
// One logical client connection
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/message.hpp"

namespace mcpd_server {

enum class SessionState : uint8_t {
    OPENING = 0,
    SERVING = 1,
    CLOSING = 2
};

const char* SessionStateToString(SessionState state);

// Opening -> Serving -> Closing. Closing is terminal.
//
// All responses leave through the send callback, which must enqueue onto the
// connection's single writer. Once the session is closing, responses from
// tasks still in flight are dropped.
class Session {
public:
    using Ptr = std::shared_ptr<Session>;
    using CloseCallback = std::function<void(const std::string& reason)>;

    Session(uint64_t session_id_p, SendCallback send_p, CloseCallback on_close_p = nullptr);
    ~Session();

    // Non-copyable
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Send the identity message and start serving.
    // Returns false if the session is not in the opening state.
    bool Open(const nlohmann::json& identity);

    // Returns false if the response was dropped
    bool Send(const Response& response);

    // Stop serving. Returns false if the session was already closing.
    bool Close(const std::string& reason);

    // Getters
    uint64_t GetSessionId() const { return session_id; }
    SessionState GetState() const { return state.load(std::memory_order_acquire); }
    bool IsServing() const { return GetState() == SessionState::SERVING; }
    TimePoint GetCreatedAt() const { return created_at; }

    // Request accounting
    void MarkRequestReceived() { requests_received++; }
    uint64_t GetRequestsReceived() const { return requests_received; }
    uint64_t GetResponsesSent() const { return responses_sent; }
    uint64_t GetResponsesDropped() const { return responses_dropped; }

    // Client info
    void SetPeerAddress(const std::string& address) { peer_address = address; }
    const std::string& GetPeerAddress() const { return peer_address; }

private:
    bool Write(std::string frame);

private:
    uint64_t session_id;
    TimePoint created_at;
    std::string peer_address;

    SendCallback send;
    CloseCallback on_close;

    // Guards state transitions against concurrent sends
    std::mutex state_mutex;
    std::atomic<SessionState> state;

    std::atomic<uint64_t> requests_received;
    std::atomic<uint64_t> responses_sent;
    std::atomic<uint64_t> responses_dropped;
};

} // namespace mcpd_server
