//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// session/session.cpp
//
// Session implementation
//===----------------------------------------------------------------------===//

#include "session/session.hpp"
#include "logging/logger.hpp"

namespace mcpd_server {

const char* SessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::OPENING: return "opening";
        case SessionState::SERVING: return "serving";
        case SessionState::CLOSING: return "closing";
        default: return "unknown";
    }
}

Session::Session(uint64_t session_id_p, SendCallback send_p, CloseCallback on_close_p)
    : session_id(session_id_p)
    , created_at(Clock::now())
    , send(std::move(send_p))
    , on_close(std::move(on_close_p))
    , state(SessionState::OPENING)
    , requests_received(0)
    , responses_sent(0)
    , responses_dropped(0) {
}

Session::~Session() {
    LOG_DEBUG("session", "Session " + std::to_string(session_id) + " destroyed (" +
              std::to_string(responses_sent.load()) + " responses sent, " +
              std::to_string(responses_dropped.load()) + " dropped)");
}

bool Session::Open(const nlohmann::json& identity) {
    std::lock_guard<std::mutex> lock(state_mutex);
    if (state != SessionState::OPENING) {
        return false;
    }

    // The identity message uses a generated id; clients never send one
    nlohmann::json frame = {
        {"jsonrpc", JSONRPC_VERSION},
        {"id", "session-" + std::to_string(session_id)},
        {"result", identity}
    };

    state = SessionState::SERVING;
    if (!Write(frame.dump())) {
        return false;
    }

    LOG_DEBUG("session", "Session " + std::to_string(session_id) + " serving");
    return true;
}

bool Session::Send(const Response& response) {
    std::lock_guard<std::mutex> lock(state_mutex);
    if (state != SessionState::SERVING) {
        responses_dropped++;
        LOG_DEBUG("session", "Session " + std::to_string(session_id) +
                  " closing, dropped response " + response.Id().dump());
        return false;
    }
    return Write(response.Serialize());
}

bool Session::Close(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (state == SessionState::CLOSING) {
            return false;
        }
        state = SessionState::CLOSING;
    }

    LOG_DEBUG("session", "Session " + std::to_string(session_id) + " closing: " + reason);

    if (on_close) {
        on_close(reason);
    }
    return true;
}

bool Session::Write(std::string frame) {
    if (!send) {
        responses_dropped++;
        return false;
    }

    try {
        send(std::move(frame));
    } catch (const std::exception& e) {
        // Transport failures are not retried
        responses_dropped++;
        LOG_WARN("session", "Session " + std::to_string(session_id) +
                 " write failed: " + std::string(e.what()));
        return false;
    }

    responses_sent++;
    return true;
}

} // namespace mcpd_server
