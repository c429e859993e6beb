//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// session/session_manager.cpp
//
// Session manager implementation
//===----------------------------------------------------------------------===//

#include "session/session_manager.hpp"
#include "logging/logger.hpp"

namespace mcpd_server {

SessionManager::SessionManager(size_t max_sessions_p)
    : max_sessions(max_sessions_p == 0 ? DEFAULT_MAX_CONNECTIONS : max_sessions_p)
    , next_session_id(1)
    , total_sessions_created(0)
    , total_sessions_rejected(0) {

    LOG_INFO("session_manager", "Session manager initialized (max_sessions=" +
             std::to_string(max_sessions) + ")");
}

SessionManager::~SessionManager() {
    CloseAll("server shutdown");
    LOG_INFO("session_manager", "Session manager shutdown");
}

SessionPtr SessionManager::CreateSession(SendCallback send, Session::CloseCallback on_close) {
    std::lock_guard<std::mutex> lock(create_mutex);

    if (sessions.size() >= max_sessions) {
        total_sessions_rejected++;
        LOG_WARN("session_manager", "Maximum sessions reached: " +
                 std::to_string(max_sessions));
        return nullptr;
    }

    uint64_t session_id = next_session_id.fetch_add(1);
    auto session = std::make_shared<Session>(session_id, std::move(send), std::move(on_close));

    sessions.insert({session_id, session});
    total_sessions_created++;

    LOG_DEBUG("session_manager", "Created session " + std::to_string(session_id) +
              " (total: " + std::to_string(sessions.size()) + ")");

    return session;
}

SessionPtr SessionManager::GetSession(uint64_t session_id) {
    SessionPtr result = nullptr;

    sessions.if_contains(session_id, [&result](const auto& item) {
        result = item.second;
    });

    return result;
}

bool SessionManager::RemoveSession(uint64_t session_id) {
    size_t erased = sessions.erase(session_id);

    if (erased > 0) {
        LOG_DEBUG("session_manager", "Removed session " + std::to_string(session_id) +
                  " (total: " + std::to_string(sessions.size()) + ")");
        return true;
    }

    return false;
}

size_t SessionManager::CloseAll(const std::string& reason) {
    std::vector<SessionPtr> live;
    sessions.for_each([&live](const auto& item) {
        live.push_back(item.second);
    });

    // Close outside the submap locks; close callbacks may remove sessions
    for (auto& session : live) {
        session->Close(reason);
    }
    sessions.clear();

    if (!live.empty()) {
        LOG_INFO("session_manager", "Closed " + std::to_string(live.size()) + " sessions");
    }
    return live.size();
}

size_t SessionManager::GetActiveSessionCount() const {
    return sessions.size();
}

} // namespace mcpd_server
