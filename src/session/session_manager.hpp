//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// session/session_manager.hpp
//
// Registry of live sessions
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "session/session.hpp"
#include <parallel_hashmap/phmap.h>

namespace mcpd_server {

class SessionManager {
public:
    explicit SessionManager(size_t max_sessions_p = DEFAULT_MAX_CONNECTIONS);
    ~SessionManager();

    // Non-copyable
    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Returns nullptr when the session limit is reached
    SessionPtr CreateSession(SendCallback send, Session::CloseCallback on_close = nullptr);

    // Get an existing session
    SessionPtr GetSession(uint64_t session_id);

    // Remove a session
    bool RemoveSession(uint64_t session_id);

    // Close and drop every session
    size_t CloseAll(const std::string& reason);

    // Get statistics
    size_t GetActiveSessionCount() const;
    size_t GetMaxSessions() const { return max_sessions; }
    uint64_t GetTotalSessionsCreated() const { return total_sessions_created; }
    uint64_t GetTotalSessionsRejected() const { return total_sessions_rejected; }

private:
    // Sessions - parallel_flat_hash_map shards the table into 2^N submaps,
    // each guarded by its own mutex
    phmap::parallel_flat_hash_map<
        uint64_t,
        SessionPtr,
        phmap::priv::hash_default_hash<uint64_t>,
        phmap::priv::hash_default_eq<uint64_t>,
        phmap::priv::Allocator<phmap::priv::Pair<const uint64_t, SessionPtr>>,
        4,
        std::mutex
    > sessions;

    const size_t max_sessions;

    // Serializes the limit check with insertion
    std::mutex create_mutex;

    std::atomic<uint64_t> next_session_id;
    std::atomic<uint64_t> total_sessions_created;
    std::atomic<uint64_t> total_sessions_rejected;
};

} // namespace mcpd_server
