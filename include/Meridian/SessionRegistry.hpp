// =================================================================
// include/Meridian/SessionRegistry.hpp
// =================================================================
// Thread-safe map of live sessions with id generation and expiry scans.

#pragma once

#include "Meridian/Session.hpp"
#include <chrono>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace Meridian {

/**
 * @brief Owner of every registered session
 *
 * A single mutex guards the id -> entry map; each entry carries its own
 * mutex for its context. Lookups hand out shared handles, so an entry
 * removed by the reaper stays alive for any executor still holding it.
 */
class SessionRegistry {
public:
    SessionRegistry();

    /**
     * @brief Register a new session under a fresh UUID v4
     * @param context Session record; its session_id is overwritten
     * @return Handle to the stored entry
     */
    SessionHandle create(SessionContext context);

    /**
     * @return Entry for the id, or nullptr when unknown
     */
    SessionHandle find(const std::string& session_id) const;

    /**
     * @brief Handles to every registered session at this instant
     */
    std::vector<SessionHandle> all() const;

    size_t size() const;

    /**
     * @brief Remove sessions inactive for longer than ttl
     *
     * Cancels the removed entries' tokens so that in-flight executions stop
     * at their next stage boundary. Never throws.
     *
     * @return Ids of the removed sessions
     */
    std::vector<std::string> removeExpired(TimePoint now, std::chrono::milliseconds ttl);

    /**
     * @brief Random RFC 4122 version 4 identifier
     */
    static std::string generateUuid(std::mt19937_64& generator);

private:
    std::unordered_map<std::string, SessionHandle> m_sessions;
    mutable std::mutex m_mutex;
    std::mt19937_64 m_generator;
};

} // namespace Meridian
