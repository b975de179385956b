// =================================================================
// src/Meridian/SessionRegistry.cpp
// =================================================================
// Implementation of the session map and expiry scan.

#include "Meridian/SessionRegistry.hpp"
#include "Meridian/Logger.hpp"
#include <cstdint>
#include <cstdio>

namespace Meridian {

SessionRegistry::SessionRegistry() {
    std::random_device rd;
    std::seed_seq seed{rd(), rd(), rd(), rd()};
    m_generator.seed(seed);
}

std::string SessionRegistry::generateUuid(std::mt19937_64& generator) {
    uint64_t high = generator();
    uint64_t low = generator();

    // Version 4, variant 10xx
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned int>(high >> 32),
                  static_cast<unsigned int>((high >> 16) & 0xFFFF),
                  static_cast<unsigned int>(high & 0xFFFF),
                  static_cast<unsigned int>(low >> 48),
                  static_cast<unsigned long long>(low & 0xFFFFFFFFFFFFULL));
    return std::string(buffer);
}

SessionHandle SessionRegistry::create(SessionContext context) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string id;
    do {
        id = generateUuid(m_generator);
    } while (m_sessions.count(id) > 0);

    context.session_id = id;
    auto entry = std::make_shared<SessionEntry>(std::move(context));
    m_sessions.emplace(id, entry);
    return entry;
}

SessionHandle SessionRegistry::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(session_id);
    return it != m_sessions.end() ? it->second : nullptr;
}

std::vector<SessionHandle> SessionRegistry::all() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<SessionHandle> handles;
    handles.reserve(m_sessions.size());
    for (const auto& [id, entry] : m_sessions) {
        handles.push_back(entry);
    }
    return handles;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.size();
}

std::vector<std::string> SessionRegistry::removeExpired(TimePoint now, std::chrono::milliseconds ttl) {
    std::vector<std::string> removed;
    std::lock_guard<std::mutex> lock(m_mutex);

    for (auto it = m_sessions.begin(); it != m_sessions.end();) {
        try {
            bool expired;
            {
                std::lock_guard<std::mutex> entry_lock(it->second->mutex);
                expired = it->second->context.isExpired(now, ttl);
            }

            if (expired) {
                it->second->cancellation->cancel();
                removed.push_back(it->first);
                it = m_sessions.erase(it);
                continue;
            }
        } catch (const std::exception& e) {
            Logger::getInstance().error("SessionRegistry",
                "Failed to clean up session " + it->first + ": " + e.what());
        }
        ++it;
    }

    return removed;
}

} // namespace Meridian
