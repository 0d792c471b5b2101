#pragma once

#include "recognition-engine.h"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <atomic>
#include <chrono>
#include <unordered_map>

// Registry record for one streaming session. The registry hands out shared
// references so a request that looked a slot up keeps a valid lock even if
// the session is closed and removed while it waits.
struct SessionSlot {
    explicit SessionSlot(const std::string& id);

    const std::string session_id;

    // Serializes all audio work for the session. Everything below except
    // last_activity_ms is guarded by it.
    std::mutex mutex;

    std::unique_ptr<EngineHandle> engine;
    bool closed = false;

    // Transcript log row opened for this session, -1 when none
    int64_t record_id = -1;

    // steady_clock milliseconds; read without the slot mutex by the idle sweep
    std::atomic<int64_t> last_activity_ms;
};

class SessionRegistry {
public:
    SessionRegistry() = default;

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Returns the slot for a session id, creating it on first reference.
    std::shared_ptr<SessionSlot> lock_for(const std::string& session_id);

    // The following require the caller to hold slot.mutex.
    EngineHandle* engine_for(const SessionSlot& slot) const;
    void bind(SessionSlot& slot, std::unique_ptr<EngineHandle> handle);
    std::unique_ptr<EngineHandle> close_and_remove(SessionSlot& slot);
    bool is_closed(const SessionSlot& slot) const;
    void touch(SessionSlot& slot);

    // Snapshot of slots without activity for longer than idle_timeout.
    std::vector<std::shared_ptr<SessionSlot>> idle_sessions(std::chrono::milliseconds idle_timeout) const;

    bool contains(const std::string& session_id) const;
    size_t size() const;

    static int64_t now_ms();

private:
    std::unordered_map<std::string, std::shared_ptr<SessionSlot>> slots_;
    mutable std::mutex registry_mutex_;  // map mutation only, never held across engine calls
};
