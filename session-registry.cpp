#include "session-registry.h"

SessionSlot::SessionSlot(const std::string& id)
    : session_id(id), last_activity_ms(SessionRegistry::now_ms()) {}

int64_t SessionRegistry::now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

std::shared_ptr<SessionSlot> SessionRegistry::lock_for(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto it = slots_.find(session_id);
    if (it != slots_.end()) {
        return it->second;
    }

    auto slot = std::make_shared<SessionSlot>(session_id);
    slots_.emplace(session_id, slot);
    return slot;
}

EngineHandle* SessionRegistry::engine_for(const SessionSlot& slot) const {
    return slot.engine.get();
}

void SessionRegistry::bind(SessionSlot& slot, std::unique_ptr<EngineHandle> handle) {
    slot.engine = std::move(handle);
    slot.last_activity_ms.store(now_ms());
}

std::unique_ptr<EngineHandle> SessionRegistry::close_and_remove(SessionSlot& slot) {
    slot.closed = true;
    std::unique_ptr<EngineHandle> handle = std::move(slot.engine);

    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = slots_.find(slot.session_id);
        // The id may already map to a fresh slot created after this one was removed
        if (it != slots_.end() && it->second.get() == &slot) {
            slots_.erase(it);
        }
    }

    return handle;
}

bool SessionRegistry::is_closed(const SessionSlot& slot) const {
    return slot.closed;
}

void SessionRegistry::touch(SessionSlot& slot) {
    slot.last_activity_ms.store(now_ms());
}

std::vector<std::shared_ptr<SessionSlot>> SessionRegistry::idle_sessions(std::chrono::milliseconds idle_timeout) const {
    std::vector<std::shared_ptr<SessionSlot>> idle;
    const int64_t cutoff = now_ms() - idle_timeout.count();

    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (const auto& pair : slots_) {
        if (pair.second->last_activity_ms.load() < cutoff) {
            idle.push_back(pair.second);
        }
    }
    return idle;
}

bool SessionRegistry::contains(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return slots_.find(session_id) != slots_.end();
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return slots_.size();
}
