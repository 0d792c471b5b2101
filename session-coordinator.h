#pragma once

#include "recognition-engine.h"
#include "session-registry.h"
#include "result-aggregator.h"
#include <string>
#include <chrono>
#include <atomic>

// Callbacks for session lifecycle events. Invoked while the session's lock is
// held, so implementations must not call back into the coordinator.
// on_session_opened returns a record id (-1 for none) that the coordinator
// keeps on the slot and passes back for that session only; a later session
// reusing the same id gets its own record.
class SessionObserver {
public:
    virtual ~SessionObserver() = default;
    virtual int64_t on_session_opened(const std::string& session_id) = 0;
    virtual void on_final_text(const std::string& session_id, int64_t record_id, const std::string& text) = 0;
    virtual void on_session_closed(const std::string& session_id, int64_t record_id) = 0;
};

// Drives each streaming session through ABSENT -> ACTIVE -> CLOSING -> ABSENT.
// All transitions happen under the session's own lock; different sessions
// never wait on each other.
class SessionCoordinator {
public:
    SessionCoordinator(RecognitionEngine* engine, SessionRegistry* registry, int sample_rate = 16000);

    // One audio fragment (raw float32 LE bytes) for a session.
    StreamResult process_fragment(const std::string& session_id, const std::string& fragment);

    // Flush the session's final text and tear the session down.
    StreamResult end_of_utterance(const std::string& session_id);

    // Closes sessions idle for longer than idle_timeout. Returns how many.
    size_t sweep_idle_sessions(std::chrono::milliseconds idle_timeout);

    void set_observer(SessionObserver* observer) { observer_ = observer; }
    void set_verbose(bool verbose) { verbose_ = verbose; }

    uint64_t fragments_processed() const { return fragments_processed_.load(); }
    uint64_t fragments_dropped() const { return fragments_dropped_.load(); }

private:
    RecognitionEngine* engine_;
    SessionRegistry* registry_;
    int sample_rate_;
    SessionObserver* observer_ = nullptr;
    bool verbose_ = false;

    std::atomic<uint64_t> fragments_processed_{0};
    std::atomic<uint64_t> fragments_dropped_{0};

    bool engine_available() const;
};
