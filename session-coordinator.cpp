#include "session-coordinator.h"
#include "audio-normalizer.h"
#include <iostream>
#include <mutex>

SessionCoordinator::SessionCoordinator(RecognitionEngine* engine, SessionRegistry* registry, int sample_rate)
    : engine_(engine), registry_(registry), sample_rate_(sample_rate) {}

bool SessionCoordinator::engine_available() const {
    return engine_ && engine_->is_loaded();
}

StreamResult SessionCoordinator::process_fragment(const std::string& session_id, const std::string& fragment) {
    if (!engine_available()) {
        return StreamResult::failure(ErrorKind::ENGINE_UNAVAILABLE, "Recognition engine not initialized");
    }

    // Validation happens before any session state is touched
    NormalizedPcm pcm = normalize_fragment(fragment);
    switch (pcm.status) {
        case NormalizeStatus::EMPTY_INPUT:
            std::cout << "⚠️ [" << session_id << "] Empty audio fragment" << std::endl;
            return StreamResult::failure(ErrorKind::EMPTY_INPUT, "Audio data is empty");
        case NormalizeStatus::MISALIGNED_INPUT:
            std::cout << "⚠️ [" << session_id << "] Fragment length " << fragment.size()
                      << " is not a multiple of 4" << std::endl;
            return StreamResult::failure(ErrorKind::MISALIGNED_INPUT,
                "Invalid audio length: " + std::to_string(fragment.size()) + " bytes, expected a multiple of 4");
        case NormalizeStatus::TOO_SHORT:
            if (verbose_) {
                std::cout << "⚠️ [" << session_id << "] Fragment too short (" << pcm.input_samples
                          << " samples), skipped" << std::endl;
            }
            return StreamResult::partial("");
        case NormalizeStatus::OK:
            break;
    }

    if (verbose_) {
        std::cout << "📥 [" << session_id << "] " << fragment.size() << " bytes -> "
                  << pcm.samples.size() << " samples"
                  << (pcm.truncated ? " (truncated)" : "")
                  << (pcm.non_finite_replaced ? " (non-finite cleaned)" : "")
                  << (pcm.declicked_samples ? " (declicked)" : "") << std::endl;
    }

    std::shared_ptr<SessionSlot> slot = registry_->lock_for(session_id);
    std::lock_guard<std::mutex> lock(slot->mutex);

    if (registry_->is_closed(*slot)) {
        fragments_dropped_++;
        std::cout << "ℹ️ [" << session_id << "] Session already closed, late fragment dropped" << std::endl;
        return StreamResult::partial("");
    }

    try {
        EngineHandle* handle = registry_->engine_for(*slot);
        if (!handle) {
            registry_->bind(*slot, engine_->create_handle(sample_rate_));
            handle = registry_->engine_for(*slot);
            std::cout << "🆕 [" << session_id << "] Recognizer session created" << std::endl;
            if (observer_) slot->record_id = observer_->on_session_opened(session_id);
        }
        registry_->touch(*slot);

        bool boundary = handle->accept_waveform(pcm.samples);
        fragments_processed_++;

        if (boundary) {
            StreamResult result = aggregate_result(handle->final_result(), ResultKind::FINAL);
            std::cout << "✅ [" << session_id << "] Final: " << result.text << std::endl;
            if (observer_ && !result.text.empty()) observer_->on_final_text(session_id, slot->record_id, result.text);
            return result;
        }

        StreamResult result = aggregate_result(handle->partial_result(), ResultKind::PARTIAL);
        if (verbose_) {
            std::cout << "🎤 [" << session_id << "] Partial: " << result.text << std::endl;
        }
        return result;
    } catch (const std::exception& e) {
        // Session stays registered; a later fragment may succeed
        std::cout << "❌ [" << session_id << "] Recognition failed: " << e.what() << std::endl;
        return StreamResult::failure(ErrorKind::ENGINE_PROCESSING,
                                     std::string("Recognition failed: ") + e.what());
    }
}

StreamResult SessionCoordinator::end_of_utterance(const std::string& session_id) {
    if (!engine_available()) {
        return StreamResult::failure(ErrorKind::ENGINE_UNAVAILABLE, "Recognition engine not initialized");
    }

    std::shared_ptr<SessionSlot> slot = registry_->lock_for(session_id);
    std::lock_guard<std::mutex> lock(slot->mutex);

    // A concurrent end-of-utterance already tore this slot down
    if (registry_->is_closed(*slot)) {
        return StreamResult::final_text("");
    }

    // A new session under the same id may open as soon as the slot is
    // removed; this session keeps writing to its own record.
    const int64_t record_id = slot->record_id;
    std::unique_ptr<EngineHandle> handle = registry_->close_and_remove(*slot);
    if (!handle) {
        std::cout << "ℹ️ [" << session_id << "] End of utterance without audio" << std::endl;
        return StreamResult::final_text("");
    }

    StreamResult result;
    try {
        result = aggregate_result(handle->final_result(), ResultKind::FINAL);
        std::cout << "✅ [" << session_id << "] Final result: " << result.text << std::endl;
        if (observer_ && !result.text.empty()) observer_->on_final_text(session_id, record_id, result.text);
    } catch (const std::exception& e) {
        std::cout << "❌ [" << session_id << "] Final result failed: " << e.what() << std::endl;
        result = StreamResult::failure(ErrorKind::ENGINE_PROCESSING,
                                       std::string("Final result failed: ") + e.what());
    }

    if (observer_) observer_->on_session_closed(session_id, record_id);
    std::cout << "🗑️ [" << session_id << "] Session closed" << std::endl;
    return result;
}

size_t SessionCoordinator::sweep_idle_sessions(std::chrono::milliseconds idle_timeout) {
    size_t closed = 0;
    for (const auto& slot : registry_->idle_sessions(idle_timeout)) {
        std::lock_guard<std::mutex> lock(slot->mutex);

        // Activity may have resumed while we waited for the lock
        int64_t idle_ms = SessionRegistry::now_ms() - slot->last_activity_ms.load();
        if (registry_->is_closed(*slot) || idle_ms < idle_timeout.count()) {
            continue;
        }

        const int64_t record_id = slot->record_id;
        std::unique_ptr<EngineHandle> handle = registry_->close_and_remove(*slot);
        if (observer_ && handle) observer_->on_session_closed(slot->session_id, record_id);
        std::cout << "🗑️ [" << slot->session_id << "] Removing inactive session (idle "
                  << idle_ms << " ms)" << std::endl;
        closed++;
    }
    return closed;
}
