#pragma once

#include "recognition-engine.h"
#include "session-registry.h"
#include "session-coordinator.h"
#include "result-aggregator.h"
#include "database.h"
#include <string>
#include <vector>
#include <memory>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>

struct SpeechServiceConfig {
    std::string database_path;          // empty: no transcript log
    std::string model_path;             // recorded in system_config
    int session_idle_timeout_ms = 0;    // 0: idle sessions are never evicted
    int sweep_interval_ms = 1000;
    bool verbose = false;
};

// Streaming speech-recognition service: session coordination for
// /recognize_stream plus the single legacy recognizer behind /recognize.
class SpeechService : public SessionObserver {
public:
    explicit SpeechService(std::unique_ptr<RecognitionEngine> engine);
    ~SpeechService() override;

    SpeechService(const SpeechService&) = delete;
    SpeechService& operator=(const SpeechService&) = delete;

    // Service lifecycle
    bool start(const SpeechServiceConfig& config);
    void stop();
    bool is_running() const { return running_.load(); }

    // Status
    bool model_loaded() const;
    size_t active_sessions() const { return registry_.size(); }

    // Streaming recognition. With end_of_utterance set the body is ignored
    // and the session is flushed and closed.
    StreamResult recognize_stream(const std::string& session_id, const std::string& body, bool end_of_utterance);

    // Single-shot recognition of 16 kHz mono PCM16 on the legacy recognizer
    StreamResult recognize_pcm(const std::vector<int16_t>& pcm);

    // Replace the legacy recognizer; streaming sessions are unaffected
    bool reset_recognizer(std::string& error);

    SessionCoordinator& coordinator() { return coordinator_; }
    Database* database() { return database_.get(); }

    // SessionObserver: transcript log
    int64_t on_session_opened(const std::string& session_id) override;
    void on_final_text(const std::string& session_id, int64_t record_id, const std::string& text) override;
    void on_session_closed(const std::string& session_id, int64_t record_id) override;

private:
    static constexpr int kSampleRate = 16000;

    std::unique_ptr<RecognitionEngine> engine_;
    SessionRegistry registry_;
    SessionCoordinator coordinator_;
    SpeechServiceConfig config_;
    std::atomic<bool> running_;

    // Database connection
    std::unique_ptr<Database> database_;

    // Legacy recognizer, shared by every /recognize request
    std::unique_ptr<EngineHandle> legacy_handle_;
    std::mutex legacy_mutex_;

    // Idle session sweep
    std::thread sweep_thread_;
    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;

    void run_sweep_loop();
};

// Command line arguments of speech-stream-service
struct ServiceArgs {
    std::string model_path = "models/ggml-base.en.bin";
    std::string database_path = "speech_stream.db";
    int port = 5001;
    int n_threads = 4;
    bool use_gpu = true;
    std::string language = "en";
    int session_idle_timeout_ms = 0;
    size_t max_body_bytes = 16 * 1024 * 1024;
    std::string log_file = "server_debug.log";
    bool verbose = false;
};

bool parse_service_args(int argc, char** argv, ServiceArgs& args);
void print_service_usage(const char* program_name);
