#include "speech-service.h"
#include <iostream>
#include <chrono>
#include <algorithm>

SpeechService::SpeechService(std::unique_ptr<RecognitionEngine> engine)
    : engine_(std::move(engine)),
      coordinator_(engine_.get(), &registry_, kSampleRate),
      running_(false) {
    coordinator_.set_observer(this);
}

SpeechService::~SpeechService() {
    stop();
}

bool SpeechService::start(const SpeechServiceConfig& config) {
    if (running_.load()) return true;

    config_ = config;
    coordinator_.set_verbose(config_.verbose);

    // Initialize database connection
    if (!config_.database_path.empty()) {
        database_ = std::make_unique<Database>();
        if (!database_->init(config_.database_path)) {
            std::cout << "❌ Failed to initialize database: " << config_.database_path << std::endl;
            database_.reset();
            return false;
        }
        database_->set_service_status("starting");
        if (!config_.model_path.empty()) {
            database_->set_config("model_path", config_.model_path);
        }
    }

    if (!model_loaded()) {
        std::cout << "⚠️ Recognition engine not loaded; recognition requests will fail" << std::endl;
    } else {
        std::string error;
        if (!reset_recognizer(error)) {
            std::cout << "⚠️ Legacy recognizer unavailable: " << error << std::endl;
        }
    }

    running_.store(true);
    if (config_.session_idle_timeout_ms > 0) {
        sweep_thread_ = std::thread(&SpeechService::run_sweep_loop, this);
        std::cout << "⏱️ Idle sessions expire after " << config_.session_idle_timeout_ms << " ms" << std::endl;
    }

    if (database_) {
        database_->set_service_status(model_loaded() ? "running" : "error");
        std::cout << "💾 Database: " << config_.database_path << std::endl;
    }
    std::cout << "🎤 Speech stream service started" << std::endl;
    return true;
}

void SpeechService::stop() {
    if (!running_.load()) return;

    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
        running_.store(false);
    }
    sweep_cv_.notify_all();
    if (sweep_thread_.joinable()) {
        sweep_thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(legacy_mutex_);
        legacy_handle_.reset();
    }

    if (database_) {
        database_->set_service_status("stopped");
    }
    std::cout << "🛑 Speech stream service stopped (" << coordinator_.fragments_processed()
              << " fragments processed, " << coordinator_.fragments_dropped() << " late fragments dropped)"
              << std::endl;
}

bool SpeechService::model_loaded() const {
    return engine_ && engine_->is_loaded();
}

StreamResult SpeechService::recognize_stream(const std::string& session_id, const std::string& body,
                                             bool end_of_utterance) {
    if (end_of_utterance) {
        if (!body.empty()) {
            std::cout << "⚠️ [" << session_id << "] Ignoring " << body.size()
                      << " bytes sent with end of utterance" << std::endl;
        }
        return coordinator_.end_of_utterance(session_id);
    }
    return coordinator_.process_fragment(session_id, body);
}

StreamResult SpeechService::recognize_pcm(const std::vector<int16_t>& pcm) {
    if (!model_loaded()) {
        return StreamResult::failure(ErrorKind::ENGINE_UNAVAILABLE, "Recognition engine not initialized");
    }

    std::lock_guard<std::mutex> lock(legacy_mutex_);
    try {
        if (!legacy_handle_) {
            legacy_handle_ = engine_->create_handle(kSampleRate);
        }
        if (legacy_handle_->accept_waveform(pcm)) {
            return aggregate_result(legacy_handle_->final_result(), ResultKind::FINAL);
        }
        return aggregate_result(legacy_handle_->partial_result(), ResultKind::PARTIAL);
    } catch (const std::exception& e) {
        std::cout << "❌ Recognition error: " << e.what() << std::endl;
        return StreamResult::failure(ErrorKind::ENGINE_PROCESSING, e.what());
    }
}

bool SpeechService::reset_recognizer(std::string& error) {
    if (!model_loaded()) {
        error = "Recognition engine not initialized";
        return false;
    }

    try {
        std::unique_ptr<EngineHandle> fresh = engine_->create_handle(kSampleRate);
        std::lock_guard<std::mutex> lock(legacy_mutex_);
        legacy_handle_ = std::move(fresh);
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
    return true;
}

int64_t SpeechService::on_session_opened(const std::string& session_id) {
    if (!database_) return -1;
    int64_t record_id = database_->create_session_record(session_id);
    if (record_id < 0) {
        std::cout << "⚠️ [" << session_id << "] Failed to record session start" << std::endl;
    }
    return record_id;
}

void SpeechService::on_final_text(const std::string& session_id, int64_t record_id, const std::string& text) {
    if (!database_ || record_id < 0) return;
    if (!database_->append_transcription(record_id, text)) {
        std::cout << "⚠️ [" << session_id << "] Failed to store transcription" << std::endl;
    }
}

void SpeechService::on_session_closed(const std::string& session_id, int64_t record_id) {
    if (!database_ || record_id < 0) return;
    if (!database_->end_session_record(record_id)) {
        std::cout << "⚠️ [" << session_id << "] Failed to record session end" << std::endl;
    }
}

void SpeechService::run_sweep_loop() {
    const auto idle_timeout = std::chrono::milliseconds(config_.session_idle_timeout_ms);
    const auto interval = std::chrono::milliseconds(std::max(10, config_.sweep_interval_ms));

    std::unique_lock<std::mutex> lock(sweep_mutex_);
    while (running_.load()) {
        sweep_cv_.wait_for(lock, interval, [this] { return !running_.load(); });
        if (!running_.load()) break;

        lock.unlock();
        size_t closed = coordinator_.sweep_idle_sessions(idle_timeout);
        if (closed > 0) {
            std::cout << "🧹 Closed " << closed << " idle session(s), " << registry_.size() << " active" << std::endl;
        }
        lock.lock();
    }
}
