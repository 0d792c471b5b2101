#pragma once

#include "recognition-engine.h"
#include "utterance-segmenter.h"
#include <string>
#include <vector>
#include <memory>
#include <atomic>

// Forward declarations for whisper.cpp
struct whisper_context;
struct whisper_state;

struct WhisperEngineConfig {
    std::string model_path = "models/ggml-base.en.bin";
    int n_threads = 4;
    bool use_gpu = true;
    std::string language = "en";

    // Utterance boundaries and partial throttling
    UtteranceSegmenterConfig segmentation;
};

// Owns the whisper model. Handles share the model read-only and each get
// their own whisper_state, so different sessions decode in parallel.
class WhisperEngine : public RecognitionEngine {
public:
    explicit WhisperEngine(const WhisperEngineConfig& config);
    ~WhisperEngine() override;

    bool load();
    void unload();

    bool is_loaded() const override { return loaded_.load(); }
    std::unique_ptr<EngineHandle> create_handle(int sample_rate) override;

    const WhisperEngineConfig& config() const { return config_; }

private:
    WhisperEngineConfig config_;
    whisper_context* ctx_;
    std::atomic<bool> loaded_;

    void warm_up();
};

class WhisperEngineHandle : public EngineHandle {
public:
    WhisperEngineHandle(whisper_context* ctx, whisper_state* state, const WhisperEngineConfig& config);
    ~WhisperEngineHandle() override;

    WhisperEngineHandle(const WhisperEngineHandle&) = delete;
    WhisperEngineHandle& operator=(const WhisperEngineHandle&) = delete;

    bool accept_waveform(const std::vector<int16_t>& pcm) override;
    EngineResult partial_result() override;
    EngineResult final_result() override;

private:
    struct Decoded {
        std::string text;
        float confidence = 0.0f;
        bool has_confidence = false;
    };

    whisper_context* ctx_;   // shared, owned by WhisperEngine
    whisper_state* state_;   // owned
    WhisperEngineConfig config_;

    UtteranceSegmenter segmenter_;
    std::string cached_partial_;

    Decoded decode(const std::vector<float>& samples);
};
