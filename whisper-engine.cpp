#include "whisper-engine.h"
#include <iostream>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <sys/stat.h>

#include <whisper.h>

static constexpr int kSampleRate = 16000;

// WhisperEngine Implementation
WhisperEngine::WhisperEngine(const WhisperEngineConfig& config)
    : config_(config), ctx_(nullptr), loaded_(false) {}

WhisperEngine::~WhisperEngine() {
    unload();
}

bool WhisperEngine::load() {
    if (loaded_.load()) return true;

    // Validate model file exists
    struct stat file_stat;
    if (stat(config_.model_path.c_str(), &file_stat) != 0) {
        std::cout << "❌ Model file not found: " << config_.model_path << std::endl;
        return false;
    }

    std::cout << "⏳ Preloading Whisper model: " << config_.model_path << std::endl;
    auto t0 = std::chrono::steady_clock::now();

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = config_.use_gpu;
    cparams.dtw_token_timestamps = false;
    ctx_ = whisper_init_from_file_with_params_no_state(config_.model_path.c_str(), cparams);
    if (!ctx_) {
        std::cout << "❌ Whisper preload failed for model: " << config_.model_path << std::endl;
        return false;
    }

    auto t1 = std::chrono::steady_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
    std::cout << "✅ Whisper model preloaded in " << ms << " ms" << std::endl;

    loaded_.store(true);
    warm_up();
    return true;
}

void WhisperEngine::unload() {
    loaded_.store(false);
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

// Warm-up inference to allocate compute graphs before the first request
void WhisperEngine::warm_up() {
    try {
        // ~1s low tone: loud enough for the VAD to open an utterance, so the
        // flush below runs a real decode
        auto handle = create_handle(kSampleRate);
        std::vector<int16_t> tone(kSampleRate);
        for (size_t i = 0; i < tone.size(); ++i) {
            tone[i] = static_cast<int16_t>(3000.0 * std::sin(6.283185307179586 * 440.0 * i / kSampleRate));
        }
        handle->accept_waveform(tone);
        handle->final_result();
        std::cout << "✅ Whisper warm-up completed" << std::endl;
    } catch (const std::exception& e) {
        std::cout << "⚠️ Whisper warm-up failed (non-fatal): " << e.what() << std::endl;
    }
}

std::unique_ptr<EngineHandle> WhisperEngine::create_handle(int sample_rate) {
    if (!loaded_.load() || !ctx_) {
        throw EngineError("whisper model not loaded");
    }
    if (sample_rate != kSampleRate) {
        throw EngineError("unsupported sample rate " + std::to_string(sample_rate) +
                          " (whisper requires " + std::to_string(kSampleRate) + ")");
    }

    whisper_state* state = whisper_init_state(ctx_);
    if (!state) {
        throw EngineError("failed to allocate whisper state");
    }
    return std::make_unique<WhisperEngineHandle>(ctx_, state, config_);
}

// WhisperEngineHandle Implementation
WhisperEngineHandle::WhisperEngineHandle(whisper_context* ctx, whisper_state* state,
                                         const WhisperEngineConfig& config)
    : ctx_(ctx), state_(state), config_(config), segmenter_(config.segmentation) {}

WhisperEngineHandle::~WhisperEngineHandle() {
    if (state_) {
        whisper_free_state(state_);
        state_ = nullptr;
    }
}

bool WhisperEngineHandle::accept_waveform(const std::vector<int16_t>& pcm) {
    bool boundary = segmenter_.accept(pcm);
    if (boundary) {
        cached_partial_.clear();
    }
    return boundary;
}

EngineResult WhisperEngineHandle::partial_result() {
    EngineResult result;
    if (!segmenter_.in_speech() || segmenter_.utterance().empty()) {
        result.text = std::string();
        return result;
    }

    if (segmenter_.partial_due()) {
        cached_partial_ = decode(segmenter_.utterance()).text;
        segmenter_.mark_partial();
    }
    result.text = cached_partial_;
    return result;
}

EngineResult WhisperEngineHandle::final_result() {
    std::vector<float> audio = segmenter_.take_final();
    cached_partial_.clear();

    EngineResult result;
    if (audio.empty()) {
        result.text = std::string();
        return result;
    }

    Decoded decoded = decode(audio);
    result.text = decoded.text;
    if (decoded.has_confidence) {
        result.confidence = decoded.confidence;
    }
    return result;
}

WhisperEngineHandle::Decoded WhisperEngineHandle::decode(const std::vector<float>& samples) {
    if (!state_) {
        throw EngineError("whisper state released");
    }

    // whisper_full rejects inputs shorter than one second
    std::vector<float> window(samples);
    const size_t min_samples = kSampleRate + kSampleRate / 100;
    if (window.size() < min_samples) {
        window.resize(min_samples, 0.0f);
    }

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.language = config_.language.c_str();
    wparams.n_threads = config_.n_threads;
    wparams.temperature = 0.0f;
    wparams.no_timestamps = true;
    wparams.no_context = true;
    wparams.translate = false;
    wparams.print_progress = false;
    wparams.print_realtime = false;
    wparams.print_special = false;
    wparams.print_timestamps = false;

    auto t_start = std::chrono::steady_clock::now();
    int rc = whisper_full_with_state(ctx_, state_, wparams, window.data(), static_cast<int>(window.size()));
    auto inference_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t_start).count();

    if (rc != 0) {
        throw EngineError("whisper inference failed (code " + std::to_string(rc) + ")");
    }

    Decoded out;
    double p_sum = 0.0;
    int p_count = 0;
    const whisper_token eot = whisper_token_eot(ctx_);

    const int n_segments = whisper_full_n_segments_from_state(state_);
    for (int i = 0; i < n_segments; ++i) {
        const char* text = whisper_full_get_segment_text_from_state(state_, i);
        if (text) {
            out.text += text;
        }
        const int n_tokens = whisper_full_n_tokens_from_state(state_, i);
        for (int j = 0; j < n_tokens; ++j) {
            if (whisper_full_get_token_id_from_state(state_, i, j) >= eot) continue;  // special tokens
            p_sum += whisper_full_get_token_p_from_state(state_, i, j);
            p_count++;
        }
    }

    if (p_count > 0) {
        out.confidence = static_cast<float>(p_sum / p_count);
        out.has_confidence = true;
    }

    std::cout << "⚡ Inference: " << inference_ms << "ms ("
              << static_cast<double>(samples.size()) / kSampleRate << "s audio)" << std::endl;
    return out;
}
