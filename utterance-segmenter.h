#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>

struct UtteranceSegmenterConfig {
    int sample_rate = 16000;

    // Energy VAD over 10ms windows
    float vad_threshold = 0.01f;
    float vad_start_mul = 1.05f;
    float vad_stop_mul = 0.5f;
    int silence_hangover_ms = 500;
    int pre_roll_ms = 350;
    int max_utterance_ms = 20000;

    // A partial re-decode is due every N ms of new utterance audio
    int partial_step_ms = 500;
};

// Splits a PCM16 stream into utterances. Silence before speech is kept as
// pre-roll; an utterance ends after silence_hangover_ms of quiet or at
// max_utterance_ms. Not thread-safe.
class UtteranceSegmenter {
public:
    explicit UtteranceSegmenter(const UtteranceSegmenterConfig& config);

    // Returns true when at least one utterance was closed by this call.
    bool accept(const std::vector<int16_t>& pcm);

    bool in_speech() const { return in_speech_; }
    const std::vector<float>& utterance() const { return utterance_; }
    size_t pre_roll_size() const { return pre_roll_.size(); }
    bool has_completed() const { return !completed_.empty(); }

    // Partial throttling for the utterance in progress
    bool partial_due() const;
    void mark_partial();

    // Closed utterances not yet taken, or else the utterance in progress
    // (flushed, including the incomplete window). Empty when neither exists.
    std::vector<float> take_final();

    static float calculate_energy(const std::vector<float>& samples);

private:
    UtteranceSegmenterConfig config_;

    size_t window_samples_;
    size_t pre_roll_samples_;
    size_t max_utterance_samples_;
    size_t partial_step_samples_;

    std::vector<float> pending_window_;
    std::vector<float> pre_roll_;
    std::vector<float> utterance_;
    std::vector<float> completed_;
    bool in_speech_ = false;
    int silence_ms_ = 0;
    size_t last_partial_samples_ = 0;

    bool process_window(const std::vector<float>& window);
    void close_utterance();
};
