#include "utterance-segmenter.h"
#include <algorithm>
#include <cmath>

UtteranceSegmenter::UtteranceSegmenter(const UtteranceSegmenterConfig& config) : config_(config) {
    window_samples_ = static_cast<size_t>(config_.sample_rate) / 100;  // 10ms
    pre_roll_samples_ = static_cast<size_t>(config_.sample_rate) * config_.pre_roll_ms / 1000;
    max_utterance_samples_ = static_cast<size_t>(config_.sample_rate) * config_.max_utterance_ms / 1000;
    partial_step_samples_ = static_cast<size_t>(config_.sample_rate) * config_.partial_step_ms / 1000;
    pending_window_.reserve(window_samples_);
}

float UtteranceSegmenter::calculate_energy(const std::vector<float>& samples) {
    if (samples.empty()) return 0.0f;
    double sum = 0.0;
    for (float s : samples) sum += static_cast<double>(s) * s;
    return static_cast<float>(std::sqrt(sum / samples.size()));
}

bool UtteranceSegmenter::accept(const std::vector<int16_t>& pcm) {
    bool boundary = false;
    for (int16_t s : pcm) {
        pending_window_.push_back(static_cast<float>(s) / 32768.0f);
        if (pending_window_.size() == window_samples_) {
            if (process_window(pending_window_)) {
                boundary = true;
            }
            pending_window_.clear();
        }
    }
    return boundary;
}

// Returns true when this window closed the current utterance
bool UtteranceSegmenter::process_window(const std::vector<float>& window) {
    const float th_start = std::max(0.001f, config_.vad_threshold * config_.vad_start_mul);
    const float th_stop = std::max(0.0005f, config_.vad_threshold * config_.vad_stop_mul);
    const int window_ms = 10;

    float rms = calculate_energy(window);
    bool speech_now = in_speech_ ? (rms > th_stop) : (rms > th_start);

    if (!in_speech_) {
        if (speech_now) {
            in_speech_ = true;
            silence_ms_ = 0;
            utterance_.swap(pre_roll_);
            pre_roll_.clear();
            utterance_.insert(utterance_.end(), window.begin(), window.end());
        } else {
            pre_roll_.insert(pre_roll_.end(), window.begin(), window.end());
            if (pre_roll_.size() > pre_roll_samples_) {
                pre_roll_.erase(pre_roll_.begin(), pre_roll_.begin() + (pre_roll_.size() - pre_roll_samples_));
            }
        }
        return false;
    }

    utterance_.insert(utterance_.end(), window.begin(), window.end());
    silence_ms_ = speech_now ? 0 : silence_ms_ + window_ms;

    if (silence_ms_ >= config_.silence_hangover_ms || utterance_.size() >= max_utterance_samples_) {
        close_utterance();
        return true;
    }
    return false;
}

void UtteranceSegmenter::close_utterance() {
    // A second boundary before take_final() keeps both utterances
    completed_.insert(completed_.end(), utterance_.begin(), utterance_.end());
    utterance_.clear();
    in_speech_ = false;
    silence_ms_ = 0;
    last_partial_samples_ = 0;
}

bool UtteranceSegmenter::partial_due() const {
    return in_speech_ && !utterance_.empty() &&
           utterance_.size() >= last_partial_samples_ + partial_step_samples_;
}

void UtteranceSegmenter::mark_partial() {
    last_partial_samples_ = utterance_.size();
}

std::vector<float> UtteranceSegmenter::take_final() {
    std::vector<float> audio;
    if (!completed_.empty()) {
        audio.swap(completed_);
    } else if (in_speech_) {
        // Explicit flush: take whatever the utterance holds so far
        audio.swap(utterance_);
        audio.insert(audio.end(), pending_window_.begin(), pending_window_.end());
        pending_window_.clear();
        in_speech_ = false;
        silence_ms_ = 0;
        last_partial_samples_ = 0;
    }
    return audio;
}
