#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

// Turns a raw float32 fragment into 16 kHz mono PCM16 ready for the engine.
// Stateless: safe to call from any request thread.

enum class NormalizeStatus {
    OK,
    TOO_SHORT,        // valid input, below 20ms after quantization
    EMPTY_INPUT,
    MISALIGNED_INPUT  // byte length not a multiple of 4
};

struct NormalizedPcm {
    NormalizeStatus status = NormalizeStatus::EMPTY_INPUT;
    std::vector<int16_t> samples;

    // Diagnostics for logging
    size_t input_samples = 0;
    size_t non_finite_replaced = 0;
    size_t declicked_samples = 0;
    bool truncated = false;
    bool padded = false;

    bool ok() const { return status == NormalizeStatus::OK; }
    size_t byte_size() const { return samples.size() * sizeof(int16_t); }
};

struct AudioNormalizerLimits {
    static constexpr size_t kMinBytes = 640;         // 20ms @ 16kHz
    static constexpr size_t kMaxBytes = 16000 * 2;   // 1s @ 16kHz
    static constexpr size_t kMinSamples = 160;       // engine's minimum window
    static constexpr int kDeclickThreshold = 20000;
    static constexpr float kQuantizeScale = 32767.0f;
};

NormalizedPcm normalize_fragment(const uint8_t* data, size_t size);
NormalizedPcm normalize_fragment(const std::string& fragment);

const char* normalize_status_name(NormalizeStatus status);
