#include "audio-normalizer.h"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <cstdlib>

// Fragments are always little-endian regardless of host order
static float read_float_le(const uint8_t* p) {
    uint32_t bits = static_cast<uint32_t>(p[0]) |
                    (static_cast<uint32_t>(p[1]) << 8) |
                    (static_cast<uint32_t>(p[2]) << 16) |
                    (static_cast<uint32_t>(p[3]) << 24);
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

NormalizedPcm normalize_fragment(const uint8_t* data, size_t size) {
    NormalizedPcm out;

    if (size == 0 || data == nullptr) {
        out.status = NormalizeStatus::EMPTY_INPUT;
        return out;
    }
    if (size % 4 != 0) {
        out.status = NormalizeStatus::MISALIGNED_INPUT;
        return out;
    }

    const size_t n = size / 4;
    out.input_samples = n;
    out.samples.reserve(std::min(n, AudioNormalizerLimits::kMaxBytes / 2));

    for (size_t i = 0; i < n; ++i) {
        float s = read_float_le(data + i * 4);
        if (std::isnan(s)) {
            s = 0.0f;
            out.non_finite_replaced++;
        } else if (std::isinf(s)) {
            s = s > 0.0f ? 1.0f : -1.0f;
            out.non_finite_replaced++;
        }
        s = std::max(-1.0f, std::min(1.0f, s));
        // float -> int conversion truncates toward zero
        out.samples.push_back(static_cast<int16_t>(s * AudioNormalizerLimits::kQuantizeScale));
    }

    if (out.byte_size() < AudioNormalizerLimits::kMinBytes) {
        out.status = NormalizeStatus::TOO_SHORT;
        out.samples.clear();
        return out;
    }

    // Odd byte lengths cannot occur here: the buffer holds whole 16-bit samples.

    const size_t max_samples = AudioNormalizerLimits::kMaxBytes / sizeof(int16_t);
    if (out.samples.size() > max_samples) {
        out.samples.resize(max_samples);
        out.truncated = true;
    }

    for (size_t i = 1; i < out.samples.size(); ++i) {
        int diff = static_cast<int>(out.samples[i]) - static_cast<int>(out.samples[i - 1]);
        if (std::abs(diff) > AudioNormalizerLimits::kDeclickThreshold) {
            out.samples[i] = out.samples[i - 1];
            out.declicked_samples++;
        }
    }

    if (out.samples.size() < AudioNormalizerLimits::kMinSamples) {
        out.samples.resize(AudioNormalizerLimits::kMinSamples, 0);
        out.padded = true;
    }

    out.status = NormalizeStatus::OK;
    return out;
}

NormalizedPcm normalize_fragment(const std::string& fragment) {
    return normalize_fragment(reinterpret_cast<const uint8_t*>(fragment.data()), fragment.size());
}

const char* normalize_status_name(NormalizeStatus status) {
    switch (status) {
        case NormalizeStatus::OK: return "OK";
        case NormalizeStatus::TOO_SHORT: return "TooShort";
        case NormalizeStatus::EMPTY_INPUT: return "EmptyInput";
        case NormalizeStatus::MISALIGNED_INPUT: return "MisalignedInput";
    }
    return "Unknown";
}
