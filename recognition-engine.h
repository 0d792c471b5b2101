#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <stdexcept>
#include <cstdint>

// Narrow contract between the session layer and a speech recognizer.
// Any backend that consumes 16 kHz mono PCM16 and can report partial/final
// text per handle fits behind these interfaces.

// Engine-native result. Either field may be missing; the result aggregator
// decides how absent values are presented.
struct EngineResult {
    std::optional<std::string> text;
    std::optional<float> confidence;
};

// Raised by engine backends when a handle cannot be created or a waveform
// cannot be processed.
class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& what) : std::runtime_error(what) {}
};

// Per-session recognizer state. Not thread-safe: the owner serializes calls.
class EngineHandle {
public:
    virtual ~EngineHandle() = default;

    // Feed PCM16 samples. Returns true when an utterance boundary was reached,
    // in which case final_result() yields the completed utterance.
    virtual bool accept_waveform(const std::vector<int16_t>& pcm) = 0;

    // Tentative text for the utterance in progress ({partial}).
    virtual EngineResult partial_result() = 0;

    // Completed or flushed utterance ({text, confidence}); resets the
    // utterance state of the handle.
    virtual EngineResult final_result() = 0;
};

class RecognitionEngine {
public:
    virtual ~RecognitionEngine() = default;

    virtual bool is_loaded() const = 0;

    // Throws EngineError when the backend cannot allocate a new handle.
    virtual std::unique_ptr<EngineHandle> create_handle(int sample_rate) = 0;
};
