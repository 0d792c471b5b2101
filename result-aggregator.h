#pragma once

#include "recognition-engine.h"
#include <string>

enum class ResultKind {
    PARTIAL,
    FINAL,
    ERROR
};

enum class ErrorKind {
    NONE,
    EMPTY_INPUT,
    MISALIGNED_INPUT,
    INVALID_AUDIO_FORMAT,
    MISSING_AUDIO,
    ENGINE_UNAVAILABLE,
    ENGINE_PROCESSING
};

// Response of one recognition request: Partial{text}, Final{text, confidence?}
// or Error{kind, message}.
struct StreamResult {
    ResultKind kind = ResultKind::PARTIAL;
    std::string text;
    bool has_confidence = false;
    float confidence = 0.0f;
    ErrorKind error = ErrorKind::NONE;
    std::string message;

    bool is_error() const { return kind == ResultKind::ERROR; }

    static StreamResult partial(const std::string& text);
    static StreamResult final_text(const std::string& text);
    static StreamResult final_text(const std::string& text, float confidence);
    static StreamResult failure(ErrorKind error, const std::string& message);
};

// Engine-native result -> service result. Missing text is an empty string,
// missing or non-finite confidence is left out. Partials never carry a
// confidence.
StreamResult aggregate_result(const EngineResult& raw, ResultKind kind);

// {text, confidence?, success: true, type} or {error, kind, success: false}
std::string result_to_json(const StreamResult& result);

// HTTP status for a result: 200, 400 for validation errors, 500 otherwise
int result_http_status(const StreamResult& result);

const char* error_kind_name(ErrorKind error);
std::string json_escape(const std::string& s);
