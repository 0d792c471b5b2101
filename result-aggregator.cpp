#include "result-aggregator.h"
#include <cmath>
#include <cstdio>
#include <sstream>

StreamResult StreamResult::partial(const std::string& text) {
    StreamResult r;
    r.kind = ResultKind::PARTIAL;
    r.text = text;
    return r;
}

StreamResult StreamResult::final_text(const std::string& text) {
    StreamResult r;
    r.kind = ResultKind::FINAL;
    r.text = text;
    return r;
}

StreamResult StreamResult::final_text(const std::string& text, float confidence) {
    StreamResult r = final_text(text);
    r.has_confidence = true;
    r.confidence = confidence;
    return r;
}

StreamResult StreamResult::failure(ErrorKind error, const std::string& message) {
    StreamResult r;
    r.kind = ResultKind::ERROR;
    r.error = error;
    r.message = message;
    return r;
}

static std::string trim_whitespace(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

StreamResult aggregate_result(const EngineResult& raw, ResultKind kind) {
    std::string text = raw.text ? trim_whitespace(*raw.text) : std::string();

    if (kind == ResultKind::FINAL) {
        if (raw.confidence && std::isfinite(*raw.confidence)) {
            return StreamResult::final_text(text, *raw.confidence);
        }
        return StreamResult::final_text(text);
    }
    return StreamResult::partial(text);
}

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

std::string result_to_json(const StreamResult& result) {
    std::ostringstream body;
    if (result.is_error()) {
        body << "{\"error\": \"" << json_escape(result.message)
             << "\", \"kind\": \"" << error_kind_name(result.error)
             << "\", \"success\": false}";
        return body.str();
    }

    body << "{\"text\": \"" << json_escape(result.text) << "\"";
    if (result.kind == ResultKind::FINAL && result.has_confidence) {
        body << ", \"confidence\": " << result.confidence;
    }
    body << ", \"success\": true, \"type\": \""
         << (result.kind == ResultKind::FINAL ? "final" : "partial") << "\"}";
    return body.str();
}

int result_http_status(const StreamResult& result) {
    if (!result.is_error()) return 200;
    switch (result.error) {
        case ErrorKind::EMPTY_INPUT:
        case ErrorKind::MISALIGNED_INPUT:
        case ErrorKind::INVALID_AUDIO_FORMAT:
        case ErrorKind::MISSING_AUDIO:
            return 400;
        default:
            return 500;
    }
}

const char* error_kind_name(ErrorKind error) {
    switch (error) {
        case ErrorKind::NONE: return "None";
        case ErrorKind::EMPTY_INPUT: return "EmptyInput";
        case ErrorKind::MISALIGNED_INPUT: return "MisalignedInput";
        case ErrorKind::INVALID_AUDIO_FORMAT: return "InvalidAudioFormat";
        case ErrorKind::MISSING_AUDIO: return "MissingAudio";
        case ErrorKind::ENGINE_UNAVAILABLE: return "EngineUnavailable";
        case ErrorKind::ENGINE_PROCESSING: return "EngineProcessingError";
    }
    return "Unknown";
}
