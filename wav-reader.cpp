#include "wav-reader.h"
#include <algorithm>

static uint32_t read_u32_le(const std::string& b, size_t pos) {
    return static_cast<uint32_t>(static_cast<uint8_t>(b[pos])) |
           (static_cast<uint32_t>(static_cast<uint8_t>(b[pos + 1])) << 8) |
           (static_cast<uint32_t>(static_cast<uint8_t>(b[pos + 2])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(b[pos + 3])) << 24);
}

static uint16_t read_u16_le(const std::string& b, size_t pos) {
    return static_cast<uint16_t>(static_cast<uint8_t>(b[pos]) |
                                 (static_cast<uint8_t>(b[pos + 1]) << 8));
}

bool parse_wav(const std::string& bytes, WavData& out, std::string& error) {
    if (bytes.size() < 12 || bytes.compare(0, 4, "RIFF") != 0 || bytes.compare(8, 4, "WAVE") != 0) {
        error = "Not a RIFF/WAVE file";
        return false;
    }

    // Walk chunks until 'fmt ' and 'data'
    bool got_fmt = false, got_data = false;
    size_t data_pos = 0, data_size = 0;
    size_t pos = 12;
    while (pos + 8 <= bytes.size() && !(got_fmt && got_data)) {
        std::string id = bytes.substr(pos, 4);
        size_t sz = read_u32_le(bytes, pos + 4);
        size_t body = pos + 8;

        if (id == "fmt ") {
            if (sz < 16 || body + 16 > bytes.size()) {
                error = "Truncated fmt chunk";
                return false;
            }
            out.audio_format = read_u16_le(bytes, body);
            out.channels = read_u16_le(bytes, body + 2);
            out.sample_rate = static_cast<int>(read_u32_le(bytes, body + 4));
            out.bits_per_sample = read_u16_le(bytes, body + 14);
            got_fmt = true;
        } else if (id == "data") {
            data_pos = body;
            // Streaming writers leave the size unset; clamp to what we have
            data_size = std::min(sz, bytes.size() - body);
            got_data = true;
        }

        // Chunks are word aligned
        pos = body + sz + (sz & 1);
        if (pos < body) break;  // overflow on a corrupt size
    }

    if (!got_fmt) {
        error = "Missing fmt chunk";
        return false;
    }
    if (!got_data) {
        error = "Missing data chunk";
        return false;
    }

    out.samples.clear();
    if (out.audio_format == 1 && out.bits_per_sample == 16) {
        out.samples.resize(data_size / 2);
        for (size_t i = 0; i < out.samples.size(); ++i) {
            out.samples[i] = static_cast<int16_t>(read_u16_le(bytes, data_pos + i * 2));
        }
    }
    return true;
}

bool is_recognizer_format(const WavData& wav, std::string& error) {
    if (wav.audio_format == 1 && wav.channels == 1 && wav.bits_per_sample == 16 && wav.sample_rate == 16000) {
        return true;
    }
    error = "Unsupported audio format. Required: mono, 16-bit, 16kHz. Found: " +
            std::to_string(wav.channels) + " channel(s), " +
            std::to_string(wav.bits_per_sample) + "-bit, " +
            std::to_string(wav.sample_rate) + "Hz";
    if (wav.audio_format != 1) {
        error += " (format tag " + std::to_string(wav.audio_format) + ", PCM required)";
    }
    return false;
}
