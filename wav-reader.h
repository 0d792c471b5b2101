#pragma once

#include <string>
#include <vector>
#include <cstdint>

// In-memory RIFF/WAVE parsing for uploaded files
struct WavData {
    int audio_format = 0;     // 1 = PCM
    int channels = 0;
    int sample_rate = 0;
    int bits_per_sample = 0;
    std::vector<int16_t> samples;   // interleaved PCM16 (only for 16-bit PCM files)
};

// Parses the header and, for 16-bit PCM, the sample data. Returns false with
// a message when the buffer is not a readable WAVE file.
bool parse_wav(const std::string& bytes, WavData& out, std::string& error);

// True for mono, 16-bit, 16 kHz PCM. Otherwise fills error with a message
// naming the format that was found.
bool is_recognizer_format(const WavData& wav, std::string& error);
