// Manual client for a running speech-stream-service: streams a tone (or a
// 16 kHz mono PCM16 WAV file) to /recognize_stream in 100 ms fragments and
// closes the session with X-End-Of-Utterance.

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "../wav-reader.h"

static bool write_all(int fd, const void* buf, size_t n) {
    const uint8_t* p = static_cast<const uint8_t*>(buf);
    size_t off = 0;
    while (off < n) {
        ssize_t k = ::send(fd, p + off, n - off, 0);
        if (k <= 0) return false;
        off += (size_t)k;
    }
    return true;
}

// One request per connection; returns status code and body
static int post(const std::string& host, int port, const std::string& path,
                const std::vector<std::pair<std::string, std::string>>& headers,
                const std::string& body, std::string& response_body) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1 ||
        ::connect(fd, (sockaddr*)&addr, sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }

    std::ostringstream req;
    req << "POST " << path << " HTTP/1.1\r\n";
    req << "Host: " << host << ":" << port << "\r\n";
    req << "Content-Type: application/octet-stream\r\n";
    for (const auto& h : headers) req << h.first << ": " << h.second << "\r\n";
    req << "Content-Length: " << body.size() << "\r\n";
    req << "Connection: close\r\n\r\n";
    std::string head = req.str();

    if (!write_all(fd, head.data(), head.size()) || !write_all(fd, body.data(), body.size())) {
        ::close(fd);
        return -1;
    }

    std::string raw;
    char buf[4096];
    ssize_t k;
    while ((k = ::recv(fd, buf, sizeof(buf), 0)) > 0) raw.append(buf, (size_t)k);
    ::close(fd);

    int status = -1;
    if (raw.compare(0, 9, "HTTP/1.1 ") == 0 && raw.size() >= 12) {
        status = std::stoi(raw.substr(9, 3));
    }
    size_t body_pos = raw.find("\r\n\r\n");
    response_body = body_pos == std::string::npos ? "" : raw.substr(body_pos + 4);
    return status;
}

static std::string to_float_le(const std::vector<float>& samples, size_t begin, size_t end) {
    std::string bytes((end - begin) * sizeof(float), '\0');
    std::memcpy(&bytes[0], samples.data() + begin, bytes.size());
    return bytes;
}

int main(int argc, char** argv) {
    std::string host = "127.0.0.1";
    int port = 5001;
    std::string session_id = "sim-" + std::to_string(::getpid());
    std::string wav_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--host" && i + 1 < argc) host = argv[++i];
        else if (arg == "--port" && i + 1 < argc) port = std::stoi(argv[++i]);
        else if (arg == "--session" && i + 1 < argc) session_id = argv[++i];
        else if (arg == "--wav" && i + 1 < argc) wav_path = argv[++i];
        else {
            std::cerr << "Usage: " << argv[0] << " [--host H] [--port P] [--session ID] [--wav FILE]\n";
            return 2;
        }
    }

    std::vector<float> audio;
    if (!wav_path.empty()) {
        std::ifstream in(wav_path, std::ios::binary);
        std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        WavData wav;
        std::string error;
        if (!parse_wav(bytes, wav, error) || !is_recognizer_format(wav, error)) {
            std::cerr << "❌ " << wav_path << ": " << error << "\n";
            return 1;
        }
        audio.reserve(wav.samples.size());
        for (int16_t s : wav.samples) audio.push_back(s / 32768.0f);
    } else {
        // 2 s of a 440 Hz tone
        audio.resize(32000);
        for (size_t i = 0; i < audio.size(); ++i) {
            audio[i] = 0.3f * (float)std::sin(6.283185307179586 * 440.0 * i / 16000.0);
        }
    }

    std::cout << "\n=== Stream Client Sim ===\n";
    std::cout << "Target: " << host << ":" << port << "\n";
    std::cout << "Session: " << session_id << "\n";
    std::cout << "Audio: " << audio.size() << " samples (" << audio.size() / 16000.0 << "s)\n\n";

    const size_t step = 1600;  // 100 ms
    auto t0 = std::chrono::steady_clock::now();
    for (size_t off = 0; off < audio.size(); off += step) {
        size_t end = std::min(audio.size(), off + step);
        std::string body;
        int status = post(host, port, "/recognize_stream", {{"X-Session-Id", session_id}},
                          to_float_le(audio, off, end), body);
        if (status < 0) {
            std::cerr << "❌ Connection to " << host << ":" << port << " failed\n";
            return 1;
        }
        std::cout << "📤 [" << off / step << "] " << status << " " << body << "\n";
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::string body;
    int status = post(host, port, "/recognize_stream",
                      {{"X-Session-Id", session_id}, {"X-End-Of-Utterance", "true"}}, "", body);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
    std::cout << "🏁 Final: " << status << " " << body << "\n";
    std::cout << "⏱️ Total: " << ms << " ms\n";
    return status == 200 ? 0 : 1;
}
