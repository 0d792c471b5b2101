#include "speech-http-api.h"
#include "speech-service.h"
#include "result-aggregator.h"
#include "wav-reader.h"
#include <iostream>
#include <sstream>
#include <fstream>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <chrono>
#include <ctime>
#include <iomanip>

// Server-side log file, shared by all server instances
static std::mutex log_mutex;

void SpeechHttpServer::write_server_log(const std::string& message) {
    if (log_file_.empty()) return;
    std::lock_guard<std::mutex> lock(log_mutex);
    std::ofstream logfile(log_file_, std::ios::app);
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    logfile << "[" << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S") << "] " << message << std::endl;
}

static bool write_all_fd(int fd, const void* buf, size_t nbytes) {
    const uint8_t* p = static_cast<const uint8_t*>(buf);
    size_t off = 0;
    while (off < nbytes) {
        ssize_t m = send(fd, p + off, nbytes - off, MSG_NOSIGNAL);
        if (m <= 0) return false;
        off += static_cast<size_t>(m);
    }
    return true;
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

static std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '+') {
            out += ' ';
        } else if (s[i] == '%' && i + 2 < s.size() &&
                   std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
            out += static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += s[i];
        }
    }
    return out;
}

const char* http_status_text(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        default: return "Unknown";
    }
}

SpeechHttpServer::SpeechHttpServer(int port, SpeechService* service)
    : port_(port), server_socket_(-1), running_(false),
      max_body_bytes_(16 * 1024 * 1024), log_file_("server_debug.log"), service_(service) {}

SpeechHttpServer::~SpeechHttpServer() {
    stop();
}

bool SpeechHttpServer::start() {
    write_server_log("SERVER: Starting HTTP server on port " + std::to_string(port_));
    server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_socket_ < 0) {
        write_server_log("SERVER: Failed to create socket");
        std::cerr << "Failed to create socket" << std::endl;
        return false;
    }

    // Allow socket reuse
    int opt = 1;
    setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(port_);

    if (bind(server_socket_, (struct sockaddr*)&address, sizeof(address)) < 0) {
        std::cerr << "Failed to bind to port " << port_ << std::endl;
        close(server_socket_);
        server_socket_ = -1;
        return false;
    }

    if (listen(server_socket_, 64) < 0) {
        std::cerr << "Failed to listen on socket" << std::endl;
        close(server_socket_);
        server_socket_ = -1;
        return false;
    }

    running_ = true;
    server_thread_ = std::thread(&SpeechHttpServer::server_loop, this);

    std::cout << "🌐 HTTP server listening on port " << port_ << std::endl;
    return true;
}

void SpeechHttpServer::stop() {
    running_ = false;
    if (server_socket_ >= 0) {
        shutdown(server_socket_, SHUT_RDWR);
        close(server_socket_);
        server_socket_ = -1;
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
        write_server_log("SERVER: HTTP server stopped");
    }
}

void SpeechHttpServer::server_loop() {
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_socket = accept(server_socket_, (struct sockaddr*)&client_addr, &client_len);
        if (client_socket < 0) {
            if (running_) {
                std::cerr << "Failed to accept client connection" << std::endl;
            }
            continue;
        }

        char addr_buf[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, addr_buf, sizeof(addr_buf));

        // One worker per connection; requests for different sessions run in parallel
        std::thread client_thread(&SpeechHttpServer::handle_client, this, client_socket, std::string(addr_buf));
        client_thread.detach();
    }
}

bool SpeechHttpServer::read_request(int client_socket, std::string& raw_request, HttpResponse& error_response) {
    const size_t kMaxHeaderBytes = 64 * 1024;
    char buffer[65536];
    std::string data;

    error_response.status_code = 0;  // 0: close without answering

    size_t header_end;
    while ((header_end = data.find("\r\n\r\n")) == std::string::npos) {
        if (data.size() > kMaxHeaderBytes) {
            error_response = json_response(431, R"({"error": "Request headers too large", "success": false})");
            return false;
        }
        ssize_t n = recv(client_socket, buffer, sizeof(buffer), 0);
        if (n <= 0) {
            if (!data.empty()) {
                error_response = json_response(400, R"({"error": "Incomplete request", "success": false})");
            }
            return false;
        }
        data.append(buffer, static_cast<size_t>(n));
    }

    const size_t body_start = header_end + 4;
    HttpRequest head = parse_request(data.substr(0, body_start));

    if (to_lower(header_value(head, "Transfer-Encoding")).find("chunked") != std::string::npos) {
        error_response = json_response(411, R"({"error": "Chunked transfer encoding not supported", "success": false})");
        return false;
    }

    size_t content_length = 0;
    std::string length_value = header_value(head, "Content-Length");
    if (!length_value.empty()) {
        bool valid = std::all_of(length_value.begin(), length_value.end(),
                                 [](unsigned char c) { return std::isdigit(c) != 0; });
        try {
            if (valid) content_length = std::stoull(length_value);
        } catch (const std::exception&) {
            valid = false;
        }
        if (!valid) {
            error_response = json_response(400, R"({"error": "Invalid Content-Length", "success": false})");
            return false;
        }
    }

    if (content_length > max_body_bytes_) {
        error_response = json_response(413, "{\"error\": \"Request body exceeds " +
                                            std::to_string(max_body_bytes_) + " bytes\", \"success\": false}");
        return false;
    }

    while (data.size() - body_start < content_length) {
        size_t remaining = content_length - (data.size() - body_start);
        ssize_t n = recv(client_socket, buffer, std::min(remaining, sizeof(buffer)), 0);
        if (n <= 0) {
            error_response = json_response(400, R"({"error": "Connection closed before request body was complete", "success": false})");
            return false;
        }
        data.append(buffer, static_cast<size_t>(n));
    }

    data.resize(body_start + content_length);
    raw_request.swap(data);
    return true;
}

void SpeechHttpServer::handle_client(int client_socket, const std::string& remote_addr) {
    struct timeval timeout;
    timeout.tv_sec = 30;
    timeout.tv_usec = 0;
    setsockopt(client_socket, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
    setsockopt(client_socket, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

    HttpResponse response;
    try {
        std::string raw_request;
        if (!read_request(client_socket, raw_request, response)) {
            if (response.status_code != 0) {
                response.headers["Access-Control-Allow-Origin"] = "*";
                std::string response_str = create_response(response);
                write_all_fd(client_socket, response_str.data(), response_str.size());
            }
            close(client_socket);
            return;
        }

        HttpRequest request = parse_request(raw_request);
        request.remote_addr = remote_addr;
        response = handle_request(request);
    } catch (const std::exception& e) {
        std::cerr << "Client handling error: " << e.what() << std::endl;
        write_server_log(std::string("SERVER: Client handling error: ") + e.what());
        response = json_response(500, "{\"error\": \"" + json_escape(e.what()) + "\", \"success\": false}");
        response.headers["Access-Control-Allow-Origin"] = "*";
    }

    std::string response_str = create_response(response);
    if (!write_all_fd(client_socket, response_str.data(), response_str.size())) {
        write_server_log("SERVER: Failed to send response to " + remote_addr);
    }
    close(client_socket);
}

HttpRequest SpeechHttpServer::parse_request(const std::string& raw_request) {
    HttpRequest request;
    std::istringstream stream(raw_request);
    std::string line;

    // Parse request line
    if (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::istringstream request_line(line);
        request_line >> request.method >> request.path;

        // Parse query parameters
        size_t query_pos = request.path.find('?');
        if (query_pos != std::string::npos) {
            std::string query = request.path.substr(query_pos + 1);
            request.path = request.path.substr(0, query_pos);

            size_t pos = 0;
            while (pos < query.length()) {
                size_t eq_pos = query.find('=', pos);
                size_t amp_pos = query.find('&', pos);
                if (amp_pos == std::string::npos) amp_pos = query.length();

                if (eq_pos != std::string::npos && eq_pos < amp_pos) {
                    std::string key = url_decode(query.substr(pos, eq_pos - pos));
                    std::string value = url_decode(query.substr(eq_pos + 1, amp_pos - eq_pos - 1));
                    request.query_params[key] = value;
                }
                pos = amp_pos + 1;
            }
        }
    }

    // Parse headers
    while (std::getline(stream, line) && line != "\r") {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon_pos = line.find(':');
        if (colon_pos != std::string::npos) {
            std::string key = line.substr(0, colon_pos);
            std::string value = line.substr(colon_pos + 1);
            // Trim whitespace
            value.erase(0, value.find_first_not_of(" \t"));
            value.erase(value.find_last_not_of(" \t") + 1);
            request.headers[key] = value;
        }
    }

    // Parse body (binary safe)
    size_t headers_end = raw_request.find("\r\n\r\n");
    if (headers_end != std::string::npos) {
        request.body = raw_request.substr(headers_end + 4);
    }

    return request;
}

std::string SpeechHttpServer::create_response(const HttpResponse& response) {
    std::ostringstream stream;
    stream << "HTTP/1.1 " << response.status_code << " " << response.status_text << "\r\n";

    for (const auto& header : response.headers) {
        stream << header.first << ": " << header.second << "\r\n";
    }

    stream << "Content-Length: " << response.body.length() << "\r\n";
    stream << "Connection: close\r\n";
    stream << "\r\n";
    stream << response.body;

    return stream.str();
}

std::string SpeechHttpServer::header_value(const HttpRequest& request, const std::string& name) {
    auto it = request.headers.find(name);
    if (it != request.headers.end()) {
        return it->second;
    }
    const std::string wanted = to_lower(name);
    for (const auto& header : request.headers) {
        if (to_lower(header.first) == wanted) {
            return header.second;
        }
    }
    return "";
}

bool SpeechHttpServer::extract_multipart_field(const HttpRequest& request, const std::string& field,
                                               std::string& content) {
    std::string content_type = header_value(request, "Content-Type");
    if (to_lower(content_type).find("multipart/form-data") == std::string::npos) {
        return false;
    }

    size_t bpos = content_type.find("boundary=");
    if (bpos == std::string::npos) return false;
    std::string boundary = content_type.substr(bpos + 9);
    size_t semi = boundary.find(';');
    if (semi != std::string::npos) boundary = boundary.substr(0, semi);
    if (boundary.size() >= 2 && boundary.front() == '"' && boundary.back() == '"') {
        boundary = boundary.substr(1, boundary.size() - 2);
    }
    if (boundary.empty()) return false;

    const std::string delimiter = "--" + boundary;
    const std::string& body = request.body;

    size_t pos = body.find(delimiter);
    while (pos != std::string::npos) {
        size_t part_start = pos + delimiter.size();
        // Closing delimiter
        if (body.compare(part_start, 2, "--") == 0) break;

        size_t headers_end = body.find("\r\n\r\n", part_start);
        if (headers_end == std::string::npos) break;

        size_t next = body.find("\r\n" + delimiter, headers_end + 4);
        if (next == std::string::npos) break;

        std::string part_headers = body.substr(part_start, headers_end - part_start);
        std::string needle = "name=\"" + field + "\"";
        if (part_headers.find(needle) != std::string::npos) {
            content = body.substr(headers_end + 4, next - (headers_end + 4));
            return true;
        }
        pos = next + 2;
    }
    return false;
}

HttpResponse SpeechHttpServer::json_response(int status_code, const std::string& body) {
    HttpResponse response;
    response.status_code = status_code;
    response.status_text = http_status_text(status_code);
    response.headers["Content-Type"] = "application/json";
    response.body = body;
    return response;
}

HttpResponse SpeechHttpServer::handle_request(const HttpRequest& request) {
    HttpResponse response;

    if (request.method == "OPTIONS") {
        response = api_preflight(request);
    } else if (request.path == "/health") {
        response = request.method == "GET" ? api_health(request)
                                           : json_response(405, R"({"error": "Method not allowed", "success": false})");
    } else if (request.path == "/recognize") {
        response = request.method == "POST" ? api_recognize(request)
                                            : json_response(405, R"({"error": "Method not allowed", "success": false})");
    } else if (request.path == "/recognize_stream") {
        response = request.method == "POST" ? api_recognize_stream(request)
                                            : json_response(405, R"({"error": "Method not allowed", "success": false})");
    } else if (request.path == "/reset") {
        response = request.method == "POST" ? api_reset(request)
                                            : json_response(405, R"({"error": "Method not allowed", "success": false})");
    } else {
        response = json_response(404, R"({"error": "API endpoint not found", "success": false})");
    }

    response.headers["Access-Control-Allow-Origin"] = "*";
    if (response.status_code >= 500) {
        write_server_log("SERVER: " + request.method + " " + request.path + " -> " +
                         std::to_string(response.status_code) + " " + response.body);
    }
    return response;
}

HttpResponse SpeechHttpServer::api_preflight(const HttpRequest& request) {
    (void)request;
    HttpResponse response;
    response.status_code = 204;
    response.status_text = http_status_text(204);
    response.headers["Access-Control-Allow-Methods"] = "GET, POST, OPTIONS";
    response.headers["Access-Control-Allow-Headers"] = "Content-Type, X-Session-Id, X-End-Of-Utterance";
    response.headers["Access-Control-Max-Age"] = "600";
    return response;
}

HttpResponse SpeechHttpServer::api_health(const HttpRequest& request) {
    (void)request;
    bool loaded = service_ && service_->model_loaded();
    size_t sessions = service_ ? service_->active_sessions() : 0;
    return json_response(200, "{\"status\": \"ok\", \"model_loaded\": " + std::string(loaded ? "true" : "false") +
                              ", \"active_sessions\": " + std::to_string(sessions) + "}");
}

HttpResponse SpeechHttpServer::api_recognize(const HttpRequest& request) {
    if (!service_ || !service_->model_loaded()) {
        StreamResult r = StreamResult::failure(ErrorKind::ENGINE_UNAVAILABLE, "Recognition engine not initialized");
        return json_response(result_http_status(r), result_to_json(r));
    }

    std::string file_bytes;
    if (!extract_multipart_field(request, "audio", file_bytes)) {
        StreamResult r = StreamResult::failure(ErrorKind::MISSING_AUDIO, "No audio file found in request");
        return json_response(result_http_status(r), result_to_json(r));
    }

    WavData wav;
    std::string error;
    if (!parse_wav(file_bytes, wav, error) || !is_recognizer_format(wav, error)) {
        std::cout << "⚠️ Rejected upload: " << error << std::endl;
        StreamResult r = StreamResult::failure(ErrorKind::INVALID_AUDIO_FORMAT, error);
        return json_response(result_http_status(r), result_to_json(r));
    }

    std::cout << "📥 Recognizing upload: " << wav.samples.size() << " samples ("
              << static_cast<double>(wav.samples.size()) / 16000.0 << "s)" << std::endl;

    StreamResult result = service_->recognize_pcm(wav.samples);
    return json_response(result_http_status(result), result_to_json(result));
}

HttpResponse SpeechHttpServer::api_recognize_stream(const HttpRequest& request) {
    if (!service_) {
        StreamResult r = StreamResult::failure(ErrorKind::ENGINE_UNAVAILABLE, "Recognition engine not initialized");
        return json_response(result_http_status(r), result_to_json(r));
    }

    // Session id: header, then query parameter, then caller address (advisory only)
    std::string session_id = header_value(request, "X-Session-Id");
    if (session_id.empty()) {
        auto it = request.query_params.find("session_id");
        if (it != request.query_params.end()) session_id = it->second;
    }
    if (session_id.empty()) {
        session_id = request.remote_addr.empty() ? "default" : request.remote_addr;
    }

    std::string eou = to_lower(header_value(request, "X-End-Of-Utterance"));
    bool end_of_utterance = (eou == "1" || eou == "true" || eou == "yes");

    StreamResult result = service_->recognize_stream(session_id, request.body, end_of_utterance);
    return json_response(result_http_status(result), result_to_json(result));
}

HttpResponse SpeechHttpServer::api_reset(const HttpRequest& request) {
    (void)request;
    std::string error;
    if (!service_ || !service_->reset_recognizer(error)) {
        if (error.empty()) error = "Recognition engine not initialized";
        return json_response(500, "{\"error\": \"" + json_escape(error) + "\", \"success\": false}");
    }
    std::cout << "🔄 Legacy recognizer reset" << std::endl;
    return json_response(200, R"({"success": true, "message": "Recognizer reset"})");
}
