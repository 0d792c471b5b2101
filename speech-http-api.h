#pragma once

#include <string>
#include <map>
#include <vector>
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>

// Forward declarations
class SpeechService;

struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> query_params;
    std::string body;
    std::string remote_addr;
};

struct HttpResponse {
    int status_code = 200;
    std::string status_text = "OK";
    std::map<std::string, std::string> headers;
    std::string body;
};

// HTTP/1.1 front end of the speech service. One thread per connection,
// one request per connection.
class SpeechHttpServer {
public:
    SpeechHttpServer(int port, SpeechService* service);
    ~SpeechHttpServer();

    bool start();
    void stop();
    bool is_running() const { return running_; }

    void set_max_body_bytes(size_t bytes) { max_body_bytes_ = bytes; }
    void set_log_file(const std::string& path) { log_file_ = path; }

    // Routing entry point, also used directly by tests
    HttpResponse handle_request(const HttpRequest& request);

    // Reads one request from a connected socket, answers it and closes the
    // socket. Runs on the per-connection thread; tests drive it directly.
    void handle_client(int client_socket, const std::string& remote_addr);

    static HttpRequest parse_request(const std::string& raw_request);
    static std::string create_response(const HttpResponse& response);

    // Case-insensitive header lookup; empty when absent
    static std::string header_value(const HttpRequest& request, const std::string& name);

    // Content of the multipart/form-data part with the given field name
    static bool extract_multipart_field(const HttpRequest& request, const std::string& field, std::string& content);

private:
    int port_;
    int server_socket_;
    std::atomic<bool> running_;
    std::thread server_thread_;
    size_t max_body_bytes_;
    std::string log_file_;

    void server_loop();
    bool read_request(int client_socket, std::string& raw_request, HttpResponse& error_response);
    void write_server_log(const std::string& message);

    // API endpoints
    HttpResponse api_health(const HttpRequest& request);
    HttpResponse api_recognize(const HttpRequest& request);
    HttpResponse api_recognize_stream(const HttpRequest& request);
    HttpResponse api_reset(const HttpRequest& request);
    HttpResponse api_preflight(const HttpRequest& request);

    HttpResponse json_response(int status_code, const std::string& body);

    SpeechService* service_;
};

const char* http_status_text(int status_code);
