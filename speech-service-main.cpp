#include "speech-service.h"
#include "speech-http-api.h"
#include "whisper-engine.h"
#include <iostream>
#include <csignal>
#include <atomic>
#include <chrono>
#include <thread>

// Global state for signal handling
std::atomic<bool> g_shutdown_requested(false);

void signal_handler(int signal) {
    std::cout << "\n🛑 Shutdown signal received (" << signal << ")" << std::endl;
    g_shutdown_requested.store(true);
}

bool parse_service_args(int argc, char** argv, ServiceArgs& args) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        try {
            if (arg == "-h" || arg == "--help") {
                print_service_usage(argv[0]);
                return false;
            }
            else if (arg == "-m" || arg == "--model") {
                if (i + 1 < argc) {
                    args.model_path = argv[++i];
                }
            }
            else if (arg == "-d" || arg == "--database") {
                if (i + 1 < argc) {
                    args.database_path = argv[++i];
                }
            }
            else if (arg == "-p" || arg == "--port") {
                if (i + 1 < argc) {
                    args.port = std::stoi(argv[++i]);
                }
            }
            else if (arg == "-t" || arg == "--threads") {
                if (i + 1 < argc) {
                    args.n_threads = std::stoi(argv[++i]);
                }
            }
            else if (arg == "-l" || arg == "--language") {
                if (i + 1 < argc) {
                    args.language = argv[++i];
                }
            }
            else if (arg == "--no-gpu") {
                args.use_gpu = false;
            }
            else if (arg == "--session-idle-timeout") {
                if (i + 1 < argc) {
                    args.session_idle_timeout_ms = std::stoi(argv[++i]);
                }
            }
            else if (arg == "--max-body") {
                if (i + 1 < argc) {
                    args.max_body_bytes = std::stoull(argv[++i]);
                }
            }
            else if (arg == "--log-file") {
                if (i + 1 < argc) {
                    args.log_file = argv[++i];
                }
            }
            else if (arg == "-v" || arg == "--verbose") {
                args.verbose = true;
            }
            else {
                std::cout << "❌ Unknown argument: " << arg << std::endl;
                print_service_usage(argv[0]);
                return false;
            }
        } catch (const std::exception& e) {
            std::cout << "❌ Invalid value for " << arg << ": " << e.what() << std::endl;
            return false;
        }
    }

    if (args.port <= 0 || args.port > 65535) {
        std::cout << "❌ Invalid port: " << args.port << std::endl;
        return false;
    }
    if (args.session_idle_timeout_ms < 0) {
        std::cout << "❌ Session idle timeout must not be negative" << std::endl;
        return false;
    }

    return true;
}

void print_service_usage(const char* program_name) {
    std::cout << "\n🎤 Speech Stream Service\n" << std::endl;
    std::cout << "Usage: " << program_name << " [options]\n" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -h, --help                    Show this help message" << std::endl;
    std::cout << "  -m, --model PATH              Whisper model path [models/ggml-base.en.bin]" << std::endl;
    std::cout << "  -d, --database PATH           Transcript database path, empty to disable [speech_stream.db]" << std::endl;
    std::cout << "  -p, --port PORT               HTTP port [5001]" << std::endl;
    std::cout << "  -t, --threads N               Number of decoder threads [4]" << std::endl;
    std::cout << "  -l, --language LANG           Language code [en]" << std::endl;
    std::cout << "  --no-gpu                      Disable GPU acceleration" << std::endl;
    std::cout << "  --session-idle-timeout MS     Close sessions idle for MS milliseconds, 0 = never [0]" << std::endl;
    std::cout << "  --max-body BYTES              Largest accepted request body [16777216]" << std::endl;
    std::cout << "  --log-file PATH               Server log file [server_debug.log]" << std::endl;
    std::cout << "  -v, --verbose                 Verbose output" << std::endl;
    std::cout << "\nEndpoints:" << std::endl;
    std::cout << "  GET  /health                  Service status" << std::endl;
    std::cout << "  POST /recognize               Multipart WAV upload (mono, 16-bit, 16kHz)" << std::endl;
    std::cout << "  POST /recognize_stream        float32 LE fragment; X-Session-Id, X-End-Of-Utterance" << std::endl;
    std::cout << "  POST /reset                   Reset the single-shot recognizer" << std::endl;
    std::cout << "\nExample:" << std::endl;
    std::cout << "  " << program_name << " -m models/ggml-base.en.bin -t 8 --port 5001 --verbose" << std::endl;
    std::cout << std::endl;
}

int main(int argc, char** argv) {
    std::cout << "🎤 Speech Stream Service v1.0" << std::endl;
    std::cout << "🌐 Streaming speech recognition over HTTP" << std::endl;
    std::cout << std::endl;

    // Parse command line arguments
    ServiceArgs args;
    if (!parse_service_args(argc, argv, args)) {
        return 1;
    }

    // Setup signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    // Load the model once; every session shares it
    WhisperEngineConfig engine_config;
    engine_config.model_path = args.model_path;
    engine_config.n_threads = args.n_threads;
    engine_config.use_gpu = args.use_gpu;
    engine_config.language = args.language;

    auto engine = std::make_unique<WhisperEngine>(engine_config);
    if (!engine->load()) {
        std::cout << "❌ Failed to load recognition model" << std::endl;
        return 1;
    }

    SpeechServiceConfig service_config;
    service_config.database_path = args.database_path;
    service_config.model_path = args.model_path;
    service_config.session_idle_timeout_ms = args.session_idle_timeout_ms;
    service_config.verbose = args.verbose;

    SpeechService service(std::move(engine));
    if (!service.start(service_config)) {
        std::cout << "❌ Failed to start speech service" << std::endl;
        return 1;
    }

    SpeechHttpServer http_server(args.port, &service);
    http_server.set_max_body_bytes(args.max_body_bytes);
    http_server.set_log_file(args.log_file);
    if (!http_server.start()) {
        std::cout << "❌ Failed to start HTTP server on port " << args.port << std::endl;
        service.stop();
        return 1;
    }

    std::cout << "✅ Speech stream service ready on http://0.0.0.0:" << args.port << std::endl;
    std::cout << "💡 Press Ctrl+C to shutdown gracefully" << std::endl;
    std::cout << std::endl;

    // Main service loop
    while (!g_shutdown_requested.load() && http_server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1000));
    }

    std::cout << "🛑 Shutting down speech stream service..." << std::endl;
    http_server.stop();
    service.stop();

    std::cout << "✅ Speech stream service shutdown complete" << std::endl;
    return 0;
}
