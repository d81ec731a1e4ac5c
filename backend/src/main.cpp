#include "core/PipelineConfig.hpp"
#include "net/CurlTransport.hpp"
#include "net/WebSocketEventSink.hpp"
#include "pipeline/FinalizationCoordinator.hpp"
#include "pipeline/UploadQueue.hpp"
#include "upload/CredentialProvider.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

namespace {

volatile std::sig_atomic_t g_signal = 0;

// Set by the stdin control thread, polled by the main loop. The thread outlives
// main's locals, so it only touches these.
std::atomic<bool> g_stdin_stop{false};
std::atomic<bool> g_stdin_cancel{false};

void on_signal(int sig) {
    g_signal = sig;
}

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options] --file PATH\n"
              << "       " << prog << " [options] --queue FILE...\n"
              << "Options:\n"
              << "  -h, --help              Show this help message and exit\n"
              << "      --version           Print build information and exit\n"
              << "  -c, --config PATH       JSON config file (CAPTURELINK_* env vars override it)\n"
              << "  -f, --file PATH         Recording to stream while it is being written\n"
              << "  -n, --name BASE         Remote object base name (default: file stem)\n"
              << "      --initiate-url URL  Resumable session initiate URL\n"
              << "      --token TOKEN       Bearer token\n"
              << "      --token-env VAR     Read the bearer token from VAR (default CAPTURELINK_TOKEN)\n"
              << "      --token-file PATH   Re-read the bearer token from PATH on every request\n"
              << "      --stop-file PATH    Recording is over once PATH exists\n"
              << "      --chunk-size BYTES  Upload chunk size\n"
              << "      --ws-port PORT      Broadcast events to WebSocket clients on PORT\n"
              << "      --keep-local        Do not delete the recording after a successful upload\n"
              << "      --queue FILE...     Upload finished recordings one after another\n"
              << "\nThe live upload ends on SIGINT/SIGTERM, on the stop file, or on a\n"
              << "{\"cmd\":\"stop\"} line on stdin ({\"cmd\":\"cancel\"} aborts).\n"
              << std::flush;
}

void print_event(const capturelink::CompletionEvent& ev) {
    std::cout << capturelink::to_wire(capturelink::to_json(ev)) << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    using namespace capturelink;

    std::string config_path;
    std::string file_path;
    std::string base_name;
    std::string initiate_url;
    std::string token;
    std::string token_env = "CAPTURELINK_TOKEN";
    std::string token_file;
    std::string stop_file;
    std::string chunk_size;
    int ws_port = -1;
    bool keep_local = false;
    bool queue_mode = false;
    std::vector<std::string> queue_files;

    for (int i = 1; i < argc; ++i) {
        const std::string a(argv[i]);
        auto next = [&](const char* flag) -> std::string {
            if (i + 1 >= argc) {
                std::cerr << flag << " requires a value" << std::endl;
                std::exit(2);
            }
            return argv[++i];
        };
        if (a == "-h" || a == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (a == "--version") {
            std::cout << net::CurlTransport::default_user_agent() << std::endl;
            return 0;
        } else if (a == "-c" || a == "--config") {
            config_path = next("--config");
        } else if (a == "-f" || a == "--file") {
            file_path = next("--file");
        } else if (a == "-n" || a == "--name") {
            base_name = next("--name");
        } else if (a == "--initiate-url") {
            initiate_url = next("--initiate-url");
        } else if (a == "--token") {
            token = next("--token");
        } else if (a == "--token-env") {
            token_env = next("--token-env");
        } else if (a == "--token-file") {
            token_file = next("--token-file");
        } else if (a == "--stop-file") {
            stop_file = next("--stop-file");
        } else if (a == "--chunk-size") {
            chunk_size = next("--chunk-size");
        } else if (a == "--ws-port") {
            const std::string v = next("--ws-port");
            try {
                ws_port = std::stoi(v);
            } catch (const std::exception&) {
                std::cerr << "invalid --ws-port: " << v << std::endl;
                return 2;
            }
        } else if (a == "--keep-local") {
            keep_local = true;
        } else if (a == "--queue") {
            queue_mode = true;
        } else if (queue_mode && !a.empty() && a[0] != '-') {
            queue_files.push_back(a);
        } else {
            std::cerr << "unknown argument: " << a << std::endl;
            print_usage(argv[0]);
            return 2;
        }
    }

    if (!queue_mode && file_path.empty()) {
        std::cerr << "either --file or --queue is required" << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    // Defaults < config file < environment < flags.
    PipelineConfig cfg;
    try {
        if (!config_path.empty()) cfg = load_config_file(config_path, cfg);
        apply_env_overrides(cfg);
        if (!initiate_url.empty()) cfg.initiate_url = initiate_url;
        if (!chunk_size.empty()) cfg.chunk_size = parse_byte_count(chunk_size, "--chunk-size");
        if (keep_local) cfg.delete_on_success = false;
        validate(cfg);
    } catch (const std::exception& e) {
        std::cerr << "configuration error: " << e.what() << std::endl;
        return 2;
    }

    std::unique_ptr<CredentialProvider> credentials;
    if (!token.empty()) {
        credentials = std::make_unique<StaticCredentialProvider>(token);
    } else if (!token_file.empty()) {
        credentials = std::make_unique<FileCredentialProvider>(token_file);
    } else {
        credentials = std::make_unique<EnvCredentialProvider>(token_env);
    }

    net::CurlTransport transport;

    std::unique_ptr<net::WebSocketEventSink> ws;
    if (ws_port >= 0) {
        try {
            ws = std::make_unique<net::WebSocketEventSink>(ws_port);
            ws->start();
        } catch (const std::exception& e) {
            std::cerr << "failed to start WebSocket event sink: " << e.what() << std::endl;
            return 1;
        }
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    if (queue_mode) {
        UploadQueue queue(cfg, transport, *credentials, ws.get());
        for (const auto& f : queue_files) queue.add(f);
        queue.start();
        while (!queue.wait_idle(std::chrono::milliseconds(200))) {
            if (g_signal) {
                std::cerr << "signal " << g_signal << " received; stopping queue" << std::endl;
                break;
            }
        }
        queue.stop();
        for (const auto& e : queue.completed()) print_event(e.last);
        for (const auto& e : queue.failed()) print_event(e.last);
        const bool ok = queue.failed().empty() && queue.pending().empty();
        if (ws) ws->stop();
        return ok ? 0 : 1;
    }

    // Progress goes to the console and, if enabled, to the WebSocket clients.
    CallbackEventSink sink(CallbackEventSink::Handlers{
        [&](PipelineState s) {
            if (ws) ws->on_state(s);
        },
        [&](const ProgressEvent& e) {
            std::cout << "[capturelink] uploaded " << e.bytes_uploaded << " / " << e.observed_size << " bytes"
                      << std::endl;
            if (ws) ws->on_progress(e);
        },
        [&](const CompletionEvent& e) {
            if (ws) ws->on_completion(e);
        }});

    if (base_name.empty()) base_name = std::filesystem::path(file_path).stem().string();

    FinalizationCoordinator coordinator(cfg, transport, *credentials, sink);
    if (ws) {
        ws->set_control_handler([&](const std::string& cmd) {
            if (cmd == "cancel") coordinator.cancel();
            else coordinator.request_stop();
        });
    }
    coordinator.start(file_path, base_name);
    std::cout << "[capturelink] streaming " << file_path << " to " << cfg.initiate_url << std::endl;

    // Only read control lines when stdin is a TTY; detached runs have nothing there.
    if (isatty(fileno(stdin))) {
        std::thread([]() {
            std::string line;
            while (std::getline(std::cin, line)) {
                if (line.empty()) continue;
                try {
                    const auto j = nlohmann::json::parse(line);
                    const std::string cmd = j.value("cmd", std::string());
                    if (cmd == "stop") {
                        g_stdin_stop = true;
                    } else if (cmd == "cancel") {
                        g_stdin_cancel = true;
                    } else {
                        std::cerr << "control: unknown cmd '" << cmd << "'" << std::endl;
                    }
                } catch (const nlohmann::json::exception& e) {
                    std::cerr << "control: failed to parse input: " << e.what() << std::endl;
                }
            }
        }).detach();
    } else {
        std::cerr << "stdin not a TTY; skipping stdin control thread" << std::endl;
    }

    bool stop_sent = false;
    bool cancel_sent = false;
    while (!is_terminal(coordinator.state())) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (!cancel_sent && g_stdin_cancel) {
            coordinator.cancel();
            cancel_sent = true;
        }
        if (stop_sent) continue;
        std::error_code ec;
        if (g_stdin_stop) {
            coordinator.request_stop();
            stop_sent = true;
        } else if (g_signal) {
            std::cerr << "signal " << g_signal << " received; finishing upload" << std::endl;
            coordinator.request_stop();
            stop_sent = true;
        } else if (!stop_file.empty() && std::filesystem::exists(stop_file, ec)) {
            std::cout << "[capturelink] stop file present; finishing upload" << std::endl;
            coordinator.request_stop();
            stop_sent = true;
        }
    }

    const CompletionEvent ev = coordinator.wait();
    print_event(ev);
    if (ws) ws->stop();
    return ev.success ? 0 : 1;
}
