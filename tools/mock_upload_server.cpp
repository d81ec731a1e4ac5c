#include "simulator/MockUploadServer.hpp"

#include <csignal>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

static volatile std::sig_atomic_t g_stop = 0;

static void on_signal(int) {
    g_stop = 1;
}

int main(int argc, char** argv) {
    std::string listen_host = "127.0.0.1";
    unsigned short listen_port = 8790;
    std::string token;
    int fail_chunks = 0;
    int fail_status = 503;
    bool expire_first = false;

    for (int i = 1; i < argc; i++) {
        const std::string a = argv[i];
        try {
            if (a == "--listen" && i + 1 < argc) {
                listen_host = argv[++i];
            } else if (a == "--port" && i + 1 < argc) {
                listen_port = static_cast<unsigned short>(std::stoi(argv[++i]));
            } else if (a == "--token" && i + 1 < argc) {
                token = argv[++i];
            } else if (a == "--fail-chunks" && i + 1 < argc) {
                fail_chunks = std::stoi(argv[++i]);
            } else if (a == "--fail-status" && i + 1 < argc) {
                fail_status = std::stoi(argv[++i]);
            } else if (a == "--expire-first-chunk") {
                expire_first = true;
            } else if (a == "--help" || a == "-h") {
                std::cerr << "Usage: " << argv[0]
                          << " [--listen 127.0.0.1] [--port 8790] [--token T] [--fail-chunks N]"
                             " [--fail-status 503] [--expire-first-chunk]\n";
                return 0;
            } else {
                std::cerr << "unknown argument: " << a << "\n";
                return 2;
            }
        } catch (const std::exception& e) {
            std::cerr << "invalid value for " << a << ": " << e.what() << "\n";
            return 2;
        }
    }

    try {
        capturelink::sim::MockUploadServer server(listen_port, listen_host);
        server.start();
        auto& endpoint = server.endpoint();
        if (!token.empty()) endpoint.set_token(token);
        if (fail_chunks > 0) endpoint.fail_next_chunks(fail_chunks, fail_status);
        if (expire_first) endpoint.expire_on_next_chunk();

        std::cerr << "[mock_upload_server] initiate url: " << server.initiate_url() << "\n";

        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);
        while (!g_stop) std::this_thread::sleep_for(std::chrono::milliseconds(200));

        for (const auto& obj : endpoint.completed_objects()) {
            std::cerr << "[mock_upload_server] stored " << obj.name << " (" << obj.data.size() << " bytes, id "
                      << obj.id << ")\n";
        }
        server.stop();
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
