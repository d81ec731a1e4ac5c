#include "simulator/RecordingSimulator.hpp"

#include <csignal>
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

static volatile std::sig_atomic_t g_stop = 0;

static void on_signal(int) {
    g_stop = 1;
}

// Writes a growing fake recording until SIGINT/SIGTERM, --duration-ms or
// --max-bytes, then appends the tail and optionally touches a stop file.
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0]
                  << " PATH [--interval-ms 50] [--bytes 65536] [--max-bytes N] [--tail N]"
                     " [--duration-ms N] [--stop-file PATH]\n";
        return 2;
    }

    capturelink::sim::RecordingSimulator::Options opts;
    const std::string path = argv[1];
    long duration_ms = 0;
    std::string stop_file;

    for (int i = 2; i < argc; i++) {
        const std::string a = argv[i];
        try {
            if (a == "--interval-ms" && i + 1 < argc) {
                opts.write_interval = std::chrono::milliseconds(std::stol(argv[++i]));
            } else if (a == "--bytes" && i + 1 < argc) {
                opts.bytes_per_write = std::stoull(argv[++i]);
            } else if (a == "--max-bytes" && i + 1 < argc) {
                opts.max_bytes = std::stoull(argv[++i]);
            } else if (a == "--tail" && i + 1 < argc) {
                opts.tail_bytes = std::stoull(argv[++i]);
            } else if (a == "--duration-ms" && i + 1 < argc) {
                duration_ms = std::stol(argv[++i]);
            } else if (a == "--stop-file" && i + 1 < argc) {
                stop_file = argv[++i];
            } else {
                std::cerr << "unknown argument: " << a << "\n";
                return 2;
            }
        } catch (const std::exception& e) {
            std::cerr << "invalid value for " << a << ": " << e.what() << "\n";
            return 2;
        }
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    capturelink::sim::RecordingSimulator sim(path, opts);
    sim.start();
    const auto started = std::chrono::steady_clock::now();
    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        if (duration_ms > 0 && std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(duration_ms)) break;
        if (opts.max_bytes > 0 && sim.bytes_written() >= opts.max_bytes) break;
    }
    sim.stop();

    if (!stop_file.empty()) {
        std::ofstream touch(stop_file);
        if (!touch) {
            std::cerr << "failed to create stop file " << stop_file << "\n";
            return 1;
        }
    }
    std::cout << sim.bytes_written() << std::endl;
    return 0;
}
