#include <iostream>
#include <atomic>
#include <chrono>
#include <thread>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>
#include "net/WebSocketEventSink.hpp"

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using nlohmann::json;
using namespace capturelink;

static json read_json(websocket::stream<tcp::socket>& ws) {
    beast::flat_buffer buffer;
    ws.read(buffer);
    return json::parse(beast::buffers_to_string(buffer.data()));
}

int main() {
    std::cout << "WebSocket sink CI-less tests starting...\n";
    try {
        net::WebSocketEventSink sink(0);
        std::atomic<int> stops{0};
        sink.set_control_handler([&](const std::string& cmd) {
            if (cmd == "stop") ++stops;
        });
        sink.start();
        if (sink.port() <= 0) { std::cerr << "no port bound\n"; return 2; }

        // State published before anyone connects is replayed to late joiners.
        sink.on_state(PipelineState::Recording);
        sink.on_progress(ProgressEvent{PipelineState::Recording, 1024, 2048});
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        asio::io_context ioc;
        tcp::resolver resolver{ioc};
        websocket::stream<tcp::socket> ws{ioc};
        asio::connect(ws.next_layer(), resolver.resolve("127.0.0.1", std::to_string(sink.port())));
        ws.handshake("127.0.0.1", "/");

        json first = read_json(ws);
        if (first.value("type", "") != "upload_state" || first.value("state", "") != "recording") {
            std::cerr << "unexpected snapshot: " << first.dump() << "\n";
            return 3;
        }
        json second = read_json(ws);
        if (second.value("type", "") != "upload_progress" || second.value("bytes_uploaded", 0) != 1024) {
            std::cerr << "unexpected progress snapshot: " << second.dump() << "\n";
            return 4;
        }

        ws.write(asio::buffer(json{{"cmd", "stop"}}.dump()));
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (stops.load() == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (stops.load() != 1) { std::cerr << "stop command not delivered\n"; return 5; }

        CompletionEvent done;
        done.success = true;
        done.bytes_uploaded = 2048;
        sink.on_completion(done);
        json last = read_json(ws);
        if (last.value("type", "") != "upload_complete" || !last.value("success", false)) {
            std::cerr << "unexpected completion: " << last.dump() << "\n";
            return 6;
        }

        beast::error_code ec;
        ws.close(websocket::close_code::normal, ec);
        sink.stop();
        std::cout << "WebSocket sink CI-less tests passed\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "exception: " << e.what() << std::endl;
        return 1;
    }
}
