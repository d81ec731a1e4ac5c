#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <cstdlib>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

struct WsUrl {
    std::string host;
    std::string port;
    std::string target;
};

static bool parse_ws_url(const std::string& url, WsUrl& out) {
    // ws://host:port[/path]
    std::string s = url;
    const std::string prefix = "ws://";
    if (s.rfind(prefix, 0) != 0) return false;
    s = s.substr(prefix.size());

    std::string hostport;
    auto slash = s.find('/');
    if (slash == std::string::npos) {
        hostport = s;
        out.target = "/";
    } else {
        hostport = s.substr(0, slash);
        out.target = s.substr(slash);
        if (out.target.empty()) out.target = "/";
    }

    auto colon = hostport.find(':');
    if (colon == std::string::npos) {
        out.host = hostport;
        out.port = "80";
    } else {
        out.host = hostport.substr(0, colon);
        out.port = hostport.substr(colon + 1);
        if (out.port.empty()) out.port = "80";
    }
    return !out.host.empty();
}

// Prints upload events from a capturelink --ws-port instance until the
// completion event arrives. An optional second argument ("stop" or "cancel")
// is sent as a control command right after connecting.
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " ws://host:port [stop|cancel]\n";
        std::cerr << "Example:\n";
        std::cerr << "  " << argv[0] << " ws://localhost:9101\n";
        return 2;
    }

    WsUrl u;
    if (!parse_ws_url(argv[1], u)) {
        std::cerr << "Invalid ws url (expected ws://host:port/path): " << argv[1] << "\n";
        return 2;
    }
    const std::string command = argc >= 3 ? argv[2] : "";
    if (!command.empty() && command != "stop" && command != "cancel") {
        std::cerr << "Unknown command: " << command << "\n";
        return 2;
    }

    try {
        net::io_context ioc;
        tcp::resolver resolver{ioc};
        websocket::stream<tcp::socket> ws{ioc};

        auto const results = resolver.resolve(u.host, u.port);
        net::connect(ws.next_layer(), results);
        ws.handshake(u.host + ":" + u.port, u.target);

        if (!command.empty()) {
            ws.text(true);
            ws.write(net::buffer(json{{"cmd", command}}.dump()));
        }

        beast::flat_buffer buffer;
        for (;;) {
            buffer.clear();
            ws.read(buffer);
            const std::string data = beast::buffers_to_string(buffer.data());
            json msg;
            try {
                msg = json::parse(data);
            } catch (const json::exception& e) {
                std::cerr << "skipping non-JSON frame: " << e.what() << "\n";
                continue;
            }
            std::cout << msg.dump() << std::endl;
            if (msg.value("type", std::string{}) == "upload_complete") {
                const bool ok = msg.value("success", false);
                beast::error_code ec;
                ws.close(websocket::close_code::normal, ec);
                return ok ? 0 : 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
