#include "net/WebSocketEventSink.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <chrono>
#include <deque>
#include <iostream>
#include <set>
#include <vector>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using json = nlohmann::json;

namespace capturelink::net {

using WsStream = websocket::stream<tcp::socket>;

struct WebSocketEventSink::Impl {
    asio::io_context ioc;
    tcp::acceptor acceptor;
    std::mutex sessions_m;
    std::set<std::shared_ptr<WsStream>> sessions;
    std::mutex outbox_m;
    std::deque<std::string> outbox;

    Impl(const std::string& host, int port) : ioc(), acceptor(ioc) {
        const tcp::endpoint ep(asio::ip::make_address(host), static_cast<unsigned short>(port));
        acceptor.open(ep.protocol());
        acceptor.set_option(asio::socket_base::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen(asio::socket_base::max_listen_connections);
    }

    void add_session(std::shared_ptr<WsStream> s) {
        std::lock_guard<std::mutex> lk(sessions_m);
        sessions.insert(s);
        std::cout << "[WebSocketEventSink] client connected (count=" << sessions.size() << ")" << std::endl;
    }
    void remove_session(std::shared_ptr<WsStream> s) {
        std::lock_guard<std::mutex> lk(sessions_m);
        if (sessions.erase(s)) {
            std::cout << "[WebSocketEventSink] client disconnected (count=" << sessions.size() << ")" << std::endl;
        }
    }
    template<typename Fn>
    void for_each_session(Fn&& fn) {
        std::lock_guard<std::mutex> lk(sessions_m);
        for (auto& s : sessions) fn(s);
    }
};

WebSocketEventSink::WebSocketEventSink(int port, std::string host)
: port_(port), host_(std::move(host)) {}

WebSocketEventSink::~WebSocketEventSink() {
    stop();
}

void WebSocketEventSink::set_control_handler(ControlHandler handler) {
    std::lock_guard<std::mutex> lk(snapshot_m_);
    control_ = std::move(handler);
}

std::size_t WebSocketEventSink::client_count() const {
    if (!impl_) return 0;
    std::lock_guard<std::mutex> lk(impl_->sessions_m);
    return impl_->sessions.size();
}

void WebSocketEventSink::start() {
    if (running_) return;
    impl_ = std::make_shared<Impl>(host_, port_);
    port_ = impl_->acceptor.local_endpoint().port();
    running_ = true;
    event_thread_ = std::thread([this]() { run_event_loop(); });
    std::cout << "[WebSocketEventSink] listening on ws://" << host_ << ":" << port_ << std::endl;
}

void WebSocketEventSink::stop() {
    if (!running_.exchange(false)) return;
    if (event_thread_.joinable()) event_thread_.join();
}

void WebSocketEventSink::remember(const json& msg) {
    std::lock_guard<std::mutex> lk(snapshot_m_);
    const std::string type = msg.value("type", std::string());
    if (type == "upload_state") last_state_ = msg;
    if (type == "upload_progress") last_progress_ = msg;
}

void WebSocketEventSink::broadcast(const json& msg) {
    remember(msg);
    if (!impl_) return;
    std::lock_guard<std::mutex> lk(impl_->outbox_m);
    impl_->outbox.push_back(to_wire(msg));
}

void WebSocketEventSink::on_state(PipelineState state) {
    broadcast(json{{"type", "upload_state"}, {"state", to_string(state)}});
}

void WebSocketEventSink::on_progress(const ProgressEvent& e) {
    broadcast(to_json(e));
}

void WebSocketEventSink::on_completion(const CompletionEvent& e) {
    broadcast(to_json(e));
}

void WebSocketEventSink::handle_control(const json& msg) {
    if (!msg.is_object() || !msg.contains("cmd") || !msg["cmd"].is_string()) {
        std::cerr << "[WebSocketEventSink] ignoring control message without cmd: " << to_wire(msg) << std::endl;
        return;
    }
    const std::string cmd = msg["cmd"].get<std::string>();
    if (cmd != "stop" && cmd != "cancel") {
        std::cerr << "[WebSocketEventSink] unknown control cmd: " << cmd << std::endl;
        return;
    }
    ControlHandler handler;
    {
        std::lock_guard<std::mutex> lk(snapshot_m_);
        handler = control_;
    }
    std::cout << "[WebSocketEventSink] control: " << cmd << std::endl;
    if (handler) handler(cmd);
}

void WebSocketEventSink::run_event_loop() {
    try {
        auto& ioc = impl_->ioc;
        auto& acceptor = impl_->acceptor;

        std::function<void()> do_accept;
        do_accept = [&]() {
            auto socket = std::make_shared<tcp::socket>(ioc);
            acceptor.async_accept(*socket, [this, socket, &do_accept](boost::system::error_code ec) {
                if (ec) {
                    if (running_) std::cerr << "[WebSocketEventSink] accept error: " << ec.message() << std::endl;
                } else {
                    auto ws = std::make_shared<WsStream>(std::move(*socket));
                    ws->async_accept([this, ws](boost::system::error_code ec) {
                        if (ec) {
                            std::cerr << "[WebSocketEventSink] websocket accept failed: " << ec.message() << std::endl;
                            return;
                        }
                        // Late joiners start from the current picture.
                        {
                            std::lock_guard<std::mutex> lk(snapshot_m_);
                            boost::system::error_code wec;
                            ws->text(true);
                            if (!last_state_.is_null()) ws->write(asio::buffer(to_wire(last_state_)), wec);
                            if (!wec && !last_progress_.is_null()) ws->write(asio::buffer(to_wire(last_progress_)), wec);
                            if (wec) {
                                std::cerr << "[WebSocketEventSink] snapshot write failed: " << wec.message() << std::endl;
                                return;
                            }
                        }
                        impl_->add_session(ws);

                        auto buffer = std::make_shared<beast::flat_buffer>();
                        auto do_read = std::make_shared<std::function<void()>>();
                        *do_read = [this, ws, buffer, do_read]() {
                            ws->async_read(*buffer, [this, ws, buffer, do_read](boost::system::error_code ec, std::size_t) {
                                if (ec) {
                                    impl_->remove_session(ws);
                                    return;
                                }
                                const auto data = beast::buffers_to_string(buffer->data());
                                buffer->consume(buffer->size());
                                try {
                                    handle_control(json::parse(data));
                                } catch (const json::exception& e) {
                                    std::cerr << "[WebSocketEventSink] bad control message: " << e.what() << std::endl;
                                }
                                (*do_read)();
                            });
                        };
                        (*do_read)();
                    });
                }
                if (running_) do_accept();
            });
        };

        do_accept();

        while (running_) {
            try {
                ioc.poll();
            } catch (const std::exception& e) {
                std::cerr << "[WebSocketEventSink] I/O context error: " << e.what() << std::endl;
            }

            std::deque<std::string> pending;
            {
                std::lock_guard<std::mutex> lk(impl_->outbox_m);
                pending.swap(impl_->outbox);
            }
            for (const auto& payload : pending) {
                std::vector<std::shared_ptr<WsStream>> dead;
                impl_->for_each_session([&](const std::shared_ptr<WsStream>& s) {
                    boost::system::error_code ec;
                    s->text(true);
                    s->write(asio::buffer(payload), ec);
                    if (ec) dead.push_back(s);
                });
                for (auto& s : dead) impl_->remove_session(s);
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        // Flush whatever was queued last (typically the completion event).
        {
            std::lock_guard<std::mutex> lk(impl_->outbox_m);
            for (const auto& payload : impl_->outbox) {
                impl_->for_each_session([&](const std::shared_ptr<WsStream>& s) {
                    boost::system::error_code ec;
                    s->write(asio::buffer(payload), ec);
                    if (ec) std::cerr << "[WebSocketEventSink] final write failed: " << ec.message() << std::endl;
                });
            }
            impl_->outbox.clear();
        }
        impl_->for_each_session([&](const std::shared_ptr<WsStream>& s) {
            boost::system::error_code ec;
            s->close(websocket::close_code::normal, ec);
        });
        boost::system::error_code ec;
        acceptor.close(ec);
    } catch (const std::exception& e) {
        std::cerr << "[WebSocketEventSink] event loop exception: " << e.what() << std::endl;
    }
}

} // namespace capturelink::net
