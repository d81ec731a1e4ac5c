#include "simulator/MockUploadServer.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <iostream>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace capturelink::sim {

struct MockUploadServer::Impl {
    asio::io_context ioc;
    tcp::acceptor acceptor;

    Impl(const std::string& host, unsigned short port) : ioc(), acceptor(ioc) {
        const tcp::endpoint ep(asio::ip::make_address(host), port);
        acceptor.open(ep.protocol());
        acceptor.set_option(asio::socket_base::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen(asio::socket_base::max_listen_connections);
    }
};

namespace {

http::response<http::string_body> to_http(const EndpointResponse& r, unsigned version, bool keep_alive) {
    http::response<http::string_body> res{static_cast<http::status>(r.status), version};
    res.set(http::field::server, "capturelink-mock-upload");
    if (!r.location.empty()) res.set(http::field::location, r.location);
    if (!r.range.empty()) res.set(http::field::range, r.range);
    if (!r.body.empty()) res.set(http::field::content_type, "application/json");
    res.keep_alive(keep_alive);
    res.body() = r.body;
    res.prepare_payload();
    return res;
}

void serve_connection(tcp::socket& socket, ResumableEndpoint& endpoint) {
    beast::error_code ec;
    beast::flat_buffer buffer;
    for (;;) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(256 * 1024 * 1024);
        http::read(socket, buffer, parser, ec);
        if (ec) break;
        const auto& req = parser.get();

        EndpointRequest er;
        er.method = std::string(req.method_string());
        er.target = std::string(req.target());
        er.authorization = std::string(req[http::field::authorization]);
        er.content_range = std::string(req[http::field::content_range]);
        er.body = req.body();

        const EndpointResponse r = endpoint.handle(er);
        auto res = to_http(r, req.version(), req.keep_alive());
        http::write(socket, res, ec);
        if (ec || !res.keep_alive()) break;
    }
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

} // namespace

MockUploadServer::MockUploadServer(unsigned short port, std::string host)
: host_(std::move(host)), port_(port) {}

MockUploadServer::~MockUploadServer() {
    stop();
}

std::string MockUploadServer::base_url() const {
    return "http://" + host_ + ":" + std::to_string(port_);
}

void MockUploadServer::start() {
    if (running_) return;
    impl_ = std::make_shared<Impl>(host_, port_);
    port_ = impl_->acceptor.local_endpoint().port();
    endpoint_.set_base_url(base_url());
    running_ = true;

    do_accept();
    io_thread_ = std::thread([this]() {
        try {
            impl_->ioc.run();
        } catch (const std::exception& e) {
            std::cerr << "[MockUploadServer] I/O error: " << e.what() << std::endl;
        }
    });
    std::cout << "[MockUploadServer] listening on " << base_url() << std::endl;
}

void MockUploadServer::do_accept() {
    auto socket = std::make_shared<tcp::socket>(impl_->ioc);
    impl_->acceptor.async_accept(*socket, [this, socket](boost::system::error_code ec) {
        if (ec) {
            if (running_) std::cerr << "[MockUploadServer] accept error: " << ec.message() << std::endl;
            return;
        }
        serve_connection(*socket, endpoint_);
        if (running_) do_accept();
    });
}

void MockUploadServer::stop() {
    if (!running_.exchange(false)) return;
    asio::post(impl_->ioc, [impl = impl_]() {
        boost::system::error_code ec;
        impl->acceptor.close(ec);
    });
    impl_->ioc.stop();
    if (io_thread_.joinable()) io_thread_.join();
    impl_.reset();
    std::cout << "[MockUploadServer] stopped" << std::endl;
}

} // namespace capturelink::sim
