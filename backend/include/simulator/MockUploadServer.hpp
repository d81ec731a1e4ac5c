#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "simulator/ResumableEndpoint.hpp"

namespace capturelink::sim {

/**
 * @brief Local HTTP server speaking the resumable upload protocol.
 *
 * Wraps a ResumableEndpoint behind a Boost.Beast listener so the real curl
 * transport can be exercised end to end. Requests are served one at a time on
 * the server's I/O thread.
 */
class MockUploadServer {
public:
    // port 0 binds an ephemeral port; see port().
    explicit MockUploadServer(unsigned short port = 0, std::string host = "127.0.0.1");
    ~MockUploadServer();

    MockUploadServer(const MockUploadServer&) = delete;
    MockUploadServer& operator=(const MockUploadServer&) = delete;

    void start();
    void stop();

    unsigned short port() const { return port_; }
    std::string base_url() const;
    std::string initiate_url() const { return endpoint_.initiate_url(); }
    ResumableEndpoint& endpoint() { return endpoint_; }

private:
    struct Impl;

    void do_accept();

    std::string host_;
    unsigned short port_;
    ResumableEndpoint endpoint_;
    std::shared_ptr<Impl> impl_;
    std::atomic<bool> running_{false};
    std::thread io_thread_;
};

} // namespace capturelink::sim
