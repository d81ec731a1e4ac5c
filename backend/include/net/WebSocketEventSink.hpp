#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "pipeline/EventSink.hpp"

namespace capturelink::net {

/**
 * @brief Publishes pipeline events to WebSocket UI clients.
 *
 * Every event is broadcast as one JSON text frame ("upload_state",
 * "upload_progress", "upload_complete"). A client that connects mid-run first
 * receives the latest state and progress. Clients may send
 * {"cmd":"stop"} or {"cmd":"cancel"}; those reach the control handler.
 */
class WebSocketEventSink : public EventSink {
public:
    using ControlHandler = std::function<void(const std::string& cmd)>;

    // port 0 binds an ephemeral port; see port() after start().
    explicit WebSocketEventSink(int port, std::string host = "127.0.0.1");
    ~WebSocketEventSink() override;

    void start();
    void stop();

    int port() const { return port_; }
    void set_control_handler(ControlHandler handler);
    std::size_t client_count() const;

    void on_state(PipelineState state) override;
    void on_progress(const ProgressEvent& e) override;
    void on_completion(const CompletionEvent& e) override;

    void broadcast(const nlohmann::json& msg);

    void handle_control(const nlohmann::json& msg);

private:
    struct Impl;

    void run_event_loop();
    void remember(const nlohmann::json& msg);

    int port_;
    std::string host_;
    std::atomic<bool> running_{false};
    std::thread event_thread_;
    std::shared_ptr<Impl> impl_;

    mutable std::mutex snapshot_m_;
    nlohmann::json last_state_;
    nlohmann::json last_progress_;
    ControlHandler control_;
};

} // namespace capturelink::net
