#pragma once

#include "../logging/async_logger.hpp"
#include "event_distributor.hpp"

#include <libwebsockets.h>

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace zonetrader {
namespace distribution {

struct WsServerConfig {
    int port = 8081;
    size_t max_queued_messages = 20000; // per connection; overflow drops the client
    size_t rx_buffer_size = 65536;
};

/**
 * One WebSocket client as a distributor subscriber. The broadcaster thread
 * queues messages; the lws service thread writes them when the socket is
 * writable.
 */
class WsSubscriber : public ISubscriber {
public:
    WsSubscriber(struct lws_context* context, size_t max_queued) : context_(context), max_queued_(max_queued) {}

    bool send(const std::string& message) override;
    void on_dropped() override;

    // Stop touching the lws context; later sends fail
    void detach();

    std::optional<std::string> next();
    bool has_pending() const;
    bool is_closing() const { return closing_.load(std::memory_order_acquire); }

private:
    struct lws_context* context_;
    size_t max_queued_;
    mutable std::mutex mutex_;
    std::deque<std::string> outbox_;
    std::atomic<bool> closing_{false};
};

/**
 * WebSocketServer - libwebsockets host for the EventDistributor
 *
 * Each connection becomes a subscriber; text frames it sends are control
 * messages. lws runs on its own service thread.
 */
class WebSocketServer {
public:
    WebSocketServer(EventDistributor& distributor, const WsServerConfig& config = WsServerConfig{},
                    logging::AsyncLogger* logger = nullptr);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    // Throws std::runtime_error when the lws context cannot be created
    void start();
    void stop();

    bool is_running() const { return running_.load(std::memory_order_acquire); }
    size_t connection_count() const;

private:
    struct Session {
        SubscriberId id = 0;
        std::shared_ptr<WsSubscriber> subscriber;
        std::string rx_buffer;
    };

    EventDistributor& distributor_;
    WsServerConfig config_;
    logging::AsyncLogger* logger_;

    struct lws_context* context_ = nullptr;
    struct lws_protocols protocols_[2];
    std::thread service_thread_;
    std::atomic<bool> running_{false};

    mutable std::mutex sessions_mutex_;
    std::unordered_map<struct lws*, std::unique_ptr<Session>> sessions_;

    static int callback(struct lws* wsi, enum lws_callback_reasons reason, void* user, void* in, size_t len);
    int on_event(struct lws* wsi, enum lws_callback_reasons reason, void* in, size_t len);
    Session* session_of(struct lws* wsi);
    void service_loop();
};

} // namespace distribution
} // namespace zonetrader
