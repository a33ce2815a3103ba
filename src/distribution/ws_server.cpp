#include "../../include/distribution/ws_server.hpp"

#include <cstring>
#include <stdexcept>
#include <vector>

namespace zonetrader {
namespace distribution {

// ============================================================================
// WsSubscriber
// ============================================================================

// The context is only touched under the lock so detach() can fence it off
bool WsSubscriber::send(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closing_.load(std::memory_order_acquire) || outbox_.size() >= max_queued_)
        return false;
    outbox_.push_back(message);
    lws_cancel_service(context_); // wake the service thread to write
    return true;
}

void WsSubscriber::on_dropped() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closing_.exchange(true))
        return;
    lws_cancel_service(context_);
}

void WsSubscriber::detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    closing_.store(true, std::memory_order_release);
    outbox_.clear();
}

std::optional<std::string> WsSubscriber::next() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (outbox_.empty())
        return std::nullopt;
    std::string message = std::move(outbox_.front());
    outbox_.pop_front();
    return message;
}

bool WsSubscriber::has_pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !outbox_.empty();
}

// ============================================================================
// WebSocketServer
// ============================================================================

WebSocketServer::WebSocketServer(EventDistributor& distributor, const WsServerConfig& config,
                                 logging::AsyncLogger* logger)
    : distributor_(distributor), config_(config), logger_(logger) {
    std::memset(protocols_, 0, sizeof(protocols_));
}

WebSocketServer::~WebSocketServer() { stop(); }

void WebSocketServer::start() {
    if (running_.load(std::memory_order_acquire))
        return;

    protocols_[0].name = "zonetrader-events";
    protocols_[0].callback = &WebSocketServer::callback;
    protocols_[0].per_session_data_size = 0;
    protocols_[0].rx_buffer_size = config_.rx_buffer_size;

    struct lws_context_creation_info info;
    std::memset(&info, 0, sizeof(info));
    info.port = config_.port;
    info.protocols = protocols_;
    info.gid = -1;
    info.uid = -1;
    info.user = this;

    context_ = lws_create_context(&info);
    if (!context_)
        throw std::runtime_error("Failed to create WebSocket context on port " + std::to_string(config_.port));

    running_.store(true, std::memory_order_release);
    service_thread_ = std::thread(&WebSocketServer::service_loop, this);
    LOGF_INFO(logger_, logging::LogCategory::Distributor, "WebSocket server listening on port %d", config_.port);
}

void WebSocketServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    lws_cancel_service(context_);
    if (service_thread_.joinable())
        service_thread_.join();

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto& [wsi, session] : sessions_)
            session->subscriber->detach();
    }

    // Destroying the context closes every connection; CLOSED callbacks unregister them
    lws_context_destroy(context_);
    context_ = nullptr;

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto& [wsi, session] : sessions_)
        distributor_.disconnect(session->id);
    sessions_.clear();
    LOG_INFO(logger_, logging::LogCategory::Distributor, "WebSocket server stopped");
}

size_t WebSocketServer::connection_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

void WebSocketServer::service_loop() {
    while (running_.load(std::memory_order_acquire)) {
        lws_service(context_, 100); // 100ms timeout
    }
}

int WebSocketServer::callback(struct lws* wsi, enum lws_callback_reasons reason, void* user, void* in,
                              size_t len) {
    (void)user;
    auto* self = static_cast<WebSocketServer*>(lws_context_user(lws_get_context(wsi)));
    if (!self)
        return 0;
    return self->on_event(wsi, reason, in, len);
}

WebSocketServer::Session* WebSocketServer::session_of(struct lws* wsi) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(wsi);
    return it == sessions_.end() ? nullptr : it->second.get();
}

int WebSocketServer::on_event(struct lws* wsi, enum lws_callback_reasons reason, void* in, size_t len) {
    switch (reason) {
    case LWS_CALLBACK_ESTABLISHED: {
        auto session = std::make_unique<Session>();
        session->subscriber = std::make_shared<WsSubscriber>(context_, config_.max_queued_messages);
        session->id = distributor_.connect(session->subscriber);
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_[wsi] = std::move(session);
        break;
    }

    case LWS_CALLBACK_RECEIVE: {
        Session* session = session_of(wsi);
        if (!session)
            break;
        if (in && len > 0)
            session->rx_buffer.append(static_cast<const char*>(in), len);
        if (lws_is_final_fragment(wsi)) {
            distributor_.receive(session->id, std::move(session->rx_buffer));
            session->rx_buffer.clear();
        }
        break;
    }

    case LWS_CALLBACK_SERVER_WRITEABLE: {
        Session* session = session_of(wsi);
        if (!session)
            break;
        if (session->subscriber->is_closing())
            return -1; // dropped by the distributor: close the connection

        auto message = session->subscriber->next();
        if (!message)
            break;
        std::vector<unsigned char> frame(LWS_PRE + message->size());
        std::memcpy(frame.data() + LWS_PRE, message->data(), message->size());
        int written = lws_write(wsi, frame.data() + LWS_PRE, message->size(), LWS_WRITE_TEXT);
        if (written < static_cast<int>(message->size())) {
            LOGF_WARN(logger_, logging::LogCategory::Distributor, "Write to subscriber %llu failed",
                      static_cast<unsigned long long>(session->id));
            return -1;
        }
        if (session->subscriber->has_pending())
            lws_callback_on_writable(wsi);
        break;
    }

    case LWS_CALLBACK_EVENT_WAIT_CANCELLED: {
        // Woken by a subscriber with queued output or a pending close
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto& [session_wsi, session] : sessions_) {
            if (session->subscriber->has_pending() || session->subscriber->is_closing())
                lws_callback_on_writable(session_wsi);
        }
        break;
    }

    case LWS_CALLBACK_CLOSED: {
        std::unique_ptr<Session> session;
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            auto it = sessions_.find(wsi);
            if (it != sessions_.end()) {
                session = std::move(it->second);
                sessions_.erase(it);
            }
        }
        if (session)
            distributor_.disconnect(session->id);
        break;
    }

    default:
        break;
    }
    return 0;
}

} // namespace distribution
} // namespace zonetrader
