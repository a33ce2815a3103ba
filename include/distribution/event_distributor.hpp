#pragma once

#include "../core/event.hpp"
#include "../logging/async_logger.hpp"
#include "control_command.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <variant>

namespace zonetrader {
namespace distribution {

struct DistributorConfig {
    size_t max_pending_events = 10000; // shared buffer while nobody is ready; oldest evicted
    size_t eviction_log_interval = 1000;
};

/**
 * One outbound connection. send() is called only from the broadcaster
 * thread; returning false drops the subscriber.
 */
class ISubscriber {
public:
    virtual ~ISubscriber() = default;
    virtual bool send(const std::string& message) = 0;
    // Called once after the subscriber was dropped for a failed send
    virtual void on_dropped() {}
};

using SubscriberId = uint64_t;

// Receives PLAN / TRADE / SPEED; must return promptly (start replays elsewhere)
using CommandHandler = std::function<void(SubscriberId, const ControlCommand&)>;

// Called on the broadcaster thread once a subscriber is gone, whether it
// disconnected or was dropped after a failed send
using DisconnectHandler = std::function<void(SubscriberId)>;

struct DistributorStats {
    size_t subscribers = 0;
    size_t ready_subscribers = 0;
    size_t pending = 0;
    uint64_t published = 0;
    uint64_t delivered = 0;
    uint64_t evicted = 0;
    uint64_t dropped_subscribers = 0;
    uint64_t malformed_messages = 0;
};

/**
 * EventDistributor - fan-out of serialized events to ready subscribers
 *
 * A single broadcaster thread owns the subscriber set and the pending
 * buffer. Everything else (publishes, connects, disconnects, control
 * messages) is posted to its queue, so a subscriber's connection is only
 * ever written from one thread and per-publisher order is preserved.
 *
 * With no ready subscriber, events accumulate in one shared buffer that is
 * replayed in full to the next subscriber sending READY, then cleared.
 */
class EventDistributor {
public:
    explicit EventDistributor(const DistributorConfig& config = DistributorConfig{},
                              logging::AsyncLogger* logger = nullptr);
    ~EventDistributor();

    EventDistributor(const EventDistributor&) = delete;
    EventDistributor& operator=(const EventDistributor&) = delete;

    void start();
    void stop(); // drains what is already queued

    void set_command_handler(CommandHandler handler);
    void set_disconnect_handler(DisconnectHandler handler);

    void publish(const core::Event& event);
    void publish_serialized(std::string message);

    SubscriberId connect(std::shared_ptr<ISubscriber> subscriber);
    void disconnect(SubscriberId id);
    void receive(SubscriberId id, std::string message);

    // Block until everything posted before the call has been handled
    void flush();

    DistributorStats stats() const;
    bool is_running() const { return running_.load(std::memory_order_acquire); }

private:
    struct Publish {
        std::string message;
    };
    struct Connect {
        SubscriberId id;
        std::shared_ptr<ISubscriber> subscriber;
    };
    struct Disconnect {
        SubscriberId id;
    };
    struct Receive {
        SubscriberId id;
        std::string message;
    };
    using Task = std::variant<Publish, Connect, Disconnect, Receive>;

    struct Connection {
        std::shared_ptr<ISubscriber> subscriber;
        bool ready = false;
    };

    DistributorConfig config_;
    logging::AsyncLogger* logger_;
    CommandHandler command_handler_;
    DisconnectHandler disconnect_handler_;

    // Queue shared with producers
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<Task> queue_;
    uint64_t posted_ = 0;
    uint64_t handled_ = 0;
    bool stopping_ = false;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<SubscriberId> next_id_{1};

    // Owned by the broadcaster thread; counters mirrored for stats()
    std::unordered_map<SubscriberId, Connection> connections_;
    std::deque<std::string> pending_;

    std::atomic<size_t> subscriber_count_{0};
    std::atomic<size_t> ready_count_{0};
    std::atomic<size_t> pending_count_{0};
    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> evicted_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> malformed_{0};

    void post(Task task);
    void run();
    void handle(Publish& task);
    void handle(Connect& task);
    void handle(Disconnect& task);
    void handle(Receive& task);

    bool deliver(SubscriberId id, Connection& connection, const std::string& message);
    void drop(SubscriberId id);
    void notify_disconnected(SubscriberId id);
    void buffer(std::string message);
    void update_counts();
};

} // namespace distribution
} // namespace zonetrader
