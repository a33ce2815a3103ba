#include "../../include/distribution/event_distributor.hpp"
#include "../../include/core/event_json.hpp"

#include <vector>

namespace zonetrader {
namespace distribution {

EventDistributor::EventDistributor(const DistributorConfig& config, logging::AsyncLogger* logger)
    : config_(config), logger_(logger) {}

EventDistributor::~EventDistributor() { stop(); }

void EventDistributor::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true))
        return;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = false;
    }
    thread_ = std::thread(&EventDistributor::run, this);
    LOG_INFO(logger_, logging::LogCategory::Distributor, "Event distributor started");
}

void EventDistributor::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (thread_.joinable())
        thread_.join();
    if (running_.exchange(false))
        LOG_INFO(logger_, logging::LogCategory::Distributor, "Event distributor stopped");
}

void EventDistributor::set_command_handler(CommandHandler handler) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    command_handler_ = std::move(handler);
}

void EventDistributor::set_disconnect_handler(DisconnectHandler handler) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    disconnect_handler_ = std::move(handler);
}

void EventDistributor::publish(const core::Event& event) { publish_serialized(core::serialize_event(event)); }

void EventDistributor::publish_serialized(std::string message) { post(Publish{std::move(message)}); }

SubscriberId EventDistributor::connect(std::shared_ptr<ISubscriber> subscriber) {
    SubscriberId id = next_id_.fetch_add(1, std::memory_order_relaxed);
    post(Connect{id, std::move(subscriber)});
    return id;
}

void EventDistributor::disconnect(SubscriberId id) { post(Disconnect{id}); }

void EventDistributor::receive(SubscriberId id, std::string message) { post(Receive{id, std::move(message)}); }

void EventDistributor::flush() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (!running_.load(std::memory_order_acquire))
        return;
    uint64_t target = posted_;
    idle_cv_.wait(lock, [&] { return handled_ >= target || !running_.load(std::memory_order_acquire); });
}

DistributorStats EventDistributor::stats() const {
    DistributorStats s;
    s.subscribers = subscriber_count_.load(std::memory_order_relaxed);
    s.ready_subscribers = ready_count_.load(std::memory_order_relaxed);
    s.pending = pending_count_.load(std::memory_order_relaxed);
    s.published = published_.load(std::memory_order_relaxed);
    s.delivered = delivered_.load(std::memory_order_relaxed);
    s.evicted = evicted_.load(std::memory_order_relaxed);
    s.dropped_subscribers = dropped_.load(std::memory_order_relaxed);
    s.malformed_messages = malformed_.load(std::memory_order_relaxed);
    return s;
}

void EventDistributor::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(std::move(task));
        ++posted_;
    }
    queue_cv_.notify_one();
}

void EventDistributor::run() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty())
                break; // stopping and drained
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        std::visit([this](auto& t) { handle(t); }, task);
        update_counts();

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            ++handled_;
        }
        idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

void EventDistributor::handle(Publish& task) {
    published_.fetch_add(1, std::memory_order_relaxed);

    std::vector<SubscriberId> failed;
    bool delivered_any = false;
    for (auto& [id, connection] : connections_) {
        if (!connection.ready)
            continue;
        if (deliver(id, connection, task.message))
            delivered_any = true;
        else
            failed.push_back(id);
    }
    for (SubscriberId id : failed)
        drop(id);

    // Nobody got it: keep it for the next READY
    if (!delivered_any)
        buffer(std::move(task.message));
}

void EventDistributor::handle(Connect& task) {
    connections_[task.id] = Connection{std::move(task.subscriber), false};
    LOGF_INFO(logger_, logging::LogCategory::Distributor, "Subscriber %llu connected (%zu total)",
              static_cast<unsigned long long>(task.id), connections_.size());
}

void EventDistributor::handle(Disconnect& task) {
    if (connections_.erase(task.id) > 0) {
        LOGF_INFO(logger_, logging::LogCategory::Distributor, "Subscriber %llu disconnected",
                  static_cast<unsigned long long>(task.id));
        notify_disconnected(task.id);
    }
}

void EventDistributor::handle(Receive& task) {
    auto it = connections_.find(task.id);
    if (it == connections_.end())
        return;

    std::string error;
    auto command = parse_control_message(task.message, &error);
    if (!command) {
        malformed_.fetch_add(1, std::memory_order_relaxed);
        LOGF_WARN(logger_, logging::LogCategory::Distributor, "Ignoring control message from %llu: %s",
                  static_cast<unsigned long long>(task.id), error.c_str());
        return;
    }

    if (command->type == ControlCommandType::Ready) {
        it->second.ready = true;
        size_t replayed = pending_.size();
        bool ok = true;
        while (!pending_.empty() && ok) {
            ok = deliver(task.id, it->second, pending_.front());
            pending_.pop_front();
        }
        if (!ok) {
            drop(task.id);
            return;
        }
        LOGF_INFO(logger_, logging::LogCategory::Distributor, "Subscriber %llu ready, replayed %zu buffered events",
                  static_cast<unsigned long long>(task.id), replayed);
        return;
    }

    LOGF_INFO(logger_, logging::LogCategory::Distributor, "Subscriber %llu sent %s",
              static_cast<unsigned long long>(task.id), control_command_type_to_string(command->type));

    CommandHandler handler;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        handler = command_handler_;
    }
    if (handler)
        handler(task.id, *command);
}

bool EventDistributor::deliver(SubscriberId id, Connection& connection, const std::string& message) {
    bool sent = false;
    try {
        sent = connection.subscriber->send(message);
    } catch (const std::exception& e) {
        LOGF_WARN(logger_, logging::LogCategory::Distributor, "Send to subscriber %llu threw: %s",
                  static_cast<unsigned long long>(id), e.what());
    }
    if (sent)
        delivered_.fetch_add(1, std::memory_order_relaxed);
    return sent;
}

void EventDistributor::drop(SubscriberId id) {
    auto it = connections_.find(id);
    if (it == connections_.end())
        return;
    std::shared_ptr<ISubscriber> subscriber = std::move(it->second.subscriber);
    connections_.erase(it);
    dropped_.fetch_add(1, std::memory_order_relaxed);
    LOGF_WARN(logger_, logging::LogCategory::Distributor, "Dropped subscriber %llu after failed send",
              static_cast<unsigned long long>(id));
    if (subscriber)
        subscriber->on_dropped();
    notify_disconnected(id);
}

void EventDistributor::notify_disconnected(SubscriberId id) {
    DisconnectHandler handler;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        handler = disconnect_handler_;
    }
    if (handler)
        handler(id);
}

void EventDistributor::buffer(std::string message) {
    if (config_.max_pending_events == 0)
        return;
    if (pending_.size() >= config_.max_pending_events) {
        pending_.pop_front();
        uint64_t evicted = evicted_.fetch_add(1, std::memory_order_relaxed) + 1;
        if (evicted == 1 || (config_.eviction_log_interval > 0 && evicted % config_.eviction_log_interval == 0)) {
            LOGF_WARN(logger_, logging::LogCategory::Distributor,
                      "Pending buffer full (%zu), evicted oldest event (%llu evicted so far)",
                      config_.max_pending_events, static_cast<unsigned long long>(evicted));
        }
    }
    pending_.push_back(std::move(message));
}

void EventDistributor::update_counts() {
    size_t ready = 0;
    for (const auto& [id, connection] : connections_) {
        if (connection.ready)
            ++ready;
    }
    subscriber_count_.store(connections_.size(), std::memory_order_relaxed);
    ready_count_.store(ready, std::memory_order_relaxed);
    pending_count_.store(pending_.size(), std::memory_order_relaxed);
}

} // namespace distribution
} // namespace zonetrader
