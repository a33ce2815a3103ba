#include "../../include/broker/async_broker.hpp"

namespace zonetrader {
namespace broker {

AsyncBrokerGateway::AsyncBrokerGateway(IBrokerGateway& inner, logging::AsyncLogger* logger)
    : inner_(inner), logger_(logger) {}

AsyncBrokerGateway::~AsyncBrokerGateway() { stop(); }

void AsyncBrokerGateway::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true))
        return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
    }
    thread_ = std::thread(&AsyncBrokerGateway::run, this);
    LOGF_INFO(logger_, logging::LogCategory::Broker, "Broker thread started for %s", inner_.name());
}

void AsyncBrokerGateway::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (thread_.joinable())
        thread_.join();
    if (running_.exchange(false))
        LOG_INFO(logger_, logging::LogCategory::Broker, "Broker thread stopped");
}

BrokerResult AsyncBrokerGateway::place_bracket(const order::Order& order) {
    return submit(Operation::Place, order, nullptr);
}

BrokerResult AsyncBrokerGateway::cancel_order(const order::Order& order) {
    return submit(Operation::Cancel, order, nullptr);
}

BrokerResult AsyncBrokerGateway::liquidate(const order::Order& order) {
    return submit(Operation::Liquidate, order, nullptr);
}

BrokerResult AsyncBrokerGateway::query_order(const order::Order& order, BrokerOrderReport& report) {
    return submit(Operation::Query, order, &report);
}

std::optional<double> AsyncBrokerGateway::account_balance() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!balance_requested_) {
        balance_requested_ = true;
        post(Request{Operation::Balance, order::Order{}});
    }
    return balance_;
}

void AsyncBrokerGateway::on_order_closed(const order::Order& order) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Results nobody will collect any more
    for (auto it = slots_.begin(); it != slots_.end();) {
        if (it->first.second == order.id)
            it = slots_.erase(it);
        else
            ++it;
    }
    post(Request{Operation::Closed, order});
}

void AsyncBrokerGateway::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!running_.load(std::memory_order_acquire))
        return;
    uint64_t target = posted_;
    idle_cv_.wait(lock, [&] { return handled_ >= target || !running_.load(std::memory_order_acquire); });
}

size_t AsyncBrokerGateway::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& [key, slot] : slots_) {
        if (!slot.done)
            ++n;
    }
    return n;
}

BrokerResult AsyncBrokerGateway::submit(Operation op, const order::Order& order, BrokerOrderReport* report) {
    std::lock_guard<std::mutex> lock(mutex_);
    Key key{op, order.id};
    auto it = slots_.find(key);
    if (it == slots_.end()) {
        slots_.emplace(key, Slot{});
        post(Request{op, order});
        return BrokerResult::failure(BrokerErrorKind::Pending, "Queued for the broker thread", 0, 0);
    }
    if (!it->second.done)
        return BrokerResult::failure(BrokerErrorKind::Pending, "Waiting on the broker thread", 0, 0);

    BrokerResult result = std::move(it->second.result);
    if (report)
        *report = it->second.report;
    slots_.erase(it);
    return result;
}

void AsyncBrokerGateway::post(Request request) {
    queue_.push_back(std::move(request));
    ++posted_;
    queue_cv_.notify_one();
}

void AsyncBrokerGateway::run() {
    while (true) {
        Request request;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty())
                break; // stopping and drained
            request = std::move(queue_.front());
            queue_.pop_front();
        }

        execute(request);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++handled_;
        }
        idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

void AsyncBrokerGateway::execute(Request& request) {
    if (request.op == Operation::Balance) {
        std::optional<double> balance;
        try {
            balance = inner_.account_balance();
        } catch (const std::exception& e) {
            LOGF_WARN(logger_, logging::LogCategory::Broker, "Balance refresh threw: %s", e.what());
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (balance)
            balance_ = balance;
        balance_requested_ = false;
        return;
    }

    if (request.op == Operation::Closed) {
        try {
            inner_.on_order_closed(request.order);
        } catch (const std::exception& e) {
            LOGF_WARN(logger_, logging::LogCategory::Broker, "Close notice for order %llu threw: %s",
                      static_cast<unsigned long long>(request.order.id), e.what());
        }
        return;
    }

    BrokerResult result;
    BrokerOrderReport report;
    try {
        switch (request.op) {
        case Operation::Place:
            result = inner_.place_bracket(request.order);
            break;
        case Operation::Cancel:
            result = inner_.cancel_order(request.order);
            break;
        case Operation::Liquidate:
            result = inner_.liquidate(request.order);
            break;
        case Operation::Query:
            result = inner_.query_order(request.order, report);
            break;
        default:
            break;
        }
    } catch (const std::exception& e) {
        result = BrokerResult::failure(BrokerErrorKind::Transport, e.what());
        LOGF_ERROR(logger_, logging::LogCategory::Broker, "%s for order %llu threw: %s",
                   operation_to_string(request.op), static_cast<unsigned long long>(request.order.id), e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(Key{request.op, request.order.id});
    if (it == slots_.end()) {
        LOGF_DEBUG(logger_, logging::LogCategory::Broker, "%s result for closed order %llu discarded",
                   operation_to_string(request.op), static_cast<unsigned long long>(request.order.id));
        return;
    }
    it->second.done = true;
    it->second.result = std::move(result);
    it->second.report = report;
}

const char* AsyncBrokerGateway::operation_to_string(Operation op) {
    switch (op) {
    case Operation::Place:
        return "place";
    case Operation::Cancel:
        return "cancel";
    case Operation::Liquidate:
        return "liquidate";
    case Operation::Query:
        return "query";
    case Operation::Balance:
        return "balance";
    case Operation::Closed:
        return "closed";
    default:
        return "unknown";
    }
}

} // namespace broker
} // namespace zonetrader
