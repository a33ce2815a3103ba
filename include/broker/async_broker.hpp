#pragma once

#include "../logging/async_logger.hpp"
#include "broker_gateway.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

namespace zonetrader {
namespace broker {

/**
 * AsyncBrokerGateway - runs another gateway's calls on a broker thread
 *
 * The first call for an (operation, order) pair queues the request and
 * returns Pending. Later calls return Pending while it is in flight, then
 * hand back its result once, so the streaming thread never waits on HTTP,
 * retries or backoff. The lifecycle repeats a pending call on the next
 * candle and applies the result then.
 *
 * account_balance() returns the last value the broker thread fetched and
 * queues a refresh.
 */
class AsyncBrokerGateway : public IBrokerGateway {
public:
    explicit AsyncBrokerGateway(IBrokerGateway& inner, logging::AsyncLogger* logger = nullptr);
    ~AsyncBrokerGateway() override;

    AsyncBrokerGateway(const AsyncBrokerGateway&) = delete;
    AsyncBrokerGateway& operator=(const AsyncBrokerGateway&) = delete;

    void start();
    void stop(); // runs what is already queued

    const char* name() const override { return inner_.name(); }
    bool simulates_fills() const override { return inner_.simulates_fills(); }

    BrokerResult place_bracket(const order::Order& order) override;
    BrokerResult cancel_order(const order::Order& order) override;
    BrokerResult liquidate(const order::Order& order) override;
    BrokerResult query_order(const order::Order& order, BrokerOrderReport& report) override;
    std::optional<double> account_balance() override;
    void on_order_closed(const order::Order& order) override;

    // Block until every request queued before the call has run
    void flush();

    size_t in_flight() const;

private:
    enum class Operation : uint8_t { Place, Cancel, Liquidate, Query, Balance, Closed };

    struct Request {
        Operation op;
        order::Order order;
    };

    struct Slot {
        bool done = false;
        BrokerResult result;
        BrokerOrderReport report;
    };

    using Key = std::pair<Operation, OrderId>;

    IBrokerGateway& inner_;
    logging::AsyncLogger* logger_;

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<Request> queue_;
    std::map<Key, Slot> slots_;
    std::optional<double> balance_;
    bool balance_requested_ = false;
    uint64_t posted_ = 0;
    uint64_t handled_ = 0;
    bool stopping_ = false;

    std::thread thread_;
    std::atomic<bool> running_{false};

    BrokerResult submit(Operation op, const order::Order& order, BrokerOrderReport* report);
    void post(Request request); // called with mutex_ held
    void run();
    void execute(Request& request);

    static const char* operation_to_string(Operation op);
};

} // namespace broker
} // namespace zonetrader
