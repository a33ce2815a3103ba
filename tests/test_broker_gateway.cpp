#include <cassert>
#include <atomic>
#include <cmath>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "../include/broker/async_broker.hpp"
#include "../include/broker/rest_broker.hpp"
#include "../include/broker/simulated_broker.hpp"
#include "../include/order/order_lifecycle.hpp"

using namespace zonetrader;
using namespace zonetrader::broker;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "  " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))
#define ASSERT_NEAR(a, b, eps) assert(std::abs((a) - (b)) < (eps))

/**
 * Transport answering from a handler and recording every request.
 */
class FakeTransport : public IHttpTransport {
public:
    std::function<HttpResponse(const HttpRequest&)> handler;
    std::vector<HttpRequest> requests;

    HttpResponse perform(const HttpRequest& request) override {
        requests.push_back(request);
        return handler(request);
    }

    size_t count(const std::string& path) const {
        size_t n = 0;
        for (const auto& r : requests)
            if (r.url.find(path) != std::string::npos)
                ++n;
        return n;
    }
};

bool has_path(const HttpRequest& request, const std::string& path) {
    return request.url.find(path) != std::string::npos;
}

std::string header(const HttpRequest& request, const std::string& name) {
    for (const auto& [key, value] : request.headers)
        if (key == name)
            return value;
    return "";
}

RestBrokerConfig test_config() {
    RestBrokerConfig config;
    config.base_url = "https://broker.test/v1";
    config.access_token = "preset";
    config.account_id = 42;
    config.account_spec = "DEMO42";
    config.requests_per_second = 1000;
    return config;
}

// Virtual time: sleeping only advances the clock
struct FakeTime {
    Timestamp now = 1710423000000LL;
    std::vector<int64_t> sleeps;

    void attach(RestBrokerGateway& gateway) {
        gateway.set_clock([this] { return now; });
        gateway.set_sleeper([this](std::chrono::milliseconds d) {
            sleeps.push_back(d.count());
            now += d.count();
        });
    }
};

order::Order long_order() { return order::Order::from_band(1, 0, OrderType::Long, 5000, 5004); }

// ============================================================================
// Payloads
// ============================================================================

TEST(test_bracket_payload) {
    json payload = RestBrokerGateway::build_bracket_payload(long_order(), test_config());
    ASSERT_EQ(payload["action"], "Buy");
    ASSERT_EQ(payload["symbol"], "ESZ5");
    ASSERT_EQ(payload["orderQty"], 5);
    ASSERT_EQ(payload["accountId"], 42);
    ASSERT_NEAR(payload["price"].get<double>(), 5004.0, 1e-9);
    ASSERT_EQ(payload["bracket1"]["action"], "Sell");
    ASSERT_NEAR(payload["bracket1"]["price"].get<double>(), 5014.0, 1e-9);
    ASSERT_EQ(payload["bracket2"]["orderType"], "Stop");
    ASSERT_NEAR(payload["bracket2"]["stopPrice"].get<double>(), 5000.0, 1e-9);
}

TEST(test_tick_rounding_and_status_mapping) {
    ASSERT_NEAR(RestBrokerGateway::round_to_tick(5000.13), 5000.25, 1e-9);
    ASSERT_NEAR(RestBrokerGateway::round_to_tick(5000.1), 5000.0, 1e-9);
    ASSERT_EQ(RestBrokerGateway::map_order_status("Filled"), order::OrderStatus::Filled);
    ASSERT_EQ(RestBrokerGateway::map_order_status("Canceled"), order::OrderStatus::Cancelled);
    ASSERT_EQ(RestBrokerGateway::map_order_status("Rejected"), order::OrderStatus::Cancelled);
    ASSERT_EQ(RestBrokerGateway::map_order_status("Working"), order::OrderStatus::Placed);
}

// ============================================================================
// Retry policy
// ============================================================================

TEST(test_429_four_times_then_placed) {
    FakeTransport transport;
    int placements = 0;
    transport.handler = [&](const HttpRequest& r) -> HttpResponse {
        if (has_path(r, "/order/placeoso")) {
            if (++placements <= 4)
                return {429, "Too Many Requests"};
            return {200, R"({"orderId":101,"oso1Id":102,"oso2Id":103})"};
        }
        if (has_path(r, "/order/item"))
            return {200, R"({"id":101,"ordStatus":"Working","contractId":9})"};
        if (has_path(r, "/fill/deps"))
            return {200, "[]"};
        return {404, ""};
    };

    RestBrokerGateway gateway(test_config(), transport);
    FakeTime time;
    time.attach(gateway);

    order::OrderLifecycle lifecycle(gateway);
    std::vector<order::Order> orders = {long_order()};
    market::Candle candle;
    candle.timestamp = util::new_york_time(util::make_date(2024, 3, 14), 13, 0);
    orders[0].timestamp = candle.timestamp;
    candle.open = candle.low = 5004.5;
    candle.high = 5006;
    candle.close = 5005;
    lifecycle.apply(orders, candle);

    ASSERT_EQ(transport.count("/order/placeoso"), 5u);
    ASSERT_EQ(time.sleeps.size(), 4u);
    ASSERT_EQ(time.sleeps[0], 1000);
    ASSERT_EQ(time.sleeps[1], 2000);
    ASSERT_EQ(time.sleeps[2], 4000);
    ASSERT_EQ(time.sleeps[3], 8000);
    ASSERT_EQ(orders[0].status, order::OrderStatus::Placed);
    ASSERT_EQ(*orders[0].broker_order_id, 101);
    ASSERT_EQ(*orders[0].broker_stop_leg_id, 103);
    ASSERT_EQ(header(transport.requests[0], "Authorization"), "Bearer preset");
}

TEST(test_retries_exhausted_is_transient_failure) {
    FakeTransport transport;
    transport.handler = [](const HttpRequest&) -> HttpResponse { return {503, ""}; };
    RestBrokerGateway gateway(test_config(), transport);
    FakeTime time;
    time.attach(gateway);

    BrokerResult result = gateway.place_bracket(long_order());
    ASSERT_EQ(result.error, BrokerErrorKind::Transient);
    ASSERT_EQ(result.attempts, 6);
    ASSERT_EQ(result.http_status, 503);
    ASSERT_EQ(time.sleeps.back(), 16000);
    ASSERT_TRUE(result.message.find("Broker unavailable") != std::string::npos);
}

TEST(test_other_status_is_definitive_without_retry) {
    FakeTransport transport;
    transport.handler = [](const HttpRequest&) -> HttpResponse { return {400, "bad symbol"}; };
    RestBrokerGateway gateway(test_config(), transport);
    FakeTime time;
    time.attach(gateway);

    BrokerResult result = gateway.place_bracket(long_order());
    ASSERT_EQ(result.error, BrokerErrorKind::Definitive);
    ASSERT_EQ(result.attempts, 1);
    ASSERT_TRUE(time.sleeps.empty());
}

TEST(test_failure_reason_in_body_is_definitive) {
    FakeTransport transport;
    transport.handler = [](const HttpRequest&) -> HttpResponse {
        return {200, R"({"failureReason":"RiskCheck","failureText":"Insufficient margin"})"};
    };
    RestBrokerGateway gateway(test_config(), transport);

    BrokerResult result = gateway.place_bracket(long_order());
    ASSERT_EQ(result.error, BrokerErrorKind::Definitive);
    ASSERT_EQ(result.message, "RiskCheck: Insufficient margin");
}

TEST(test_transport_exception_reported) {
    FakeTransport transport;
    transport.handler = [](const HttpRequest&) -> HttpResponse { throw std::runtime_error("connection refused"); };
    RestBrokerGateway gateway(test_config(), transport);

    BrokerResult result = gateway.place_bracket(long_order());
    ASSERT_EQ(result.error, BrokerErrorKind::Transport);
    ASSERT_EQ(result.message, "connection refused");
    ASSERT_EQ(result.attempts, 1); // not retried
    ASSERT_EQ(transport.requests.size(), 1u);
}

// ============================================================================
// Authentication
// ============================================================================

TEST(test_expired_token_refreshed_once) {
    FakeTransport transport;
    transport.handler = [](const HttpRequest& r) -> HttpResponse {
        if (has_path(r, "/auth/accesstokenrequest"))
            return {200, R"({"accessToken":"fresh"})"};
        if (header(r, "Authorization") == "Bearer fresh")
            return {200, R"([{"amount":51234.5}])"};
        return {401, ""};
    };
    RestBrokerGateway gateway(test_config(), transport);

    auto balance = gateway.account_balance();
    ASSERT_TRUE(balance.has_value());
    ASSERT_NEAR(*balance, 51234.5, 1e-9);
    ASSERT_EQ(transport.count("/auth/accesstokenrequest"), 1u);
    ASSERT_EQ(transport.count("/cashBalance/list"), 2u);
}

TEST(test_zero_contracts_never_sent) {
    FakeTransport transport;
    transport.handler = [](const HttpRequest&) -> HttpResponse { return {200, "{}"}; };
    RestBrokerGateway gateway(test_config(), transport);
    order::Order o = long_order();
    o.contracts = 0;
    ASSERT_EQ(gateway.place_bracket(o).error, BrokerErrorKind::Definitive);
    ASSERT_TRUE(transport.requests.empty());
}

TEST(test_rate_limit_waits_for_next_window) {
    FakeTransport transport;
    transport.handler = [](const HttpRequest&) -> HttpResponse { return {200, "[]"}; };
    RestBrokerConfig config = test_config();
    config.requests_per_second = 2;
    RestBrokerGateway gateway(config, transport);
    FakeTime time;
    time.now = 1710423000000LL; // on a second boundary
    time.attach(gateway);

    std::vector<BrokerOrderSummary> out;
    for (int i = 0; i < 3; ++i)
        ASSERT_TRUE(gateway.list_orders(out).ok());
    ASSERT_EQ(time.sleeps.size(), 1u);
    ASSERT_EQ(time.sleeps[0], 1000);
}

// ============================================================================
// Bracket status
// ============================================================================

TEST(test_query_reports_profit_leg_fill) {
    FakeTransport transport;
    transport.handler = [](const HttpRequest& r) -> HttpResponse {
        if (has_path(r, "/order/item?id=101"))
            return {200, R"({"ordStatus":"Filled","contractId":9})"};
        if (has_path(r, "/order/item?id=102"))
            return {200, R"({"ordStatus":"Filled","contractId":9})"};
        if (has_path(r, "/order/item?id=103"))
            return {200, R"({"ordStatus":"Canceled","contractId":9})"};
        if (has_path(r, "/fill/deps?masterid=101"))
            return {200, R"([{"qty":5,"price":5004,"timestamp":"2024-03-14T13:01:00Z","active":true}])"};
        if (has_path(r, "/fill/deps?masterid=102"))
            return {200, R"([{"qty":5,"price":5014,"timestamp":"2024-03-14T13:50:00Z","active":true}])"};
        return {200, "[]"};
    };
    RestBrokerGateway gateway(test_config(), transport);

    order::Order o = long_order();
    o.broker_order_id = 101;
    o.broker_profit_leg_id = 102;
    o.broker_stop_leg_id = 103;
    o.status = order::OrderStatus::Placed;

    BrokerOrderReport report;
    ASSERT_TRUE(gateway.query_order(o, report).ok());
    ASSERT_EQ(report.status, order::OrderStatus::Profit);
    ASSERT_NEAR(*report.exit_price, 5014.0, 1e-9);
    ASSERT_NEAR(*report.entry_fill_price, 5004.0, 1e-9);
    ASSERT_EQ(*report.exit_timestamp, 1710423000000LL + 20 * MS_PER_MINUTE);
}

// ============================================================================
// Broker thread
// ============================================================================

TEST(test_async_results_handed_back_once) {
    SimulatedBroker simulated;
    AsyncBrokerGateway async(simulated);
    async.start();
    ASSERT_EQ(std::string(async.name()), "simulated");
    ASSERT_TRUE(async.simulates_fills());

    order::Order o = long_order();
    ASSERT_EQ(async.place_bracket(o).error, BrokerErrorKind::Pending);
    async.flush();
    BrokerResult placed = async.place_bracket(o);
    ASSERT_TRUE(placed.ok());
    ASSERT_TRUE(placed.broker_order_id.has_value());
    ASSERT_EQ(simulated.placed_count(), 1u);

    // A collected result is gone; asking again sends a new request
    ASSERT_TRUE(async.place_bracket(o).pending());
    async.flush();
    ASSERT_EQ(simulated.placed_count(), 2u);

    // Closing the order discards what was never collected
    BrokerOrderReport report;
    ASSERT_TRUE(async.query_order(o, report).pending());
    async.flush();
    order::Order closed = o;
    closed.status = order::OrderStatus::Cancelled; // leaves the simulated balance alone
    async.on_order_closed(closed);
    ASSERT_TRUE(async.query_order(o, report).pending());
    async.flush();
    ASSERT_TRUE(async.query_order(o, report).ok());
    ASSERT_EQ(async.in_flight(), 0u);

    ASSERT_FALSE(async.account_balance().has_value());
    async.flush();
    ASSERT_NEAR(*async.account_balance(), 50000.0, 1e-9);
    async.stop();
}

/**
 * Backoff sleeper that parks the broker thread until released.
 */
struct SleepGate {
    std::mutex mutex;
    std::condition_variable cv;
    bool open = false;
    std::vector<int64_t> sleeps;
    std::atomic<Timestamp> now{1710423000000LL};

    void attach(RestBrokerGateway& gateway) {
        gateway.set_clock([this] { return now.load(); });
        gateway.set_sleeper([this](std::chrono::milliseconds d) {
            std::unique_lock<std::mutex> lock(mutex);
            sleeps.push_back(d.count());
            cv.notify_all();
            cv.wait(lock, [this] { return open; });
            now += d.count();
        });
    }

    void wait_for_first_sleep() {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this] { return !sleeps.empty(); });
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            open = true;
        }
        cv.notify_all();
    }
};

TEST(test_backoff_does_not_hold_up_candles) {
    SleepGate gate;
    FakeTransport transport;
    int placements = 0;
    transport.handler = [&](const HttpRequest& r) -> HttpResponse {
        if (has_path(r, "/order/placeoso")) {
            if (++placements <= 4)
                return {429, "Too Many Requests"};
            return {200, R"({"orderId":101,"oso1Id":102,"oso2Id":103})"};
        }
        if (has_path(r, "/order/item"))
            return {200, R"({"id":101,"ordStatus":"Working","contractId":9})"};
        if (has_path(r, "/fill/deps"))
            return {200, "[]"};
        return {404, ""};
    };
    RestBrokerGateway rest(test_config(), transport);
    gate.attach(rest);
    AsyncBrokerGateway async(rest);
    async.start();

    order::OrderLifecycle lifecycle(async);
    Timestamp start = util::new_york_time(util::make_date(2024, 3, 14), 13, 0);
    std::vector<order::Order> orders = {long_order()};
    orders[0].timestamp = start;
    auto candle_at = [&](int minute) {
        market::Candle candle;
        candle.timestamp = start + minute * MS_PER_MINUTE;
        candle.open = candle.low = 5004.5;
        candle.high = 5006;
        candle.close = 5005;
        return candle;
    };

    // Returns while the broker thread is still in its first backoff
    ASSERT_TRUE(lifecycle.apply(orders, candle_at(0)).empty());
    gate.wait_for_first_sleep();
    ASSERT_TRUE(lifecycle.apply(orders, candle_at(1)).empty());
    ASSERT_EQ(orders[0].status, order::OrderStatus::Planned);
    ASSERT_TRUE(orders[0].last_broker_error.empty());
    ASSERT_TRUE(lifecycle.placement_pending(orders[0]));
    ASSERT_EQ(async.in_flight(), 1u);

    // Past the unfilled timeout, still waiting on the broker
    ASSERT_TRUE(lifecycle.apply(orders, candle_at(3)).empty());
    ASSERT_EQ(orders[0].status, order::OrderStatus::Planned);

    gate.release();
    async.flush();
    auto changed = lifecycle.apply(orders, candle_at(4));
    ASSERT_EQ(changed.size(), 1u);
    ASSERT_EQ(orders[0].status, order::OrderStatus::Placed);
    ASSERT_EQ(*orders[0].broker_order_id, 101);
    ASSERT_FALSE(lifecycle.placement_pending(orders[0]));
    async.stop();
    ASSERT_EQ(transport.count("/order/placeoso"), 5u);
    ASSERT_EQ(gate.sleeps.size(), 4u);
}

int main() {
    std::cout << "\n=== Broker Gateway Tests ===\n\n";

    RUN_TEST(test_bracket_payload);
    RUN_TEST(test_tick_rounding_and_status_mapping);
    RUN_TEST(test_429_four_times_then_placed);
    RUN_TEST(test_retries_exhausted_is_transient_failure);
    RUN_TEST(test_other_status_is_definitive_without_retry);
    RUN_TEST(test_failure_reason_in_body_is_definitive);
    RUN_TEST(test_transport_exception_reported);
    RUN_TEST(test_expired_token_refreshed_once);
    RUN_TEST(test_zero_contracts_never_sent);
    RUN_TEST(test_rate_limit_waits_for_next_window);
    RUN_TEST(test_query_reports_profit_leg_fill);
    RUN_TEST(test_async_results_handed_back_once);
    RUN_TEST(test_backoff_does_not_hold_up_candles);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
