#pragma once

#include "../logging/async_logger.hpp"
#include "../security/rate_limiter.hpp"
#include "broker_gateway.hpp"
#include "http_transport.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace zonetrader {
namespace broker {

using json = nlohmann::json;

struct RestBrokerConfig {
    std::string base_url = "https://demo.tradovateapi.com/v1";
    std::string username;
    std::string password;
    std::string client_id;
    std::string client_secret;
    std::string device_id;
    int64_t account_id = 0;
    std::string account_spec;
    std::string contract_month = "Z5"; // appended to ES/MES for the order symbol
    std::string access_token;          // preset token skips the first authentication

    int max_retries = 5;                 // 429/503 retries after the first attempt
    int64_t initial_retry_delay_ms = 1000; // doubles per retry
    long request_timeout_seconds = 30;
    uint32_t requests_per_second = 10;
};

struct BrokerPosition {
    int64_t id = 0;
    int64_t contract_id = 0;
    int net_position = 0;
    int bought = 0;
    int sold = 0;
    double bought_value = 0;
    double sold_value = 0;
};

struct BrokerFill {
    int64_t id = 0;
    int64_t order_id = 0;
    int64_t contract_id = 0;
    std::optional<Timestamp> timestamp;
    std::string action;
    int quantity = 0;
    double price = 0;
    bool active = true;
};

struct BrokerOrderSummary {
    int64_t id = 0;
    int64_t contract_id = 0;
    std::string action;
    std::string status; // broker's ordStatus
};

/**
 * RestBrokerGateway - futures broker over JSON/HTTPS
 *
 * Brackets are sent as one order-sends-order request: the entry limit plus
 * a take-profit limit (bracket1) and a stop (bracket2). Requests carry a
 * bearer token obtained lazily and refreshed once on 401. HTTP 429 and 503
 * are retried with exponential backoff (1s, 2s, 4s, ...) up to max_retries
 * times; any other non-2xx status is a definitive failure.
 */
class RestBrokerGateway : public IBrokerGateway {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using Clock = std::function<Timestamp()>;

    RestBrokerGateway(const RestBrokerConfig& config, IHttpTransport& transport,
                      logging::AsyncLogger* logger = nullptr);

    const char* name() const override { return "rest"; }
    bool simulates_fills() const override { return false; }

    BrokerResult place_bracket(const order::Order& order) override;
    BrokerResult cancel_order(const order::Order& order) override;
    BrokerResult liquidate(const order::Order& order) override;
    BrokerResult query_order(const order::Order& order, BrokerOrderReport& report) override;
    std::optional<double> account_balance() override;

    BrokerResult list_orders(std::vector<BrokerOrderSummary>& out);
    BrokerResult list_positions(std::vector<BrokerPosition>& out);
    BrokerResult list_fills(std::vector<BrokerFill>& out);

    // Test seams: backoff delays and the rate limiter's clock
    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }
    void set_clock(Clock clock) { clock_ = std::move(clock); }

    static json build_bracket_payload(const order::Order& order, const RestBrokerConfig& config);
    static order::OrderStatus map_order_status(const std::string& ord_status);
    static Price round_to_tick(Price price);

    const RestBrokerConfig& config() const { return config_; }

private:
    struct Exchange {
        BrokerResult result;
        json body;
    };

    struct LegState {
        order::OrderStatus status = order::OrderStatus::Placed;
        std::optional<Price> fill_price;
        std::optional<Timestamp> fill_timestamp;
        int64_t contract_id = 0;
    };

    RestBrokerConfig config_;
    IHttpTransport& transport_;
    logging::AsyncLogger* logger_;
    security::RateLimiter rate_limiter_;
    Sleeper sleeper_;
    Clock clock_;

    std::mutex token_mutex_;
    std::string token_;

    Exchange execute(const std::string& method, const std::string& endpoint, const json* payload = nullptr);
    bool ensure_token(std::string& token, BrokerResult& result);
    void clear_token();
    void throttle();
    BrokerResult leg_state(int64_t order_id, LegState& state);
    BrokerResult cancel_or_liquidate(int64_t order_id);
};

} // namespace broker
} // namespace zonetrader
