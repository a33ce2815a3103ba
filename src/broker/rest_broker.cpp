#include "../../include/broker/rest_broker.hpp"
#include "../../include/util/time_utils.hpp"

#include <cmath>
#include <thread>

namespace zonetrader {
namespace broker {

namespace {

template <typename T>
std::optional<T> optional_field(const json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key) || obj[key].is_null())
        return std::nullopt;
    return obj[key].get<T>();
}

std::string failure_text(const json& body) {
    std::string text = body.value("failureReason", std::string());
    std::string detail = body.value("failureText", std::string());
    if (!detail.empty())
        text += text.empty() ? detail : ": " + detail;
    return text;
}

bool has_failure(const json& body) {
    return body.is_object() && body.contains("failureReason") && !body["failureReason"].is_null();
}

} // namespace

RestBrokerGateway::RestBrokerGateway(const RestBrokerConfig& config, IHttpTransport& transport,
                                     logging::AsyncLogger* logger)
    : config_(config), transport_(transport), logger_(logger),
      rate_limiter_(security::RateLimiter::Config{config.requests_per_second, config.requests_per_second > 0}),
      sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }),
      clock_([] { return util::now_ms(); }), token_(config.access_token) {}

Price RestBrokerGateway::round_to_tick(Price price) {
    double ticks_per_point = 1.0 / TICK_SIZE;
    return std::round(price * ticks_per_point) / ticks_per_point;
}

order::OrderStatus RestBrokerGateway::map_order_status(const std::string& ord_status) {
    if (ord_status == "Filled")
        return order::OrderStatus::Filled;
    if (ord_status == "Canceled" || ord_status == "Cancelled" || ord_status == "Rejected")
        return order::OrderStatus::Cancelled;
    // Working, Pending and anything unrecognized are still live at the venue
    return order::OrderStatus::Placed;
}

json RestBrokerGateway::build_bracket_payload(const order::Order& order, const RestBrokerConfig& config) {
    bool is_long = order.type == OrderType::Long;
    const char* action = is_long ? "Buy" : "Sell";
    const char* exit_action = is_long ? "Sell" : "Buy";

    json take_profit = {
        {"action", exit_action},
        {"orderType", "Limit"},
        {"price", round_to_tick(order.take_profit())},
    };
    json stop_loss = {
        {"action", exit_action},
        {"orderType", "Stop"},
        {"stopPrice", round_to_tick(order.stop_loss())},
    };

    return json{
        {"accountSpec", config.account_spec},
        {"accountId", config.account_id},
        {"action", action},
        {"symbol", order.contract + config.contract_month},
        {"orderQty", order.contracts},
        {"orderType", "Limit"},
        {"price", round_to_tick(order.entry_price())},
        {"isAutomated", true},
        {"bracket1", take_profit},
        {"bracket2", stop_loss},
    };
}

// ============================================================================
// Transport plumbing
// ============================================================================

void RestBrokerGateway::throttle() {
    while (!rate_limiter_.allow_request(clock_())) {
        sleeper_(std::chrono::milliseconds(security::RateLimiter::wait_ms(clock_())));
    }
}

void RestBrokerGateway::clear_token() {
    std::lock_guard<std::mutex> lock(token_mutex_);
    token_.clear();
}

bool RestBrokerGateway::ensure_token(std::string& token, BrokerResult& result) {
    std::lock_guard<std::mutex> lock(token_mutex_);
    if (!token_.empty()) {
        token = token_;
        return true;
    }

    json credentials = {
        {"name", config_.username},   {"password", config_.password}, {"appId", config_.client_id},
        {"appVersion", "1.0"},        {"cid", config_.client_id},     {"sec", config_.client_secret},
        {"deviceId", config_.device_id},
    };

    HttpRequest request;
    request.method = "POST";
    request.url = config_.base_url + "/auth/accesstokenrequest";
    request.body = credentials.dump();
    request.headers = {{"Content-Type", "application/json"}, {"Accept", "application/json"}};
    request.timeout_seconds = config_.request_timeout_seconds;

    HttpResponse response;
    try {
        response = transport_.perform(request);
    } catch (const std::exception& e) {
        result.error = BrokerErrorKind::Transport;
        result.message = std::string("Authentication request failed: ") + e.what();
        return false;
    }

    if (response.status != 200) {
        result.error = BrokerErrorKind::Definitive;
        result.http_status = response.status;
        result.message = "Authentication failed with status " + std::to_string(response.status);
        return false;
    }

    try {
        json body = json::parse(response.body);
        token_ = body.at("accessToken").get<std::string>();
    } catch (const json::exception& e) {
        result.error = BrokerErrorKind::Parse;
        result.message = std::string("Failed to parse auth response: ") + e.what();
        return false;
    }

    LOG_INFO(logger_, logging::LogCategory::Broker, "broker access token acquired");
    token = token_;
    return true;
}

RestBrokerGateway::Exchange RestBrokerGateway::execute(const std::string& method, const std::string& endpoint,
                                                       const json* payload) {
    Exchange out;
    int retries = 0;
    bool refreshed = false;

    while (true) {
        std::string token;
        if (!ensure_token(token, out.result))
            return out;

        HttpRequest request;
        request.method = method;
        request.url = config_.base_url + endpoint;
        request.body = payload ? payload->dump() : (method == "POST" ? "{}" : "");
        request.headers = {{"Authorization", "Bearer " + token},
                           {"Content-Type", "application/json"},
                           {"Accept", "application/json"}};
        request.timeout_seconds = config_.request_timeout_seconds;

        throttle();
        ++out.result.attempts;

        HttpResponse response;
        try {
            response = transport_.perform(request);
        } catch (const std::exception& e) {
            out.result.error = BrokerErrorKind::Transport;
            out.result.message = e.what();
            LOGF_WARN(logger_, logging::LogCategory::Broker, "%s %s transport failure: %s", method.c_str(),
                      endpoint.c_str(), e.what());
            return out;
        }
        out.result.http_status = response.status;

        if (response.status == 200 || response.status == 201) {
            try {
                out.body = response.body.empty() ? json::object() : json::parse(response.body);
                out.result.error = BrokerErrorKind::None;
                out.result.message.clear();
            } catch (const json::exception& e) {
                out.result.error = BrokerErrorKind::Parse;
                out.result.message = std::string("Failed to parse response: ") + e.what();
            }
            return out;
        }

        if (response.status == 401 && !refreshed) {
            // Expired access token: refresh once and resend
            refreshed = true;
            clear_token();
            continue;
        }

        if (response.status == 429 || response.status == 503) {
            if (retries < config_.max_retries) {
                int64_t delay = config_.initial_retry_delay_ms * (int64_t{1} << retries);
                LOGF_WARN(logger_, logging::LogCategory::Broker, "%s %s HTTP %d, retry in %lld ms", method.c_str(),
                          endpoint.c_str(), response.status, static_cast<long long>(delay));
                sleeper_(std::chrono::milliseconds(delay));
                ++retries;
                continue;
            }
            out.result.error = BrokerErrorKind::Transient;
            out.result.message = "Broker unavailable after " + std::to_string(out.result.attempts) +
                                 " attempts: HTTP " + std::to_string(response.status);
            LOGF_ERROR(logger_, logging::LogCategory::Broker, "%s %s gave up after %d attempts", method.c_str(),
                       endpoint.c_str(), out.result.attempts);
            return out;
        }

        out.result.error = BrokerErrorKind::Definitive;
        out.result.message = "HTTP " + std::to_string(response.status) + ": " + response.body;
        LOGF_WARN(logger_, logging::LogCategory::Broker, "%s %s failed: HTTP %d", method.c_str(), endpoint.c_str(),
                  response.status);
        return out;
    }
}

// ============================================================================
// Orders
// ============================================================================

BrokerResult RestBrokerGateway::place_bracket(const order::Order& order) {
    if (order.contracts <= 0)
        return BrokerResult::failure(BrokerErrorKind::Definitive, "Order size is zero contracts", 0, 0);

    json payload = build_bracket_payload(order, config_);
    Exchange ex = execute("POST", "/order/placeoso", &payload);
    if (!ex.result.ok())
        return ex.result;

    if (has_failure(ex.body)) {
        ex.result.error = BrokerErrorKind::Definitive;
        ex.result.message = failure_text(ex.body);
        return ex.result;
    }

    try {
        ex.result.broker_order_id = optional_field<int64_t>(ex.body, "orderId");
        ex.result.profit_leg_id = optional_field<int64_t>(ex.body, "oso1Id");
        ex.result.stop_leg_id = optional_field<int64_t>(ex.body, "oso2Id");
    } catch (const json::exception& e) {
        ex.result.error = BrokerErrorKind::Parse;
        ex.result.message = std::string("Malformed placeoso response: ") + e.what();
        return ex.result;
    }
    if (!ex.result.broker_order_id) {
        ex.result.error = BrokerErrorKind::Parse;
        ex.result.message = "placeoso response carried no orderId";
    }
    return ex.result;
}

BrokerResult RestBrokerGateway::cancel_order(const order::Order& order) {
    if (!order.broker_order_id)
        return BrokerResult::failure(BrokerErrorKind::Definitive, "Order was never placed with the broker", 0, 0);

    json payload = {{"orderId", *order.broker_order_id}, {"isAutomated", true}};
    Exchange ex = execute("POST", "/order/cancelorder", &payload);
    if (ex.result.ok() && has_failure(ex.body)) {
        ex.result.error = BrokerErrorKind::Definitive;
        ex.result.message = failure_text(ex.body);
    }
    return ex.result;
}

BrokerResult RestBrokerGateway::liquidate(const order::Order& order) {
    if (!order.broker_order_id)
        return BrokerResult::failure(BrokerErrorKind::Definitive, "Order was never placed with the broker", 0, 0);

    LegState main;
    BrokerResult lookup = leg_state(*order.broker_order_id, main);
    if (!lookup.ok())
        return lookup;

    json payload = {
        {"accountSpec", config_.account_spec}, {"accountId", config_.account_id}, {"contractId", main.contract_id},
        {"admin", false},                      {"isAutomated", true},
    };
    Exchange ex = execute("POST", "/order/liquidateposition", &payload);
    if (ex.result.ok() && has_failure(ex.body)) {
        ex.result.error = BrokerErrorKind::Definitive;
        ex.result.message = failure_text(ex.body);
    }
    return ex.result;
}

BrokerResult RestBrokerGateway::cancel_or_liquidate(int64_t order_id) {
    LegState state;
    BrokerResult result = leg_state(order_id, state);
    if (!result.ok())
        return result;

    if (state.status == order::OrderStatus::Filled) {
        json payload = {
            {"accountSpec", config_.account_spec}, {"accountId", config_.account_id},
            {"contractId", state.contract_id},     {"admin", false},
            {"isAutomated", true},
        };
        return execute("POST", "/order/liquidateposition", &payload).result;
    }
    if (state.status == order::OrderStatus::Placed) {
        json payload = {{"orderId", order_id}, {"isAutomated", true}};
        return execute("POST", "/order/cancelorder", &payload).result;
    }
    return result;
}

/**
 * Status of one order plus its volume-weighted fill from the active fills.
 */
BrokerResult RestBrokerGateway::leg_state(int64_t order_id, LegState& state) {
    Exchange item = execute("GET", "/order/item?id=" + std::to_string(order_id));
    if (!item.result.ok())
        return item.result;

    Exchange fills = execute("GET", "/fill/deps?masterid=" + std::to_string(order_id));
    if (!fills.result.ok())
        return fills.result;

    try {
        state.status = map_order_status(item.body.value("ordStatus", std::string()));
        state.contract_id = item.body.value("contractId", int64_t{0});

        double weighted = 0;
        int quantity = 0;
        std::optional<Timestamp> latest;
        for (const auto& fill : fills.body) {
            if (!fill.value("active", true))
                continue;
            int qty = fill.value("qty", 0);
            weighted += fill.value("price", 0.0) * qty;
            quantity += qty;
            if (auto ts = util::parse_utc_timestamp(fill.value("timestamp", std::string()))) {
                if (!latest || *ts > *latest)
                    latest = ts;
            }
        }
        if (quantity > 0) {
            state.fill_price = weighted / quantity;
            state.fill_timestamp = latest;
        }
    } catch (const json::exception& e) {
        item.result.error = BrokerErrorKind::Parse;
        item.result.message = std::string("Malformed order status: ") + e.what();
        return item.result;
    }
    item.result.attempts += fills.result.attempts;
    return item.result;
}

BrokerResult RestBrokerGateway::query_order(const order::Order& order, BrokerOrderReport& report) {
    if (!order.broker_order_id)
        return BrokerResult::failure(BrokerErrorKind::Definitive, "Order was never placed with the broker", 0, 0);

    LegState main;
    BrokerResult result = leg_state(*order.broker_order_id, main);
    if (!result.ok())
        return result;

    report.entry_fill_price = main.fill_price;
    report.entry_fill_timestamp = main.fill_timestamp;

    if (main.status != order::OrderStatus::Filled) {
        report.status = main.status;
        return result;
    }
    if (!order.broker_profit_leg_id || !order.broker_stop_leg_id) {
        report.status = order::OrderStatus::Filled;
        return result;
    }

    LegState profit;
    LegState stop;
    BrokerResult profit_lookup = leg_state(*order.broker_profit_leg_id, profit);
    if (!profit_lookup.ok())
        return profit_lookup;
    BrokerResult stop_lookup = leg_state(*order.broker_stop_leg_id, stop);
    if (!stop_lookup.ok())
        return stop_lookup;

    if (profit.status == order::OrderStatus::Filled) {
        report.status = order::OrderStatus::Profit;
        report.exit_price = profit.fill_price;
        report.exit_timestamp = profit.fill_timestamp;
    } else if (stop.status == order::OrderStatus::Filled) {
        // A trailed stop can close in profit
        bool in_profit = false;
        if (stop.fill_price) {
            in_profit = order.type == OrderType::Long ? *stop.fill_price > order.entry_price()
                                                      : *stop.fill_price < order.entry_price();
        }
        report.status = in_profit ? order::OrderStatus::Profit : order::OrderStatus::Loss;
        report.exit_price = stop.fill_price;
        report.exit_timestamp = stop.fill_timestamp;
    } else if (profit.status == order::OrderStatus::Placed && stop.status == order::OrderStatus::Placed) {
        report.status = order::OrderStatus::Filled;
    } else {
        // Legs are in a state the bracket should never reach: flatten everything
        LOGF_ERROR(logger_, logging::LogCategory::Broker, "order %lld has broken bracket legs, flattening",
                   static_cast<long long>(*order.broker_order_id));
        BrokerResult flatten = cancel_or_liquidate(*order.broker_order_id);
        if (!flatten.ok())
            return flatten;
        report.status = order::OrderStatus::Cancelled;
    }
    return result;
}

std::optional<double> RestBrokerGateway::account_balance() {
    Exchange ex = execute("GET", "/cashBalance/list");
    if (!ex.result.ok() || !ex.body.is_array() || ex.body.empty()) {
        LOGF_WARN(logger_, logging::LogCategory::Broker, "cash balance unavailable: %s", ex.result.message.c_str());
        return std::nullopt;
    }
    try {
        return ex.body.front().at("amount").get<double>();
    } catch (const json::exception& e) {
        LOGF_WARN(logger_, logging::LogCategory::Broker, "malformed cash balance: %s", e.what());
        return std::nullopt;
    }
}

// ============================================================================
// Account listings
// ============================================================================

BrokerResult RestBrokerGateway::list_orders(std::vector<BrokerOrderSummary>& out) {
    Exchange ex = execute("GET", "/order/list");
    if (!ex.result.ok())
        return ex.result;
    try {
        for (const auto& item : ex.body) {
            BrokerOrderSummary summary;
            summary.id = item.at("id").get<int64_t>();
            summary.contract_id = item.value("contractId", int64_t{0});
            summary.action = item.value("action", std::string());
            summary.status = item.value("ordStatus", std::string());
            out.push_back(summary);
        }
    } catch (const json::exception& e) {
        ex.result.error = BrokerErrorKind::Parse;
        ex.result.message = e.what();
    }
    return ex.result;
}

BrokerResult RestBrokerGateway::list_positions(std::vector<BrokerPosition>& out) {
    Exchange ex = execute("GET", "/position/list");
    if (!ex.result.ok())
        return ex.result;
    try {
        for (const auto& item : ex.body) {
            BrokerPosition position;
            position.id = item.at("id").get<int64_t>();
            position.contract_id = item.value("contractId", int64_t{0});
            position.net_position = item.value("netPos", 0);
            position.bought = item.value("bought", 0);
            position.sold = item.value("sold", 0);
            position.bought_value = item.value("boughtValue", 0.0);
            position.sold_value = item.value("soldValue", 0.0);
            out.push_back(position);
        }
    } catch (const json::exception& e) {
        ex.result.error = BrokerErrorKind::Parse;
        ex.result.message = e.what();
    }
    return ex.result;
}

BrokerResult RestBrokerGateway::list_fills(std::vector<BrokerFill>& out) {
    Exchange ex = execute("GET", "/fill/list");
    if (!ex.result.ok())
        return ex.result;
    try {
        for (const auto& item : ex.body) {
            BrokerFill fill;
            fill.id = item.at("id").get<int64_t>();
            fill.order_id = item.value("orderId", int64_t{0});
            fill.contract_id = item.value("contractId", int64_t{0});
            fill.timestamp = util::parse_utc_timestamp(item.value("timestamp", std::string()));
            fill.action = item.value("action", std::string());
            fill.quantity = item.value("qty", 0);
            fill.price = item.value("price", 0.0);
            fill.active = item.value("active", true);
            out.push_back(fill);
        }
    } catch (const json::exception& e) {
        ex.result.error = BrokerErrorKind::Parse;
        ex.result.message = e.what();
    }
    return ex.result;
}

} // namespace broker
} // namespace zonetrader
