#include "../../include/config/engine_config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace zonetrader {
namespace config {

namespace {

// Field visitors shared by reading and writing so the two never drift apart

struct Reader {
    const json& section;

    template <typename T>
    void operator()(const char* key, T& field) const {
        auto it = section.find(key);
        if (it != section.end())
            field = it->template get<T>();
    }
};

struct Writer {
    json& section;

    template <typename T>
    void operator()(const char* key, const T& field) const {
        section[key] = field;
    }
};

template <typename Io, typename Config>
void visit_analysis(Io& io, Config& c) {
    io("trend_period", c.trend_period);
    io("short_ma_period", c.short_ma_period);
    io("long_ma_period", c.long_ma_period);
    io("rsi_period", c.rsi_period);
    io("stochastics_k_period", c.stochastics_k_period);
    io("stochastics_d_period", c.stochastics_d_period);
    io("williams_r_period", c.williams_r_period);
    io("cci_period", c.cci_period);
    io("atr_period", c.atr_period);
    io("keltner_period", c.keltner_period);
    io("keltner_multiplier", c.keltner_multiplier);
    io("bollinger_period", c.bollinger_period);
    io("bollinger_multiplier", c.bollinger_multiplier);
    io("std_dev_period", c.std_dev_period);
    io("profile_levels", c.profile_levels);
    io("relative_volume_lookback", c.relative_volume_lookback);
    io("volume_trend_periods", c.volume_trend_periods);
    io("obv_window", c.obv_window);
    io("lookback_candles", c.lookback_candles);
}

template <typename Io, typename Config>
void visit_stream(Io& io, Config& c) {
    io("max_candles", c.max_candles);
    io("swing_confirmations", c.swing_confirmations);
    io("max_swings", c.max_swings);
    io("max_liquidity_history", c.max_liquidity_history);
    io("max_plan_zones", c.max_plan_zones);
    io("max_closed_history", c.max_closed_history);
    io("emit_analysis", c.emit_analysis);
}

template <typename Io, typename Config>
void visit_decision(Io& io, Config& c) {
    io("min_signal_score", c.min_signal_score);
    io("breakout_min_score", c.breakout_min_score);
    io("max_daily_r", c.max_daily_r);
    io("blackout_enabled", c.blackout_enabled);
    io("blackout_start_hour", c.blackout_start_hour);
    io("blackout_end_hour", c.blackout_end_hour);
    io("min_candles", c.min_candles);
    io("min_analytics", c.min_analytics);
    io("trending_min_adx", c.trending_min_adx);
    io("ranging_max_adx", c.ranging_max_adx);
    io("ma_cross_lookback", c.ma_cross_lookback);
    io("volume_floor", c.volume_floor);
    io("breakout_relative_volume", c.breakout_relative_volume);
    io("trend_atr_multiplier", c.trend_atr_multiplier);
    io("breakout_atr_multiplier", c.breakout_atr_multiplier);
    io("ranging_atr_multiplier", c.ranging_atr_multiplier);
    io("profit_multiplier", c.profit_multiplier);
    io("starting_balance", c.starting_balance);
}

template <typename Io, typename Config>
void visit_lifecycle(Io& io, Config& c) {
    io("unfilled_timeout_ms", c.unfilled_timeout_ms);
    io("flatten_at_end_of_day", c.flatten_at_end_of_day);
}

template <typename Io, typename Config>
void visit_replay(Io& io, Config& c) {
    io("default_plan_days", c.default_plan_days);
    io("trade_warmup_ms", c.trade_warmup_ms);
    io("trade_candle_ms", c.trade_candle_ms);
}

template <typename Io, typename Config>
void visit_distributor(Io& io, Config& c) {
    io("max_pending_events", c.max_pending_events);
    io("eviction_log_interval", c.eviction_log_interval);
}

template <typename Io, typename Config>
void visit_websocket(Io& io, Config& c) {
    io("port", c.port);
    io("max_queued_messages", c.max_queued_messages);
    io("rx_buffer_size", c.rx_buffer_size);
}

template <typename Io, typename Config>
void visit_control(Io& io, Config& c) {
    io("host", c.host);
    io("port", c.port);
    io("enable_cors", c.enable_cors);
}

template <typename Io, typename Config>
void visit_simulated(Io& io, Config& c) {
    io("starting_balance", c.starting_balance);
    io("fee_per_es_contract", c.fee_per_es_contract);
    io("fee_per_mes_contract", c.fee_per_mes_contract);
}

// Credentials are not written back; they belong in the environment
template <typename Io, typename Config>
void visit_rest(Io& io, Config& c) {
    io("base_url", c.base_url);
    io("account_id", c.account_id);
    io("account_spec", c.account_spec);
    io("contract_month", c.contract_month);
    io("max_retries", c.max_retries);
    io("initial_retry_delay_ms", c.initial_retry_delay_ms);
    io("request_timeout_seconds", c.request_timeout_seconds);
    io("requests_per_second", c.requests_per_second);
}

template <typename Io, typename Config>
void visit_report(Io& io, Config& c) {
    io("fee_per_es_contract", c.fee_per_es_contract);
    io("fee_per_mes_contract", c.fee_per_mes_contract);
}

template <typename Config, typename Visit>
void read_section(const json& root, const char* name, Config& config, Visit visit) {
    auto it = root.find(name);
    if (it == root.end())
        return;
    if (!it->is_object())
        throw std::runtime_error(std::string("Config section '") + name + "' must be an object");
    Reader reader{*it};
    visit(reader, config);
}

template <typename Config, typename Visit>
json write_section(const Config& config, Visit visit) {
    json section = json::object();
    Writer writer{section};
    visit(writer, config);
    return section;
}

} // namespace

AppConfig ConfigParser::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filename);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

AppConfig ConfigParser::parse(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded())
        throw std::runtime_error("Config is not valid JSON");
    return from_json(j);
}

AppConfig ConfigParser::from_json(const json& j) {
    if (!j.is_object())
        throw std::runtime_error("Config root must be an object");

    AppConfig config;
    try {
        read_section(j, "analysis", config.pipeline.analysis,
                     [](auto& io, auto& c) { visit_analysis(io, c); });
        read_section(j, "stream", config.pipeline.stream, [](auto& io, auto& c) { visit_stream(io, c); });
        read_section(j, "decision", config.pipeline.decision, [](auto& io, auto& c) { visit_decision(io, c); });
        read_section(j, "lifecycle", config.pipeline.lifecycle,
                     [](auto& io, auto& c) { visit_lifecycle(io, c); });
        read_section(j, "replay", config.replay, [](auto& io, auto& c) { visit_replay(io, c); });
        read_section(j, "distributor", config.distributor, [](auto& io, auto& c) { visit_distributor(io, c); });
        read_section(j, "websocket", config.websocket, [](auto& io, auto& c) { visit_websocket(io, c); });
        read_section(j, "control", config.control, [](auto& io, auto& c) { visit_control(io, c); });
        read_section(j, "report", config.report, [](auto& io, auto& c) { visit_report(io, c); });

        auto broker = j.find("broker");
        if (broker != j.end()) {
            if (!broker->is_object())
                throw std::runtime_error("Config section 'broker' must be an object");
            Reader reader{*broker};
            reader("kind", config.broker.kind);
            read_section(*broker, "simulated", config.broker.simulated,
                         [](auto& io, auto& c) { visit_simulated(io, c); });
            read_section(*broker, "rest", config.broker.rest, [](auto& io, auto& c) { visit_rest(io, c); });
        }

        Reader root{j};
        root("events_dir", config.events_dir);
        root("log_level", config.log_level);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    if (config.broker.kind != "sim" && config.broker.kind != "rest")
        throw std::runtime_error("broker.kind must be 'sim' or 'rest', got '" + config.broker.kind + "'");
    return config;
}

void ConfigParser::save(const std::string& filename, const AppConfig& config) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot create config file: " + filename);
    }
    file << to_json(config).dump(2) << "\n";
}

json to_json(const AppConfig& config) {
    json j;
    j["analysis"] = write_section(config.pipeline.analysis, [](auto& io, auto& c) { visit_analysis(io, c); });
    j["stream"] = write_section(config.pipeline.stream, [](auto& io, auto& c) { visit_stream(io, c); });
    j["decision"] = write_section(config.pipeline.decision, [](auto& io, auto& c) { visit_decision(io, c); });
    j["lifecycle"] = write_section(config.pipeline.lifecycle, [](auto& io, auto& c) { visit_lifecycle(io, c); });
    j["replay"] = write_section(config.replay, [](auto& io, auto& c) { visit_replay(io, c); });
    j["distributor"] = write_section(config.distributor, [](auto& io, auto& c) { visit_distributor(io, c); });
    j["websocket"] = write_section(config.websocket, [](auto& io, auto& c) { visit_websocket(io, c); });
    j["control"] = write_section(config.control, [](auto& io, auto& c) { visit_control(io, c); });
    j["report"] = write_section(config.report, [](auto& io, auto& c) { visit_report(io, c); });
    j["broker"] = {
        {"kind", config.broker.kind},
        {"simulated", write_section(config.broker.simulated, [](auto& io, auto& c) { visit_simulated(io, c); })},
        {"rest", write_section(config.broker.rest, [](auto& io, auto& c) { visit_rest(io, c); })},
    };
    j["events_dir"] = config.events_dir;
    j["log_level"] = config.log_level;
    return j;
}

int apply_environment(AppConfig& config) {
    int applied = 0;
    auto apply = [&applied](const char* name, std::string& field) {
        if (const char* value = std::getenv(name)) {
            field = value;
            ++applied;
        }
    };

    broker::RestBrokerConfig& rest = config.broker.rest;
    apply("ZONETRADER_BROKER_USERNAME", rest.username);
    apply("ZONETRADER_BROKER_PASSWORD", rest.password);
    apply("ZONETRADER_BROKER_CLIENT_ID", rest.client_id);
    apply("ZONETRADER_BROKER_SECRET", rest.client_secret);
    apply("ZONETRADER_BROKER_DEVICE_ID", rest.device_id);
    apply("ZONETRADER_BROKER_ACCOUNT_SPEC", rest.account_spec);
    apply("ZONETRADER_BROKER_URL", rest.base_url);

    if (const char* value = std::getenv("ZONETRADER_BROKER_ACCOUNT_ID")) {
        char* end = nullptr;
        long long id = std::strtoll(value, &end, 10);
        if (end == value || *end != '\0')
            throw std::runtime_error(std::string("ZONETRADER_BROKER_ACCOUNT_ID is not a number: ") + value);
        rest.account_id = id;
        ++applied;
    }
    return applied;
}

} // namespace config
} // namespace zonetrader
