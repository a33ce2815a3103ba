#pragma once

#include "../api/control_server.hpp"
#include "../broker/rest_broker.hpp"
#include "../broker/simulated_broker.hpp"
#include "../core/event_pipeline.hpp"
#include "../core/replay_coordinator.hpp"
#include "../distribution/event_distributor.hpp"
#include "../distribution/ws_server.hpp"
#include "../report/daily_report.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace zonetrader {
namespace config {

using json = nlohmann::json;

struct BrokerConfig {
    std::string kind = "sim"; // "sim" or "rest"
    broker::SimulatedBroker::Config simulated;
    broker::RestBrokerConfig rest;
};

struct AppConfig {
    core::PipelineConfig pipeline;
    core::ReplayConfig replay;
    distribution::DistributorConfig distributor;
    distribution::WsServerConfig websocket;
    api::ControlConfig control;
    BrokerConfig broker;
    report::ReportConfig report;
    std::string events_dir = "events";
    std::string log_level = "info";
};

/**
 * JSON config file, one object per section:
 *
 * {
 *   "analysis":    {"rsi_period": 14, ...},
 *   "stream":      {"max_candles": 500, ...},
 *   "decision":    {"min_signal_score": 75, ...},
 *   "lifecycle":   {"unfilled_timeout_ms": 120000, ...},
 *   "replay":      {"default_plan_days": 2, ...},
 *   "distributor": {"max_pending_events": 10000, ...},
 *   "websocket":   {"port": 8081, ...},
 *   "control":     {"port": 8080, ...},
 *   "broker":      {"kind": "sim", "simulated": {...}, "rest": {...}},
 *   "report":      {"fee_per_es_contract": 2.88, ...},
 *   "events_dir":  "events"
 * }
 *
 * Absent keys keep their defaults. A key with the wrong type is an error.
 */
class ConfigParser {
public:
    // Throws std::runtime_error when the file cannot be read or parsed
    static AppConfig load(const std::string& filename);
    static AppConfig parse(const std::string& text);
    static AppConfig from_json(const json& j);

    static void save(const std::string& filename, const AppConfig& config);
};

json to_json(const AppConfig& config);

inline AppConfig load_config(const std::string& filename) { return ConfigParser::load(filename); }

/**
 * ZONETRADER_BROKER_* environment variables override the file's broker
 * credentials. Returns the number of variables applied.
 */
int apply_environment(AppConfig& config);

} // namespace config
} // namespace zonetrader
