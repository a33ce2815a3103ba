#pragma once

/**
 * CLI utilities for the zonetrader executable
 *
 * Provides command-line argument parsing and related utilities.
 */

#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace zonetrader {
namespace util {

enum class RunMode : uint8_t {
    Serve = 0,    // wait for PLAN/TRADE commands over WebSocket or HTTP
    Plan = 1,     // run one planning replay and exit
    Backtest = 2, // plan then trade one date and exit
    Live = 3,     // stream candles pushed from stdin CSV
};

inline const char* run_mode_to_string(RunMode mode) {
    switch (mode) {
    case RunMode::Serve:
        return "serve";
    case RunMode::Plan:
        return "plan";
    case RunMode::Backtest:
        return "backtest";
    case RunMode::Live:
        return "live";
    default:
        return "unknown";
    }
}

inline std::optional<RunMode> run_mode_from_string(const std::string& name) {
    if (name == "serve")
        return RunMode::Serve;
    if (name == "plan")
        return RunMode::Plan;
    if (name == "backtest")
        return RunMode::Backtest;
    if (name == "live")
        return RunMode::Live;
    return std::nullopt;
}

/**
 * Command-line arguments. Options left unset fall back to the config file.
 */
struct CLIArgs {
    bool help = false;
    bool verbose = false;
    RunMode mode = RunMode::Serve;
    std::string config_path;
    std::string candles_path;    // 1-minute CSV
    std::string candles_5m_path; // 5-minute CSV
    std::string date;            // YYYY-MM-DD
    int days = 0;                // 0 = config default
    int ws_port = 0;
    int http_port = 0;
    std::optional<double> balance;
    std::string broker;          // "sim" or "rest"
    std::string events_dir;
};

inline void print_help() {
    std::cout << R"(
ZoneTrader - zone planning and order streaming engine
=====================================================

Usage: zonetrader [options]

Modes:
  --mode serve           (default) Serve PLAN/TRADE requests over WebSocket and HTTP
  --mode plan            Run one planning replay for --date and exit
  --mode backtest        Plan then trade --date and exit
  --mode live            Stream 1-minute candles read as CSV from stdin

Options:
  --config FILE          JSON config file
  --candles FILE         1-minute candle CSV (timestamp,open,high,low,close,volume)
  --candles-5m FILE      5-minute candle CSV for the trading replay
  --date YYYY-MM-DD      Trading date for plan/backtest
  --days N               Planning days (default: 2)
  --ws-port N            WebSocket port (default: 8081)
  --http-port N          HTTP control port (default: 8080)
  --balance USD          Starting balance for risk sizing
  --broker sim|rest      Broker gateway (default: sim)
  --events-dir DIR       Where event JSONL files are kept (default: events)
  -v, --verbose          Debug logging
  -h, --help             Show this help

Environment:
  ZONETRADER_BROKER_USERNAME, _PASSWORD, _CLIENT_ID, _SECRET, _DEVICE_ID,
  _ACCOUNT_ID, _ACCOUNT_SPEC, _URL   override the REST broker settings

Examples:
  zonetrader --candles es_1m.csv --candles-5m es_5m.csv
  zonetrader --mode backtest --date 2024-03-14 --candles es_1m.csv --candles-5m es_5m.csv
)";
}

/**
 * Parse command-line arguments into CLIArgs struct.
 *
 * @return true if parsing succeeded, false on error (message printed)
 */
inline bool parse_args(int argc, char* argv[], CLIArgs& args) {
    auto number = [](const std::string& option, const char* value, auto parse) -> bool {
        try {
            parse(std::string(value));
            return true;
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << option << ": " << value << "\n";
            return false;
        }
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        } else if (arg == "--mode" && has_value) {
            auto mode = run_mode_from_string(argv[++i]);
            if (!mode) {
                std::cerr << "Unknown mode: " << argv[i] << "\n";
                return false;
            }
            args.mode = *mode;
        } else if (arg == "--config" && has_value) {
            args.config_path = argv[++i];
        } else if (arg == "--candles" && has_value) {
            args.candles_path = argv[++i];
        } else if (arg == "--candles-5m" && has_value) {
            args.candles_5m_path = argv[++i];
        } else if (arg == "--date" && has_value) {
            args.date = argv[++i];
        } else if (arg == "--days" && has_value) {
            if (!number(arg, argv[++i], [&](const std::string& v) { args.days = std::stoi(v); }))
                return false;
        } else if (arg == "--ws-port" && has_value) {
            if (!number(arg, argv[++i], [&](const std::string& v) { args.ws_port = std::stoi(v); }))
                return false;
        } else if (arg == "--http-port" && has_value) {
            if (!number(arg, argv[++i], [&](const std::string& v) { args.http_port = std::stoi(v); }))
                return false;
        } else if (arg == "--balance" && has_value) {
            if (!number(arg, argv[++i], [&](const std::string& v) { args.balance = std::stod(v); }))
                return false;
        } else if (arg == "--broker" && has_value) {
            args.broker = argv[++i];
            if (args.broker != "sim" && args.broker != "rest") {
                std::cerr << "Unknown broker: " << args.broker << "\n";
                return false;
            }
        } else if (arg == "--events-dir" && has_value) {
            args.events_dir = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information.\n";
            return false;
        }
    }
    return true;
}

} // namespace util
} // namespace zonetrader
