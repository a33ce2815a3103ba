/**
 * ZoneTrader
 *
 * Streams 1-minute candles through the zone and order pipeline and fans the
 * resulting events out to WebSocket clients. Planning replays and
 * backtests are started over WebSocket (PLAN/TRADE) or the HTTP control
 * API; their events are kept under the events directory for reports.
 *
 * Usage:
 *   zonetrader --candles es_1m.csv --candles-5m es_5m.csv
 *   zonetrader --mode backtest --date 2024-03-14 --candles es_1m.csv
 *   feed_candles | zonetrader --mode live --broker rest
 */

#include "../include/api/control_api.hpp"
#include "../include/api/control_server.hpp"
#include "../include/api/phase_runner.hpp"
#include "../include/broker/async_broker.hpp"
#include "../include/broker/http_transport.hpp"
#include "../include/broker/rest_broker.hpp"
#include "../include/broker/simulated_broker.hpp"
#include "../include/config/engine_config.hpp"
#include "../include/core/event_pipeline.hpp"
#include "../include/core/replay_coordinator.hpp"
#include "../include/distribution/event_distributor.hpp"
#include "../include/distribution/ws_server.hpp"
#include "../include/logging/async_logger.hpp"
#include "../include/market/candle_source.hpp"
#include "../include/report/daily_report.hpp"
#include "../include/report/event_store.hpp"
#include "../include/util/cli.hpp"
#include "../include/util/system.hpp"

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace zonetrader;
using zonetrader::util::CLIArgs;
using zonetrader::util::RunMode;

namespace {

std::atomic<bool> g_running{true};

// ============================================================================
// Setup helpers
// ============================================================================

config::AppConfig build_config(const CLIArgs& args) {
    config::AppConfig cfg;
    if (!args.config_path.empty())
        cfg = config::load_config(args.config_path);
    config::apply_environment(cfg);

    if (args.days > 0)
        cfg.replay.default_plan_days = args.days;
    if (args.ws_port > 0)
        cfg.websocket.port = args.ws_port;
    if (args.http_port > 0)
        cfg.control.port = args.http_port;
    if (args.balance) {
        cfg.pipeline.decision.starting_balance = *args.balance;
        cfg.broker.simulated.starting_balance = *args.balance;
    }
    if (!args.broker.empty())
        cfg.broker.kind = args.broker;
    if (!args.events_dir.empty())
        cfg.events_dir = args.events_dir;
    if (args.verbose)
        cfg.log_level = "debug";
    return cfg;
}

std::unique_ptr<market::ICandleSource> open_candles(const std::string& path, Timestamp duration_ms) {
    if (path.empty())
        return std::make_unique<market::VectorCandleSource>(std::vector<market::Candle>{});
    return std::make_unique<market::CsvCandleSource>(path, duration_ms);
}

void print_report(const util::Date& date, const report::OrderReport& r) {
    std::cout << "\n================================================================\n";
    std::cout << "  Report " << util::format_date(date) << "\n";
    std::cout << "================================================================\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  Orders:        " << r.orders.size() << " (" << r.winning << " won, " << r.losing << " lost, "
              << r.cancelled << " cancelled)\n";
    std::cout << "  Win rate:      " << r.win_rate() * 100.0 << "%\n";
    std::cout << "  Total R:       " << r.total_r << "\n";
    std::cout << "  Avg win:       $" << r.average_win_dollars << "\n";
    std::cout << "  Avg loss:      $" << r.average_loss_dollars << "\n";
    std::cout << "  Max drawdown:  $" << r.max_drawdown_dollars << "\n";
    std::cout << "  Gross P&L:     $" << r.total_pnl << "\n";
    std::cout << "  Fees:          $" << r.total_fees << "\n";
    std::cout << "  Net P&L:       $" << r.net_pnl() << "\n";
    for (const auto& s : r.strategies) {
        std::cout << "    " << std::left << std::setw(36) << s.entry_strategy << std::right << s.wins << "W/"
                  << s.losses << "L  " << s.total_r << "R\n";
    }
    std::cout << "================================================================\n";
}

// stdin CSV rows into the live feed until EOF or shutdown
void read_stdin_candles(std::shared_ptr<market::LiveCandleFeed> feed, logging::AsyncLogger* logger) {
    std::string line;
    uint64_t rejected = 0;
    while (g_running && std::getline(std::cin, line)) {
        if (auto candle = market::parse_candle_csv_row(line))
            feed->push(*candle);
        else if (++rejected % 100 == 1)
            LOGF_WARN(logger, logging::LogCategory::System, "Skipped unparseable candle row (%llu so far)",
                      static_cast<unsigned long long>(rejected));
    }
    feed->close();
}

// ============================================================================
// Run
// ============================================================================

int run(const CLIArgs& args) {
    config::AppConfig cfg = build_config(args);

    logging::AsyncLogger logger;
    logger.set_min_level(logging::level_from_string(cfg.log_level.c_str()));
    logger.start();

    std::optional<util::Date> date;
    if (!args.date.empty()) {
        date = util::parse_date(args.date);
        if (!date) {
            std::cerr << "Invalid --date: " << args.date << "\n";
            return 1;
        }
    }
    if ((args.mode == RunMode::Plan || args.mode == RunMode::Backtest) && !date) {
        std::cerr << "--date is required for --mode " << util::run_mode_to_string(args.mode) << "\n";
        return 1;
    }

    std::cout << "\nZoneTrader - " << util::run_mode_to_string(args.mode) << " mode, " << cfg.broker.kind
              << " broker\n";
    std::cout << "================================================================\n\n";

    auto minute_candles = open_candles(args.candles_path, MS_PER_MINUTE);
    auto five_minute_candles = open_candles(args.candles_5m_path, 5 * MS_PER_MINUTE);

    // Backtests always fill against the simulator; the configured broker serves the live stream
    broker::SimulatedBroker backtest_broker(cfg.broker.simulated);
    broker::SimulatedBroker simulated(cfg.broker.simulated);
    std::unique_ptr<broker::CurlTransport> transport;
    std::unique_ptr<broker::RestBrokerGateway> rest;
    std::unique_ptr<broker::AsyncBrokerGateway> rest_thread;
    broker::IBrokerGateway* gateway = &simulated;
    if (cfg.broker.kind == "rest") {
        transport = std::make_unique<broker::CurlTransport>();
        rest = std::make_unique<broker::RestBrokerGateway>(cfg.broker.rest, *transport, &logger);
        // HTTP, retries and backoff stay off the candle thread
        rest_thread = std::make_unique<broker::AsyncBrokerGateway>(*rest, &logger);
        rest_thread->start();
        gateway = rest_thread.get();
    }

    report::EventStore store(cfg.events_dir, &logger);
    store.load();

    distribution::EventDistributor distributor(cfg.distributor, &logger);
    core::ReplayCoordinator coordinator(*minute_candles, *five_minute_candles, cfg.pipeline, cfg.replay, &logger);

    api::PhaseRunner runner(coordinator, store, distributor, &logger);
    runner.set_broker(&backtest_broker);
    runner.set_mode(util::run_mode_to_string(args.mode));
    distributor.set_command_handler(
        [&runner](distribution::SubscriberId from, const distribution::ControlCommand& command) {
            runner.on_command(from, command);
        });
    distributor.set_disconnect_handler([&runner](distribution::SubscriberId id) { runner.on_disconnect(id); });
    distributor.start();

    // One-shot modes
    if (args.mode == RunMode::Plan || args.mode == RunMode::Backtest) {
        util::install_shutdown_handler(g_running);
        std::thread watchdog([&runner] {
            util::wait_for_shutdown(g_running);
            runner.stop();
        });

        int days = cfg.replay.default_plan_days;
        std::optional<core::RunOutcome> outcome;
        if (runner.start(core::Phase::Planning, *date, days) == api::StartResult::Accepted)
            outcome = runner.wait();
        if (args.mode == RunMode::Backtest && outcome == core::RunOutcome::Completed) {
            outcome.reset();
            if (runner.start(core::Phase::Trading, *date, days) == api::StartResult::Accepted)
                outcome = runner.wait();
            if (outcome == core::RunOutcome::Completed)
                print_report(*date, report::ReportService(store, cfg.report).daily(*date));
        }

        g_running = false;
        watchdog.join();
        distributor.stop();
        logger.stop();
        std::cout << "Finished: " << (outcome ? core::run_outcome_to_string(*outcome) : "not started") << "\n";
        return outcome == core::RunOutcome::Completed ? 0 : 2;
    }

    // Serving modes
    distribution::WebSocketServer ws_server(distributor, cfg.websocket, &logger);
    api::ControlApi control_api(store, runner, &logger, {}, cfg.report);
    api::ControlServer control_server(control_api, cfg.control, &logger);
    try {
        ws_server.start();
        control_server.start();
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        ws_server.stop();
        distributor.stop();
        logger.stop();
        return 1;
    }
    std::cout << "[WS] Events on port " << cfg.websocket.port << "\n";
    std::cout << "[HTTP] Control API on port " << cfg.control.port << "\n";

    util::install_shutdown_handler(g_running);

    std::shared_ptr<market::LiveCandleFeed> feed;
    std::unique_ptr<core::EventPipeline> live;
    std::thread live_thread;
    std::thread reader_thread;
    if (args.mode == RunMode::Live) {
        feed = std::make_shared<market::LiveCandleFeed>();
        live = std::make_unique<core::EventPipeline>(
            core::Phase::Trading, cfg.pipeline,
            [&store, &distributor](const core::Event& event) {
                store.add(event);
                distributor.publish(event);
            },
            &logger);
        live->attach_broker(gateway);
        runner.set_live_snapshot([&live] { return live->snapshot(); });

        live_thread = std::thread([&] {
            core::RunOutcome outcome = live->run_live(*feed, 0);
            LOGF_INFO(&logger, logging::LogCategory::System, "Live stream ended: %s",
                      core::run_outcome_to_string(outcome));
            g_running = false;
        });
        // The reader can outlive run(), so it gets no logger
        reader_thread = std::thread(read_stdin_candles, feed, nullptr);
        std::cout << "[LIVE] Reading candles from stdin\n";
    }

    std::cout << "\nPress Ctrl+C to stop\n";
    util::wait_for_shutdown(g_running);

    std::cout << "\n[SHUTDOWN] Stopping (" << util::signal_name(util::shutdown_signal()) << ")...\n";
    runner.stop();
    runner.wait();
    if (live) {
        live->cancel();
        feed->close();
        live_thread.join();
        // The reader may be blocked on stdin; it exits with the process
        reader_thread.detach();
    }
    if (rest_thread)
        rest_thread->stop();
    control_server.stop();
    ws_server.stop();
    distributor.stop();

    auto stats = distributor.stats();
    std::cout << "Published " << stats.published << " events, delivered " << stats.delivered << ", evicted "
              << stats.evicted << "\n";
    logger.stop();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CLIArgs args;
    if (!util::parse_args(argc, argv, args))
        return 1;

    if (args.help) {
        util::print_help();
        return 0;
    }

    try {
        return run(args);
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << "\n";
        return 1;
    }
}
