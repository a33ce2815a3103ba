#pragma once

#include "../logging/async_logger.hpp"
#include "control_api.hpp"

#include <memory>
#include <string>
#include <thread>

namespace httplib {
class Server;
}

namespace zonetrader {
namespace api {

struct ControlConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    bool enable_cors = true;
};

/**
 * ControlServer - cpp-httplib front end for ControlApi
 *
 * Endpoints:
 *   PUT  /phase/start   {phase, tradingDate, days}
 *   PUT  /phase/stop
 *   GET  /events?date=YYYY-MM-DD&phase=planning|trading
 *   GET  /report[?date=YYYY-MM-DD]
 *   GET  /dates
 *   GET  /status
 *   GET  /health
 */
class ControlServer {
public:
    ControlServer(ControlApi& api, const ControlConfig& config = ControlConfig{},
                  logging::AsyncLogger* logger = nullptr);
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    // Listens on a background thread; throws std::runtime_error if the port cannot be bound
    void start();
    void stop();

    bool is_running() const;

private:
    ControlApi& api_;
    ControlConfig config_;
    logging::AsyncLogger* logger_;
    std::unique_ptr<httplib::Server> server_;
    std::thread listen_thread_;

    void setup_routes();
};

} // namespace api
} // namespace zonetrader
