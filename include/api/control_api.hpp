#pragma once

#include "../core/event.hpp"
#include "../logging/async_logger.hpp"
#include "../report/daily_report.hpp"
#include "../report/event_store.hpp"
#include "../util/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>

namespace zonetrader {
namespace api {

using json = nlohmann::json;

enum class StartResult : uint8_t {
    Accepted = 0,
    Busy = 1,     // another phase is running
    Rejected = 2, // controller refused (no data source for the phase)
};

inline const char* start_result_to_string(StartResult result) {
    switch (result) {
    case StartResult::Accepted:
        return "Accepted";
    case StartResult::Busy:
        return "Busy";
    case StartResult::Rejected:
        return "Rejected";
    default:
        return "Unknown";
    }
}

struct PhaseStatus {
    bool running = false;
    std::optional<core::Phase> phase;
    std::optional<util::Date> trading_date;
    std::string mode;
};

/**
 * Whatever runs replays: the executable wires this to the replay
 * coordinator. Calls come from HTTP worker threads.
 */
class IPhaseController {
public:
    virtual ~IPhaseController() = default;

    virtual StartResult start(core::Phase phase, const util::Date& date, int days) = 0;
    // Returns false when nothing was running
    virtual bool stop() = 0;
    virtual PhaseStatus status() const = 0;
};

struct ApiResponse {
    int status = 200;
    std::string body;

    static ApiResponse ok(const json& j, int status = 200) { return {status, j.dump()}; }
    static ApiResponse error(int status, const std::string& message) {
        return {status, json{{"error", message}}.dump()};
    }
};

/**
 * ControlApi - request handling behind the HTTP control surface
 *
 * Transport-free: takes decoded parameters, returns status and JSON body.
 * ControlServer maps routes onto these methods.
 */
class ControlApi {
public:
    using TodayFn = std::function<util::Date()>;

    ControlApi(report::EventStore& store, IPhaseController& controller, logging::AsyncLogger* logger = nullptr,
               TodayFn today = TodayFn(), const report::ReportConfig& report_config = report::ReportConfig{});

    // PUT /phase/start  {"phase": "planning"|"trading", "tradingDate": "YYYY-MM-DD", "days": N}
    ApiResponse start_phase(const std::string& body);

    // PUT /phase/stop
    ApiResponse stop_phase();

    // GET /events?date=&phase=
    ApiResponse events(const std::string& date, const std::string& phase) const;

    // GET /report?date=   (no date: aggregate over all stored dates)
    ApiResponse report(const std::string& date) const;

    // GET /dates
    ApiResponse dates() const;

    // GET /status
    ApiResponse status() const;

    // GET /health
    ApiResponse health() const;

private:
    report::EventStore& store_;
    IPhaseController& controller_;
    logging::AsyncLogger* logger_;
    TodayFn today_;
    report::ReportService reports_;
};

} // namespace api
} // namespace zonetrader
