#include "../../include/api/control_api.hpp"
#include "../../include/core/event_json.hpp"
#include "../../include/distribution/control_command.hpp"

namespace zonetrader {
namespace api {

ControlApi::ControlApi(report::EventStore& store, IPhaseController& controller, logging::AsyncLogger* logger,
                       TodayFn today, const report::ReportConfig& report_config)
    : store_(store), controller_(controller), logger_(logger), today_(std::move(today)),
      reports_(store, report_config) {
    if (!today_)
        today_ = [] { return util::to_new_york_date(util::now_ms()); };
}

ApiResponse ControlApi::start_phase(const std::string& body) {
    json request = json::parse(body, nullptr, false);
    if (request.is_discarded() || !request.is_object())
        return ApiResponse::error(400, "Request body must be a JSON object.");

    if (!request.contains("phase") || !request["phase"].is_string())
        return ApiResponse::error(400, "Missing phase.");
    auto phase = core::phase_from_string(request["phase"].get<std::string>());
    if (!phase)
        return ApiResponse::error(400, "Invalid phase.");

    if (!request.contains("tradingDate") || !request["tradingDate"].is_string())
        return ApiResponse::error(400, "Missing tradingDate.");
    auto date = util::parse_date(request["tradingDate"].get<std::string>());
    if (!date)
        return ApiResponse::error(400, "Invalid tradingDate.");

    int days = distribution::DEFAULT_PLAN_DAYS;
    if (request.contains("days")) {
        if (!request["days"].is_number_integer() || request["days"].get<int>() <= 0)
            return ApiResponse::error(400, "days must be a positive integer.");
        days = request["days"].get<int>();
    }

    // Today's session is still live; replaying it would trade on partial data
    if (*date == today_())
        return ApiResponse::error(400, "Not allowed to backtest today's trade.");

    StartResult result = controller_.start(*phase, *date, days);
    LOGF_INFO(logger_, logging::LogCategory::Api, "Start %s %s (%d days): %s", core::phase_to_string(*phase),
              util::format_date(*date).c_str(), days, start_result_to_string(result));

    switch (result) {
    case StartResult::Accepted:
        return ApiResponse::ok({{"phase", core::phase_to_string(*phase)},
                                {"tradingDate", util::format_date(*date)},
                                {"days", days}},
                               202);
    case StartResult::Busy:
        return ApiResponse::error(409, "A phase is already running.");
    default:
        return ApiResponse::error(503, "Phase cannot be started in this mode.");
    }
}

ApiResponse ControlApi::stop_phase() {
    bool stopped = controller_.stop();
    LOGF_INFO(logger_, logging::LogCategory::Api, "Stop requested (%s)", stopped ? "stopping" : "idle");
    return ApiResponse::ok({{"stopped", stopped}});
}

ApiResponse ControlApi::events(const std::string& date, const std::string& phase) const {
    auto parsed_date = util::parse_date(date);
    if (!parsed_date)
        return ApiResponse::error(400, "Invalid date.");
    auto parsed_phase = core::phase_from_string(phase);
    if (!parsed_phase)
        return ApiResponse::error(400, "Invalid phase.");

    report::PhaseEvents stored = store_.get(*parsed_date, *parsed_phase);
    json events = json::array();
    for (const auto& event : stored.events)
        events.push_back(core::event_to_json(event));

    return ApiResponse::ok({{"events", std::move(events)},
                            {"isComplete", stored.complete},
                            {"newYorkOffset", util::new_york_offset_ms(*parsed_date) / MS_PER_HOUR}});
}

ApiResponse ControlApi::report(const std::string& date) const {
    if (date.empty())
        return ApiResponse::ok(report::report_to_json(reports_.aggregate()));

    auto parsed = util::parse_date(date);
    if (!parsed)
        return ApiResponse::error(400, "Invalid date.");
    json j = report::report_to_json(reports_.daily(*parsed));
    j["tradingDate"] = util::format_date(*parsed);
    return ApiResponse::ok(j);
}

ApiResponse ControlApi::dates() const {
    json dates = json::array();
    for (const auto& [date, profitable] : reports_.dates_with_profitability()) {
        dates.push_back({{"date", util::format_date(date)},
                         {"profitable", profitable ? json(*profitable) : json(nullptr)}});
    }
    return ApiResponse::ok({{"dates", std::move(dates)}});
}

ApiResponse ControlApi::status() const {
    PhaseStatus s = controller_.status();
    json j = {{"running", s.running}, {"mode", s.mode}};
    j["phase"] = s.phase ? json(core::phase_to_string(*s.phase)) : json(nullptr);
    j["tradingDate"] = s.trading_date ? json(util::format_date(*s.trading_date)) : json(nullptr);
    return ApiResponse::ok(j);
}

ApiResponse ControlApi::health() const { return ApiResponse::ok({{"status", "ok"}}); }

} // namespace api
} // namespace zonetrader
