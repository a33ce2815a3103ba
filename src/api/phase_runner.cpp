#include "../../include/api/phase_runner.hpp"

namespace zonetrader {
namespace api {

PhaseRunner::PhaseRunner(core::ReplayCoordinator& coordinator, report::EventStore& store,
                         distribution::EventDistributor& distributor, logging::AsyncLogger* logger)
    : coordinator_(coordinator), store_(store), distributor_(distributor), logger_(logger) {}

PhaseRunner::~PhaseRunner() {
    stop();
    wait();
}

void PhaseRunner::set_mode(std::string mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    mode_ = std::move(mode);
}

StartResult PhaseRunner::start(core::Phase phase, const util::Date& date, int days) {
    return start_phase(phase, date, days, std::nullopt);
}

StartResult PhaseRunner::start_phase(core::Phase phase, const util::Date& date, int days,
                                     std::optional<distribution::SubscriberId> initiator) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (phase == core::Phase::Planning) {
        return launch(
            [this, date, days](const core::CancelFlag& cancel) {
                store_.clear(date, core::Phase::Planning);
                std::shared_ptr<const core::StreamSnapshot> snapshot;
                core::RunOutcome outcome = coordinator_.plan(
                    date, days, [this](const core::Event& e) { record(e); }, cancel, &snapshot);
                if (outcome == core::RunOutcome::Completed) {
                    store_.mark_complete(date, core::Phase::Planning);
                    std::lock_guard<std::mutex> guard(mutex_);
                    last_plan_ = std::move(snapshot);
                }
                return outcome;
            },
            phase, date, initiator);
    }

    if (!gateway_) {
        LOG_WARN(logger_, logging::LogCategory::Api, "Trading phase requested without a broker");
        return StartResult::Rejected;
    }
    broker::IBrokerGateway* gateway = gateway_;
    return launch(
        [this, date, days, gateway](const core::CancelFlag& cancel) {
            store_.clear(date, core::Phase::Trading);
            core::RunOutcome outcome = coordinator_.backtest(
                date, days, *gateway, [this](const core::Event& e) { record(e); }, cancel);
            if (outcome == core::RunOutcome::Completed)
                store_.mark_complete(date, core::Phase::Trading);
            return outcome;
        },
        phase, date, initiator);
}

bool PhaseRunner::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.load(std::memory_order_acquire) || !cancel_)
        return false;
    cancel_->store(true, std::memory_order_release);
    return true;
}

PhaseStatus PhaseRunner::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PhaseStatus s;
    s.running = running_.load(std::memory_order_acquire);
    s.phase = phase_;
    s.trading_date = date_;
    s.mode = mode_;
    return s;
}

std::optional<core::RunOutcome> PhaseRunner::wait() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        worker = std::move(worker_);
    }
    if (worker.joinable())
        worker.join();
    std::lock_guard<std::mutex> lock(mutex_);
    return outcome_;
}

void PhaseRunner::on_command(distribution::SubscriberId from, const distribution::ControlCommand& command) {
    switch (command.type) {
    case distribution::ControlCommandType::Plan: {
        if (!command.date)
            break;
        StartResult result = start_phase(core::Phase::Planning, *command.date, command.days, from);
        LOGF_INFO(logger_, logging::LogCategory::Api, "PLAN %s,%d from subscriber %llu: %s",
                  util::format_date(*command.date).c_str(), command.days, static_cast<unsigned long long>(from),
                  start_result_to_string(result));
        break;
    }
    case distribution::ControlCommandType::Trade: {
        StartResult result = start_trade_context(from);
        LOGF_INFO(logger_, logging::LogCategory::Api, "TRADE from subscriber %llu: %s",
                  static_cast<unsigned long long>(from), start_result_to_string(result));
        break;
    }
    case distribution::ControlCommandType::Speed:
        speed_.store(command.speed, std::memory_order_relaxed);
        LOGF_DEBUG(logger_, logging::LogCategory::Api, "SPEED %.2f from subscriber %llu", command.speed,
                   static_cast<unsigned long long>(from));
        break;
    default:
        break;
    }
}

void PhaseRunner::on_disconnect(distribution::SubscriberId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.load(std::memory_order_acquire) || !cancel_ || initiator_ != id)
        return;
    cancel_->store(true, std::memory_order_release);
    LOGF_INFO(logger_, logging::LogCategory::Api, "Subscriber %llu left, cancelling its %s replay for %s",
              static_cast<unsigned long long>(id), phase_ ? core::phase_to_string(*phase_) : "?",
              date_ ? util::format_date(*date_).c_str() : "?");
}

StartResult PhaseRunner::launch(std::function<core::RunOutcome(const core::CancelFlag&)> task, core::Phase phase,
                                const util::Date& date, std::optional<distribution::SubscriberId> initiator) {
    if (running_.load(std::memory_order_acquire))
        return StartResult::Busy;
    if (worker_.joinable())
        worker_.join(); // finished; running_ is cleared last

    cancel_ = core::make_cancel_flag();
    phase_ = phase;
    date_ = date;
    initiator_ = initiator;
    outcome_.reset();
    running_.store(true, std::memory_order_release);

    core::CancelFlag cancel = cancel_;
    worker_ = std::thread([this, task = std::move(task), cancel, phase, date] {
        core::RunOutcome outcome = core::RunOutcome::Cancelled;
        try {
            outcome = task(cancel);
        } catch (const std::exception& e) {
            LOGF_ERROR(logger_, logging::LogCategory::Api, "%s run for %s failed: %s", core::phase_to_string(phase),
                       util::format_date(date).c_str(), e.what());
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            outcome_ = outcome;
        }
        running_.store(false, std::memory_order_release);
    });
    return StartResult::Accepted;
}

void PhaseRunner::record(const core::Event& event) {
    store_.add(event);
    distributor_.publish(event);
}

void PhaseRunner::publish_only(const core::Event& event) { distributor_.publish(event); }

StartResult PhaseRunner::start_trade_context(distribution::SubscriberId from) {
    std::shared_ptr<const core::StreamSnapshot> snapshot;
    if (live_snapshot_)
        snapshot = live_snapshot_();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!snapshot)
        snapshot = last_plan_;
    if (!snapshot || !snapshot->trading_day) {
        LOG_WARN(logger_, logging::LogCategory::Api, "TRADE requested with no stream or plan to take zones from");
        return StartResult::Rejected;
    }

    util::Date date = *snapshot->trading_day;
    // Context replays go to connected clients only; stored Trading events are the backtest's
    return launch(
        [this, snapshot, date](const core::CancelFlag& cancel) {
            return coordinator_.trade(*snapshot, date, [this](const core::Event& e) { publish_only(e); }, cancel);
        },
        core::Phase::Trading, date, from);
}

} // namespace api
} // namespace zonetrader
