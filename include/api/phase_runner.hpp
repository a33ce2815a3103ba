#pragma once

#include "../broker/broker_gateway.hpp"
#include "../core/replay_coordinator.hpp"
#include "../distribution/control_command.hpp"
#include "../distribution/event_distributor.hpp"
#include "../logging/async_logger.hpp"
#include "../report/event_store.hpp"
#include "control_api.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace zonetrader {
namespace api {

/**
 * PhaseRunner - runs one replay at a time on a worker thread
 *
 * Planning replays and backtests write their events to the EventStore and
 * publish them through the distributor. A completed run marks its
 * (date, phase) complete; a cancelled one leaves it open.
 *
 * Also serves the distributor's control commands: PLAN starts a planning
 * replay, TRADE replays zone context from the live stream (or, without
 * one, from the last planning replay), SPEED is recorded only. A replay
 * started by a subscriber is cancelled when that subscriber goes away.
 */
class PhaseRunner : public IPhaseController {
public:
    using SnapshotFn = std::function<std::shared_ptr<const core::StreamSnapshot>()>;

    PhaseRunner(core::ReplayCoordinator& coordinator, report::EventStore& store,
                distribution::EventDistributor& distributor, logging::AsyncLogger* logger = nullptr);
    ~PhaseRunner() override;

    PhaseRunner(const PhaseRunner&) = delete;
    PhaseRunner& operator=(const PhaseRunner&) = delete;

    // Backtests are rejected until a gateway is set
    void set_broker(broker::IBrokerGateway* gateway) { gateway_ = gateway; }

    // TRADE context source when a live pipeline is running
    void set_live_snapshot(SnapshotFn fn) { live_snapshot_ = std::move(fn); }

    void set_mode(std::string mode);

    StartResult start(core::Phase phase, const util::Date& date, int days) override;
    bool stop() override;
    PhaseStatus status() const override;

    // Block until the current run (if any) finishes; returns its outcome
    std::optional<core::RunOutcome> wait();

    // Distributor command handler
    void on_command(distribution::SubscriberId from, const distribution::ControlCommand& command);

    // Distributor disconnect handler
    void on_disconnect(distribution::SubscriberId id);

    double speed() const { return speed_.load(std::memory_order_relaxed); }

private:
    core::ReplayCoordinator& coordinator_;
    report::EventStore& store_;
    distribution::EventDistributor& distributor_;
    logging::AsyncLogger* logger_;
    broker::IBrokerGateway* gateway_ = nullptr;
    SnapshotFn live_snapshot_;

    mutable std::mutex mutex_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    core::CancelFlag cancel_;
    std::optional<core::Phase> phase_;
    std::optional<util::Date> date_;
    std::optional<core::RunOutcome> outcome_;
    std::optional<distribution::SubscriberId> initiator_; // unset for HTTP starts
    std::string mode_ = "serve";

    std::shared_ptr<const core::StreamSnapshot> last_plan_;
    std::atomic<double> speed_{1.0};

    StartResult start_phase(core::Phase phase, const util::Date& date, int days,
                            std::optional<distribution::SubscriberId> initiator);

    // Called with mutex_ held
    StartResult launch(std::function<core::RunOutcome(const core::CancelFlag&)> task, core::Phase phase,
                       const util::Date& date, std::optional<distribution::SubscriberId> initiator);

    void record(const core::Event& event);
    void publish_only(const core::Event& event);
    StartResult start_trade_context(distribution::SubscriberId from);
};

} // namespace api
} // namespace zonetrader
