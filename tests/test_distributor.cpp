#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "../include/distribution/event_distributor.hpp"

using namespace zonetrader;
using namespace zonetrader::distribution;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "  " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

class RecordingSubscriber : public ISubscriber {
public:
    // Sends beyond `accept` fail
    explicit RecordingSubscriber(size_t accept = SIZE_MAX) : accept_(accept) {}

    bool send(const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (received_.size() >= accept_)
            return false;
        received_.push_back(message);
        return true;
    }

    void on_dropped() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++dropped_;
    }

    std::vector<std::string> received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    int dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    size_t accept_;
    mutable std::mutex mutex_;
    std::vector<std::string> received_;
    int dropped_ = 0;
};

void publish_range(EventDistributor& d, int from, int to) {
    for (int i = from; i <= to; ++i)
        d.publish_serialized("e" + std::to_string(i));
}

// ============================================================================
// Buffering
// ============================================================================

TEST(test_buffer_replayed_in_order_on_ready) {
    EventDistributor d;
    d.start();
    publish_range(d, 1, 3);

    auto sub = std::make_shared<RecordingSubscriber>();
    SubscriberId id = d.connect(sub);
    publish_range(d, 4, 4);
    d.flush();
    ASSERT_TRUE(sub->received().empty());
    ASSERT_EQ(d.stats().pending, 4u);

    d.receive(id, "READY");
    publish_range(d, 5, 6);
    d.flush();

    std::vector<std::string> expected = {"e1", "e2", "e3", "e4", "e5", "e6"};
    ASSERT_TRUE(sub->received() == expected);
    ASSERT_EQ(d.stats().pending, 0u);
    ASSERT_EQ(d.stats().ready_subscribers, 1u);
    d.stop();
}

TEST(test_late_subscriber_sees_only_live_events) {
    EventDistributor d;
    d.start();
    publish_range(d, 1, 2);

    auto first = std::make_shared<RecordingSubscriber>();
    d.receive(d.connect(first), "{\"cmd\":\"READY\"}");
    publish_range(d, 3, 3);

    auto second = std::make_shared<RecordingSubscriber>();
    d.receive(d.connect(second), "ready");
    publish_range(d, 4, 4);
    d.flush();

    ASSERT_EQ(first->received().size(), 4u);
    std::vector<std::string> expected = {"e4"};
    ASSERT_TRUE(second->received() == expected);
    d.stop();
}

TEST(test_buffer_bound_evicts_oldest) {
    DistributorConfig config;
    config.max_pending_events = 3;
    EventDistributor d(config);
    d.start();
    publish_range(d, 1, 5);
    d.flush();
    ASSERT_EQ(d.stats().pending, 3u);
    ASSERT_EQ(d.stats().evicted, 2u);

    auto sub = std::make_shared<RecordingSubscriber>();
    d.receive(d.connect(sub), "READY");
    d.flush();
    std::vector<std::string> expected = {"e3", "e4", "e5"};
    ASSERT_TRUE(sub->received() == expected);
    d.stop();
}

// ============================================================================
// Subscribers
// ============================================================================

TEST(test_failing_subscriber_dropped) {
    EventDistributor d;
    d.start();
    auto healthy = std::make_shared<RecordingSubscriber>();
    auto flaky = std::make_shared<RecordingSubscriber>(1);
    d.receive(d.connect(healthy), "READY");
    d.receive(d.connect(flaky), "READY");
    publish_range(d, 1, 3);
    d.flush();

    ASSERT_EQ(healthy->received().size(), 3u);
    ASSERT_EQ(flaky->received().size(), 1u);
    ASSERT_EQ(flaky->dropped(), 1);
    auto stats = d.stats();
    ASSERT_EQ(stats.subscribers, 1u);
    ASSERT_EQ(stats.dropped_subscribers, 1u);
    ASSERT_EQ(stats.delivered, 4u);
    d.stop();
}

TEST(test_event_kept_when_only_ready_subscriber_fails) {
    EventDistributor d;
    d.start();
    auto broken = std::make_shared<RecordingSubscriber>(0);
    d.receive(d.connect(broken), "READY");
    publish_range(d, 1, 2);
    d.flush();

    ASSERT_EQ(broken->dropped(), 1);
    ASSERT_EQ(d.stats().subscribers, 0u);
    ASSERT_EQ(d.stats().pending, 2u);

    auto next = std::make_shared<RecordingSubscriber>();
    d.receive(d.connect(next), "READY");
    d.flush();
    std::vector<std::string> expected = {"e1", "e2"};
    ASSERT_TRUE(next->received() == expected);
    d.stop();
}

TEST(test_disconnected_subscriber_gets_nothing) {
    EventDistributor d;
    d.start();
    auto sub = std::make_shared<RecordingSubscriber>();
    SubscriberId id = d.connect(sub);
    d.receive(id, "READY");
    d.disconnect(id);
    publish_range(d, 1, 2);
    d.flush();
    ASSERT_TRUE(sub->received().empty());
    ASSERT_EQ(d.stats().pending, 2u);
    d.stop();
}

// ============================================================================
// Control messages
// ============================================================================

TEST(test_malformed_messages_ignored) {
    EventDistributor d;
    d.start();
    publish_range(d, 1, 1);
    auto sub = std::make_shared<RecordingSubscriber>();
    SubscriberId id = d.connect(sub);
    d.receive(id, "HELLO");
    d.receive(id, "{\"cmd\":\"PLAN\"}");
    d.receive(999, "READY"); // unknown subscriber
    d.flush();

    ASSERT_EQ(d.stats().malformed_messages, 2u);
    ASSERT_EQ(d.stats().ready_subscribers, 0u);
    ASSERT_EQ(d.stats().pending, 1u);
    ASSERT_TRUE(sub->received().empty());
    d.stop();
}

TEST(test_commands_reach_handler) {
    EventDistributor d;
    std::mutex mutex;
    std::vector<std::pair<SubscriberId, ControlCommand>> seen;
    d.set_command_handler([&](SubscriberId id, const ControlCommand& cmd) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.emplace_back(id, cmd);
    });
    d.start();
    auto sub = std::make_shared<RecordingSubscriber>();
    SubscriberId id = d.connect(sub);
    d.receive(id, "{\"cmd\":\"PLAN\",\"date\":\"2024-03-14\",\"days\":3}");
    d.receive(id, "TRADE");
    d.receive(id, "READY");
    d.flush();

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(seen.size(), 2u);
    ASSERT_EQ(seen[0].first, id);
    ASSERT_EQ(seen[0].second.type, ControlCommandType::Plan);
    ASSERT_EQ(seen[0].second.days, 3);
    ASSERT_EQ(seen[1].second.type, ControlCommandType::Trade);
    d.stop();
}

TEST(test_disconnect_handler_sees_departures) {
    EventDistributor d;
    std::mutex mutex;
    std::vector<SubscriberId> gone;
    d.set_disconnect_handler([&](SubscriberId id) {
        std::lock_guard<std::mutex> lock(mutex);
        gone.push_back(id);
    });
    d.start();
    SubscriberId left = d.connect(std::make_shared<RecordingSubscriber>());
    SubscriberId failed = d.connect(std::make_shared<RecordingSubscriber>(0));
    SubscriberId stays = d.connect(std::make_shared<RecordingSubscriber>());
    d.receive(failed, "READY");
    d.receive(stays, "READY");
    d.disconnect(left);
    d.disconnect(left); // already gone
    publish_range(d, 1, 1);
    d.flush();

    std::lock_guard<std::mutex> lock(mutex);
    std::vector<SubscriberId> expected = {left, failed};
    ASSERT_TRUE(gone == expected);
    d.stop();
}

TEST(test_stop_drains_queue) {
    auto sub = std::make_shared<RecordingSubscriber>();
    {
        EventDistributor d;
        d.start();
        d.receive(d.connect(sub), "READY");
        publish_range(d, 1, 50);
        d.stop();
        ASSERT_FALSE(d.is_running());
    }
    ASSERT_EQ(sub->received().size(), 50u);
}

int main() {
    std::cout << "\n=== Event Distributor Tests ===\n\n";

    RUN_TEST(test_buffer_replayed_in_order_on_ready);
    RUN_TEST(test_late_subscriber_sees_only_live_events);
    RUN_TEST(test_buffer_bound_evicts_oldest);
    RUN_TEST(test_failing_subscriber_dropped);
    RUN_TEST(test_event_kept_when_only_ready_subscriber_fails);
    RUN_TEST(test_disconnected_subscriber_gets_nothing);
    RUN_TEST(test_malformed_messages_ignored);
    RUN_TEST(test_commands_reach_handler);
    RUN_TEST(test_disconnect_handler_sees_departures);
    RUN_TEST(test_stop_drains_queue);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
