#pragma once

#include "../core/event.hpp"
#include "../logging/async_logger.hpp"

#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace zonetrader {
namespace report {

struct PhaseEvents {
    std::vector<core::Event> events;
    bool complete = false;
};

/**
 * EventStore - events per (trading date, phase)
 *
 * Kept in memory and, when a directory is configured, appended to
 * <directory>/<YYYY-MM-DD>_<phase>.jsonl one event per line. A phase marked
 * complete accepts no more events. Thread-safe.
 */
class EventStore {
public:
    explicit EventStore(std::string directory = std::string(), logging::AsyncLogger* logger = nullptr);

    void add(const core::Event& event);

    void mark_complete(const util::Date& date, core::Phase phase);
    bool is_complete(const util::Date& date, core::Phase phase) const;

    PhaseEvents get(const util::Date& date, core::Phase phase) const;

    // Orders only, in emission order
    std::vector<order::Order> orders(const util::Date& date, core::Phase phase = core::Phase::Trading) const;

    void clear(const util::Date& date, core::Phase phase);
    void clear_all();

    // Dates with at least one stored event, oldest first
    std::vector<util::Date> available_dates() const;

    /**
     * Load every <date>_<phase>.jsonl file from the directory. Unparseable
     * lines are skipped. Loaded phases are marked complete. Returns the
     * number of events loaded.
     */
    size_t load();

    const std::string& directory() const { return directory_; }

private:
    using Key = std::pair<std::string, core::Phase>; // formatted date sorts chronologically

    std::string directory_;
    logging::AsyncLogger* logger_;

    mutable std::mutex mutex_;
    std::map<Key, PhaseEvents> store_;
    std::map<Key, std::unique_ptr<std::ofstream>> files_;

    static Key key_of(const util::Date& date, core::Phase phase) { return {util::format_date(date), phase}; }
    std::string path_of(const Key& key) const;
    void persist(const Key& key, const core::Event& event);
};

} // namespace report
} // namespace zonetrader
