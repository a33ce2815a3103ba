#include "../../include/report/event_store.hpp"
#include "../../include/core/event_json.hpp"

#include <filesystem>
#include <set>

namespace zonetrader {
namespace report {

namespace fs = std::filesystem;

EventStore::EventStore(std::string directory, logging::AsyncLogger* logger)
    : directory_(std::move(directory)), logger_(logger) {
    if (!directory_.empty()) {
        std::error_code ec;
        fs::create_directories(directory_, ec);
        if (ec) {
            LOGF_ERROR(logger_, logging::LogCategory::System, "Cannot create events directory %s: %s",
                       directory_.c_str(), ec.message().c_str());
        }
    }
}

void EventStore::add(const core::Event& event) {
    if (!event.trading_day.ok())
        return;
    Key key = key_of(event.trading_day, event.phase);
    std::lock_guard<std::mutex> lock(mutex_);
    PhaseEvents& entry = store_[key];
    if (entry.complete)
        return;
    entry.events.push_back(event);
    persist(key, event);
}

void EventStore::mark_complete(const util::Date& date, core::Phase phase) {
    Key key = key_of(date, phase);
    std::lock_guard<std::mutex> lock(mutex_);
    store_[key].complete = true;
    files_.erase(key);
}

bool EventStore::is_complete(const util::Date& date, core::Phase phase) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = store_.find(key_of(date, phase));
    return it != store_.end() && it->second.complete;
}

PhaseEvents EventStore::get(const util::Date& date, core::Phase phase) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = store_.find(key_of(date, phase));
    return it == store_.end() ? PhaseEvents{} : it->second;
}

std::vector<order::Order> EventStore::orders(const util::Date& date, core::Phase phase) const {
    std::vector<order::Order> result;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = store_.find(key_of(date, phase));
    if (it == store_.end())
        return result;
    for (const auto& event : it->second.events) {
        if (const auto* o = event.get<order::Order>())
            result.push_back(*o);
    }
    return result;
}

void EventStore::clear(const util::Date& date, core::Phase phase) {
    Key key = key_of(date, phase);
    std::lock_guard<std::mutex> lock(mutex_);
    store_.erase(key);
    files_.erase(key);
}

void EventStore::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    store_.clear();
    files_.clear();
}

std::vector<util::Date> EventStore::available_dates() const {
    std::set<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, entry] : store_) {
            if (!entry.events.empty())
                names.insert(key.first);
        }
    }
    std::vector<util::Date> dates;
    for (const auto& name : names) {
        if (auto date = util::parse_date(name))
            dates.push_back(*date);
    }
    return dates;
}

size_t EventStore::load() {
    if (directory_.empty() || !fs::is_directory(directory_))
        return 0;

    size_t loaded = 0;
    size_t skipped = 0;
    for (const auto& entry : fs::directory_iterator(directory_)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".jsonl")
            continue;
        std::string stem = entry.path().stem().string();
        auto sep = stem.find('_');
        if (sep == std::string::npos)
            continue;
        auto date = util::parse_date(stem.substr(0, sep));
        auto phase = core::phase_from_string(stem.substr(sep + 1));
        if (!date || !phase)
            continue;

        std::ifstream in(entry.path());
        std::vector<core::Event> events;
        std::string line;
        while (std::getline(in, line)) {
            if (line.empty())
                continue;
            auto j = core::json::parse(line, nullptr, false);
            std::optional<core::Event> event;
            if (!j.is_discarded())
                event = core::event_from_json(j);
            if (event)
                events.push_back(std::move(*event));
            else
                ++skipped;
        }

        Key key = key_of(*date, *phase);
        std::lock_guard<std::mutex> lock(mutex_);
        PhaseEvents& stored = store_[key];
        loaded += events.size();
        stored.events = std::move(events);
        stored.complete = true;
    }

    LOGF_INFO(logger_, logging::LogCategory::System, "Loaded %zu stored events from %s (%zu lines skipped)", loaded,
              directory_.c_str(), skipped);
    return loaded;
}

std::string EventStore::path_of(const Key& key) const {
    return (fs::path(directory_) / (key.first + "_" + core::phase_to_string(key.second) + ".jsonl")).string();
}

// Called with mutex_ held
void EventStore::persist(const Key& key, const core::Event& event) {
    if (directory_.empty())
        return;
    auto& file = files_[key];
    if (!file) {
        file = std::make_unique<std::ofstream>(path_of(key), std::ios::app);
        if (!file->is_open()) {
            LOGF_ERROR(logger_, logging::LogCategory::System, "Cannot open event file %s", path_of(key).c_str());
            file.reset();
            return;
        }
    }
    *file << core::serialize_event(event) << '\n';
    file->flush();
}

} // namespace report
} // namespace zonetrader
