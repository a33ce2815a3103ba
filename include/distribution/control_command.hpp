#pragma once

/**
 * Inbound control protocol, one command per message:
 *   READY                                      (bare word, any case)
 *   {"cmd":"READY"}
 *   {"cmd":"PLAN","date":"YYYY-MM-DD","days":N}   days defaults to 2
 *   {"cmd":"TRADE"}
 *   {"cmd":"SPEED","speed":x}                   advisory only
 * The legacy text form "PLAN YYYY-MM-DD,N" is accepted as well.
 */

#include "../util/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace zonetrader {
namespace distribution {

enum class ControlCommandType : uint8_t { Ready = 0, Plan = 1, Trade = 2, Speed = 3 };

inline const char* control_command_type_to_string(ControlCommandType type) {
    switch (type) {
    case ControlCommandType::Ready:
        return "READY";
    case ControlCommandType::Plan:
        return "PLAN";
    case ControlCommandType::Trade:
        return "TRADE";
    case ControlCommandType::Speed:
        return "SPEED";
    default:
        return "UNKNOWN";
    }
}

constexpr int DEFAULT_PLAN_DAYS = 2;

struct ControlCommand {
    ControlCommandType type = ControlCommandType::Ready;
    std::optional<util::Date> date; // PLAN
    int days = DEFAULT_PLAN_DAYS;   // PLAN
    double speed = 1.0;             // SPEED
};

namespace detail {

inline std::string trim_upper(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
        --end;
    std::string out;
    out.reserve(end - begin);
    for (size_t i = begin; i < end; ++i)
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(text[i]))));
    return out;
}

inline std::optional<ControlCommandType> command_from_name(const std::string& upper) {
    if (upper == "READY")
        return ControlCommandType::Ready;
    if (upper == "PLAN")
        return ControlCommandType::Plan;
    if (upper == "TRADE")
        return ControlCommandType::Trade;
    if (upper == "SPEED")
        return ControlCommandType::Speed;
    return std::nullopt;
}

} // namespace detail

/**
 * Parse one control message. Returns nullopt and fills `error` for
 * anything malformed; the caller logs and ignores it.
 */
inline std::optional<ControlCommand> parse_control_message(std::string_view text, std::string* error = nullptr) {
    auto fail = [&](const std::string& why) -> std::optional<ControlCommand> {
        if (error)
            *error = why;
        return std::nullopt;
    };

    std::string upper = detail::trim_upper(text);
    if (upper.empty())
        return fail("empty message");

    if (upper.front() != '{') {
        // Bare word, or "PLAN <date>,<days>"
        std::string name = upper.substr(0, upper.find(' '));
        auto type = detail::command_from_name(name);
        if (!type)
            return fail("unknown command: " + name);
        ControlCommand cmd;
        cmd.type = *type;
        if (cmd.type == ControlCommandType::Plan) {
            if (name.size() == upper.size())
                return fail("PLAN requires a date");
            std::string args = upper.substr(name.size() + 1);
            std::string date_text = args.substr(0, args.find(','));
            cmd.date = util::parse_date(date_text);
            if (!cmd.date)
                return fail("PLAN date is not YYYY-MM-DD: " + date_text);
            if (auto comma = args.find(','); comma != std::string::npos) {
                try {
                    cmd.days = std::stoi(args.substr(comma + 1));
                } catch (const std::exception&) {
                    return fail("PLAN days is not a number");
                }
            }
        } else if (cmd.type == ControlCommandType::Speed && name.size() < upper.size()) {
            try {
                cmd.speed = std::stod(upper.substr(name.size() + 1));
            } catch (const std::exception&) {
                return fail("SPEED is not a number");
            }
        }
        if (cmd.days <= 0)
            return fail("PLAN days must be positive");
        return cmd;
    }

    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return fail("not a JSON object");
    auto cmd_it = j.find("cmd");
    if (cmd_it == j.end() || !cmd_it->is_string())
        return fail("missing cmd");
    auto type = detail::command_from_name(detail::trim_upper(cmd_it->get<std::string>()));
    if (!type)
        return fail("unknown command: " + cmd_it->get<std::string>());

    ControlCommand cmd;
    cmd.type = *type;
    switch (cmd.type) {
    case ControlCommandType::Plan: {
        auto date_it = j.find("date");
        if (date_it == j.end() || !date_it->is_string())
            return fail("PLAN requires a date");
        cmd.date = util::parse_date(date_it->get<std::string>());
        if (!cmd.date)
            return fail("PLAN date is not YYYY-MM-DD: " + date_it->get<std::string>());
        if (auto days_it = j.find("days"); days_it != j.end()) {
            if (!days_it->is_number_integer())
                return fail("PLAN days is not an integer");
            cmd.days = days_it->get<int>();
            if (cmd.days <= 0)
                return fail("PLAN days must be positive");
        }
        break;
    }
    case ControlCommandType::Speed: {
        auto speed_it = j.find("speed");
        if (speed_it == j.end() || !speed_it->is_number())
            return fail("SPEED requires a number");
        cmd.speed = speed_it->get<double>();
        break;
    }
    default:
        break;
    }
    return cmd;
}

} // namespace distribution
} // namespace zonetrader
