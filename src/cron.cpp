/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swarmcron/cron.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <sstream>
#include <vector>

namespace swarmcron {

namespace {

struct Bounds {
    int min;
    int max;
    const char* const* names;  // indexed from `min`, nullptr when numeric only
    std::size_t nameCount;
};

const char* const kMonthNames[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                   "jul", "aug", "sep", "oct", "nov", "dec"};
const char* const kDayNames[] = {"sun", "mon", "tue", "wed", "thu", "fri", "sat"};

constexpr Bounds kSeconds{0, 59, nullptr, 0};
constexpr Bounds kMinutes{0, 59, nullptr, 0};
constexpr Bounds kHours{0, 23, nullptr, 0};
constexpr Bounds kDaysOfMonth{1, 31, nullptr, 0};
const Bounds kMonths{1, 12, kMonthNames, 12};
const Bounds kDaysOfWeek{0, 6, kDayNames, 7};

std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream in(text);
    while (std::getline(in, current, sep)) {
        parts.push_back(current);
    }
    if (!text.empty() && text.back() == sep) {
        parts.emplace_back();
    }
    return parts;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool isNumber(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::tm toTm(Clock::time_point tp, bool utc) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    if (utc) {
        gmtime_r(&t, &tm);
    } else {
        localtime_r(&t, &tm);
    }
    return tm;
}

// Re-derives all fields after arithmetic on tm members.
Clock::time_point normalize(std::tm& tm, bool utc) {
    std::time_t t;
    if (utc) {
        t = timegm(&tm);
        gmtime_r(&t, &tm);
    } else {
        tm.tm_isdst = -1;
        t = std::mktime(&tm);
        localtime_r(&t, &tm);
    }
    return Clock::from_time_t(t);
}

bool isUtcZone(const std::string& zone) {
    return zone == "UTC" || zone == "Etc/UTC" || zone == "GMT" || zone == "Etc/GMT";
}

}

struct CronFieldParser {
    std::string error;

    bool value(const std::string& token, const Bounds& bounds, int& out) {
        if (isNumber(token)) {
            try {
                out = std::stoi(token);
            } catch (const std::exception&) {
                error = "value out of range: " + token;
                return false;
            }
        } else if (bounds.names) {
            std::string lower = toLower(token);
            auto it = std::find_if(bounds.names, bounds.names + bounds.nameCount,
                                   [&](const char* name) { return lower == name; });
            if (it == bounds.names + bounds.nameCount) {
                error = "failed to parse value: " + token;
                return false;
            }
            out = bounds.min + static_cast<int>(it - bounds.names);
        } else {
            error = "failed to parse int from " + token;
            return false;
        }
        return true;
    }

    // One comma-separated term: "*", "?", "a", "a-b", each with an optional "/step".
    template <std::size_t N>
    bool range(const std::string& term, const Bounds& bounds, std::bitset<N>& bits, bool& star) {
        auto rangeAndStep = split(term, '/');
        if (rangeAndStep.empty() || rangeAndStep.size() > 2) {
            error = "too many slashes: " + term;
            return false;
        }
        auto lowAndHigh = split(rangeAndStep[0], '-');
        if (lowAndHigh.empty() || lowAndHigh[0].empty()) {
            error = "empty range: " + term;
            return false;
        }
        bool single = lowAndHigh.size() == 1;

        int start = 0;
        int end = 0;
        bool isStar = false;
        if (lowAndHigh[0] == "*" || lowAndHigh[0] == "?") {
            if (!single) {
                error = "range over wildcard: " + term;
                return false;
            }
            start = bounds.min;
            end = bounds.max;
            isStar = true;
        } else {
            if (!value(lowAndHigh[0], bounds, start)) return false;
            if (single) {
                end = start;
            } else if (lowAndHigh.size() == 2) {
                if (!value(lowAndHigh[1], bounds, end)) return false;
            } else {
                error = "too many hyphens: " + term;
                return false;
            }
        }

        int step = 1;
        if (rangeAndStep.size() == 2) {
            if (!isNumber(rangeAndStep[1])) {
                error = "failed to parse step: " + term;
                return false;
            }
            try {
                step = std::stoi(rangeAndStep[1]);
            } catch (const std::exception&) {
                error = "step out of range: " + term;
                return false;
            }
            // "N/step" means "N-max/step"
            if (single && !isStar) {
                end = bounds.max;
            }
            if (step > 1) {
                isStar = false;
            }
        }

        if (start < bounds.min) {
            error = "beginning of range (" + std::to_string(start) + ") below minimum (" +
                    std::to_string(bounds.min) + "): " + term;
            return false;
        }
        if (end > bounds.max) {
            error = "end of range (" + std::to_string(end) + ") above maximum (" +
                    std::to_string(bounds.max) + "): " + term;
            return false;
        }
        if (start > end) {
            error = "beginning of range (" + std::to_string(start) + ") beyond end of range (" +
                    std::to_string(end) + "): " + term;
            return false;
        }
        if (step == 0) {
            error = "step of range should be a positive number: " + term;
            return false;
        }

        for (int i = start; i <= end; i += step) {
            bits.set(static_cast<std::size_t>(i));
        }
        star = star || isStar;
        return true;
    }

    template <std::size_t N>
    bool field(const std::string& text, const Bounds& bounds, std::bitset<N>& bits, bool& star) {
        bits.reset();
        star = false;
        for (const auto& term : split(text, ',')) {
            if (!range(term, bounds, bits, star)) return false;
        }
        return true;
    }

    bool fields(const std::vector<std::string>& f, CronSchedule& s) {
        bool unused = false;
        return field(f[0], kSeconds, s.seconds_, unused) &&
               field(f[1], kMinutes, s.minutes_, unused) &&
               field(f[2], kHours, s.hours_, unused) &&
               field(f[3], kDaysOfMonth, s.daysOfMonth_, s.domStar_) &&
               field(f[4], kMonths, s.months_, unused) &&
               field(f[5], kDaysOfWeek, s.daysOfWeek_, s.dowStar_);
    }

    bool descriptor(const std::string& spec, CronSchedule& s) {
        std::string lower = toLower(spec);
        const char* fields6 = nullptr;
        if (lower == "@yearly" || lower == "@annually") {
            fields6 = "0 0 0 1 1 *";
        } else if (lower == "@monthly") {
            fields6 = "0 0 0 1 * *";
        } else if (lower == "@weekly") {
            fields6 = "0 0 0 * * 0";
        } else if (lower == "@daily" || lower == "@midnight") {
            fields6 = "0 0 0 * * *";
        } else if (lower == "@hourly") {
            fields6 = "0 0 * * * *";
        }

        if (fields6) {
            std::istringstream in(fields6);
            std::vector<std::string> f;
            for (std::string t; in >> t;) f.push_back(t);
            return fields(f, s);
        }

        const std::string every = "@every ";
        if (lower.rfind(every, 0) == 0) {
            auto d = parseDuration(spec.substr(every.size()));
            if (!d || *d <= Duration::zero()) {
                error = "failed to parse duration " + spec;
                return false;
            }
            // Sub-second intervals are rounded up to one second, remainders truncated
            auto secs = std::chrono::duration_cast<std::chrono::seconds>(*d);
            if (secs < std::chrono::seconds(1)) {
                secs = std::chrono::seconds(1);
            }
            s.every_ = std::chrono::duration_cast<Duration>(secs);
            return true;
        }

        error = "unrecognized descriptor: " + spec;
        return false;
    }
};

CronParseResult CronSchedule::parse(const std::string& expression) {
    CronParseResult result;
    result.schedule.expression_ = expression;

    std::istringstream in(expression);
    std::vector<std::string> fields;
    for (std::string token; in >> token;) {
        fields.push_back(token);
    }

    if (fields.empty()) {
        result.error = "empty spec string";
        return result;
    }
    if (fields[0].rfind("TZ=", 0) == 0 || fields[0].rfind("CRON_TZ=", 0) == 0) {
        std::string zone = fields[0].substr(fields[0].find('=') + 1);
        if (!isUtcZone(zone)) {
            result.error = "unsupported time zone '" + zone + "' (only UTC): " + expression;
            return result;
        }
        result.schedule.utc_ = true;
        fields.erase(fields.begin());
        if (fields.empty()) {
            result.error = "empty spec string";
            return result;
        }
    }

    CronFieldParser parser;
    if (fields[0][0] == '@') {
        std::string trimmed = expression.substr(expression.find('@'));
        while (!trimmed.empty() && std::isspace(static_cast<unsigned char>(trimmed.back()))) {
            trimmed.pop_back();
        }
        result.ok = parser.descriptor(trimmed, result.schedule);
        result.error = parser.error;
        return result;
    }

    if (fields.size() == 5) {
        fields.insert(fields.begin(), "0");
    } else if (fields.size() != 6) {
        result.error = "expected 5 to 6 fields, found " + std::to_string(fields.size()) + ": " + expression;
        return result;
    }

    result.ok = parser.fields(fields, result.schedule);
    result.error = parser.error;
    return result;
}

bool CronSchedule::dayMatches(int mday, int wday) const noexcept {
    bool domMatch = daysOfMonth_.test(static_cast<std::size_t>(mday));
    bool dowMatch = daysOfWeek_.test(static_cast<std::size_t>(wday));
    if (domStar_ || dowStar_) {
        return domMatch && dowMatch;
    }
    return domMatch || dowMatch;
}

std::optional<Clock::time_point> CronSchedule::next(Clock::time_point after) const {
    if (every_) {
        auto base = std::chrono::time_point_cast<std::chrono::seconds>(after);
        if (base > after) base -= std::chrono::seconds(1);
        return base + std::chrono::duration_cast<Clock::duration>(*every_);
    }

    // Start at the next whole second
    auto start = std::chrono::time_point_cast<std::chrono::seconds>(after);
    if (start > after) start -= std::chrono::seconds(1);
    start += std::chrono::seconds(1);

    std::tm t = toTm(start, utc_);
    const int yearLimit = t.tm_year + 5;
    bool added = false;

    // Each field search restarts from the month when a higher field wraps
    for (;;) {
        if (t.tm_year > yearLimit) {
            return std::nullopt;
        }

        bool wrapped = false;
        while (!months_.test(static_cast<std::size_t>(t.tm_mon + 1))) {
            if (!added) {
                added = true;
                t.tm_mday = 1;
                t.tm_hour = t.tm_min = t.tm_sec = 0;
            }
            t.tm_mon += 1;
            normalize(t, utc_);
            if (t.tm_mon == 0) {
                wrapped = true;
                break;
            }
        }
        if (wrapped) {
            continue;
        }

        while (!dayMatches(t.tm_mday, t.tm_wday)) {
            if (!added) {
                added = true;
                t.tm_hour = t.tm_min = t.tm_sec = 0;
            }
            t.tm_mday += 1;
            normalize(t, utc_);
            if (t.tm_mday == 1) {
                wrapped = true;
                break;
            }
        }
        if (wrapped) {
            continue;
        }

        while (!hours_.test(static_cast<std::size_t>(t.tm_hour))) {
            if (!added) {
                added = true;
                t.tm_min = t.tm_sec = 0;
            }
            t.tm_hour += 1;
            normalize(t, utc_);
            if (t.tm_hour == 0) {
                wrapped = true;
                break;
            }
        }
        if (wrapped) {
            continue;
        }

        while (!minutes_.test(static_cast<std::size_t>(t.tm_min))) {
            if (!added) {
                added = true;
                t.tm_sec = 0;
            }
            t.tm_min += 1;
            normalize(t, utc_);
            if (t.tm_min == 0) {
                wrapped = true;
                break;
            }
        }
        if (wrapped) {
            continue;
        }

        while (!seconds_.test(static_cast<std::size_t>(t.tm_sec))) {
            added = true;
            t.tm_sec += 1;
            normalize(t, utc_);
            if (t.tm_sec == 0) {
                wrapped = true;
                break;
            }
        }
        if (wrapped) {
            continue;
        }

        return normalize(t, utc_);
    }
}

}
