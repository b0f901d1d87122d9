/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swarmcron/duration.hpp"
#include <cctype>
#include <exception>
#include <cstdint>
#include <limits>
#include <sstream>

namespace swarmcron {

namespace {

struct Unit {
    const char* name;
    std::int64_t nanos;
};

constexpr Unit kUnits[] = {
    {"ns", 1LL},
    {"us", 1000LL},
    {"\xC2\xB5s", 1000LL},   // U+00B5 micro sign
    {"\xCE\xBCs", 1000LL},   // U+03BC greek mu
    {"ms", 1000000LL},
    {"s", 1000000000LL},
    {"m", 60LL * 1000000000LL},
    {"h", 3600LL * 1000000000LL},
};

std::optional<std::int64_t> unitNanos(const std::string& unit) noexcept {
    for (const auto& u : kUnits) {
        if (unit == u.name) return u.nanos;
    }
    return std::nullopt;
}

}

std::optional<Duration> parseDuration(const std::string& text) noexcept {
    try {
        std::size_t pos = 0;
        bool negative = false;
        if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
            negative = text[pos] == '-';
            ++pos;
        }

        if (text.substr(pos) == "0") {
            return Duration::zero();
        }
        if (pos >= text.size()) {
            return std::nullopt;
        }

        constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
        std::int64_t total = 0;

        while (pos < text.size()) {
            // Integer part
            std::int64_t whole = 0;
            std::size_t digits = 0;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                int digit = text[pos] - '0';
                if (whole > (kMax - digit) / 10) return std::nullopt;
                whole = whole * 10 + digit;
                ++pos;
                ++digits;
            }

            // Fraction part
            double fraction = 0.0;
            std::size_t fracDigits = 0;
            if (pos < text.size() && text[pos] == '.') {
                ++pos;
                double scale = 0.1;
                while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                    fraction += (text[pos] - '0') * scale;
                    scale /= 10.0;
                    ++pos;
                    ++fracDigits;
                }
            }
            if (digits == 0 && fracDigits == 0) {
                return std::nullopt;
            }

            std::size_t unitStart = pos;
            while (pos < text.size() && text[pos] != '.' &&
                   !std::isdigit(static_cast<unsigned char>(text[pos]))) {
                ++pos;
            }
            auto nanos = unitNanos(text.substr(unitStart, pos - unitStart));
            if (!nanos) {
                return std::nullopt;
            }

            if (whole > kMax / *nanos) return std::nullopt;
            std::int64_t value = whole * *nanos;
            value += static_cast<std::int64_t>(fraction * static_cast<double>(*nanos));
            if (value < 0 || total > kMax - value) return std::nullopt;
            total += value;
        }

        return Duration(negative ? -total : total);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string formatDuration(Duration d) {
    std::int64_t ns = d.count();
    if (ns == 0) {
        return "0s";
    }

    std::ostringstream out;
    if (ns < 0) {
        out << "-";
        ns = -ns;
    }

    if (ns < 1000) {
        out << ns << "ns";
        return out.str();
    }
    if (ns < 1000000) {
        out << static_cast<double>(ns) / 1e3 << "us";
        return out.str();
    }
    if (ns < 1000000000) {
        out << static_cast<double>(ns) / 1e6 << "ms";
        return out.str();
    }

    std::int64_t hours = ns / (3600LL * 1000000000LL);
    ns -= hours * 3600LL * 1000000000LL;
    std::int64_t minutes = ns / (60LL * 1000000000LL);
    ns -= minutes * 60LL * 1000000000LL;

    if (hours > 0) out << hours << "h";
    if (hours > 0 || minutes > 0) out << minutes << "m";
    out << static_cast<double>(ns) / 1e9 << "s";
    return out.str();
}

}
