/// @file src/core/types.cpp
/// @brief Series helpers, calendar conversions and enum names.

#include "prism/types.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <cmath>

namespace prism {

// ─── SeriesKind ───────────────────────────────────────────────────────────────

const char* to_string(SeriesKind kind) noexcept {
    switch (kind) {
        case SeriesKind::CompetitorPrice: return "competitor_price";
        case SeriesKind::UnitsSold:       return "units_sold";
        case SeriesKind::TrendScore:      return "trend_score";
    }
    return "unknown";
}

std::optional<SeriesKind> parse_series_kind(std::string_view name) noexcept {
    if (name == "competitor_price") return SeriesKind::CompetitorPrice;
    if (name == "units_sold")       return SeriesKind::UnitsSold;
    if (name == "trend_score")      return SeriesKind::TrendScore;
    return std::nullopt;
}

const char* to_string(Quality q) noexcept {
    switch (q) {
        case Quality::Ok:       return "ok";
        case Quality::Degraded: return "degraded";
        case Quality::Empty:    return "empty";
    }
    return "empty";
}

// ─── Series helpers ───────────────────────────────────────────────────────────

Series normalize_series(Series series) {
    std::erase_if(series, [](const Observation& o) {
        return !std::isfinite(o.value) || o.value < 0.0;
    });
    std::stable_sort(series.begin(), series.end(),
                     [](const Observation& a, const Observation& b) {
                         return a.time < b.time;
                     });
    return series;
}

Series most_recent(const Series& ascending, std::size_t limit) {
    if (ascending.size() <= limit) {
        return ascending;
    }
    return Series(ascending.end() - static_cast<std::ptrdiff_t>(limit), ascending.end());
}

std::vector<double> values_of(const Series& series) {
    std::vector<double> out;
    out.reserve(series.size());
    for (const auto& o : series) {
        out.push_back(o.value);
    }
    return out;
}

// ─── Calendar ─────────────────────────────────────────────────────────────────

Date to_date(Timestamp t) noexcept {
    return std::chrono::floor<std::chrono::days>(t);
}

Timestamp to_timestamp(Date d) noexcept {
    return Timestamp(d);
}

bool is_weekend(Date d) noexcept {
    const std::chrono::weekday wd{d};
    return wd == std::chrono::Saturday || wd == std::chrono::Sunday;
}

std::string format_date(Date d) {
    const std::chrono::year_month_day ymd{d};
    return fmt::format("{:04d}-{:02d}-{:02d}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()));
}

std::string format_timestamp(Timestamp t) {
    const Date day = to_date(t);
    const std::chrono::hh_mm_ss hms{t - Timestamp(day)};
    return fmt::format("{}T{:02d}:{:02d}:{:02d}Z",
                       format_date(day),
                       hms.hours().count(),
                       hms.minutes().count(),
                       hms.seconds().count());
}

const char* weekday_name(Date d) noexcept {
    static constexpr const char* NAMES[] = {
        "Sunday", "Monday", "Tuesday", "Wednesday",
        "Thursday", "Friday", "Saturday",
    };
    return NAMES[std::chrono::weekday{d}.c_encoding()];
}

namespace {

/// Parse exactly `width` decimal digits at `text[pos]`.
std::optional<int> parse_fixed(std::string_view text, std::size_t pos, std::size_t width) noexcept {
    if (pos + width > text.size()) {
        return std::nullopt;
    }
    int value = 0;
    const char* first = text.data() + pos;
    const char* last  = first + width;
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::optional<Timestamp> parse_timestamp(std::string_view text) noexcept {
    // YYYY-MM-DD
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    const auto y = parse_fixed(text, 0, 4);
    const auto m = parse_fixed(text, 5, 2);
    const auto d = parse_fixed(text, 8, 2);
    if (!y || !m || !d) {
        return std::nullopt;
    }

    const std::chrono::year_month_day ymd{
        std::chrono::year{*y},
        std::chrono::month{static_cast<unsigned>(*m)},
        std::chrono::day{static_cast<unsigned>(*d)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }

    Timestamp ts{Date{ymd}};
    if (text.size() == 10) {
        return ts;
    }

    // THH:MM:SS with optional trailing Z
    if ((text[10] != 'T' && text[10] != ' ') || text.size() < 19 ||
        text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }
    const auto hh = parse_fixed(text, 11, 2);
    const auto mm = parse_fixed(text, 14, 2);
    const auto ss = parse_fixed(text, 17, 2);
    if (!hh || !mm || !ss || *hh > 23 || *mm > 59 || *ss > 60) {
        return std::nullopt;
    }
    const std::string_view rest = text.substr(19);
    if (!rest.empty() && rest != "Z") {
        return std::nullopt;
    }

    ts += std::chrono::hours{*hh} + std::chrono::minutes{*mm} + std::chrono::seconds{*ss};
    return ts;
}

}  // namespace prism
