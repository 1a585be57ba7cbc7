/// @file src/main.cpp
/// @brief PRISM CLI entry point.
///
/// Usage:
///   prism --analyze <csv_file> <product_id> [options]   Full analysis of one product
///   prism --portfolio <csv_file> [options]              KPIs over every product in a file
///   prism --demo [--seed N] [options]                   Analyse simulated products
///   prism --help                                        Print usage

#include "prism/data_loader.hpp"
#include "prism/engine.hpp"
#include "prism/simulator.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  prism --analyze <csv_file> <product_id> [options]\n"
        "  prism --portfolio <csv_file> [options]\n"
        "  prism --demo [--seed N] [options]\n"
        "  prism --help\n"
        "\n"
        "Options:\n"
        "  --horizon N     Forecast horizon in days (clamped to 7-30, default 14)\n"
        "  --price P       Reference price override\n"
        "  --alpha A       Holt-Winters level smoothing (default 0.3)\n"
        "  --beta B        Holt-Winters trend smoothing (default 0.1)\n"
        "  --gamma G       Holt-Winters seasonal smoothing (default 0.2)\n"
        "  --as-of DATE    Evaluation date, YYYY-MM-DD (default: now)\n"
        "  --verbose       Diagnostics on stderr\n"
        "\n"
        "CSV format (header required):\n"
        "  product_id,kind,timestamp,value\n"
        "  kind: competitor_price | units_sold | trend_score | reference_price\n"
    );
}

/// Command-line options shared by every mode.
struct CliOptions {
    prism::AnalyticsConfig          config{};
    int                             horizon = prism::constants::DEFAULT_HORIZON_DAYS;
    std::optional<double>           price;
    std::optional<prism::Timestamp> as_of;
    std::uint64_t                   seed = 42;
    std::vector<std::string>        positional;
};

template <typename T>
std::optional<T> parse_number(std::string_view text) {
    T value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

/// Parse options after the mode flag. Returns `nullopt` (after printing the
/// reason) on a malformed option.
std::optional<CliOptions> parse_options(int argc, char* argv[], int first) {
    CliOptions opts;

    for (int i = first; i < argc; ++i) {
        const std::string_view arg(argv[i]);

        if (arg == "--verbose") {
            opts.config.verbose = true;
            continue;
        }
        if (!arg.starts_with("--")) {
            opts.positional.emplace_back(arg);
            continue;
        }
        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", arg);
            return std::nullopt;
        }
        const std::string_view value(argv[++i]);

        bool ok = true;
        if (arg == "--horizon") {
            const auto v = parse_number<int>(value);
            ok = v.has_value();
            if (ok) opts.horizon = *v;
        } else if (arg == "--seed") {
            const auto v = parse_number<std::uint64_t>(value);
            ok = v.has_value();
            if (ok) opts.seed = *v;
        } else if (arg == "--price") {
            const auto v = parse_number<double>(value);
            ok = v.has_value() && *v > 0.0;
            if (ok) opts.price = *v;
        } else if (arg == "--alpha" || arg == "--beta" || arg == "--gamma") {
            const auto v = parse_number<double>(value);
            ok = v.has_value() && *v >= 0.0 && *v <= 1.0;
            if (ok) {
                if (arg == "--alpha") opts.config.forecast.alpha = *v;
                if (arg == "--beta")  opts.config.forecast.beta  = *v;
                if (arg == "--gamma") opts.config.forecast.gamma = *v;
            }
        } else if (arg == "--as-of") {
            opts.as_of = prism::parse_timestamp(value);
            ok = opts.as_of.has_value();
        } else {
            fmt::print(stderr, "Unknown option: {}\n", arg);
            return std::nullopt;
        }

        if (!ok) {
            fmt::print(stderr, "Error: invalid value '{}' for {}\n", value, arg);
            return std::nullopt;
        }
    }
    return opts;
}

/// Load a CSV file, reporting failures on stderr.
std::optional<prism::InMemorySource> load_source(const std::string& filepath) {
    auto source = prism::core::DataLoader::load_csv(filepath);
    if (!source) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", filepath);
        return std::nullopt;
    }
    if (source->products().empty()) {
        fmt::print(stderr, "Error: no valid rows loaded from '{}'\n", filepath);
        return std::nullopt;
    }
    fmt::print("Loaded {} observations for {} products from '{}'\n",
               source->size(), source->products().size(), filepath);
    return source;
}

/// Analyse one product from a CSV file.
/// Returns 0 on success, 1 on error.
int run_analyze(const CliOptions& opts) {
    if (opts.positional.size() != 2) {
        fmt::print(stderr, "Error: --analyze requires <csv_file> <product_id>\n");
        return 1;
    }
    const auto source = load_source(opts.positional[0]);
    if (!source) {
        return 1;
    }

    const prism::core::Engine engine(*source, opts.config, opts.as_of);
    const auto report = engine.analyze(opts.positional[1], opts.horizon, opts.price);
    fmt::print("{}", report.to_string());
    return 0;
}

/// Portfolio KPIs over every product in a CSV file.
int run_portfolio(const CliOptions& opts) {
    if (opts.positional.size() != 1) {
        fmt::print(stderr, "Error: --portfolio requires <csv_file>\n");
        return 1;
    }
    const auto source = load_source(opts.positional[0]);
    if (!source) {
        return 1;
    }

    const prism::core::Engine engine(*source, opts.config, opts.as_of);
    const auto kpis = engine.portfolio(source->products());
    fmt::print("{}", kpis->to_string());
    if (!kpis.is_ok()) {
        fmt::print("  ({}: {})\n", prism::to_string(kpis.quality), kpis.reason);
    }
    return 0;
}

/// Simulate a small catalogue and analyse every product in it.
int run_demo(const CliOptions& opts) {
    const prism::Timestamp now = opts.as_of.value_or(
        std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()));
    const prism::Date today = prism::to_date(now);

    const std::vector<prism::ProductProfile> catalogue{
        {.product_id = "headphones", .base_price = 129.0, .base_demand = 40.0, .days = 180,
         .growth_rate = 0.0020, .elasticity = -1.6},
        {.product_id = "desk-lamp", .base_price = 45.0, .base_demand = 70.0, .days = 180,
         .growth_rate = -0.0010, .elasticity = -0.9},
        {.product_id = "espresso", .base_price = 349.0, .base_demand = 12.0, .days = 180,
         .growth_rate = 0.0005, .elasticity = -1.2},
    };
    // Offered price relative to the competitor average, per product.
    const std::vector<double> premium{1.18, 0.80, 1.00};

    prism::SalesSimulator simulator(opts.seed);
    prism::InMemorySource source;

    for (std::size_t p = 0; p < catalogue.size(); ++p) {
        const auto& profile = catalogue[p];
        const auto history  = simulator.generate(profile, today);

        source.set_series(profile.product_id, prism::SeriesKind::UnitsSold, history.sales);
        source.set_series(profile.product_id, prism::SeriesKind::CompetitorPrice, history.prices);
        source.set_reference_price(profile.product_id, profile.base_price * premium[p]);

        // Trend interest follows demand relative to its base level.
        prism::Series trend;
        trend.reserve(history.sales.size());
        for (const auto& o : history.sales) {
            const double score = 50.0 * o.value / profile.base_demand;
            trend.push_back({o.time, std::clamp(score, 0.0, 100.0)});
        }
        source.set_series(profile.product_id, prism::SeriesKind::TrendScore, std::move(trend));
    }

    fmt::print("Simulated {} products, {} observations (seed {})\n\n",
               catalogue.size(), source.size(), opts.seed);

    const prism::core::Engine engine(source, opts.config, now);
    for (const auto& profile : catalogue) {
        fmt::print("{}\n", engine.analyze(profile.product_id, opts.horizon, opts.price).to_string());
    }
    fmt::print("{}", engine.portfolio(source.products())->to_string());
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    const auto opts = parse_options(argc, argv, 2);
    if (!opts) {
        print_usage();
        return 1;
    }

    if (mode == "--analyze") {
        return run_analyze(*opts);
    }
    if (mode == "--portfolio") {
        return run_portfolio(*opts);
    }
    if (mode == "--demo") {
        return run_demo(*opts);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
