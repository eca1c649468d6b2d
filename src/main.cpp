/// @file src/main.cpp
/// @brief kagg CLI entry point.
///
/// Usage:
///   kagg --tra <file> [options]   Aggregate a .tra chain and run it
///   kagg --help                   Print usage

#include "kagg/aggregation.hpp"
#include "kagg/constants.hpp"
#include "kagg/errors.hpp"
#include "kagg/sizing.hpp"
#include "kagg/tra_loader.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <charconv>
#include <chrono>
#include <fstream>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

using kagg::Index;
using kagg::Vector;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  kagg --tra <file> [options]   Aggregate a .tra chain and step it\n"
        "  kagg --help                   Show this help\n"
        "\n"
        "Options:\n"
        "  --tolerance <eps>             Stationary-weighted residual bound (default {})\n"
        "  --schedule <first>:<stride>:<count>\n"
        "                                Checkpoint sizes (default {}:{}:{})\n"
        "  --cap <n>                     Basis size cap (default {})\n"
        "  --steps <n>                   Steps to run (default {})\n"
        "  --seed <n>                    Seed of the random initial distribution (default {})\n"
        "  --instrument                  Track exact distribution and error metrics\n"
        "  --trace <file>                Append 'step err_k err_k_bnd' per step (implies --instrument)\n"
        "\n"
        ".tra format:\n"
        "  <states> <transitions>\n"
        "  <from> <to> <probability>     one line per transition, 0-based\n",
        kagg::constants::DEFAULT_TOLERANCE,
        kagg::constants::DEFAULT_SCHEDULE_FIRST,
        kagg::constants::DEFAULT_SCHEDULE_STRIDE,
        kagg::constants::DEFAULT_SCHEDULE_COUNT,
        kagg::constants::DEFAULT_SIZE_CAP,
        kagg::constants::DEFAULT_STEPS,
        kagg::constants::DEFAULT_SEED
    );
}

// ─── Argument parsing ─────────────────────────────────────────────────────────

struct Args {
    std::string                tra_path;
    kagg::sizing::SizingConfig sizing;
    long                       steps      = kagg::constants::DEFAULT_STEPS;
    unsigned long              seed       = kagg::constants::DEFAULT_SEED;
    bool                       instrument = false;
    std::optional<std::string> trace_path;
};

template <typename T>
std::optional<T> parse_number(std::string_view text) {
    T value{};
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

/// "first:stride:count" → linear schedule.
std::optional<std::vector<Index>> parse_schedule(std::string_view text) {
    const auto c1 = text.find(':');
    if (c1 == std::string_view::npos) return std::nullopt;
    const auto c2 = text.find(':', c1 + 1);
    if (c2 == std::string_view::npos) return std::nullopt;

    const auto first  = parse_number<Index>(text.substr(0, c1));
    const auto stride = parse_number<Index>(text.substr(c1 + 1, c2 - c1 - 1));
    const auto count  = parse_number<Index>(text.substr(c2 + 1));
    if (!first || !stride || !count) return std::nullopt;

    return kagg::sizing::SizingConfig::linear_schedule(*first, *stride, *count);
}

/// Throws std::runtime_error describing the first bad argument.
Args parse_args(int argc, char* argv[]) {
    Args args;

    auto value_of = [&](int& i, std::string_view flag) -> std::string_view {
        if (i + 1 >= argc) {
            throw std::runtime_error(fmt::format("{} requires a value", flag));
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view flag(argv[i]);

        if (flag == "--tra") {
            args.tra_path = std::string(value_of(i, flag));
        } else if (flag == "--tolerance") {
            const auto text = value_of(i, flag);
            const auto eps  = parse_number<double>(text);
            if (!eps) throw std::runtime_error(fmt::format("invalid tolerance '{}'", text));
            args.sizing.tolerance = *eps;
        } else if (flag == "--schedule") {
            const auto text     = value_of(i, flag);
            auto       schedule = parse_schedule(text);
            if (!schedule) throw std::runtime_error(fmt::format("invalid schedule '{}'", text));
            args.sizing.checkpoints = std::move(*schedule);
        } else if (flag == "--cap") {
            const auto text = value_of(i, flag);
            const auto cap  = parse_number<Index>(text);
            if (!cap) throw std::runtime_error(fmt::format("invalid cap '{}'", text));
            args.sizing.size_cap = *cap;
        } else if (flag == "--steps") {
            const auto text  = value_of(i, flag);
            const auto steps = parse_number<long>(text);
            if (!steps || *steps < 0) {
                throw std::runtime_error(fmt::format("invalid step count '{}'", text));
            }
            args.steps = *steps;
        } else if (flag == "--seed") {
            const auto text = value_of(i, flag);
            const auto seed = parse_number<unsigned long>(text);
            if (!seed) throw std::runtime_error(fmt::format("invalid seed '{}'", text));
            args.seed = *seed;
        } else if (flag == "--instrument") {
            args.instrument = true;
        } else if (flag == "--trace") {
            args.trace_path = std::string(value_of(i, flag));
            args.instrument = true;
        } else {
            throw std::runtime_error(fmt::format("unknown option: {}", flag));
        }
    }

    if (args.tra_path.empty()) {
        throw std::runtime_error("--tra <file> is required");
    }
    return args;
}

// ─── Run ──────────────────────────────────────────────────────────────────────

/// Uniform random distribution over n states, ‖p₀‖₁ = 1.
Vector random_distribution(Index n, unsigned long seed) {
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> uniform(0.0, 1.0);

    Vector p0(n);
    for (Index i = 0; i < n; ++i) {
        p0(i) = uniform(rng);
    }
    return p0 / p0.lpNorm<1>();
}

void print_sizing(const kagg::sizing::SizingResult& result) {
    fmt::print("{:>6}  {:<16}  {:>14}  {}\n", "size", "status", "criterion", "eigenvalue");
    for (const auto& record : result.trace) {
        const std::string criterion = record.criterion
            ? fmt::format("{:.6e}", *record.criterion) : std::string("-");
        const std::string eigenvalue = record.eigenvalue
            ? fmt::format("{:.12f}{:+.3e}i", record.eigenvalue->real(), record.eigenvalue->imag())
            : std::string("-");
        fmt::print("{:>6}  {:<16}  {:>14}  {}\n",
                   record.size, kagg::sizing::to_string(record.status),
                   criterion, eigenvalue);
    }
    fmt::print("Outcome: {} at size {}\n",
               kagg::sizing::to_string(result.outcome), result.aggregation.size());
}

void print_metrics(const kagg::aggregation::ErrorMetrics& m) {
    auto optional_value = [](const std::optional<double>& v) {
        return v ? fmt::format("{:.6e}", *v) : std::string("n/a");
    };
    fmt::print("Steps:                      {}\n", m.steps);
    fmt::print("Static error:               {:.6e}\n", m.static_error);
    fmt::print("Stationary error:           {}\n", optional_value(m.stationary_error));
    fmt::print("Stationary-weighted error:  {}\n", optional_value(m.stationary_weighted_error));
    fmt::print("Dynamic error (last step):  {:.6e}\n", m.dynamic_error);
    fmt::print("Dynamic error bound:        {:.6e}\n", m.dynamic_error_bound);
}

int run(const Args& args) {
    auto chain = kagg::chain::TraLoader::load(args.tra_path);
    if (!chain) {
        fmt::print(stderr, "Error: cannot load transition matrix from '{}'\n", args.tra_path);
        return 1;
    }
    fmt::print("Loaded {} states, {} transitions from '{}'\n",
               chain->size(), chain->transitions(), args.tra_path);
    if (!chain->is_stochastic()) {
        fmt::print(stderr, "Warning: chain is not stochastic (column-sum defect {:.3e})\n",
                   chain->stochastic_defect());
    }

    const Vector p0 = random_distribution(chain->size(), args.seed);

    const kagg::sizing::AdaptiveSizeSelector selector(args.sizing);
    auto result = selector.select(*chain, p0);
    print_sizing(result);
    if (!result.certified()) {
        fmt::print(stderr, "Warning: aggregation is not certified for tolerance {}\n",
                   args.sizing.tolerance);
    }

    if (!args.instrument) {
        kagg::aggregation::AggregationEngine engine(std::move(result.aggregation));
        const auto start = std::chrono::steady_clock::now();
        for (long t = 0; t < args.steps; ++t) {
            engine.step();
        }
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

        Vector lifted(chain->size());
        engine.disaggregate(lifted);
        fmt::print("Stepped {} times in {:.6f} s (disaggregated mass {:.12f})\n",
                   engine.steps(), elapsed.count(), lifted.sum());
        return 0;
    }

    kagg::aggregation::ErrorInstrumentation probe(*chain, p0, std::move(result.aggregation));

    std::ofstream trace;
    if (args.trace_path) {
        trace.open(*args.trace_path, std::ios::app);
        if (!trace) {
            fmt::print(stderr, "Error: cannot open trace file '{}'\n", *args.trace_path);
            return 1;
        }
    }

    for (long t = 0; t < args.steps; ++t) {
        probe.measure_dynamic_error();
        if (trace.is_open()) {
            trace << fmt::format("{} {:.17g} {:.17g}\n",
                                 t, probe.dynamic_error(), probe.dynamic_error_bound());
        }
    }

    print_metrics(probe.metrics());
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string_view mode(argv[1]);
    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    try {
        return run(parse_args(argc, argv));
    } catch (const kagg::AggregationError& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
    } catch (const std::runtime_error& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        print_usage();
    }
    return 1;
}
