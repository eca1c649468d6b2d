/// @file src/chain/tra_loader.cpp
/// @brief `.tra` coordinate-format loader.

#include "kagg/tra_loader.hpp"
#include "kagg/errors.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <vector>

namespace kagg::chain {

// ─── Internal helpers ─────────────────────────────────────────────────────────

namespace {

/// Upper bound on the state count a `.tra` file may declare through its
/// indices. Guards the sparse allocation against forged indices.
constexpr Index MAX_TRA_STATES = Index{1} << 24;

/// Advance `rest` past the next line that is neither blank nor a `#` comment
/// and store that line (without its terminator) in `line`.
/// Returns false when the input is exhausted.
bool next_line(std::string_view& rest, std::string_view& line) noexcept {
    while (!rest.empty()) {
        const auto eol = rest.find('\n');
        std::string_view raw = rest.substr(0, eol);
        rest = (eol == std::string_view::npos) ? std::string_view{}
                                               : rest.substr(eol + 1);

        const auto first = raw.find_first_not_of(" \t\r");
        if (first == std::string_view::npos || raw[first] == '#') {
            continue;
        }
        line = raw.substr(first);
        return true;
    }
    return false;
}

/// Split a line on spaces/tabs. At most `N` fields are collected; the
/// returned count may exceed N to signal surplus fields.
template <std::size_t N>
std::size_t split_fields(std::string_view line,
                         std::array<std::string_view, N>& fields) noexcept {
    std::size_t count = 0;
    std::size_t pos   = 0;
    while (pos < line.size()) {
        const auto start = line.find_first_not_of(" \t\r", pos);
        if (start == std::string_view::npos) break;
        auto stop = line.find_first_of(" \t\r", start);
        if (stop == std::string_view::npos) stop = line.size();
        if (count < N) {
            fields[count] = line.substr(start, stop - start);
        }
        ++count;
        pos = stop;
    }
    return count;
}

/// Parse a nonnegative integer occupying the whole token.
std::optional<Index> parse_index(std::string_view token) noexcept {
    Index value = 0;
    const auto* end = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(token.data(), end, value);
    if (ec != std::errc{} || ptr != end || value < 0) {
        return std::nullopt;
    }
    return value;
}

/// Parse a finite nonnegative probability occupying the whole token.
std::optional<double> parse_probability(std::string_view token) noexcept {
    double value = 0.0;
    const auto* end = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(token.data(), end, value);
    if (ec != std::errc{} || ptr != end || !std::isfinite(value) || value < 0.0) {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

// ─── TraLoader::parse ─────────────────────────────────────────────────────────

std::optional<TransitionMatrix>
TraLoader::parse(std::string_view content) noexcept {
    std::string_view rest = content;
    std::string_view line;

    // ── Header: <ignored> <num_transitions> ──────────────────────────────────
    if (!next_line(rest, line)) {
        return std::nullopt;
    }
    std::array<std::string_view, 2> header{};
    if (split_fields(line, header) != 2) {
        return std::nullopt;
    }
    const auto declared = parse_index(header[1]);
    if (!declared || *declared == 0) {
        return std::nullopt;
    }

    // ── Transitions: <src> <dst> <probability> ───────────────────────────────
    std::vector<Eigen::Triplet<double>> triplets;
    // A forged header must not drive the reservation; each line is >= 6 bytes.
    triplets.reserve(static_cast<std::size_t>(
        std::min<Index>(*declared, static_cast<Index>(content.size() / 6 + 1))));

    Index max_index = 0;
    for (Index i = 0; i < *declared; ++i) {
        if (!next_line(rest, line)) {
            return std::nullopt;  // truncated
        }
        std::array<std::string_view, 3> fields{};
        if (split_fields(line, fields) != 3) {
            return std::nullopt;
        }
        const auto src   = parse_index(fields[0]);
        const auto dst   = parse_index(fields[1]);
        const auto value = parse_probability(fields[2]);
        if (!src || !dst || !value) {
            return std::nullopt;
        }
        if (*src >= MAX_TRA_STATES || *dst >= MAX_TRA_STATES) {
            return std::nullopt;
        }

        max_index = std::max({max_index, *src, *dst});
        if (*value != 0.0) {
            // Column = source state, row = destination state.
            triplets.emplace_back(
                static_cast<SparseMatrix::StorageIndex>(*dst),
                static_cast<SparseMatrix::StorageIndex>(*src),
                *value);
        }
    }

    if (triplets.empty()) {
        return std::nullopt;
    }

    const Index n = max_index + 1;
    SparseMatrix forward(n, n);
    forward.setFromTriplets(triplets.begin(), triplets.end());

    try {
        return TransitionMatrix::from_forward_operator(std::move(forward));
    } catch (const AggregationError&) {
        // Summed duplicates can overflow to a non-finite probability.
        return std::nullopt;
    }
}

// ─── TraLoader::load ──────────────────────────────────────────────────────────

std::optional<TransitionMatrix>
TraLoader::load(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse(contents.str());
}

} // namespace kagg::chain
