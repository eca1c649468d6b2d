/**
 * @file  fuzz_tra_loader.cpp
 * @brief libFuzzer target for TraLoader::parse
 *
 * Build:
 *   cmake -DKAGG_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_tra_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_tra_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no exception escapes for any byte sequence,
 *      including embedded NULs, huge indices and non-numeric tokens.
 *   2. parse() returns either std::nullopt or a chain with at least one
 *      state and one stored transition.
 *   3. Every stored probability is finite and strictly positive.
 *   4. Every stored index lies inside [0, size()).
 *
 * Fuzzer strategy:
 *   Input bytes → std::string_view → TraLoader::parse
 *   Seed the corpus with small valid .tra files to reach the line parser.
 */

#include <cstddef>
#include <cstdint>
#include <cassert>
#include <cmath>
#include <string_view>

#include "kagg/tra_loader.hpp"

using namespace kagg;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view text(reinterpret_cast<const char*>(data), size);

    // ── Test 1: parse must never throw; nullopt is a valid answer ──────────────
    const auto chain = chain::TraLoader::parse(text);
    if (!chain.has_value()) {
        return 0;
    }

    // ── Test 2: structural invariants of an accepted chain ─────────────────────
    const Index n = chain->size();
    assert(n >= 1);
    assert(chain->transitions() >= 1);

    const SparseMatrix& f = chain->forward();
    assert(f.rows() == n);
    assert(f.cols() == n);

    for (Index col = 0; col < f.outerSize(); ++col) {
        for (SparseMatrix::InnerIterator it(f, col); it; ++it) {
            assert(std::isfinite(it.value()));
            assert(it.value() > 0.0);
            assert(it.row() >= 0 && it.row() < n);
            assert(it.col() >= 0 && it.col() < n);
        }
    }

    // ── Test 3: the stochastic defect is never negative or NaN ─────────────────
    const double defect = chain->stochastic_defect();
    assert(defect >= 0.0);
    (void)defect;

    return 0;
}
