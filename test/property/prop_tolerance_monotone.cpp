/**
 * @file  prop_tolerance_monotone.cpp
 * @brief Property: ∀ chain, p₀, ε₁ ≤ ε₂: size(ε₁) ≥ size(ε₂)
 *
 * Run with 1,000 random inputs:
 *   RC_PARAMS="max_success=1000" ./prop_tolerance_monotone
 *
 * The checkpoint criteria depend only on (chain, p₀, schedule); the tolerance
 * only decides where the search stops. Tightening ε can therefore never pick
 * a smaller aggregation, and every returned size lies inside [1, cap].
 */

#include <rapidcheck.h>
#include <algorithm>
#include <cmath>

#include "kagg/sizing.hpp"
#include "support/test_chains.hpp"

using namespace kagg;
using namespace kagg::sizing;

namespace {

SizingConfig config_for(double tolerance) {
    SizingConfig config;
    config.tolerance   = tolerance;
    config.checkpoints = SizingConfig::linear_schedule(1, 2, 12);
    config.size_cap    = 30;
    return config;
}

} // anonymous namespace

int main() {
    // ── Property 1: size is non-increasing in ε ──────────────────────────────
    rc::check(
        "tolerance_monotone: tighter tolerance never shrinks the aggregation",
        [](unsigned seed) {
            const Index n  = *rc::gen::inRange<Index>(2, 40);
            const int   e1 = *rc::gen::inRange(1, 16);
            const int   e2 = *rc::gen::inRange(1, 16);
            const double loose = std::pow(10.0, -std::min(e1, e2));
            const double tight = std::pow(10.0, -std::max(e1, e2));

            const auto chain = fixtures::random_chain(n, seed);
            const Vector p0  = fixtures::random_distribution(n, seed + 1);

            const auto coarse = AdaptiveSizeSelector(config_for(loose)).select(chain, p0);
            const auto fine   = AdaptiveSizeSelector(config_for(tight)).select(chain, p0);

            RC_ASSERT(fine.aggregation.size() >= coarse.aggregation.size());
            if (fine.certified()) {
                RC_ASSERT(coarse.certified());
            }
        }
    );

    // ── Property 2: returned size is bounded and certification is honest ─────
    rc::check(
        "tolerance_monotone: size within [1, cap]; certified implies criterion <= eps",
        [](unsigned seed) {
            const Index  n   = *rc::gen::inRange<Index>(2, 40);
            const int    e   = *rc::gen::inRange(1, 16);
            const double eps = std::pow(10.0, -e);

            const auto chain  = fixtures::birth_death_chain(n);
            const auto result = AdaptiveSizeSelector(config_for(eps))
                                    .select(chain, fixtures::random_distribution(n, seed));

            RC_ASSERT(result.aggregation.size() >= 1);
            RC_ASSERT(result.aggregation.size() <= std::min<Index>(n, 30));
            RC_ASSERT(!result.trace.empty());
            if (result.certified()) {
                RC_ASSERT(result.criterion.has_value());
                RC_ASSERT(*result.criterion <= eps);
                RC_ASSERT(result.trace.back().status == CheckpointStatus::Accepted);
            }
        }
    );

    return 0;
}
