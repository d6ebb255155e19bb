/**
 * @file  prop_flip_antisymmetry.cpp
 * @brief Property: ∀ raw, points: normalize(raw, flipped) = −normalize(raw, unflipped)
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_flip_antisymmetry
 *
 * Mathematical basis:
 *   Flipping swaps the poles of the rendered scale, so the same physical
 *   click lands on the mirror-image value. Rounding half away from zero is
 *   symmetric about 0, so the rounded values are exact negatives too.
 *   The neutral answer must come back as +0.0 on both sides.
 */

#include <rapidcheck.h>

#include <cmath>

#include "semdiff/normalizer.hpp"

using namespace semdiff;

int main() {
    // ── Property 1: discrete antisymmetry ────────────────────────────────────
    rc::check(
        "flip: discrete values negate exactly",
        []() {
            const int points = *rc::gen::inRange(1, 12);
            const int raw    = *rc::gen::inRange(0, points);
            const double a = ResponseNormalizer::normalize(raw, false, ScaleMode::Discrete, points);
            const double b = ResponseNormalizer::normalize(raw, true, ScaleMode::Discrete, points);
            RC_ASSERT(a == -b);
            RC_ASSERT(!std::signbit(a) || a != 0.0);
            RC_ASSERT(!std::signbit(b) || b != 0.0);
        }
    );

    // ── Property 2: continuous antisymmetry ──────────────────────────────────
    rc::check(
        "flip: continuous values negate exactly",
        []() {
            const double raw = *rc::gen::inRange(0, 10001) / 100.0;
            const double a = ResponseNormalizer::normalize(raw, false, ScaleMode::Continuous, 7);
            const double b = ResponseNormalizer::normalize(raw, true, ScaleMode::Continuous, 7);
            RC_ASSERT(a == -b);
        }
    );

    return 0;
}
