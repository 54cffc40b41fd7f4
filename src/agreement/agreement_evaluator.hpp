#pragma once

#include "measures/effect_measures.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

// ---------------------------------------------------------------------------
// Subset layout
//
// A subset of the six measures is a 6-bit mask (0..63). The bit each measure
// owns is fixed by the published six-way diagram, so it does not follow the
// canonical measure order:
//
//   RR = 32, OR = 16, RD = 8, RR* = 4, HR = 2, HR* = 1
// ---------------------------------------------------------------------------
using SubsetMask = uint32_t;

constexpr std::size_t NUM_SUBSETS = std::size_t{1} << NUM_EFFECT_MEASURES;
constexpr SubsetMask FULL_SUBSET = static_cast<SubsetMask>(NUM_SUBSETS - 1);

constexpr SubsetMask subset_bit(EffectMeasure m) {
    switch (m) {
        case EffectMeasure::RELATIVE_RISK:            return 32;
        case EffectMeasure::ODDS_RATIO:               return 16;
        case EffectMeasure::RISK_DIFFERENCE:          return 8;
        case EffectMeasure::COMPLEMENT_RELATIVE_RISK: return 4;
        case EffectMeasure::HAZARD_RATIO:             return 2;
        case EffectMeasure::COMPLEMENT_HAZARD_RATIO:  return 1;
    }
    return 0;
}

inline bool subset_contains(SubsetMask mask, EffectMeasure m) {
    return (mask & subset_bit(m)) != 0;
}

inline int subset_size(SubsetMask mask) {
    int n = 0;
    for (; mask != 0; mask &= mask - 1) ++n;
    return n;
}

using DirectionVector = std::array<bool, NUM_EFFECT_MEASURES>;
using AgreementVector = std::array<bool, NUM_SUBSETS>;

// ---------------------------------------------------------------------------
// AgreementEvaluator
//
// direction(m) is true iff stratum 2's measure m is strictly greater than
// stratum 1's. Ties and NaN comparisons are false.
//
// A subset agrees iff its selected directions are not a mix of true and
// false. The empty subset and every singleton always agree.
// ---------------------------------------------------------------------------
class AgreementEvaluator {
public:
    static DirectionVector direction_vector(const EffectMeasureVector& first,
                                            const EffectMeasureVector& second) {
        DirectionVector dir{};
        for (std::size_t i = 0; i < NUM_EFFECT_MEASURES; ++i) {
            dir[i] = second[i] > first[i];
        }
        return dir;
    }

    static DirectionVector direction_vector(const Stratum& first, const Stratum& second) {
        return direction_vector(evaluate_effect_measures(first),
                                evaluate_effect_measures(second));
    }

    // Masks of the measures pointing up and pointing not-up, in subset bits.
    static std::array<SubsetMask, 2> direction_masks(const DirectionVector& dir) {
        SubsetMask up = 0;
        SubsetMask not_up = 0;
        for (std::size_t i = 0; i < NUM_EFFECT_MEASURES; ++i) {
            SubsetMask bit = subset_bit(ALL_EFFECT_MEASURES[i]);
            if (dir[i]) {
                up |= bit;
            } else {
                not_up |= bit;
            }
        }
        return {up, not_up};
    }

    static bool agrees(SubsetMask mask, const DirectionVector& dir) {
        auto [up, not_up] = direction_masks(dir);
        return (mask & up) == 0 || (mask & not_up) == 0;
    }

    static AgreementVector agreement_vector(const DirectionVector& dir) {
        auto [up, not_up] = direction_masks(dir);
        AgreementVector agreement{};
        for (SubsetMask mask = 0; mask < NUM_SUBSETS; ++mask) {
            agreement[mask] = (mask & up) == 0 || (mask & not_up) == 0;
        }
        return agreement;
    }

    static AgreementVector agreement_vector(const Stratum& first, const Stratum& second) {
        return agreement_vector(direction_vector(first, second));
    }
};
