#pragma once

#include "agreement/agreement_evaluator.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

// ---------------------------------------------------------------------------
// AgreementTally — per-subset count of agreeing trials
//
// counts[mask] is the number of trials in which every measure of `mask`
// pointed the same way. counts[0] == trial_count always.
// ---------------------------------------------------------------------------
struct AgreementTally {
    std::array<int64_t, NUM_SUBSETS> counts{};
    int64_t trial_count = 0;

    void add(const AgreementVector& agreement) {
        for (std::size_t mask = 0; mask < NUM_SUBSETS; ++mask) {
            if (agreement[mask]) ++counts[mask];
        }
        ++trial_count;
    }

    void merge(const AgreementTally& other) {
        for (std::size_t mask = 0; mask < NUM_SUBSETS; ++mask) {
            counts[mask] += other.counts[mask];
        }
        trial_count += other.trial_count;
    }

    // The empty subset agrees trivially, so its probability is 1 even before
    // any trial has run. Other subsets read 0 on an empty tally.
    double probability(SubsetMask mask) const {
        if (mask == 0) return 1.0;
        if (trial_count == 0) return 0.0;
        return static_cast<double>(counts[mask]) / static_cast<double>(trial_count);
    }
};
