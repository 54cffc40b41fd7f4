#pragma once

#include "agreement/agreement_evaluator.hpp"
#include "simulation/agreement_tally.hpp"

#include <array>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// subset_code — letter codes used by the six-way diagram
//
//   letter  measure  weight
//   a       RR       32
//   b       OR       16
//   c       HR*       1
//   d       RR*       4
//   e       RD        8
//   f       HR        2
//
// A code's mask is the sum of the weights of the letters it contains.
// Letters may appear in any order; repeats and other characters are ignored.
// ---------------------------------------------------------------------------
namespace subset_code {

constexpr std::array<char, NUM_EFFECT_MEASURES> LETTERS = {'a', 'b', 'c', 'd', 'e', 'f'};

constexpr SubsetMask letter_weight(char letter) {
    switch (letter) {
        case 'a': return 32;
        case 'b': return 16;
        case 'c': return 1;
        case 'd': return 4;
        case 'e': return 8;
        case 'f': return 2;
        default:  return 0;
    }
}

inline SubsetMask mask_of(std::string_view code) {
    SubsetMask mask = 0;
    for (char c : code) mask |= letter_weight(c);
    return mask;
}

// Inverse of mask_of, letters in alphabetical order. code_of(0) is "".
inline std::string code_of(SubsetMask mask) {
    std::string code;
    for (char letter : LETTERS) {
        if (mask & letter_weight(letter)) code += letter;
    }
    return code;
}

// Measure names of a mask joined with '+', e.g. "RR+OR". Empty mask gives "".
inline std::string measures_of(SubsetMask mask) {
    std::string names;
    for (EffectMeasure m : ALL_EFFECT_MEASURES) {
        if (!subset_contains(mask, m)) continue;
        if (!names.empty()) names += '+';
        names += effect_measure_name(m);
    }
    return names;
}

inline double probability(std::string_view code, const AgreementTally& tally) {
    return tally.probability(mask_of(code));
}

}  // namespace subset_code
