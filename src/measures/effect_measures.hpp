#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <string>

// ---------------------------------------------------------------------------
// EffectMeasure — the six effect measures compared across strata
//
// Canonical order: RR, RR*, OR, RD, HR, HR*. EffectMeasureVector is indexed
// by this order.
// ---------------------------------------------------------------------------
enum class EffectMeasure {
    RELATIVE_RISK = 0,
    COMPLEMENT_RELATIVE_RISK,
    ODDS_RATIO,
    RISK_DIFFERENCE,
    HAZARD_RATIO,
    COMPLEMENT_HAZARD_RATIO,
};

constexpr std::size_t NUM_EFFECT_MEASURES = 6;

constexpr std::array<EffectMeasure, NUM_EFFECT_MEASURES> ALL_EFFECT_MEASURES = {
    EffectMeasure::RELATIVE_RISK,
    EffectMeasure::COMPLEMENT_RELATIVE_RISK,
    EffectMeasure::ODDS_RATIO,
    EffectMeasure::RISK_DIFFERENCE,
    EffectMeasure::HAZARD_RATIO,
    EffectMeasure::COMPLEMENT_HAZARD_RATIO,
};

using EffectMeasureVector = std::array<double, NUM_EFFECT_MEASURES>;

inline std::string effect_measure_name(EffectMeasure m) {
    switch (m) {
        case EffectMeasure::RELATIVE_RISK:            return "RR";
        case EffectMeasure::COMPLEMENT_RELATIVE_RISK: return "RR*";
        case EffectMeasure::ODDS_RATIO:               return "OR";
        case EffectMeasure::RISK_DIFFERENCE:          return "RD";
        case EffectMeasure::HAZARD_RATIO:             return "HR";
        case EffectMeasure::COMPLEMENT_HAZARD_RATIO:  return "HR*";
        default: return "UNKNOWN";
    }
}

// ---------------------------------------------------------------------------
// Stratum — control and treatment risk for one population subgroup
//
// No range check: risks outside (0, 1) produce inf/NaN measures, which are
// valid inputs to the agreement vote.
// ---------------------------------------------------------------------------
struct Stratum {
    double control_risk = 0.0;
    double treatment_risk = 0.0;
};

namespace effect {

inline double relative_risk(double control, double treatment) {
    return treatment / control;
}

inline double complement_relative_risk(double control, double treatment) {
    return (1.0 - control) / (1.0 - treatment);
}

// OR = RR × RR*
inline double odds_ratio(double control, double treatment) {
    return relative_risk(control, treatment) * complement_relative_risk(control, treatment);
}

inline double risk_difference(double control, double treatment) {
    return treatment - control;
}

inline double hazard_ratio(double control, double treatment) {
    return std::log(1.0 - treatment) / std::log(1.0 - control);
}

inline double complement_hazard_ratio(double control, double treatment) {
    return std::log(control) / std::log(treatment);
}

inline double measure(EffectMeasure m, double control, double treatment) {
    switch (m) {
        case EffectMeasure::RELATIVE_RISK:            return relative_risk(control, treatment);
        case EffectMeasure::COMPLEMENT_RELATIVE_RISK: return complement_relative_risk(control, treatment);
        case EffectMeasure::ODDS_RATIO:               return odds_ratio(control, treatment);
        case EffectMeasure::RISK_DIFFERENCE:          return risk_difference(control, treatment);
        case EffectMeasure::HAZARD_RATIO:             return hazard_ratio(control, treatment);
        case EffectMeasure::COMPLEMENT_HAZARD_RATIO:  return complement_hazard_ratio(control, treatment);
        default: return std::nan("");
    }
}

}  // namespace effect

inline double measure(const Stratum& s, EffectMeasure m) {
    return effect::measure(m, s.control_risk, s.treatment_risk);
}

// All six measures for one stratum, in canonical order.
inline EffectMeasureVector evaluate_effect_measures(double control, double treatment) {
    EffectMeasureVector v{};
    for (std::size_t i = 0; i < NUM_EFFECT_MEASURES; ++i) {
        v[i] = effect::measure(ALL_EFFECT_MEASURES[i], control, treatment);
    }
    return v;
}

inline EffectMeasureVector evaluate_effect_measures(const Stratum& s) {
    return evaluate_effect_measures(s.control_risk, s.treatment_risk);
}
