#pragma once

#include "errors.hpp"
#include "measures/effect_measures.hpp"

#include <cmath>
#include <cstdint>
#include <random>
#include <string>
#include <utility>

// ---------------------------------------------------------------------------
// SamplingMode — how the four risks of a trial are drawn
//
//   INDEPENDENT: all four risks uniform on [lower, upper)
//   TENT:        control risks uniform, each treatment risk drawn from a
//                triangular ("tent") distribution whose mode is its stratum's
//                control risk
// ---------------------------------------------------------------------------
enum class SamplingMode { INDEPENDENT, TENT };

inline std::string sampling_mode_str(SamplingMode m) {
    switch (m) {
        case SamplingMode::INDEPENDENT: return "independent";
        case SamplingMode::TENT:        return "tent";
        default: return "unknown";
    }
}

// ---------------------------------------------------------------------------
// tent_cdf — CDF at r of the tent distribution on [lower, upper] with mode
// control_risk
//
//   r <= p1:  (r - L)^2 / ((p1 - L)(U - L))
//   r >  p1:  1 - (U - r)^2 / ((U - L)(U - p1))
//
// Both branches equal (p1 - L) / (U - L) at r = p1.
// ---------------------------------------------------------------------------
inline double tent_cdf(double r, double control_risk, double lower, double upper) {
    if (r <= lower) return 0.0;
    if (r >= upper) return 1.0;
    double width = upper - lower;
    if (r <= control_risk) {
        double below = r - lower;
        return below * below / ((control_risk - lower) * width);
    }
    double above = upper - r;
    return 1.0 - above * above / (width * (upper - control_risk));
}

// ---------------------------------------------------------------------------
// RiskSampler — seedable source of risks in [lower, upper)
//
// tent_risk inverts tent_cdf by bisection. The search starts at the midpoint
// with step (upper - lower) / 4 and halves the step until it falls to
// 1 / precision; the result is within one terminal step of the exact
// quantile.
// ---------------------------------------------------------------------------
class RiskSampler {
public:
    RiskSampler(double lower, double upper, int64_t precision, uint64_t seed)
        : lower_(lower), upper_(upper), precision_(precision), rng_(seed) {
        check_bounds();
    }

    RiskSampler(double lower, double upper, int64_t precision, std::seed_seq& seq)
        : lower_(lower), upper_(upper), precision_(precision), rng_(seq) {
        check_bounds();
    }

    double lower() const { return lower_; }
    double upper() const { return upper_; }
    int64_t precision() const { return precision_; }

    // Smallest bisection step still applied.
    double resolution() const { return 1.0 / static_cast<double>(precision_); }

    double uniform_risk() {
        return lower_ + (upper_ - lower_) * unit_(rng_);
    }

    double tent_risk(double control_risk) {
        return tent_risk_at(unit_(rng_), control_risk);
    }

    // Deterministic inverse of tent_cdf for a given quantile u in [0, 1).
    double tent_risk_at(double u, double control_risk) const {
        double risk = lower_ + (upper_ - lower_) / 2.0;
        double stop = resolution();
        for (double step = (upper_ - lower_) / 4.0; step > stop; step /= 2.0) {
            double cdf = tent_cdf(risk, control_risk, lower_, upper_);
            if (cdf == u) return risk;
            if (cdf > u) {
                risk -= step;
            } else {
                risk += step;
            }
        }
        return risk;
    }

    // Draw both strata of one trial. Draw order: stratum 1 control, stratum 1
    // treatment, stratum 2 control, stratum 2 treatment.
    std::pair<Stratum, Stratum> draw_strata(SamplingMode mode) {
        Stratum first;
        Stratum second;
        if (mode == SamplingMode::TENT) {
            first.control_risk = uniform_risk();
            first.treatment_risk = tent_risk(first.control_risk);
            second.control_risk = uniform_risk();
            second.treatment_risk = tent_risk(second.control_risk);
        } else {
            first.control_risk = uniform_risk();
            first.treatment_risk = uniform_risk();
            second.control_risk = uniform_risk();
            second.treatment_risk = uniform_risk();
        }
        return {first, second};
    }

private:
    double lower_;
    double upper_;
    int64_t precision_;
    std::mt19937_64 rng_;
    std::uniform_real_distribution<double> unit_{0.0, 1.0};

    void check_bounds() const {
        if (!std::isfinite(lower_) || !std::isfinite(upper_)) {
            throw InvalidConfiguration("risk bounds must be finite");
        }
        if (upper_ <= lower_) {
            throw InvalidConfiguration("upper bound must exceed lower bound");
        }
        if (precision_ <= 0) {
            throw InvalidConfiguration("bisection precision must be positive");
        }
    }
};
