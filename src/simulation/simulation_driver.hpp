#pragma once

#include "agreement/agreement_evaluator.hpp"
#include "sampling/risk_sampler.hpp"
#include "simulation/agreement_tally.hpp"
#include "simulation/simulation_config.hpp"

#include <cstdint>
#include <functional>
#include <random>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// SimulationResult — tally plus the parameters that produced it
// ---------------------------------------------------------------------------
struct SimulationResult {
    SimulationConfig config;
    uint64_t seed = 0;  // resolved seed, also when config.seed was unset
    AgreementTally tally;
};

// ---------------------------------------------------------------------------
// SimulationDriver — runs the trial loop
//
// Each trial draws two strata, evaluates the agreement vector and adds it to
// the tally. Trials never fail; degenerate risks yield inf/NaN measures that
// simply vote "not greater".
//
// With num_workers > 1 the trials are split across threads. Every worker owns
// its sampler and tally; tallies are summed after join. Worker engines are
// seeded from (seed, worker index), so a run is reproducible for a fixed seed
// and worker count.
// ---------------------------------------------------------------------------
class SimulationDriver {
public:
    // Called with (completed, total) roughly every 1% of trials. Only the
    // single-worker path reports progress.
    using ProgressCallback = std::function<void(int64_t, int64_t)>;

    explicit SimulationDriver(const SimulationConfig& config) : config_(config) {
        config_.validate();
    }

    void set_progress_callback(ProgressCallback cb) { progress_ = std::move(cb); }

    const SimulationConfig& config() const { return config_; }

    SimulationResult run() const {
        uint64_t seed = config_.seed.has_value() ? *config_.seed : fresh_seed();
        return run(seed);
    }

    SimulationResult run(uint64_t seed) const {
        SimulationResult result;
        result.config = config_;
        result.seed = seed;

        int workers = config_.num_workers;
        if (workers == 1) {
            RiskSampler sampler = make_sampler(seed, 0);
            result.tally = run_trials(sampler, config_.trial_count, progress_);
            return result;
        }

        std::vector<AgreementTally> partials(static_cast<size_t>(workers));
        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(workers));

        int64_t base = config_.trial_count / workers;
        int64_t extra = config_.trial_count % workers;
        try {
            for (int w = 0; w < workers; ++w) {
                int64_t trials = base + (w < extra ? 1 : 0);
                threads.emplace_back([this, seed, w, trials, &partials]() {
                    RiskSampler sampler = make_sampler(seed, w);
                    partials[static_cast<size_t>(w)] = run_trials(sampler, trials, nullptr);
                });
            }
        } catch (const std::system_error&) {
            // Workers already started must be joined before the vector unwinds.
            for (auto& t : threads) t.join();
            throw;
        }
        for (auto& t : threads) t.join();

        for (const auto& partial : partials) {
            result.tally.merge(partial);
        }
        return result;
    }

    // One trial: sample, evaluate, return the 64-entry agreement vector.
    static AgreementVector run_trial(RiskSampler& sampler, SamplingMode mode) {
        auto [first, second] = sampler.draw_strata(mode);
        return AgreementEvaluator::agreement_vector(first, second);
    }

private:
    SimulationConfig config_;
    ProgressCallback progress_;

    static uint64_t fresh_seed() {
        std::random_device rd;
        return (static_cast<uint64_t>(rd()) << 32) | rd();
    }

    RiskSampler make_sampler(uint64_t seed, int worker) const {
        std::seed_seq seq{static_cast<uint32_t>(seed),
                          static_cast<uint32_t>(seed >> 32),
                          static_cast<uint32_t>(worker)};
        return RiskSampler(config_.lower_bound, config_.upper_bound,
                           config_.effective_precision(), seq);
    }

    AgreementTally run_trials(RiskSampler& sampler, int64_t trials,
                              const ProgressCallback& progress) const {
        AgreementTally tally;
        SamplingMode mode = config_.mode();
        int64_t report_every = trials >= 100 ? trials / 100 : 1;
        for (int64_t i = 0; i < trials; ++i) {
            tally.add(run_trial(sampler, mode));
            if (progress && ((i + 1) % report_every == 0 || i + 1 == trials)) {
                progress(i + 1, trials);
            }
        }
        return tally;
    }
};
