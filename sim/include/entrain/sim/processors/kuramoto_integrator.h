// ==============================================================================
// Layer 2: Processor - Kuramoto Integrator
// ==============================================================================
// Advances all oscillator phases by one Euler-Maruyama sub-step:
//
//   coupling_i = K_eff(t) * sum_j w_ij * g_i(t) * g_j(t) * sin(theta_j - theta_i)
//   eta_i      ~ N(0, noiseStd^2 * dt)
//   theta_i   <- wrap(theta_i + (omega_i + coupling_i) * dt + eta_i)
//
// The sign of the coupling term pulls each oscillator toward its neighbors;
// flipping it makes the coupling repulsive and prevents synchronization.
//
// All coupling terms are computed from the pre-step phases before any phase
// is written, and oscillator i draws its noise from stream i, so the result
// does not depend on iteration order.
// ==============================================================================

#pragma once

#include <entrain/sim/core/phase_utils.h>
#include <entrain/sim/primitives/activation_model.h>
#include <entrain/sim/primitives/coupling_scheduler.h>
#include <entrain/sim/primitives/spatial_weights.h>
#include <entrain/sim/processors/engine_state.h>

#include <cmath>
#include <cstddef>
#include <span>
#include <utility>
#include <vector>

namespace Entrain {
namespace Sim {

/// @brief Kuramoto phase integrator with spatial weights, ramped coupling,
///        staggered activation and phase noise.
///
/// @par Usage
/// @code
/// KuramotoIntegrator integrator;
/// integrator.prepare(std::move(weights), schedule, std::move(activation),
///                    std::move(omega), config.noiseStd);
/// for (int s = 0; s < substeps; ++s) {
///     integrator.step(state, state.time, dt);
///     // caller advances state.time
/// }
/// @endcode
class KuramotoIntegrator {
public:
    /// @brief Take ownership of the immutable inputs of the run.
    /// @param weights Normalized spatial weights (N x N)
    /// @param schedule Coupling ramp
    /// @param activation Start times and fade-in (N entries)
    /// @param naturalFrequencies omega_i in rad/s (N entries)
    /// @param noiseStd Phase noise intensity, >= 0
    /// @pre weights, activation and naturalFrequencies share the same size
    void prepare(
        SpatialWeights weights,
        const CouplingScheduler& schedule,
        ActivationModel activation,
        std::vector<double> naturalFrequencies,
        double noiseStd
    ) {
        weights_ = std::move(weights);
        schedule_ = schedule;
        activation_ = std::move(activation);
        omega_ = std::move(naturalFrequencies);
        noiseStd_ = noiseStd;
        gains_.assign(omega_.size(), 0.0);
        coupling_.assign(omega_.size(), 0.0);
    }

    /// Number of oscillators
    [[nodiscard]] std::size_t size() const noexcept { return omega_.size(); }

    /// @brief Advance every phase in @p state by one sub-step of length @p dt.
    ///
    /// Consumes exactly one Gaussian draw from every noise stream.
    /// Does not advance state.time; the caller owns the clock.
    /// @param state Engine state (phases and noise streams, N entries)
    /// @param t Simulation time at the start of the sub-step
    /// @param dt Sub-step length (s), > 0
    void step(EngineState& state, double t, double dt) noexcept {
        const std::size_t n = omega_.size();
        const double kEff = schedule_.effectiveCoupling(t);
        const double noiseScale = noiseStd_ * std::sqrt(dt);

        activation_.computeGains(t, gains_);

        for (std::size_t i = 0; i < n; ++i) {
            coupling_[i] = 0.0;
            const double gi = gains_[i];
            if (gi == 0.0) {
                continue;
            }
            const double thetaI = state.phases[i];
            const auto row = weights_.row(i);
            double sum = 0.0;
            for (std::size_t j = 0; j < n; ++j) {
                const double gj = gains_[j];
                if (gj == 0.0 || row[j] == 0.0) {
                    continue;
                }
                sum += row[j] * gj * std::sin(state.phases[j] - thetaI);
            }
            coupling_[i] = kEff * gi * sum;
        }

        for (std::size_t i = 0; i < n; ++i) {
            const double eta = noiseScale * state.noise.nextGaussian(i);
            state.phases[i] = wrapPhase(state.phases[i] + (omega_[i] + coupling_[i]) * dt + eta);
        }
    }

    /// Coupling term of oscillator i from the most recent step()
    [[nodiscard]] double lastCoupling(std::size_t i) const noexcept { return coupling_[i]; }

    [[nodiscard]] const SpatialWeights& weights() const noexcept { return weights_; }
    [[nodiscard]] const CouplingScheduler& schedule() const noexcept { return schedule_; }
    [[nodiscard]] const ActivationModel& activation() const noexcept { return activation_; }
    [[nodiscard]] std::span<const double> naturalFrequencies() const noexcept { return omega_; }
    [[nodiscard]] double noiseStd() const noexcept { return noiseStd_; }

private:
    SpatialWeights weights_;
    CouplingScheduler schedule_;
    ActivationModel activation_;
    std::vector<double> omega_;
    double noiseStd_ = 0.0;

    // Per-step scratch, sized in prepare()
    std::vector<double> gains_;
    std::vector<double> coupling_;
};

} // namespace Sim
} // namespace Entrain
