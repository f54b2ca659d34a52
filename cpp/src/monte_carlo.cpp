#include "exotica/monte_carlo.hpp"
#include "exotica/pricing_error.hpp"
#include <cmath>
#include <random>

namespace exotica::montecarlo {

SimulationGrid simulate_gbm_grid(const SimulationParams& params) {
    if (params.num_steps == 0) {
        throw ValidationError("simulation: number of time steps must be positive");
    }
    if (params.num_paths == 0) {
        throw ValidationError("simulation: number of paths must be positive");
    }
    if (!std::isfinite(params.S0) || !std::isfinite(params.mu) ||
        !std::isfinite(params.sigma) || !std::isfinite(params.T)) {
        throw ValidationError("simulation: parameters must be finite");
    }
    if (params.sigma < 0.0 || params.T <= 0.0) {
        throw ValidationError("simulation: requires sigma >= 0 and T > 0");
    }

    const double dt = params.T / static_cast<double>(params.num_steps);
    const double drift_term = (params.mu - 0.5 * params.sigma * params.sigma) * dt;
    const double diffusion_coeff = params.sigma * std::sqrt(dt);

    std::mt19937_64 rng(params.seed);
    // normal_distribution requires a positive stddev
    std::normal_distribution<double> dist(drift_term, diffusion_coeff > 0.0 ? diffusion_coeff : 1.0);
    const bool deterministic = !(diffusion_coeff > 0.0);

    SimulationGrid grid(params.num_steps, params.num_paths, params.S0);
    std::vector<double> log_return(params.num_paths, 0.0);

    // Row 0 is drawn like every other row and stays in the running sum,
    // while the stored spot at step 0 is pinned to S0
    for (size_t path = 0; path < params.num_paths; ++path) {
        log_return[path] = deterministic ? drift_term : dist(rng);
    }

    // Row by row so the draw order depends only on (seed, steps, paths)
    for (size_t step = 1; step <= params.num_steps; ++step) {
        auto row = grid.row(step);
        for (size_t path = 0; path < params.num_paths; ++path) {
            log_return[path] += deterministic ? drift_term : dist(rng);
            row[path] = params.S0 * std::exp(log_return[path]);
        }
    }

    return grid;
}

} // namespace exotica::montecarlo
