#include "exotica/options_pricing.hpp"
#include "exotica/regression.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <numeric>
#include <span>
#include <utility>

namespace exotica::options {

namespace {

// Runs fn(begin, end) over [0, num_paths) split into contiguous chunks.
// Work inside a chunk must only touch its own paths.
template<typename Fn>
void for_each_path_chunk(size_t num_paths, unsigned int num_threads, Fn&& fn) {
    const size_t workers = std::clamp<size_t>(num_threads, 1, num_paths);
    if (workers == 1) {
        fn(size_t{0}, num_paths);
        return;
    }

    const size_t paths_per_worker = num_paths / workers;
    std::vector<std::future<void>> futures;
    futures.reserve(workers);

    for (size_t w = 0; w < workers; ++w) {
        const size_t begin = w * paths_per_worker;
        const size_t end = (w == workers - 1) ? num_paths : (w + 1) * paths_per_worker;
        futures.push_back(std::async(std::launch::async, [&fn, begin, end]() {
            fn(begin, end);
        }));
    }

    for (auto& future : futures) {
        future.get();
    }
}

} // namespace

void QuantoPricer::validate(const OptionContract& contract, const QuantoParams& quanto) {
    validate_contract(contract);
    if (!std::isfinite(quanto.vol_ex) || !std::isfinite(quanto.correlation)) {
        throw ValidationError("vol_ex and correlation should be finite numbers");
    }
    if (quanto.vol_ex < 0.0) {
        throw ValidationError("vol_ex >= 0");
    }
}

// ============================================================================
// QUANTO - LATTICE
// ============================================================================

PricingResult QuantoPricer::price_lattice(
    const OptionContract& contract,
    const QuantoParams& quanto,
    const BinomialTreeConfig& config
) {
    validate(contract, quanto);

    const auto& ref = contract.ref;
    const double q_adj = quanto_adjusted_yield(
        quanto.correlation, ref.vol, quanto.vol_ex, contract.r, ref.q, contract.r_f
    );

    // The quanto correction lives entirely in the yield, so a plain American
    // option on the synthetic underlying carries the early-exercise logic
    const Underlying synthetic{ref.S0, ref.vol, q_adj};
    auto result = AmericanOptionPricer::price_binomial(
        synthetic, contract.right, contract.strike(), contract.T, contract.r_f, config
    );

    result.vol_ex = quanto.vol_ex;
    result.correlation = quanto.correlation;
    return result;
}

// ============================================================================
// QUANTO - LONGSTAFF-SCHWARTZ LSM IMPLEMENTATION
// ============================================================================

PricingResult QuantoPricer::price_lsm(
    const OptionContract& contract,
    const QuantoParams& quanto,
    const LSMConfig& config
) {
    const auto start = std::chrono::steady_clock::now();

    validate(contract, quanto);
    if (config.time_steps <= 0) {
        throw ValidationError("LSM: number of time steps must be positive");
    }
    if (config.num_paths <= 0) {
        throw ValidationError("LSM: number of paths must be positive");
    }

    const int deg = resolve_basis_degree(config.basis_degree);
    const size_t N = static_cast<size_t>(config.time_steps);
    const size_t M = static_cast<size_t>(config.num_paths);

    const auto& ref = contract.ref;
    const double K = contract.strike();
    const double dt = contract.T / static_cast<double>(N);
    const double df = std::exp(-contract.r_f * dt);
    const double sign = sign_cp(contract.right);
    const double q_adj = quanto_adjusted_yield(
        quanto.correlation, ref.vol, quanto.vol_ex, contract.r, ref.q, contract.r_f
    );

    // Paths drift at r_f - q' under the foreign measure, matching df
    auto S = montecarlo::simulate_gbm_grid({
        .S0 = ref.S0,
        .mu = contract.r_f - q_adj,
        .sigma = ref.vol,
        .T = contract.T,
        .num_steps = N,
        .num_paths = M,
        .seed = config.seed
    });

    montecarlo::SimulationGrid payout(N, M);
    for (size_t t = 0; t <= N; ++t) {
        for (size_t i = 0; i < M; ++i) {
            payout(t, i) = std::max(sign * (S(t, i) - K), 0.0);
        }
    }
    montecarlo::SimulationGrid value = payout;

    std::vector<double> held(M);
    std::vector<double> continuation(M);
    std::vector<double> X_itm, Y_itm;

    // Backward induction: exercise dates N-1 .. 1
    for (size_t t = N - 1; t >= 1; --t) {
        if (config.cancel != nullptr && config.cancel->load(std::memory_order_relaxed)) {
            throw CancelledError("LSM: cancelled");
        }

        const auto spot = S.row(t);
        const auto exercise = payout.row(t);
        const auto next = value.row(t + 1);
        auto current = value.row(t);

        for (size_t i = 0; i < M; ++i) {
            held[i] = next[i] * df;
        }

        if (!config.itm_only) {
            const auto model = regression::ContinuationModel::fit(spot, held, deg);

            for_each_path_chunk(M, config.num_threads, [&](size_t begin, size_t end) {
                const std::span<double> C(continuation.data() + begin, end - begin);
                model.evaluate(spot.subspan(begin, end - begin), C);
                for (size_t i = begin; i < end; ++i) {
                    current[i] = exercise[i] > continuation[i] ? exercise[i] : held[i];
                }
            });
            continue;
        }

        X_itm.clear();
        Y_itm.clear();
        for (size_t i = 0; i < M; ++i) {
            if (exercise[i] > 0.0) {
                X_itm.push_back(spot[i]);
                Y_itm.push_back(held[i]);
            }
        }

        // Too few in-the-money paths to identify the polynomial: hold everywhere
        if (X_itm.size() <= static_cast<size_t>(deg)) {
            std::copy(held.begin(), held.end(), current.begin());
            continue;
        }

        const auto model = regression::ContinuationModel::fit(X_itm, Y_itm, deg);

        for_each_path_chunk(M, config.num_threads, [&](size_t begin, size_t end) {
            const std::span<double> C(continuation.data() + begin, end - begin);
            model.evaluate(spot.subspan(begin, end - begin), C);
            for (size_t i = begin; i < end; ++i) {
                const bool exercise_now = exercise[i] > 0.0 && exercise[i] > continuation[i];
                current[i] = exercise_now ? exercise[i] : held[i];
            }
        });
    }

    auto v0 = value.row(0);
    const auto v1 = value.row(1);
    for (size_t i = 0; i < M; ++i) {
        v0[i] = v1[i] * df;
    }

    const double sum = std::accumulate(v0.begin(), v0.end(), 0.0);
    const double mean = sum / static_cast<double>(M);

    double sum_sq = 0.0;
    for (double v : v0) {
        sum_sq += (v - mean) * (v - mean);
    }

    PricingResult result{};
    result.price = mean;
    result.std_error = M > 1 ? std::sqrt(sum_sq / static_cast<double>(M - 1) / static_cast<double>(M)) : 0.0;
    result.method = PricingMethod::MC;
    result.sub_method = config.itm_only
        ? "LSM; polynomial regression on in-the-money paths"
        : "LSM; polynomial regression on all paths";
    result.keep_hist = config.keep_hist;
    result.nsteps = config.time_steps;
    result.npaths = config.num_paths;
    result.deg = deg;
    result.seed = config.seed;
    result.vol_ex = quanto.vol_ex;
    result.correlation = quanto.correlation;

    if (config.keep_hist) {
        result.paths = std::move(S);
        result.values = std::move(value);
    }

    const auto end = std::chrono::steady_clock::now();
    result.calc_time_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();

    return result;
}

} // namespace exotica::options
