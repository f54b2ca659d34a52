#include "exotica/options_pricing.hpp"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <vector>
#include <numeric>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>

using namespace exotica::options;

// Benchmark utilities
struct BenchmarkStats {
    double mean_ns;
    double std_dev_ns;
    double min_ns;
    double max_ns;
    double p50_ns;
    double p95_ns;
    double p99_ns;
    size_t num_samples;
};

// Nearest-rank percentile on sorted samples
double percentile(const std::vector<int64_t>& sorted, double q) {
    const size_t rank = static_cast<size_t>(q * static_cast<double>(sorted.size()));
    return static_cast<double>(sorted[std::min(rank, sorted.size() - 1)]);
}

BenchmarkStats compute_stats(std::vector<int64_t> times) {
    std::sort(times.begin(), times.end());

    const size_t n = times.size();
    const double mean = std::accumulate(times.begin(), times.end(), 0.0) / static_cast<double>(n);

    double sq_sum = 0.0;
    for (auto t : times) {
        sq_sum += (static_cast<double>(t) - mean) * (static_cast<double>(t) - mean);
    }

    return BenchmarkStats{
        .mean_ns = mean,
        .std_dev_ns = std::sqrt(sq_sum / static_cast<double>(n)),
        .min_ns = static_cast<double>(times.front()),
        .max_ns = static_cast<double>(times.back()),
        .p50_ns = percentile(times, 0.50),
        .p95_ns = percentile(times, 0.95),
        .p99_ns = percentile(times, 0.99),
        .num_samples = n
    };
}

void print_stats(const std::string& name, const BenchmarkStats& stats) {
    std::cout << std::fixed << std::setprecision(1);
    std::cout << "  " << std::left << std::setw(30) << name << " | "
              << std::setw(10) << stats.mean_ns << " ns (mean) | "
              << std::setw(10) << stats.p50_ns << " ns (p50) | "
              << std::setw(10) << stats.p95_ns << " ns (p95) | "
              << std::setw(10) << stats.p99_ns << " ns (p99) | "
              << stats.num_samples << " runs\n";
}

void print_header(const char* title) {
    std::cout << "\n";
    std::cout << "============================================================\n";
    std::cout << "  " << title << "\n";
    std::cout << "============================================================\n\n";
}

OptionContract hull_quanto_contract() {
    return OptionContract{
        .ref = {.S0 = 1200.0, .vol = 0.25, .q = 0.015},
        .right = OptionType::CALL,
        .K = 1200.0,
        .T = 2.0,
        .T_s = 0.0,
        .r = 0.03,
        .r_f = 0.05
    };
}

// ============================================================================
// FORWARD-START BENCHMARK
// ============================================================================

void benchmark_forward_start() {
    print_header("FORWARD-START (BLACK-SCHOLES) BENCHMARK");

    const int NUM_WARMUP = 10000;
    const int NUM_ITERATIONS = 100000;

    OptionContract contract{
        .ref = {.S0 = 60.0, .vol = 0.3, .q = 0.04},
        .right = OptionType::CALL,
        .K = 66.0,
        .T = 0.75,
        .T_s = 0.25,
        .r = 0.08
    };

    // Warmup
    for (int i = 0; i < NUM_WARMUP; ++i) {
        volatile double price = ForwardStartPricer::price_analytic(contract).price;
        (void)price;
    }

    std::vector<int64_t> times(NUM_ITERATIONS);
    for (int i = 0; i < NUM_ITERATIONS; ++i) {
        auto start = std::chrono::steady_clock::now();
        auto result = price_forward_start(contract, PricingMethod::BS);
        auto end = std::chrono::steady_clock::now();
        times[i] = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
        (void)result;
    }

    auto stats = compute_stats(times);
    print_stats("Forward start (call)", stats);

    auto result = price_forward_start(contract, PricingMethod::BS);
    std::cout << "\n  Sample Result: Price = $" << std::setprecision(6) << result.price << "\n";
}

// ============================================================================
// QUANTO LATTICE BENCHMARK
// ============================================================================

void benchmark_quanto_lattice() {
    print_header("QUANTO BINOMIAL LATTICE BENCHMARK");

    const auto contract = hull_quanto_contract();
    const QuantoParams quanto{.vol_ex = 0.12, .correlation = 0.2};

    for (int steps : {100, 500, 1000}) {
        const int iterations = steps >= 500 ? 200 : 2000;
        std::vector<int64_t> times(iterations);
        for (int i = 0; i < iterations; ++i) {
            auto start = std::chrono::steady_clock::now();
            auto result = QuantoPricer::price_lattice(contract, quanto, {steps, false});
            auto end = std::chrono::steady_clock::now();
            times[i] = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
            (void)result;
        }

        auto stats = compute_stats(times);
        print_stats("Lattice (" + std::to_string(steps) + " steps)", stats);
    }

    std::vector<int64_t> hist_times(200);
    for (auto& t : hist_times) {
        auto start = std::chrono::steady_clock::now();
        auto result = QuantoPricer::price_lattice(contract, quanto, {500, true});
        auto end = std::chrono::steady_clock::now();
        t = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
        (void)result;
    }

    auto hist_stats = compute_stats(hist_times);
    print_stats("Lattice (500 steps, history)", hist_stats);

    auto result = QuantoPricer::price_lattice(contract, quanto, {100, false});
    std::cout << "\n  Sample Result: Price = $" << std::setprecision(6) << result.price
              << ", p = " << result.lattice->p << "\n";
}

// ============================================================================
// QUANTO LONGSTAFF-SCHWARTZ BENCHMARK
// ============================================================================

void benchmark_quanto_lsm() {
    print_header("QUANTO LONGSTAFF-SCHWARTZ LSM BENCHMARK");

    const auto contract = hull_quanto_contract();
    const QuantoParams quanto{.vol_ex = 0.12, .correlation = 0.2};
    const int LSM_ITERATIONS = 5;

    struct Case {
        const char* name;
        LSMConfig config;
    };

    const std::vector<Case> cases = {
        {"LSM (10k paths, 50 steps)", {.num_paths = 10000, .time_steps = 50}},
        {"LSM ITM (10k paths, 50 steps)", {.num_paths = 10000, .time_steps = 50, .itm_only = true}},
        {"LSM (50k paths, 50 steps)", {.num_paths = 50000, .time_steps = 50}},
        {"LSM (50k paths, 4 threads)", {.num_paths = 50000, .time_steps = 50, .num_threads = 4}},
    };

    for (const auto& c : cases) {
        std::vector<int64_t> times(LSM_ITERATIONS);
        double price = 0.0;
        double std_error = 0.0;
        for (int i = 0; i < LSM_ITERATIONS; ++i) {
            auto result = QuantoPricer::price_lsm(contract, quanto, c.config);
            times[i] = result.calc_time_ns;
            price = result.price;
            std_error = result.std_error;
        }

        auto stats = compute_stats(times);
        std::cout << std::fixed << std::setprecision(2);
        std::cout << "  " << std::left << std::setw(30) << c.name << " | "
                  << std::setw(8) << (stats.mean_ns / 1e6) << " ms (mean) | "
                  << "price " << std::setprecision(4) << price
                  << " +/- " << std_error << "\n";
    }
}

// ============================================================================
// MAIN
// ============================================================================

int main() {
    std::cout << "============================================================\n";
    std::cout << "        EXOTICA OPTIONS PRICING ENGINE - BENCHMARK          \n";
    std::cout << "============================================================\n";
    std::cout << "\n";
    std::cout << "Models implemented:\n";
    std::cout << "  - Forward-start options (Black-Scholes, continuous yield)\n";
    std::cout << "  - Quanto options (CRR binomial lattice, Hull Ch.13)\n";
    std::cout << "  - Quanto options (Longstaff-Schwartz LSM)\n";
    std::cout << "\n";

    benchmark_forward_start();
    benchmark_quanto_lattice();
    benchmark_quanto_lsm();

    std::cout << "\n";
    std::cout << "============================================================\n";
    std::cout << "                   BENCHMARK COMPLETE                         \n";
    std::cout << "============================================================\n";

    return 0;
}
