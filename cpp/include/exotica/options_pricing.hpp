#pragma once

#include "exotica/monte_carlo.hpp"
#include "exotica/pricing_error.hpp"

#include <atomic>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace exotica::options {

// ============================================================================
// CORE TYPES AND ENUMS
// ============================================================================

enum class OptionType : uint8_t { CALL = 0, PUT = 1 };

// BS: closed form, LT: binomial lattice, MC: least-squares Monte Carlo,
// FD: finite differences (no option type implements it yet)
enum class PricingMethod : uint8_t { BS = 0, LT = 1, MC = 2, FD = 3 };

// Accepts any spelling whose first letter is c/C or p/P ("call", "Put", ...)
[[nodiscard]] OptionType parse_right(std::string_view right);

// Case-insensitive "BS", "LT", "MC", "FD"; UnsupportedMethodError otherwise
[[nodiscard]] PricingMethod parse_method(std::string_view name);

[[nodiscard]] std::string_view to_string(PricingMethod method) noexcept;

[[nodiscard]] inline double sign_cp(OptionType type) noexcept {
    return type == OptionType::CALL ? 1.0 : -1.0;
}

struct Underlying {
    double S0;      // Spot
    double vol;     // Volatility
    double q;       // Continuous dividend yield
};

// Immutable for the duration of a pricing call
struct OptionContract {
    Underlying ref;
    OptionType right;
    std::optional<double> K;    // Strike; spot when unset
    double T;                   // Maturity (years)
    double T_s = 0.0;           // Forward-start date
    double r = 0.0;             // Domestic risk-free rate
    double r_f = 0.0;           // Foreign risk-free rate (quanto)

    [[nodiscard]] double strike() const noexcept { return K.value_or(ref.S0); }
};

struct QuantoParams {
    double vol_ex = 0.0;        // Exchange-rate volatility
    double correlation = 0.0;   // Asset / exchange-rate correlation
};

// Hull CRR parameters reported by the lattice
struct LatticeSpecs {
    double dt;
    double u;
    double d;
    double a;       // exp((r - q) dt)
    double p;       // Risk-neutral up probability
    double df_dt;
    double df_T;
};

// Complete pricing result with diagnostics
struct PricingResult {
    double price = 0.0;
    PricingMethod method = PricingMethod::BS;
    std::string sub_method;
    double std_error = 0.0;         // Monte Carlo standard error
    int64_t calc_time_ns = 0;
    bool keep_hist = false;

    std::optional<int> nsteps;
    std::optional<int> npaths;
    std::optional<int> deg;
    std::optional<uint64_t> seed;
    std::optional<double> vol_ex;
    std::optional<double> correlation;
    std::optional<LatticeSpecs> lattice;

    // Populated only when keep_hist is set
    std::vector<std::vector<double>> ref_tree;   // Spot per node, level by level
    std::vector<std::vector<double>> opt_tree;   // Option value per node
    montecarlo::SimulationGrid paths;
    montecarlo::SimulationGrid values;
};

// ============================================================================
// CONFIGURATION
// ============================================================================

struct BinomialTreeConfig {
    int steps = 3;              // Number of time steps
    bool keep_hist = false;     // Return spot and option trees
};

inline constexpr int DEFAULT_BASIS_DEGREE = 5;

struct LSMConfig {
    int num_paths = 5000;           // Number of Monte Carlo paths
    int time_steps = 3;             // Exercise opportunities
    int basis_degree = DEFAULT_BASIS_DEGREE;
    uint64_t seed = 1;              // RNG seed for reproducibility
    bool itm_only = false;          // Regress on in-the-money paths only
    bool keep_hist = false;         // Return path and value grids
    unsigned int num_threads = 1;   // Workers for the per-path exercise decision
    const std::atomic<bool>* cancel = nullptr;
};

// Negative degrees fall back to DEFAULT_BASIS_DEGREE
[[nodiscard]] inline int resolve_basis_degree(int degree) noexcept {
    return degree < 0 ? DEFAULT_BASIS_DEGREE : degree;
}

// Text that is not a non-negative integer falls back to DEFAULT_BASIS_DEGREE
[[nodiscard]] int coerce_basis_degree(std::string_view text) noexcept;

// Throws ValidationError unless the contract satisfies sigma >= 0, T > 0,
// T_s >= 0, S0 >= 0, K >= 0, r >= 0, q >= 0, r_f >= 0 with finite fields
void validate_contract(const OptionContract& contract);

// ============================================================================
// MATHEMATICAL UTILITIES
// ============================================================================

class alignas(64) MathUtils {
public:
    [[nodiscard]] static inline double norm_cdf(double x) noexcept {
        return 0.5 * std::erfc(-x * INV_SQRT2);
    }

    static constexpr double INV_SQRT2 = 0.7071067811865475;
};

// ============================================================================
// BLACK-SCHOLES PRICER (CONTINUOUS DIVIDEND YIELD)
// ============================================================================

class alignas(64) BlackScholesPricer {
public:
    // Inputs are not validated. Where d1 is undefined (sigma * sqrt(T) == 0,
    // S == 0 or K == 0) the limiting value, the discounted intrinsic forward,
    // is returned.
    [[nodiscard]] static PricingResult price(
        double S, double K, double T, double r, double q, double sigma, OptionType type
    ) noexcept;

private:
    static inline void calc_d1_d2(double S, double K, double T, double r, double q,
                                  double sigma, double& d1, double& d2) noexcept {
        const double sigma_sqrt_T = sigma * std::sqrt(T);
        d1 = (std::log(S / K) + (r - q + sigma * sigma / 2.0) * T) / sigma_sqrt_T;
        d2 = d1 - sigma_sqrt_T;
    }
};

// ============================================================================
// FORWARD-START OPTIONS - CLOSED FORM
// Black-Scholes value over the option life T, discounted by exp(-q T_s) for
// the expected drift of the strike reference between today and T_s.
// ============================================================================

class alignas(64) ForwardStartPricer {
public:
    [[nodiscard]] static PricingResult price_analytic(const OptionContract& contract);
};

// ============================================================================
// AMERICAN OPTIONS - BINOMIAL TREE (HULL CH.13)
// ============================================================================

class alignas(64) AmericanOptionPricer {
public:
    // Throws ValidationError on non-positive steps or volatility, and
    // NumericalError when the up probability leaves [0, 1].
    [[nodiscard]] static PricingResult price_binomial(
        const Underlying& ref, OptionType type, double K, double T, double r,
        const BinomialTreeConfig& config = {}
    );

private:
    [[nodiscard]] static LatticeSpecs build_crr_params(
        double r, double q, double sigma, double dt
    ) noexcept;
};

// ============================================================================
// QUANTO OPTIONS
// ============================================================================

/**
 * Dividend yield that absorbs the quanto drift correction:
 *   q' = r_f - (r - q + correlation * vol * vol_ex)
 * No range check on correlation.
 */
[[nodiscard]] inline double quanto_adjusted_yield(
    double correlation, double vol, double vol_ex, double r, double q, double r_f
) noexcept {
    const double growth_adj = correlation * vol * vol_ex;
    const double domestic_numeraire = r - q;
    const double foreign_numeraire = domestic_numeraire + growth_adj;
    return r_f - foreign_numeraire;
}

class alignas(64) QuantoPricer {
public:
    // American option on a synthetic underlying with yield q', discounted at r_f
    [[nodiscard]] static PricingResult price_lattice(
        const OptionContract& contract,
        const QuantoParams& quanto,
        const BinomialTreeConfig& config = {}
    );

    // Longstaff-Schwartz on simulated quanto-adjusted paths
    [[nodiscard]] static PricingResult price_lsm(
        const OptionContract& contract,
        const QuantoParams& quanto,
        const LSMConfig& config = {}
    );

private:
    static void validate(const OptionContract& contract, const QuantoParams& quanto);
};

// ============================================================================
// METHOD DISPATCH
// ============================================================================

// BS only; LT, MC and FD throw UnsupportedMethodError
[[nodiscard]] PricingResult price_forward_start(
    const OptionContract& contract, PricingMethod method
);

// LT and MC; BS and FD throw UnsupportedMethodError
[[nodiscard]] PricingResult price_quanto(
    const OptionContract& contract,
    PricingMethod method,
    const QuantoParams& quanto,
    const BinomialTreeConfig& lattice = {},
    const LSMConfig& lsm = {}
);

} // namespace exotica::options
