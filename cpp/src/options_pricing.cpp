#include "exotica/options_pricing.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <string>

namespace exotica::options {

namespace {

void require(bool condition, const char* message) {
    if (!condition) {
        throw ValidationError(message);
    }
}

int64_t elapsed_ns(std::chrono::steady_clock::time_point start) noexcept {
    const auto end = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
}

} // namespace

// ============================================================================
// PARSING AND VALIDATION
// ============================================================================

OptionType parse_right(std::string_view right) {
    if (!right.empty()) {
        const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(right.front())));
        if (c == 'c') return OptionType::CALL;
        if (c == 'p') return OptionType::PUT;
    }
    throw ValidationError("right should be either \"call\" or \"put\", got \"" + std::string(right) + "\"");
}

PricingMethod parse_method(std::string_view name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "BS") return PricingMethod::BS;
    if (upper == "LT") return PricingMethod::LT;
    if (upper == "MC") return PricingMethod::MC;
    if (upper == "FD") return PricingMethod::FD;
    throw UnsupportedMethodError("unknown pricing method \"" + std::string(name) + "\"");
}

std::string_view to_string(PricingMethod method) noexcept {
    switch (method) {
        case PricingMethod::BS: return "BS";
        case PricingMethod::LT: return "LT";
        case PricingMethod::MC: return "MC";
        case PricingMethod::FD: return "FD";
    }
    return "?";
}

int coerce_basis_degree(std::string_view text) noexcept {
    int degree = DEFAULT_BASIS_DEGREE;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, degree);
    if (ec != std::errc{} || ptr != last || degree < 0) {
        return DEFAULT_BASIS_DEGREE;
    }
    return degree;
}

void validate_contract(const OptionContract& c) {
    require(c.right == OptionType::CALL || c.right == OptionType::PUT,
            "right should be either call or put");

    require(std::isfinite(c.ref.S0) && std::isfinite(c.ref.vol) && std::isfinite(c.ref.q) &&
            std::isfinite(c.T) && std::isfinite(c.T_s) && std::isfinite(c.r) &&
            std::isfinite(c.r_f) && std::isfinite(c.strike()),
            "S0, K, T, T_s, vol, r, r_f, q should be finite numbers");

    require(c.ref.vol >= 0.0, "vol >= 0");
    require(c.T > 0.0, "T > 0");
    require(c.T_s >= 0.0, "T_s >= 0");
    require(c.ref.S0 >= 0.0, "S0 >= 0");
    require(c.strike() >= 0.0, "K >= 0");
    require(c.r >= 0.0, "r >= 0");
    require(c.r_f >= 0.0, "r_f >= 0");
    require(c.ref.q >= 0.0, "q >= 0");
}

// ============================================================================
// BLACK-SCHOLES PRICER IMPLEMENTATION
// ============================================================================

PricingResult BlackScholesPricer::price(
    double S, double K, double T, double r, double q, double sigma, OptionType type
) noexcept {
    const auto start = std::chrono::steady_clock::now();

    PricingResult result{};
    result.method = PricingMethod::BS;
    result.sub_method = "Black-Scholes";

    const double forward_S = S * std::exp(-q * T);
    const double discounted_K = K * std::exp(-r * T);
    const double sign = sign_cp(type);

    if (!(sigma * std::sqrt(T) > 0.0) || S <= 0.0 || K <= 0.0) {
        // Limit of the formula: the payoff on the deterministic forward
        result.price = std::max(sign * (forward_S - discounted_K), 0.0);
    } else {
        double d1, d2;
        calc_d1_d2(S, K, T, r, q, sigma, d1, d2);

        if (type == OptionType::CALL) {
            result.price = forward_S * MathUtils::norm_cdf(d1) - discounted_K * MathUtils::norm_cdf(d2);
        } else {
            result.price = discounted_K * MathUtils::norm_cdf(-d2) - forward_S * MathUtils::norm_cdf(-d1);
        }
    }

    result.calc_time_ns = elapsed_ns(start);
    return result;
}

// ============================================================================
// FORWARD-START PRICER IMPLEMENTATION
// ============================================================================

PricingResult ForwardStartPricer::price_analytic(const OptionContract& contract) {
    const auto start = std::chrono::steady_clock::now();
    validate_contract(contract);

    const auto& ref = contract.ref;
    auto result = BlackScholesPricer::price(
        ref.S0, contract.strike(), contract.T, contract.r, ref.q, ref.vol, contract.right
    );
    result.price *= std::exp(-ref.q * contract.T_s);
    result.sub_method = "forward start; Black-Scholes";
    result.calc_time_ns = elapsed_ns(start);
    return result;
}

// ============================================================================
// AMERICAN OPTIONS - BINOMIAL TREE IMPLEMENTATION
// ============================================================================

LatticeSpecs AmericanOptionPricer::build_crr_params(
    double r, double q, double sigma, double dt
) noexcept {
    const double u = std::exp(sigma * std::sqrt(dt));
    const double d = 1.0 / u;
    const double a = std::exp((r - q) * dt);
    const double p = (a - d) / (u - d);
    return {dt, u, d, a, p, std::exp(-r * dt), 0.0};
}

PricingResult AmericanOptionPricer::price_binomial(
    const Underlying& ref, OptionType type, double K, double T, double r,
    const BinomialTreeConfig& config
) {
    const auto start = std::chrono::steady_clock::now();

    require(config.steps > 0, "binomial tree: number of steps must be positive");
    require(type == OptionType::CALL || type == OptionType::PUT,
            "right should be either call or put");
    require(std::isfinite(ref.S0) && std::isfinite(ref.vol) && std::isfinite(ref.q) &&
            std::isfinite(K) && std::isfinite(T) && std::isfinite(r),
            "binomial tree: inputs should be finite numbers");
    require(ref.vol > 0.0, "binomial tree: volatility must be positive");
    require(T > 0.0, "T > 0");
    require(ref.S0 >= 0.0 && K >= 0.0, "S0 >= 0 and K >= 0");

    const int N = config.steps;
    auto params = build_crr_params(r, ref.q, ref.vol, T / N);
    params.df_T = std::exp(-r * T);

    if (!(params.p >= 0.0 && params.p <= 1.0)) {
        throw NumericalError("binomial tree: risk-neutral probability " +
                             std::to_string(params.p) + " outside [0, 1]; increase steps");
    }

    const double u = params.u;
    const double d = params.d;
    const double p = params.p;
    const double disc = params.df_dt;
    const double sign = sign_cp(type);

    PricingResult result{};
    result.method = PricingMethod::LT;
    result.sub_method = "binomial tree; Hull Ch.13";
    result.keep_hist = config.keep_hist;
    result.nsteps = N;

    if (config.keep_hist) {
        result.ref_tree.resize(N + 1);
        result.opt_tree.resize(N + 1);
    }

    // Node j at level i (j up moves) carries S0 * u^j * d^(i - j)
    std::vector<double> prices(N + 1);
    std::vector<double> spots(N + 1);

    for (int j = 0; j <= N; ++j) {
        spots[j] = ref.S0 * std::pow(u, j) * std::pow(d, N - j);
        prices[j] = std::max(sign * (spots[j] - K), 0.0);
    }

    if (config.keep_hist) {
        result.ref_tree[N] = spots;
        result.opt_tree[N] = prices;
    }

    // Backward induction with early exercise check
    for (int i = N - 1; i >= 0; --i) {
        for (int j = 0; j <= i; ++j) {
            const double cont_value = disc * (p * prices[j + 1] + (1.0 - p) * prices[j]);
            spots[j] = ref.S0 * std::pow(u, j) * std::pow(d, i - j);
            const double exercise_value = std::max(sign * (spots[j] - K), 0.0);
            prices[j] = std::max(cont_value, exercise_value);
        }

        if (config.keep_hist) {
            result.ref_tree[i].assign(spots.begin(), spots.begin() + i + 1);
            result.opt_tree[i].assign(prices.begin(), prices.begin() + i + 1);
        }
    }

    result.price = prices[0];
    result.lattice = params;
    result.calc_time_ns = elapsed_ns(start);

    return result;
}

// ============================================================================
// METHOD DISPATCH
// ============================================================================

PricingResult price_forward_start(const OptionContract& contract, PricingMethod method) {
    switch (method) {
        case PricingMethod::BS:
            return ForwardStartPricer::price_analytic(contract);
        case PricingMethod::LT:
        case PricingMethod::MC:
        case PricingMethod::FD:
            break;
    }
    throw UnsupportedMethodError("forward start: method " + std::string(to_string(method)) +
                                 " is not implemented");
}

PricingResult price_quanto(
    const OptionContract& contract,
    PricingMethod method,
    const QuantoParams& quanto,
    const BinomialTreeConfig& lattice,
    const LSMConfig& lsm
) {
    switch (method) {
        case PricingMethod::LT:
            return QuantoPricer::price_lattice(contract, quanto, lattice);
        case PricingMethod::MC:
            return QuantoPricer::price_lsm(contract, quanto, lsm);
        case PricingMethod::BS:
        case PricingMethod::FD:
            break;
    }
    throw UnsupportedMethodError("quanto: method " + std::string(to_string(method)) +
                                 " is not implemented");
}

} // namespace exotica::options
