#pragma once

#include <span>
#include <utility>
#include <vector>

namespace exotica::regression {

// =============================================================================
// CONTINUATION VALUE MODEL
// Least-squares polynomial in spot, refitted at every exercise date of the
// Longstaff-Schwartz backward induction.
// =============================================================================

class ContinuationModel {
public:
    /**
     * Fit y ~ sum_k beta_k u^k, k = 0..degree, where u maps [min x, max x]
     * onto [-1, 1]. Solved with column-pivoting Householder QR.
     *
     * Throws NumericalError if x and y differ in size, are empty, or the
     * design matrix is rank deficient (fewer distinct x than coefficients).
     */
    [[nodiscard]] static ContinuationModel fit(
        std::span<const double> x,
        std::span<const double> y,
        int degree
    );

    // Horner evaluation at a single spot
    [[nodiscard]] double operator()(double x) const noexcept;

    void evaluate(std::span<const double> x, std::span<double> out) const noexcept;

    [[nodiscard]] int degree() const noexcept {
        return static_cast<int>(coefficients_.size()) - 1;
    }

    // Ascending powers of the scaled variable
    [[nodiscard]] const std::vector<double>& coefficients() const noexcept {
        return coefficients_;
    }

private:
    ContinuationModel(std::vector<double> coefficients, double center, double half_width)
        : coefficients_(std::move(coefficients)), center_(center), half_width_(half_width) {}

    std::vector<double> coefficients_;
    double center_;
    double half_width_;
};

} // namespace exotica::regression
