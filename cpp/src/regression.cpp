#include "exotica/regression.hpp"
#include "exotica/pricing_error.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <string>

namespace exotica::regression {

ContinuationModel ContinuationModel::fit(
    std::span<const double> x,
    std::span<const double> y,
    int degree
) {
    if (degree < 0) {
        throw NumericalError("regression: polynomial degree must be non-negative");
    }
    if (x.size() != y.size()) {
        throw NumericalError("regression: regressor and response sizes differ");
    }
    if (x.empty()) {
        throw NumericalError("regression: no observations");
    }

    const auto [lo, hi] = std::minmax_element(x.begin(), x.end());
    const double center = 0.5 * (*lo + *hi);
    double half_width = 0.5 * (*hi - *lo);
    if (!(half_width > 0.0)) {
        half_width = 1.0;
    }

    const Eigen::Index n = static_cast<Eigen::Index>(x.size());
    const Eigen::Index p = degree + 1;

    // Vandermonde matrix in the scaled variable
    Eigen::MatrixXd A(n, p);
    Eigen::VectorXd b(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const double u = (x[i] - center) / half_width;
        double term = 1.0;
        for (Eigen::Index k = 0; k < p; ++k) {
            A(i, k) = term;
            term *= u;
        }
        b(i) = y[i];
    }

    const Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(A);
    if (qr.rank() < p) {
        throw NumericalError(
            "regression: design matrix is rank deficient (rank " +
            std::to_string(qr.rank()) + " for " + std::to_string(p) + " coefficients)"
        );
    }

    const Eigen::VectorXd beta = qr.solve(b);
    if (!beta.allFinite()) {
        throw NumericalError("regression: non-finite coefficients");
    }

    return ContinuationModel(std::vector<double>(beta.data(), beta.data() + p), center, half_width);
}

double ContinuationModel::operator()(double x) const noexcept {
    const double u = (x - center_) / half_width_;
    double value = 0.0;
    for (auto it = coefficients_.rbegin(); it != coefficients_.rend(); ++it) {
        value = value * u + *it;
    }
    return value;
}

void ContinuationModel::evaluate(std::span<const double> x, std::span<double> out) const noexcept {
    const size_t n = std::min(x.size(), out.size());
    for (size_t i = 0; i < n; ++i) {
        out[i] = (*this)(x[i]);
    }
}

} // namespace exotica::regression
