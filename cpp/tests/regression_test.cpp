#include <gtest/gtest.h>
#include "exotica/regression.hpp"
#include "exotica/pricing_error.hpp"
#include <cmath>
#include <span>
#include <vector>

using namespace exotica;
using namespace exotica::regression;

class ContinuationModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (int i = 0; i <= 40; ++i) {
            const double s = 80.0 + i;
            x.push_back(s);
            y.push_back(cubic(s));
        }
    }

    static double cubic(double s) {
        const double m = s - 100.0;
        return 3.0 - 0.4 * m + 0.02 * m * m - 0.001 * m * m * m;
    }

    std::vector<double> x;
    std::vector<double> y;
};

TEST_F(ContinuationModelTest, RecoversExactPolynomial) {
    auto model = ContinuationModel::fit(x, y, 3);

    EXPECT_EQ(model.degree(), 3);
    EXPECT_EQ(model.coefficients().size(), 4u);
    for (double s : {80.0, 93.5, 100.0, 117.25, 120.0}) {
        EXPECT_NEAR(model(s), cubic(s), 1e-9);
    }
}

TEST_F(ContinuationModelTest, HigherDegreeStillFitsExactly) {
    auto model = ContinuationModel::fit(x, y, 5);

    for (size_t i = 0; i < x.size(); ++i) {
        EXPECT_NEAR(model(x[i]), y[i], 1e-8);
    }
}

TEST_F(ContinuationModelTest, EvaluateMatchesPointwise) {
    auto model = ContinuationModel::fit(x, y, 2);
    std::vector<double> out(x.size());
    model.evaluate(x, out);

    for (size_t i = 0; i < x.size(); ++i) {
        EXPECT_EQ(out[i], model(x[i]));
    }
}

TEST_F(ContinuationModelTest, EvaluateIntoChunks) {
    auto model = ContinuationModel::fit(x, y, 3);
    std::vector<double> out(x.size(), -1.0);
    const std::span<const double> spots(x);
    const std::span<double> buffer(out);

    // Two disjoint chunks fill the whole buffer, as the exercise loop does
    const size_t split = x.size() / 3;
    model.evaluate(spots.subspan(0, split), buffer.subspan(0, split));
    model.evaluate(spots.subspan(split), buffer.subspan(split));

    for (size_t i = 0; i < x.size(); ++i) {
        EXPECT_EQ(out[i], model(x[i]));
        EXPECT_NEAR(out[i], cubic(x[i]), 1e-9);
    }
}

TEST_F(ContinuationModelTest, DegreeZeroIsMean) {
    std::vector<double> values{1.0, 2.0, 4.0, 9.0};
    std::vector<double> spots{10.0, 11.0, 12.0, 13.0};

    auto model = ContinuationModel::fit(spots, values, 0);

    EXPECT_NEAR(model(10.0), 4.0, 1e-12);
    EXPECT_NEAR(model(50.0), 4.0, 1e-12);
}

TEST_F(ContinuationModelTest, ConstantRegressorIsRankDeficient) {
    std::vector<double> flat(10, 100.0);
    std::vector<double> values(10, 1.0);

    EXPECT_THROW((void)ContinuationModel::fit(flat, values, 2), NumericalError);
    EXPECT_NO_THROW((void)ContinuationModel::fit(flat, values, 0));
}

TEST_F(ContinuationModelTest, TooFewObservations) {
    std::vector<double> spots{90.0, 100.0, 110.0};
    std::vector<double> values{12.0, 5.0, 1.0};

    EXPECT_THROW((void)ContinuationModel::fit(spots, values, 5), NumericalError);
    EXPECT_NO_THROW((void)ContinuationModel::fit(spots, values, 2));
}

TEST_F(ContinuationModelTest, RejectsMalformedInput) {
    std::vector<double> shorter(y.begin(), y.end() - 1);
    std::vector<double> empty;

    EXPECT_THROW((void)ContinuationModel::fit(x, shorter, 2), NumericalError);
    EXPECT_THROW((void)ContinuationModel::fit(empty, empty, 2), NumericalError);
    EXPECT_THROW((void)ContinuationModel::fit(x, y, -1), NumericalError);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
