#include "metrics.hpp"
#include "decompose.hpp"
#include <gtest/gtest.h>
#include <cmath>

namespace tcomp {
namespace {

TEST(MetricsTest, KnownValues) {
    torch::Tensor ref = torch::tensor({1.0, 2.0, 3.0, 4.0}, torch::kFloat64);
    torch::Tensor approx = torch::tensor({1.0, 2.0, 3.0, 5.0}, torch::kFloat64);

    EXPECT_DOUBLE_EQ(relative_error(ref, approx), 1.0 / std::sqrt(30.0));
    EXPECT_DOUBLE_EQ(rmse(ref, approx), 0.5);
    EXPECT_DOUBLE_EQ(r_squared(ref, approx), 0.8);

    EXPECT_DOUBLE_EQ(relative_error(ref, ref), 0.0);
    EXPECT_DOUBLE_EQ(r_squared(ref, ref), 1.0);
}

TEST(MetricsTest, DegenerateReferences) {
    torch::Tensor zero = torch::zeros({2, 2}, torch::kFloat64);
    torch::Tensor one = torch::ones({2, 2}, torch::kFloat64);

    EXPECT_EQ(relative_error(zero, zero), 0.0);
    EXPECT_TRUE(std::isinf(relative_error(zero, one)));

    // constant reference has no variance to explain
    EXPECT_EQ(r_squared(one, one), 1.0);
    EXPECT_EQ(r_squared(one, zero), 0.0);
}

TEST(MetricsTest, ShapeMismatchThrows) {
    torch::Tensor a = torch::ones({2, 3}, torch::kFloat64);
    torch::Tensor b = torch::ones({3, 2}, torch::kFloat64);

    EXPECT_THROW(relative_error(a, b), std::runtime_error);
    EXPECT_THROW(rmse(a, b), std::runtime_error);
    EXPECT_THROW(r_squared(a, b), std::runtime_error);
}

TEST(MetricsTest, MixedPrecisionIsComparedInDouble) {
    torch::Tensor ref = torch::tensor({1.0, 2.0}, torch::kFloat64);
    torch::Tensor approx = torch::tensor({1.0f, 2.0f}, torch::kFloat32);
    EXPECT_EQ(relative_error(ref, approx), 0.0);
}

TEST(MetricsTest, StructuredOverloadsMatchDense) {
    torch::manual_seed(0);
    torch::Tensor X = torch::randn({5, 4, 6}, torch::kFloat64);
    StructuredTensor T = make_tt(X, {2});
    torch::Tensor Y = T.full();

    EXPECT_DOUBLE_EQ(relative_error(X, T), relative_error(X, Y));
    EXPECT_DOUBLE_EQ(rmse(X, T), rmse(X, Y));
    EXPECT_DOUBLE_EQ(r_squared(X, T), r_squared(X, Y));
    EXPECT_GT(r_squared(X, T), 0.0);
    EXPECT_LT(r_squared(X, T), 1.0);
}

}
}
