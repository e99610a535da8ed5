#include "svd.hpp"
#include <gtest/gtest.h>
#include <cmath>

namespace tcomp {
namespace {

torch::Tensor reconstruct(const SvdResult& svd) {
    return torch::matmul(svd.U * svd.S.unsqueeze(0), svd.V.t());
}

TEST(SvdTest, FixedRankIsBestApproximation) {
    torch::manual_seed(0);
    torch::Tensor M = torch::randn({6, 4}, torch::kFloat64);
    auto [U, S, Vh] = torch::linalg_svd(M, /*full_matrices=*/false);

    SvdResult svd = truncated_svd(M, Truncation::to_rank(2));
    ASSERT_EQ(svd.rank(), 2);
    EXPECT_EQ(svd.U.size(0), 6);
    EXPECT_EQ(svd.V.size(0), 4);

    double tail = std::sqrt(S[2].item<double>() * S[2].item<double>() +
                            S[3].item<double>() * S[3].item<double>());
    double err = (M - reconstruct(svd)).norm().item<double>();
    EXPECT_NEAR(err, tail, 1e-10);
    EXPECT_TRUE(torch::allclose(svd.S, S.slice(0, 0, 2), 1e-12, 1e-12));
}

TEST(SvdTest, RankIsCappedByMatrixRank) {
    torch::manual_seed(1);
    torch::Tensor a = torch::randn({5, 1}, torch::kFloat64);
    torch::Tensor b = torch::randn({1, 7}, torch::kFloat64);
    torch::Tensor c = torch::randn({5, 1}, torch::kFloat64);
    torch::Tensor d = torch::randn({1, 7}, torch::kFloat64);
    torch::Tensor M = torch::matmul(a, b) + torch::matmul(c, d);

    SvdResult svd = truncated_svd(M, Truncation::to_rank(5));
    EXPECT_EQ(svd.rank(), 2);
    EXPECT_TRUE(torch::allclose(reconstruct(svd), M, 1e-10, 1e-10));
}

TEST(SvdTest, TruncationRankPrefersFewerComponentsOnTies) {
    std::vector<double> S = {4.0, 3.0, 2.0, 1.0};
    // discarding {2, 1} costs exactly sqrt(5)
    EXPECT_EQ(truncation_rank(S, std::sqrt(5.0)), 2);
    EXPECT_EQ(truncation_rank(S, std::sqrt(5.0) - 1e-9), 3);
    EXPECT_EQ(truncation_rank(S, 0.0), 4);
    EXPECT_EQ(truncation_rank(S, std::sqrt(30.0)), 0);
}

TEST(SvdTest, EpsBoundsDiscardedEnergy) {
    torch::manual_seed(2);
    torch::Tensor M = torch::randn({20, 12}, torch::kFloat64);
    double norm = M.norm().item<double>();

    for (double eps : {0.05, 0.2, 0.6}) {
        SvdResult svd = truncated_svd(M, Truncation::to_eps(eps));
        double err = (M - reconstruct(svd)).norm().item<double>();
        EXPECT_LE(err, eps * norm * (1 + 1e-12)) << "eps " << eps;

        // one component less would violate the bound
        if (svd.rank() > 0) {
            SvdResult smaller = truncated_svd(M, Truncation::to_rank(svd.rank() - 1));
            double err_smaller = (M - reconstruct(smaller)).norm().item<double>();
            EXPECT_GT(err_smaller, eps * norm) << "eps " << eps;
        }
    }
}

TEST(SvdTest, ReferenceNormReplacesMatrixNorm) {
    torch::Tensor M = torch::diag(torch::tensor({4.0, 3.0, 2.0, 1.0}, torch::kFloat64));
    // threshold = 0.5 * 10 = 5 > sqrt(1 + 4 + 9)
    SvdResult svd = truncated_svd(M, Truncation::to_eps(0.5, 10.0));
    EXPECT_EQ(svd.rank(), 1);
}

TEST(SvdTest, ZeroMatrixGivesEmptyFactors) {
    torch::Tensor Z = torch::zeros({5, 3}, torch::kFloat64);

    SvdResult by_eps = truncated_svd(Z, Truncation::to_eps(0.1));
    EXPECT_EQ(by_eps.rank(), 0);
    EXPECT_EQ(by_eps.U.size(0), 5);
    EXPECT_EQ(by_eps.U.size(1), 0);
    EXPECT_EQ(by_eps.V.size(0), 3);
    EXPECT_EQ(by_eps.V.size(1), 0);

    SvdResult by_rank = truncated_svd(Z, Truncation::to_rank(3));
    EXPECT_EQ(by_rank.rank(), 0);
}

TEST(SvdTest, TallAndWideMatchDirectSvd) {
    torch::manual_seed(3);
    for (auto dims : {std::vector<int64_t>{3, 9}, std::vector<int64_t>{9, 3}, std::vector<int64_t>{4, 4}}) {
        torch::Tensor M = torch::randn(dims, torch::kFloat64);
        SvdResult svd = truncated_svd(M, Truncation::to_rank(3));
        auto S = std::get<1>(torch::linalg_svd(M, /*full_matrices=*/false));

        EXPECT_TRUE(torch::allclose(reconstruct(svd), M, 1e-10, 1e-10));
        EXPECT_TRUE(torch::allclose(svd.S, S.slice(0, 0, 3), 1e-10, 1e-10));
        // orthonormal columns
        EXPECT_TRUE(torch::allclose(torch::matmul(svd.U.t(), svd.U), torch::eye(3, torch::kFloat64), 1e-10, 1e-10));
        EXPECT_TRUE(torch::allclose(torch::matmul(svd.V.t(), svd.V), torch::eye(3, torch::kFloat64), 1e-10, 1e-10));
    }
}

TEST(SvdTest, InvalidArgumentsThrow) {
    torch::Tensor M = torch::ones({3, 3}, torch::kFloat64);

    EXPECT_THROW(truncated_svd(M, Truncation{}), std::invalid_argument);

    Truncation both = Truncation::to_rank(1);
    both.eps = 0.1;
    EXPECT_THROW(truncated_svd(M, both), std::invalid_argument);

    EXPECT_THROW(truncated_svd(M, Truncation::to_rank(-1)), std::invalid_argument);
    EXPECT_THROW(truncated_svd(M, Truncation::to_eps(-0.1)), std::invalid_argument);
    EXPECT_THROW(truncated_svd(torch::ones({3}, torch::kFloat64), Truncation::to_rank(1)), std::runtime_error);
}

TEST(SvdTest, NumericalRankIgnoresRoundOff) {
    std::vector<double> S = {1.0, 0.5, 1e-17, 0.0};
    EXPECT_EQ(numerical_rank(S, 4, 4, torch::kFloat64), 2);
    EXPECT_EQ(numerical_rank({0.0, 0.0}, 2, 2, torch::kFloat64), 0);
    EXPECT_EQ(numerical_rank({1.0, 1e-9}, 2, 2, torch::kFloat32), 1);
}

}
}
