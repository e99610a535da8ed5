#include "utils.hpp"
#include "cp_als.hpp"
#include <gtest/gtest.h>

namespace tcomp {
namespace {

torch::Tensor arange_tensor(std::vector<int64_t> shape) {
    int64_t n = utils::product(shape);
    return torch::arange(n, torch::kFloat64).reshape(shape);
}

TEST(UtilsTest, UnfoldRowsIndexModeColumnsRowMajor) {
    torch::Tensor X = arange_tensor({2, 3, 4});
    torch::Tensor M = utils::unfold(X, 1);

    ASSERT_EQ(M.size(0), 3);
    ASSERT_EQ(M.size(1), 8);
    for (int64_t i = 0; i < 2; ++i)
        for (int64_t j = 0; j < 3; ++j)
            for (int64_t l = 0; l < 4; ++l)
                EXPECT_EQ(M[j][i * 4 + l].item<double>(), X[i][j][l].item<double>());
}

TEST(UtilsTest, FoldInvertsUnfoldOnEveryMode) {
    torch::manual_seed(0);
    torch::Tensor X = torch::randn({3, 4, 2, 5}, torch::kFloat64);
    for (int64_t mode = 0; mode < X.dim(); ++mode) {
        torch::Tensor back = utils::fold(utils::unfold(X, mode), mode, X.sizes());
        EXPECT_TRUE(torch::equal(back, X)) << "mode " << mode;
    }
}

TEST(UtilsTest, InvalidModeThrows) {
    torch::Tensor X = arange_tensor({2, 3});
    EXPECT_THROW(utils::unfold(X, 2), std::runtime_error);
    EXPECT_THROW(utils::unfold(X, -1), std::runtime_error);
    EXPECT_THROW(utils::fold(utils::unfold(X, 0), 0, {3, 2}), std::runtime_error);
}

TEST(UtilsTest, ModeProductMatchesEinsum) {
    torch::manual_seed(1);
    torch::Tensor X = torch::randn({3, 4, 5}, torch::kFloat64);
    torch::Tensor A = torch::randn({6, 4}, torch::kFloat64);

    torch::Tensor Y = utils::mode_product(X, A, 1);
    torch::Tensor expected = torch::einsum("ijk,lj->ilk", {X, A});
    EXPECT_TRUE(torch::allclose(Y, expected, 1e-12, 1e-12));

    EXPECT_THROW(utils::mode_product(X, A, 0), std::runtime_error);
}

TEST(UtilsTest, KhatriRaoLastMatrixVariesFastest) {
    torch::Tensor A = torch::tensor({1.0, 2.0, 3.0, 4.0}, torch::kFloat64).reshape({2, 2});
    torch::Tensor B = torch::tensor({1.0, -1.0, 0.5, 2.0, 0.0, 3.0}, torch::kFloat64).reshape({3, 2});
    torch::Tensor K = utils::khatri_rao({A, B});

    ASSERT_EQ(K.size(0), 6);
    ASSERT_EQ(K.size(1), 2);
    for (int64_t i = 0; i < 2; ++i)
        for (int64_t j = 0; j < 3; ++j)
            for (int64_t r = 0; r < 2; ++r)
                EXPECT_DOUBLE_EQ(K[i * 3 + j][r].item<double>(), A[i][r].item<double>() * B[j][r].item<double>());

    EXPECT_THROW(utils::khatri_rao({A, torch::ones({3, 3}, torch::kFloat64)}), std::runtime_error);
}

TEST(UtilsTest, KhatriRaoMatchesUnfoldingOfCpTensor) {
    torch::manual_seed(2);
    std::vector<torch::Tensor> F = {torch::randn({3, 2}, torch::kFloat64),
                                    torch::randn({4, 2}, torch::kFloat64),
                                    torch::randn({5, 2}, torch::kFloat64)};
    torch::Tensor X = cp_full(F);

    torch::Tensor X1 = torch::matmul(F[1], utils::khatri_rao({F[0], F[2]}).t());
    EXPECT_TRUE(torch::allclose(utils::unfold(X, 1), X1, 1e-12, 1e-12));
}

}
}
