#pragma once
#include <torch/torch.h>
#include <optional>
#include <vector>

namespace tcomp {

// Exactly one of rank / eps must be set.
// eps is relative to ||M||_F, or to reference_norm when that is given.
struct Truncation {
    std::optional<int64_t> rank;
    std::optional<double> eps;
    std::optional<double> reference_norm;

    static Truncation to_rank(int64_t r) {
        Truncation t;
        t.rank = r;
        return t;
    }

    static Truncation to_eps(double e, std::optional<double> ref = std::nullopt) {
        Truncation t;
        t.eps = e;
        t.reference_norm = ref;
        return t;
    }
};

// M ~= U * diag(S) * V^T with U (m x r), S (r), V (n x r)
struct SvdResult {
    torch::Tensor U;
    torch::Tensor S;
    torch::Tensor V;

    int64_t rank() const { return S.size(0); }
};

// Smallest r such that sqrt(sum_{i >= r} s_i^2) <= delta.
// S must be sorted in descending order.
int64_t truncation_rank(const std::vector<double>& S, double delta);

// Number of singular values above the floating point noise level of an m x n matrix
int64_t numerical_rank(const std::vector<double>& S, int64_t m, int64_t n, torch::ScalarType dtype);

// Truncated SVD of a 2D tensor.
// Non-square matrices are first reduced by a QR of the tall side,
// the SVD then runs on the small triangular factor.
SvdResult truncated_svd(const torch::Tensor& M, const Truncation& trunc);

}
