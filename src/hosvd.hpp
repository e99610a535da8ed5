#pragma once
#include <torch/torch.h>
#include <vector>

namespace tcomp {

// Tucker decompositions, X ~= core x_0 U_0 x_1 U_1 ... x_{N-1} U_{N-1}
// with orthonormal factors U_k of shape (n_k, s_k).
// Ranks: N values, or a single value used for every mode.
// eps: each mode truncates at eps/sqrt(N) * ||X||.

// Standard HOSVD: every factor from the unfolding of X itself
std::pair<torch::Tensor, std::vector<torch::Tensor>> hosvd(
    const torch::Tensor& X,
    const std::vector<int64_t>& target_ranks
);

std::pair<torch::Tensor, std::vector<torch::Tensor>> hosvd_eps(
    const torch::Tensor& X,
    double eps
);

// Sequentially truncated HOSVD: mode n is unfolded from the core
// already projected on modes 0..n-1
std::pair<torch::Tensor, std::vector<torch::Tensor>> st_hosvd(
    const torch::Tensor& X,
    const std::vector<int64_t>& target_ranks
);

std::pair<torch::Tensor, std::vector<torch::Tensor>> st_hosvd_eps(
    const torch::Tensor& X,
    double eps
);

// core x_k U_k for all k
torch::Tensor tucker_full(const torch::Tensor& core, const std::vector<torch::Tensor>& factors);

}
