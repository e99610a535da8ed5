#pragma once
#include <torch/torch.h>
#include <vector>

namespace tcomp {

// TT-SVD, left-to-right sweep of truncated SVDs.
// Returns N cores of shape (r_{k-1}, n_k, r_k) with r_0 = r_N = 1.

// Fixed bond ranks: N-1 values, or a single value used for every bond
std::vector<torch::Tensor> tt_svd(
    const torch::Tensor& X,
    const std::vector<int64_t>& target_ranks
);

// Relative error target: each of the N-1 steps truncates at eps/sqrt(N-1) * ||X||
std::vector<torch::Tensor> tt_svd_eps(
    const torch::Tensor& X,
    double eps
);

// Reconstruct the dense array of a TT chain
torch::Tensor tt_full(const std::vector<torch::Tensor>& cores);

}
