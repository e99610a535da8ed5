#pragma once
#include <torch/torch.h>
#include <optional>
#include <vector>

#include "cp_als.hpp"
#include "structured_tensor.hpp"

namespace tcomp {

enum class TuckerVariant { hosvd, st_hosvd };

// Which formats to build and how hard to truncate.
// Rank vectors hold one value per bond (TT, N-1) or per mode (Tucker, N),
// or a single value applied everywhere.
struct DecompositionRequest {
    std::optional<std::vector<int64_t>> rank_tt;
    std::optional<std::vector<int64_t>> rank_tucker;
    std::optional<int64_t> rank_cp;
    std::optional<double> eps;

    TuckerVariant tucker_variant = TuckerVariant::hosvd;
    CpOptions cp;
};

// Build a structured tensor from a dense array.
//   rank_tt                -> TT
//   rank_tucker            -> TT-Tucker, core kept exactly
//   rank_tucker + rank_tt  -> TT-Tucker
//   rank_cp                -> CP
//   rank_cp + rank_tucker  -> CP-Tucker
//   eps                    -> TT-Tucker with relative error <= eps
// eps combined with rank_tt or rank_tucker drives the stage without a rank.
// Throws std::invalid_argument for conflicting or missing arguments.
StructuredTensor decompose(const torch::Tensor& X, const DecompositionRequest& req);

// Single-stage builders
StructuredTensor make_tt(const torch::Tensor& X, const std::vector<int64_t>& ranks);
StructuredTensor make_tt_eps(const torch::Tensor& X, double eps);

// Tucker factors with the core stored as an exact TT chain
StructuredTensor make_tucker(const torch::Tensor& X, const std::vector<int64_t>& ranks,
                             TuckerVariant variant = TuckerVariant::hosvd);
StructuredTensor make_tucker_eps(const torch::Tensor& X, double eps,
                                 TuckerVariant variant = TuckerVariant::hosvd);

StructuredTensor make_cp(const torch::Tensor& X, int64_t rank, const CpOptions& opts = CpOptions());

// Rejects undefined, non-floating, zero-dimensional or empty input
void check_dense_input(const torch::Tensor& X);

}
