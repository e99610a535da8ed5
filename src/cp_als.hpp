#pragma once
#include <torch/torch.h>
#include <cstdint>
#include <vector>

namespace tcomp {

struct CpOptions {
    int64_t max_iter = 100;
    // stop once a sweep improves the relative error by less than tol
    double tol = 1e-4;
    uint64_t seed = 0;
    // print one line per sweep to stdout
    bool verbose = false;
};

struct CpResult {
    std::vector<torch::Tensor> factors;   // (n_k, R) per mode
    std::vector<double> errors;           // relative error after each sweep
    int64_t iterations = 0;
    bool converged = false;
};

// Rank-R CP decomposition by alternating least squares.
// Factor k is updated as X_(k) * KR(others) * pinv(hadamard of the other Gram matrices).
CpResult cp_als(const torch::Tensor& X, int64_t rank, const CpOptions& opts = CpOptions());

// sum_r A_0[:, r] o A_1[:, r] o ... o A_{N-1}[:, r]
torch::Tensor cp_full(const std::vector<torch::Tensor>& factors);

}
