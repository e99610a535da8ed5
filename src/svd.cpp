#include "svd.hpp"
#include <ATen/ops/linalg_qr.h>
#include <ATen/ops/linalg_svd.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace tcomp {

namespace {
    std::vector<double> to_vector(const torch::Tensor& S) {
        torch::Tensor S_cpu = S.to(torch::kCPU).to(torch::kFloat64).contiguous();
        auto acc = S_cpu.accessor<double, 1>();

        std::vector<double> out(S_cpu.size(0));
        for (int64_t i = 0; i < S_cpu.size(0); ++i) {
            // singular values are non-negative, clamp round-off
            out[i] = std::max(acc[i], 0.0);
        }
        return out;
    }

    SvdResult empty_result(const torch::Tensor& M) {
        auto options = M.options();
        return {torch::zeros({M.size(0), 0}, options),
                torch::zeros({0}, options),
                torch::zeros({M.size(1), 0}, options)};
    }

    // Full thin SVD, QR-preconditioned for non-square input
    std::tuple<torch::Tensor, torch::Tensor, torch::Tensor> thin_svd(const torch::Tensor& M) {
        int64_t m = M.size(0);
        int64_t n = M.size(1);

        if (m > n) {
            // M = Q R, R = Ur S Vh  =>  M = (Q Ur) S Vh
            auto [Q, R] = at::linalg_qr(M, "reduced");
            auto [Ur, S, Vh] = at::linalg_svd(R, /*full_matrices=*/false);
            return {torch::matmul(Q, Ur), S, Vh.t()};
        }

        if (n > m) {
            // M^T = Q R  =>  M = R^T Q^T, R^T = U S Vh  =>  M = U S (Q Vh^T)^T
            auto [Q, R] = at::linalg_qr(M.t(), "reduced");
            auto [U, S, Vh] = at::linalg_svd(R.t(), /*full_matrices=*/false);
            return {U, S, torch::matmul(Q, Vh.t())};
        }

        auto [U, S, Vh] = at::linalg_svd(M, /*full_matrices=*/false);
        return {U, S, Vh.t()};
    }
}

int64_t truncation_rank(const std::vector<double>& S, double delta) {
    int64_t n = S.size();
    double discarded_energy_sq = 0.0;

    for (int64_t r = n; r > 0; --r) {
        double sigma = S[r - 1];
        discarded_energy_sq += sigma * sigma;
        if (std::sqrt(discarded_energy_sq) > delta) {
            return r;
        }
    }
    return 0;
}

int64_t numerical_rank(const std::vector<double>& S, int64_t m, int64_t n, torch::ScalarType dtype) {
    if (S.empty() || S[0] == 0.0) {
        return 0;
    }

    double machine_eps = (dtype == torch::kFloat32)
        ? static_cast<double>(std::numeric_limits<float>::epsilon())
        : std::numeric_limits<double>::epsilon();
    double tol = static_cast<double>(std::max(m, n)) * machine_eps * S[0];

    int64_t r = 0;
    while (r < static_cast<int64_t>(S.size()) && S[r] > tol) {
        ++r;
    }
    return r;
}

SvdResult truncated_svd(const torch::Tensor& M, const Truncation& trunc) {
    if (M.dim() != 2) {
        throw std::runtime_error("truncated_svd expects a matrix, got " + std::to_string(M.dim()) + " dimensions");
    }
    if (trunc.rank.has_value() == trunc.eps.has_value()) {
        throw std::invalid_argument("truncated_svd: exactly one of rank or eps must be given");
    }
    if (trunc.rank.has_value() && *trunc.rank < 0) {
        throw std::invalid_argument("truncated_svd: rank must be non-negative");
    }
    if (trunc.eps.has_value() && !(*trunc.eps >= 0.0 && std::isfinite(*trunc.eps))) {
        throw std::invalid_argument("truncated_svd: eps must be finite and non-negative");
    }

    if (M.numel() == 0 || (trunc.rank.has_value() && *trunc.rank == 0)) {
        return empty_result(M);
    }

    auto [U, S, V] = thin_svd(M);
    std::vector<double> s = to_vector(S);

    int64_t rank = 0;
    if (trunc.rank.has_value()) {
        rank = std::min(*trunc.rank, numerical_rank(s, M.size(0), M.size(1), M.scalar_type()));
    } else {
        double total_sq = 0.0;
        for (double sigma : s) total_sq += sigma * sigma;

        double norm = trunc.reference_norm.has_value() ? *trunc.reference_norm : std::sqrt(total_sq);
        rank = truncation_rank(s, *trunc.eps * norm);
    }

    if (rank == 0) {
        return empty_result(M);
    }

    return {U.slice(/*dim=*/1, /*start=*/0, /*end=*/rank).contiguous(),
            S.slice(/*dim=*/0, /*start=*/0, /*end=*/rank).contiguous(),
            V.slice(/*dim=*/1, /*start=*/0, /*end=*/rank).contiguous()};
}

}
