#include "hosvd.hpp"
#include "error_budget.hpp"
#include "svd.hpp"
#include "utils.hpp"
#include <functional>
#include <stdexcept>
#include <string>

namespace tcomp {

namespace {
    using ModeTruncation = std::function<Truncation(int64_t)>;

    std::pair<torch::Tensor, std::vector<torch::Tensor>> run_hosvd(
        const torch::Tensor& X,
        const ModeTruncation& mode_truncation,
        bool sequential
    ) {
        if (X.dim() == 0) {
            throw std::invalid_argument("hosvd: input needs at least one mode");
        }

        torch::Tensor core = X;
        int64_t ndim = X.dim();
        std::vector<torch::Tensor> factors(ndim);

        for (int64_t n = 0; n < ndim; ++n) {
            // Unfold on mode-n, either from X or from the partially projected core
            torch::Tensor Yn = utils::unfold(sequential ? core : X, n);

            SvdResult svd = truncated_svd(Yn, mode_truncation(n));
            factors[n] = svd.U;

            if (sequential) {
                // Update core to be core x_n (U^(n))^T
                core = utils::mode_product(core, svd.U.t(), n);
            }
        }

        if (!sequential) {
            for (int64_t n = 0; n < ndim; ++n) {
                core = utils::mode_product(core, factors[n].t(), n);
            }
        }

        return {core, factors};
    }

    ModeTruncation rank_truncation(const torch::Tensor& X, const std::vector<int64_t>& target_ranks) {
        int64_t ndim = X.dim();
        if (target_ranks.size() != 1 && target_ranks.size() != static_cast<size_t>(ndim)) {
            throw std::invalid_argument("Target ranks size must match tensor dimensions (expected 1 or " +
                                        std::to_string(ndim) + ", got " + std::to_string(target_ranks.size()) + ")");
        }
        for (int64_t r : target_ranks) {
            if (r < 0) throw std::invalid_argument("hosvd: ranks must be non-negative");
        }

        return [target_ranks](int64_t n) {
            return Truncation::to_rank(target_ranks.size() == 1 ? target_ranks[0] : target_ranks[n]);
        };
    }

    ModeTruncation eps_truncation(const torch::Tensor& X, double eps) {
        double mode_eps = tucker_mode_tolerance(eps, X.dim());
        double norm_X = X.norm().item<double>();

        return [mode_eps, norm_X](int64_t) {
            return Truncation::to_eps(mode_eps, norm_X);
        };
    }
}

std::pair<torch::Tensor, std::vector<torch::Tensor>> hosvd(
    const torch::Tensor& X,
    const std::vector<int64_t>& target_ranks
) {
    return run_hosvd(X, rank_truncation(X, target_ranks), /*sequential=*/false);
}

std::pair<torch::Tensor, std::vector<torch::Tensor>> hosvd_eps(
    const torch::Tensor& X,
    double eps
) {
    return run_hosvd(X, eps_truncation(X, eps), /*sequential=*/false);
}

std::pair<torch::Tensor, std::vector<torch::Tensor>> st_hosvd(
    const torch::Tensor& X,
    const std::vector<int64_t>& target_ranks
) {
    return run_hosvd(X, rank_truncation(X, target_ranks), /*sequential=*/true);
}

std::pair<torch::Tensor, std::vector<torch::Tensor>> st_hosvd_eps(
    const torch::Tensor& X,
    double eps
) {
    return run_hosvd(X, eps_truncation(X, eps), /*sequential=*/true);
}

torch::Tensor tucker_full(const torch::Tensor& core, const std::vector<torch::Tensor>& factors) {
    if (static_cast<size_t>(core.dim()) != factors.size()) {
        throw std::runtime_error("tucker_full: need one factor per mode of the core");
    }

    torch::Tensor recon = core;
    for (size_t n = 0; n < factors.size(); ++n) {
        recon = utils::mode_product(recon, factors[n], n);
    }
    return recon;
}

}
