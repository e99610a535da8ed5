#include "tt_svd.hpp"
#include "error_budget.hpp"
#include "svd.hpp"
#include "utils.hpp"
#include <algorithm>
#include <functional>
#include <stdexcept>
#include <string>

namespace tcomp {

namespace {
    std::vector<torch::Tensor> tt_sweep(
        const torch::Tensor& X,
        const std::function<Truncation(int64_t)>& step_truncation
    ) {
        if (X.dim() == 0) {
            throw std::invalid_argument("tt_svd: input needs at least one mode");
        }

        std::vector<int64_t> shape = X.sizes().vec();
        int64_t ndim = shape.size();
        std::vector<torch::Tensor> cores;
        cores.reserve(ndim);

        // remainder is kept as (r_{k-1} * n_k, n_{k+1} * ... * n_{N-1})
        int64_t r_prev = 1;
        torch::Tensor remainder = X.reshape({1, utils::product(shape)});

        for (int64_t k = 0; k < ndim - 1; ++k) {
            // column count from the trailing modes, any of which may be empty
            int64_t rest = utils::product(std::vector<int64_t>(shape.begin() + k + 1, shape.end()));
            torch::Tensor W = remainder.reshape({r_prev * shape[k], rest});

            SvdResult svd = truncated_svd(W, step_truncation(k));
            int64_t r = svd.rank();

            cores.push_back(svd.U.reshape({r_prev, shape[k], r}));

            if (r == 0) {
                // nothing left to carry, the chain reconstructs to zero
                for (int64_t j = k + 1; j < ndim; ++j) {
                    int64_t r_right = (j == ndim - 1) ? 1 : 0;
                    cores.push_back(torch::zeros({0, shape[j], r_right}, X.options()));
                }
                return cores;
            }

            // carry S * V^T forward
            remainder = svd.S.unsqueeze(1) * svd.V.t();
            r_prev = r;
        }

        cores.push_back(remainder.reshape({r_prev, shape[ndim - 1], 1}).contiguous());
        return cores;
    }
}

std::vector<torch::Tensor> tt_svd(
    const torch::Tensor& X,
    const std::vector<int64_t>& target_ranks
) {
    int64_t bonds = std::max<int64_t>(X.dim() - 1, 0);

    if (target_ranks.size() != 1 && target_ranks.size() != static_cast<size_t>(bonds)) {
        throw std::invalid_argument("tt_svd: expected 1 or " + std::to_string(bonds) +
                                    " target ranks, got " + std::to_string(target_ranks.size()));
    }
    for (int64_t r : target_ranks) {
        if (r < 0) throw std::invalid_argument("tt_svd: ranks must be non-negative");
    }

    return tt_sweep(X, [&](int64_t k) {
        int64_t rank = (target_ranks.size() == 1) ? target_ranks[0] : target_ranks[k];
        return Truncation::to_rank(rank);
    });
}

std::vector<torch::Tensor> tt_svd_eps(
    const torch::Tensor& X,
    double eps
) {
    double step_eps = tt_step_tolerance(eps, X.dim());
    double norm_X = X.norm().item<double>();

    return tt_sweep(X, [&](int64_t) {
        return Truncation::to_eps(step_eps, norm_X);
    });
}

torch::Tensor tt_full(const std::vector<torch::Tensor>& cores) {
    if (cores.empty()) {
        throw std::runtime_error("tt_full: empty chain");
    }

    std::vector<int64_t> shape;
    shape.reserve(cores.size());

    // (n_0 * ... * n_k, r_k)
    torch::Tensor acc = cores[0].reshape({cores[0].size(1), cores[0].size(2)});
    shape.push_back(cores[0].size(1));

    for (size_t k = 1; k < cores.size(); ++k) {
        const torch::Tensor& G = cores[k];
        if (G.size(0) != acc.size(1)) {
            throw std::runtime_error("tt_full: bond rank mismatch at core " + std::to_string(k));
        }
        torch::Tensor prod = torch::matmul(acc, G.reshape({G.size(0), G.size(1) * G.size(2)}));
        acc = prod.reshape({acc.size(0) * G.size(1), G.size(2)});
        shape.push_back(G.size(1));
    }

    return acc.reshape(shape);
}

}
