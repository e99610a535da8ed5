#include "decompose.hpp"
#include "error_budget.hpp"
#include "hosvd.hpp"
#include "tt_svd.hpp"
#include <limits>
#include <stdexcept>
#include <string>

namespace tcomp {

namespace {
    using TuckerPair = std::pair<torch::Tensor, std::vector<torch::Tensor>>;

    TuckerPair run_tucker(const torch::Tensor& X, const std::vector<int64_t>& ranks, TuckerVariant variant) {
        return (variant == TuckerVariant::st_hosvd) ? st_hosvd(X, ranks) : hosvd(X, ranks);
    }

    TuckerPair run_tucker_eps(const torch::Tensor& X, double eps, TuckerVariant variant) {
        return (variant == TuckerVariant::st_hosvd) ? st_hosvd_eps(X, eps) : hosvd_eps(X, eps);
    }

    // TT chain of a Tucker core without truncation beyond round-off
    std::vector<torch::Tensor> exact_tt(const torch::Tensor& core) {
        return tt_svd(core, {std::numeric_limits<int64_t>::max()});
    }
}

void check_dense_input(const torch::Tensor& X) {
    if (!X.defined()) {
        throw std::invalid_argument("input tensor is undefined");
    }
    if (!X.is_floating_point()) {
        throw std::invalid_argument("input tensor must hold floating point values");
    }
    if (X.dim() == 0) {
        throw std::invalid_argument("input tensor needs at least one mode");
    }
    for (int64_t k = 0; k < X.dim(); ++k) {
        if (X.size(k) == 0) {
            throw std::invalid_argument("mode " + std::to_string(k) + " of the input tensor is empty");
        }
    }
}

StructuredTensor make_tt(const torch::Tensor& X, const std::vector<int64_t>& ranks) {
    check_dense_input(X);
    return StructuredTensor(Layout::tt, tt_svd(X, ranks));
}

StructuredTensor make_tt_eps(const torch::Tensor& X, double eps) {
    check_dense_input(X);
    return StructuredTensor(Layout::tt, tt_svd_eps(X, eps));
}

StructuredTensor make_tucker(const torch::Tensor& X, const std::vector<int64_t>& ranks, TuckerVariant variant) {
    check_dense_input(X);
    auto [core, factors] = run_tucker(X, ranks, variant);
    return StructuredTensor(Layout::tt, exact_tt(core), std::move(factors));
}

StructuredTensor make_tucker_eps(const torch::Tensor& X, double eps, TuckerVariant variant) {
    check_dense_input(X);
    auto [core, factors] = run_tucker_eps(X, eps, variant);
    return StructuredTensor(Layout::tt, exact_tt(core), std::move(factors));
}

StructuredTensor make_cp(const torch::Tensor& X, int64_t rank, const CpOptions& opts) {
    check_dense_input(X);
    CpResult cp = cp_als(X, rank, opts);
    return StructuredTensor(Layout::cp, std::move(cp.factors));
}

StructuredTensor decompose(const torch::Tensor& X, const DecompositionRequest& req) {
    check_dense_input(X);

    const bool T = req.rank_tucker.has_value();
    const bool R = req.rank_tt.has_value();
    const bool C = req.rank_cp.has_value();
    const bool E = req.eps.has_value();

    if (!T && !R && !C && !E) {
        throw std::invalid_argument("decompose: give at least one of rank_tt, rank_tucker, rank_cp or eps");
    }
    if (C && R) {
        throw std::invalid_argument("decompose: rank_cp and rank_tt select different core formats");
    }
    if (C && E) {
        throw std::invalid_argument("decompose: CP is fitted at a fixed rank and cannot be driven by eps; "
                                    "drop eps or request a TT format");
    }
    if (E && T && R) {
        throw std::invalid_argument("decompose: eps has no stage to drive when rank_tucker and rank_tt are both given");
    }

    // stages without a rank share the error budget
    double stage_eps = 0.0;
    if (E) {
        int eps_stages = (T ? 0 : 1) + (R ? 0 : 1);
        stage_eps = split_budget(*req.eps, eps_stages);
    }

    // Tucker stage
    torch::Tensor core = X;
    std::vector<torch::Tensor> factors;
    if (T || E) {
        auto [G, Us] = T ? run_tucker(X, *req.rank_tucker, req.tucker_variant)
                         : run_tucker_eps(X, stage_eps, req.tucker_variant);
        core = G;
        factors = std::move(Us);
    }

    // core stage
    if (C) {
        CpResult cp = cp_als(core, *req.rank_cp, req.cp);
        return StructuredTensor(Layout::cp, std::move(cp.factors), std::move(factors));
    }

    std::vector<torch::Tensor> cores;
    if (R) {
        cores = tt_svd(core, *req.rank_tt);
    } else if (E) {
        cores = tt_svd_eps(core, stage_eps);
    } else {
        cores = exact_tt(core);
    }

    return StructuredTensor(Layout::tt, std::move(cores), std::move(factors));
}

}
