#include "rounding.hpp"
#include "error_budget.hpp"
#include "svd.hpp"
#include <ATen/ops/linalg_qr.h>
#include <functional>
#include <stdexcept>
#include <string>

namespace tcomp {

namespace {
    void reject_cp(const StructuredTensor& t, const char* op) {
        if (t.is_cp()) {
            throw std::invalid_argument(std::string(op) + ": " + t.format_name() +
                                        " tensors cannot be rounded, convert with cp_to_tt() first");
        }
    }

    bool has_zero_bond(const std::vector<torch::Tensor>& cores) {
        for (size_t k = 0; k + 1 < cores.size(); ++k) {
            if (cores[k].size(2) == 0) return true;
        }
        return false;
    }

    // chain of rank-0 bonds over the given modal sizes
    std::vector<torch::Tensor> zero_chain(const std::vector<int64_t>& sizes, const torch::TensorOptions& options) {
        int64_t N = sizes.size();
        std::vector<torch::Tensor> cores;
        cores.reserve(N);
        for (int64_t k = 0; k < N; ++k) {
            int64_t r_left = (k == 0) ? 1 : 0;
            int64_t r_right = (k == N - 1) ? 1 : 0;
            cores.push_back(torch::zeros({r_left, sizes[k], r_right}, options));
        }
        return cores;
    }

    std::vector<int64_t> modal_sizes(const std::vector<torch::Tensor>& cores) {
        std::vector<int64_t> sizes;
        for (const auto& G : cores) sizes.push_back(G.size(1));
        return sizes;
    }

    // G (r0, n, r1), M (r1, q)  ->  (r0, n, q)
    torch::Tensor absorb_right(const torch::Tensor& G, const torch::Tensor& M) {
        int64_t r0 = G.size(0), n = G.size(1), r1 = G.size(2);
        return torch::matmul(G.reshape({r0 * n, r1}), M).reshape({r0, n, M.size(1)});
    }

    // M (q, r0), G (r0, n, r1)  ->  (q, n, r1)
    torch::Tensor absorb_left(const torch::Tensor& M, const torch::Tensor& G) {
        int64_t r0 = G.size(0), n = G.size(1), r1 = G.size(2);
        return torch::matmul(M, G.reshape({r0, n * r1})).reshape({M.size(0), n, r1});
    }

    // truncation of step k given the norm of the whole tensor
    using StepTruncation = std::function<Truncation(int64_t, double)>;

    // cores must be right-orthonormal from core 1 on
    std::vector<torch::Tensor> truncate_sweep(std::vector<torch::Tensor> cores, const StepTruncation& step_truncation) {
        int64_t N = cores.size();
        double norm = cores[0].norm().item<double>();

        for (int64_t k = 0; k < N - 1; ++k) {
            const torch::Tensor& G = cores[k];
            int64_t r0 = G.size(0), n = G.size(1), r1 = G.size(2);

            SvdResult svd = truncated_svd(G.reshape({r0 * n, r1}), step_truncation(k, norm));
            int64_t r = svd.rank();
            if (r == 0) {
                return zero_chain(modal_sizes(cores), cores[0].options());
            }

            cores[k] = svd.U.reshape({r0, n, r});
            cores[k + 1] = absorb_left(svd.S.unsqueeze(1) * svd.V.t(), cores[k + 1]);
        }
        return cores;
    }

    void round_tt_impl(StructuredTensor& t, const StepTruncation& step_truncation) {
        std::vector<torch::Tensor> cores = t.cores();

        if (has_zero_bond(cores)) {
            cores = zero_chain(modal_sizes(cores), cores[0].options());
        } else {
            orthogonalize_right(cores);
            cores = truncate_sweep(std::move(cores), step_truncation);
        }

        t = StructuredTensor(Layout::tt, std::move(cores), t.factors());
    }

    std::vector<int64_t> expand_ranks(const std::vector<int64_t>& ranks, size_t expected, const char* what) {
        if (ranks.size() != 1 && ranks.size() != expected) {
            throw std::invalid_argument(std::string(what) + ": expected 1 or " + std::to_string(expected) +
                                        " ranks, got " + std::to_string(ranks.size()));
        }
        for (int64_t r : ranks) {
            if (r < 0) throw std::invalid_argument(std::string(what) + ": ranks must be non-negative");
        }
        return (ranks.size() == 1) ? std::vector<int64_t>(expected, ranks[0]) : ranks;
    }

    using ModeTruncation = std::function<Truncation(int64_t, double)>;

    void round_tucker_impl(StructuredTensor& t, const ModeTruncation& mode_truncation) {
        std::vector<torch::Tensor> cores = t.cores();
        std::vector<torch::Tensor> factors = t.factors();
        const std::vector<int64_t>& shape = t.shape();
        int64_t N = cores.size();
        auto options = cores[0].options();

        auto zero_tensor = [&]() {
            std::vector<torch::Tensor> zf;
            for (int64_t k = 0; k < N; ++k) zf.push_back(torch::zeros({shape[k], 0}, options));
            std::vector<int64_t> zeros_sizes(N, 0);
            t = StructuredTensor(Layout::tt, zero_chain(zeros_sizes, options), std::move(zf));
        };

        if (has_zero_bond(cores)) {
            zero_tensor();
            return;
        }

        orthogonalize_right(cores);
        double norm = cores[0].norm().item<double>();

        for (int64_t k = 0; k < N; ++k) {
            // cores < k are left-orthonormal, cores > k right-orthonormal
            torch::Tensor G = cores[k];
            int64_t r0 = G.size(0), s = G.size(1), r1 = G.size(2);

            // mode unfolding of the (reduced) Tucker core
            torch::Tensor M = G.permute({1, 0, 2}).reshape({s, r0 * r1});
            SvdResult svd = truncated_svd(M, mode_truncation(k, norm));
            int64_t s_new = svd.rank();
            if (s_new == 0) {
                zero_tensor();
                return;
            }

            factors[k] = factors[k].defined() ? torch::matmul(factors[k], svd.U) : svd.U;
            G = (svd.S.unsqueeze(1) * svd.V.t()).reshape({s_new, r0, r1}).permute({1, 0, 2}).contiguous();

            if (k < N - 1) {
                auto [Q, R] = at::linalg_qr(G.reshape({r0 * s_new, r1}), "reduced");
                cores[k] = Q.reshape({r0, s_new, Q.size(1)});
                cores[k + 1] = absorb_left(R, cores[k + 1]);
            } else {
                cores[k] = G;
            }
        }

        t = StructuredTensor(Layout::tt, std::move(cores), std::move(factors));
    }
}

void orthogonalize_right(std::vector<torch::Tensor>& cores) {
    for (int64_t k = static_cast<int64_t>(cores.size()) - 1; k > 0; --k) {
        const torch::Tensor& G = cores[k];
        int64_t r0 = G.size(0), n = G.size(1), r1 = G.size(2);

        // G^T = Q R  =>  G = R^T Q^T
        auto [Q, R] = at::linalg_qr(G.reshape({r0, n * r1}).t(), "reduced");
        int64_t q = Q.size(1);

        cores[k] = Q.t().reshape({q, n, r1});
        cores[k - 1] = absorb_right(cores[k - 1], R.t());
    }
}

void orthogonalize_left(std::vector<torch::Tensor>& cores) {
    for (size_t k = 0; k + 1 < cores.size(); ++k) {
        const torch::Tensor& G = cores[k];
        int64_t r0 = G.size(0), n = G.size(1), r1 = G.size(2);

        auto [Q, R] = at::linalg_qr(G.reshape({r0 * n, r1}), "reduced");
        int64_t q = Q.size(1);

        cores[k] = Q.reshape({r0, n, q});
        cores[k + 1] = absorb_left(R, cores[k + 1]);
    }
}

void round_tt(StructuredTensor& t, const std::vector<int64_t>& ranks) {
    reject_cp(t, "round_tt");
    std::vector<int64_t> bond_ranks = expand_ranks(ranks, t.ndim() - 1, "round_tt");

    round_tt_impl(t, [&](int64_t k, double) { return Truncation::to_rank(bond_ranks[k]); });
}

void round_tt_eps(StructuredTensor& t, double eps) {
    reject_cp(t, "round_tt");
    double step_eps = tt_step_tolerance(eps, t.ndim());

    round_tt_impl(t, [&](int64_t, double norm) { return Truncation::to_eps(step_eps, norm); });
}

void round_tucker(StructuredTensor& t, const std::vector<int64_t>& ranks) {
    reject_cp(t, "round_tucker");
    std::vector<int64_t> mode_ranks = expand_ranks(ranks, t.ndim(), "round_tucker");

    round_tucker_impl(t, [&](int64_t k, double) { return Truncation::to_rank(mode_ranks[k]); });
}

void round_tucker_eps(StructuredTensor& t, double eps) {
    reject_cp(t, "round_tucker");
    double mode_eps = tucker_mode_tolerance(eps, t.ndim());

    round_tucker_impl(t, [&](int64_t, double norm) { return Truncation::to_eps(mode_eps, norm); });
}

StructuredTensor cp_to_tt(const StructuredTensor& t) {
    if (!t.is_cp()) {
        throw std::invalid_argument("cp_to_tt: tensor is already in " + t.format_name() + " format");
    }

    const std::vector<torch::Tensor>& A = t.cores();
    int64_t N = A.size();
    std::vector<torch::Tensor> cores;
    cores.reserve(N);

    if (N == 1) {
        cores.push_back(A[0].sum(1).reshape({1, A[0].size(0), 1}));
    } else {
        for (int64_t k = 0; k < N; ++k) {
            if (k == 0) {
                cores.push_back(A[k].unsqueeze(0).contiguous());               // (1, n, R)
            } else if (k == N - 1) {
                cores.push_back(A[k].t().unsqueeze(2).contiguous());           // (R, n, 1)
            } else {
                // (n, R, R) diagonal in the last two indices -> (R, n, R)
                cores.push_back(torch::diag_embed(A[k]).permute({1, 0, 2}).contiguous());
            }
        }
    }

    return StructuredTensor(Layout::tt, std::move(cores), t.factors());
}

StructuredTensor round_cp(const StructuredTensor& t, const std::vector<int64_t>& ranks) {
    StructuredTensor tt = cp_to_tt(t);
    round_tt(tt, ranks);
    return tt;
}

StructuredTensor round_cp_eps(const StructuredTensor& t, double eps) {
    StructuredTensor tt = cp_to_tt(t);
    round_tt_eps(tt, eps);
    return tt;
}

}
