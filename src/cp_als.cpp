#include "cp_als.hpp"
#include "utils.hpp"
#include <ATen/CPUGeneratorImpl.h>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace tcomp {

namespace {
    // Khatri-Rao product of all factors except `skip`, in mode order
    torch::Tensor khatri_rao_except(const std::vector<torch::Tensor>& factors, size_t skip) {
        std::vector<torch::Tensor> others;
        others.reserve(factors.size() - 1);
        for (size_t j = 0; j < factors.size(); ++j) {
            if (j != skip) others.push_back(factors[j]);
        }
        return utils::khatri_rao(others);
    }

    torch::Tensor gram_hadamard_except(const std::vector<torch::Tensor>& factors, size_t skip, int64_t rank) {
        torch::Tensor V = torch::ones({rank, rank}, factors[0].options());
        for (size_t j = 0; j < factors.size(); ++j) {
            if (j != skip) V = V * torch::matmul(factors[j].t(), factors[j]);
        }
        return V;
    }
}

torch::Tensor cp_full(const std::vector<torch::Tensor>& factors) {
    if (factors.empty()) {
        throw std::runtime_error("cp_full: no factors");
    }

    std::vector<int64_t> shape;
    shape.reserve(factors.size());
    for (const auto& A : factors) shape.push_back(A.size(0));

    if (factors.size() == 1) {
        return factors[0].sum(1);
    }

    torch::Tensor K = utils::khatri_rao(factors);
    return K.sum(1).reshape(shape);
}

CpResult cp_als(const torch::Tensor& X, int64_t rank, const CpOptions& opts) {
    if (X.dim() == 0) {
        throw std::invalid_argument("cp_als: input needs at least one mode");
    }
    if (rank < 0) {
        throw std::invalid_argument("cp_als: rank must be non-negative");
    }
    if (opts.max_iter < 1) {
        throw std::invalid_argument("cp_als: max_iter must be at least 1");
    }

    int64_t ndim = X.dim();
    auto options = X.options();
    CpResult result;

    double norm_X = X.norm().item<double>();

    if (rank == 0 || norm_X == 0.0) {
        // nothing to fit, the model is identically zero
        for (int64_t k = 0; k < ndim; ++k) {
            result.factors.push_back(torch::zeros({X.size(k), rank}, options));
        }
        result.converged = true;
        return result;
    }

    at::Generator gen = at::detail::createCPUGenerator(opts.seed);
    std::vector<torch::Tensor> factors;
    factors.reserve(ndim);
    for (int64_t k = 0; k < ndim; ++k) {
        factors.push_back(torch::randn({X.size(k), rank}, gen, options));
    }

    std::vector<torch::Tensor> unfoldings;
    unfoldings.reserve(ndim);
    for (int64_t k = 0; k < ndim; ++k) {
        unfoldings.push_back(utils::unfold(X, k));
    }

    auto start = std::chrono::high_resolution_clock::now();
    double prev_err = std::numeric_limits<double>::infinity();

    for (int64_t iter = 0; iter < opts.max_iter; ++iter) {
        for (int64_t k = 0; k < ndim; ++k) {
            if (ndim == 1) {
                // X ~= A 1: any column split is optimal, keep the full vector in column 0
                torch::Tensor A = torch::zeros({X.size(0), rank}, options);
                A.select(1, 0).copy_(X);
                factors[0] = A;
                continue;
            }

            torch::Tensor K = khatri_rao_except(factors, k);
            torch::Tensor V = gram_hadamard_except(factors, k, rank);
            torch::Tensor mttkrp = torch::matmul(unfoldings[k], K);

            factors[k] = torch::matmul(mttkrp, torch::linalg_pinv(V, 1e-15, /*hermitian=*/true));
        }

        double err = (X - cp_full(factors)).norm().item<double>() / norm_X;
        result.errors.push_back(err);
        result.iterations = iter + 1;

        if (opts.verbose) {
            auto now = std::chrono::high_resolution_clock::now();
            std::chrono::duration<double> elapsed = now - start;
            std::ostringstream line;
            line << "iter: " << std::setw(4) << iter
                 << " | rel. error: " << std::scientific << std::setprecision(6) << err
                 << " | delta: " << std::scientific << std::setprecision(3) << (prev_err - err)
                 << " | time: " << std::fixed << std::setprecision(4) << elapsed.count() << "s";
            std::cout << line.str() << std::endl;
        }

        if (prev_err - err < opts.tol) {
            result.converged = true;
            break;
        }
        prev_err = err;
    }

    result.factors = std::move(factors);
    return result;
}

}
