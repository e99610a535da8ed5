#include <torch/torch.h>
#include <iostream>
#include <vector>
#include <cmath>
#include <chrono>
#include <functional>
#include <string>

#include "cp_als.hpp"
#include "decompose.hpp"
#include "metrics.hpp"
#include "rounding.hpp"
#include "utils.hpp"

using namespace tcomp;

void test_algorithm(
    const std::string& name,
    std::function<StructuredTensor(const torch::Tensor&)> func,
    const torch::Tensor& X,
    double expected_max_error
) {
    std::cout << "Testing : " << name << std::endl;

    auto start = std::chrono::high_resolution_clock::now();
    StructuredTensor T = func(X);
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = end - start;

    double rel_error = relative_error(X, T);

    std::cout << "Format : " << T << std::endl;
    std::cout << "Time : " << elapsed.count() << "s" << std::endl;
    std::cout << "Relative Error : " << rel_error << std::endl;
    std::cout << "RMSE : " << rmse(X, T) << ", R2 : " << r_squared(X, T) << std::endl;

    if (rel_error < expected_max_error) {
        std::cout << "Result : SUCCESS" << std::endl;
    } else {
        std::cout << "Result : HIGH ERROR" << std::endl;
    }
    std::cout << std::endl;
}

int main(int argc, char* argv[]) {
    // Default seed
    int64_t seed = 42;

    // Check for seed
    if (argc > 1) {
        try {
            seed = std::stoll(argv[1]);
            std::cout << "Using seed : " << seed << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Invalid seed '" << argv[1] << "', using default seed 42." << std::endl;
        }
    } else {
        std::cout << "No seed provided. Using default seed 42." << std::endl;
    }

    torch::manual_seed(seed);
    torch::NoGradGuard no_grad;
    auto options = torch::TensorOptions().dtype(torch::kFloat64);

    int64_t size = 64;
    int64_t r = 6;

    try {
        // Test 1: Synthetic low multilinear rank
        std::cout << "Test 1 : Synthetic Low-Rank Tensor" << std::endl;
        torch::Tensor true_core = torch::randn({r, r, r}, options);
        torch::Tensor X_low = true_core.clone();
        for (int i = 0; i < 3; ++i) {
            auto qr = torch::linalg_qr(torch::randn({size, r}, options), "reduced");
            X_low = utils::mode_product(X_low, std::get<0>(qr), i);
        }

        test_algorithm("TT-SVD (rank)", [&](const torch::Tensor& X) { return make_tt(X, {r * r}); }, X_low, 1e-10);
        test_algorithm("HOSVD (rank)", [&](const torch::Tensor& X) { return make_tucker(X, {r}); }, X_low, 1e-10);
        test_algorithm("ST-HOSVD (rank)", [&](const torch::Tensor& X) {
            return make_tucker(X, {r}, TuckerVariant::st_hosvd);
        }, X_low, 1e-10);

        DecompositionRequest by_eps;
        by_eps.eps = 1e-8;
        test_algorithm("TT-Tucker (eps=1e-8)", [&](const torch::Tensor& X) { return decompose(X, by_eps); }, X_low, 1e-8);

        // Test 2: Random full-rank tensor, error bounded by eps
        std::cout << "Test 2 : Random Full-Rank Tensor" << std::endl;
        torch::Tensor X_rand = torch::randn({24, 24, 24}, options);
        test_algorithm("TT-SVD (eps=0.5)", [](const torch::Tensor& X) { return make_tt_eps(X, 0.5); }, X_rand, 0.5);
        test_algorithm("TT-Tucker (eps=0.5)", [](const torch::Tensor& X) {
            DecompositionRequest req;
            req.eps = 0.5;
            return decompose(X, req);
        }, X_rand, 0.5);

        // Test 3: Sum of rank-1 terms
        std::cout << "Test 3 : CP Structured Tensor" << std::endl;
        std::vector<torch::Tensor> cp_factors;
        for (int i = 0; i < 4; ++i) {
            cp_factors.push_back(torch::randn({16, 3}, options));
        }
        torch::Tensor X_cp = cp_full(cp_factors);

        CpOptions cp_opts;
        cp_opts.max_iter = 500;
        cp_opts.tol = 1e-12;
        cp_opts.seed = static_cast<uint64_t>(seed);
        test_algorithm("CP-ALS (rank 3)", [&](const torch::Tensor& X) { return make_cp(X, 3, cp_opts); }, X_cp, 1e-6);

        // Test 4: Recompression
        std::cout << "Test 4 : Rounding" << std::endl;
        StructuredTensor over = make_tt(X_low, {size});
        std::cout << "Before : " << over << std::endl;
        round_tt_eps(over, 1e-10);
        std::cout << "After round_tt : " << over << std::endl;
        round_tucker_eps(over, 1e-10);
        std::cout << "After round_tucker : " << over << std::endl;
        std::cout << "Relative Error : " << relative_error(X_low, over) << std::endl;
        std::cout << over.diagram() << std::endl;

        StructuredTensor cp = make_cp(X_cp, 3, cp_opts);
        StructuredTensor cp_tt = round_cp_eps(cp, 1e-10);
        std::cout << "CP as TT : " << cp_tt << std::endl;
        std::cout << cp_tt.diagram() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error running demo: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
