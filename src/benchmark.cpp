#include <torch/torch.h>
#include <iostream>
#include <vector>
#include <chrono>
#include <iomanip>
#include <string>
#include <sys/resource.h>

#include "rounding.hpp"
#include "structured_tensor.hpp"
#include "tt_svd.hpp"

using namespace tcomp;

long get_peak_memory_kb() {
    struct rusage usage;
    getrusage(RUSAGE_SELF, &usage);
    return usage.ru_maxrss;
}

// Random TT with the given bond rank
std::vector<torch::Tensor> random_tt(int64_t size, int64_t ndim, int64_t rank, const torch::TensorOptions& options) {
    std::vector<torch::Tensor> cores;
    for (int64_t k = 0; k < ndim; ++k) {
        int64_t r0 = (k == 0) ? 1 : rank;
        int64_t r1 = (k == ndim - 1) ? 1 : rank;
        cores.push_back(torch::randn({r0, size, r1}, options));
    }
    return cores;
}

void run_benchmark(int64_t size, int64_t rank, const std::string& algo_type) {
    auto options = torch::TensorOptions().dtype(torch::kFloat64);
    const int64_t ndim = 4;

    // Generate Data
    std::vector<torch::Tensor> cores = random_tt(size, ndim, rank, options);
    StructuredTensor T(Layout::tt, cores);
    torch::Tensor X;
    if (algo_type == "tt") {
        X = T.full();
    }

    // redundant representation: bond ranks 2r for a rank-r tensor
    std::vector<torch::Tensor> doubled;
    for (int64_t k = 0; k < ndim; ++k) {
        const torch::Tensor& G = cores[k];
        if (k == 0) doubled.push_back(torch::cat({G, G}, 2) * 0.5);
        else if (k == ndim - 1) doubled.push_back(torch::cat({G, G}, 0));
        else doubled.push_back(torch::cat({torch::cat({G, torch::zeros_like(G)}, 2),
                                           torch::cat({torch::zeros_like(G), G}, 2)}, 0));
    }

    // Measure Baseline Memory (Data only)
    long mem_data_loaded = get_peak_memory_kb();

    // Run Algorithm
    auto start = std::chrono::high_resolution_clock::now();

    int64_t result_rank = 0;
    if (algo_type == "tt") {
        auto tt = tt_svd_eps(X, 1e-10);
        result_rank = tt[0].size(2);
    } else if (algo_type == "round") {
        StructuredTensor R(Layout::tt, doubled);
        round_tt_eps(R, 1e-10);
        result_rank = R.ranks_tt()[1];
    }

    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = end - start;

    // Measure Peak Memory
    long mem_final_peak = get_peak_memory_kb();
    double peak_mb = mem_final_peak / 1024.0;

    // Calculate approximate overhead (Algorithm Peak - Data Load Peak)
    long mem_algo_overhead = mem_final_peak - mem_data_loaded;
    double overhead_mb = mem_algo_overhead / 1024.0;

    std::cout << size << "," << algo_type << "," << result_rank << ","
              << std::fixed << std::setprecision(6) << elapsed.count() << ","
              << std::fixed << std::setprecision(2) << peak_mb << ","
              << overhead_mb << std::endl;
}

int main(int argc, char* argv[]) {
    torch::manual_seed(42);
    torch::NoGradGuard no_grad;

    if (argc < 2) {
        std::cerr << "Usage : ./benchmark tt/round" << std::endl;
        return 1;
    }

    std::string algo = argv[1];
    if (algo != "tt" && algo != "round") {
        std::cerr << "Unknown algorithm: " << algo << std::endl;
        return 1;
    }

    std::cout << "Size,Algorithm,Rank,Time(s),Peak Memory(MB),Algo Overhead(MB)" << std::endl;

    std::vector<int64_t> sizes = {8, 16, 32, 48};
    int64_t fixed_rank = 5;

    try {
        for (int64_t s : sizes) {
            run_benchmark(s, fixed_rank, algo);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error running " << algo << ": " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
