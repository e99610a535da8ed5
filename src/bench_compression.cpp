#include <torch/torch.h>
#include <iostream>
#include <vector>
#include <string>
#include <chrono>
#include <iomanip>
#include <optional>
#include <sys/resource.h>
#include <cmath>
#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "decompose.hpp"
#include "metrics.hpp"
#include "utils.hpp"

using namespace tcomp;

long get_peak_memory_kb() {
    struct rusage usage;
    getrusage(RUSAGE_SELF, &usage);
    return usage.ru_maxrss;
}

// Tensor with a superdiagonal core whose entries decay from 1 to 1/cond,
// rotated by a random orthogonal matrix on every mode
torch::Tensor generate_conditioned_tensor(const std::vector<int64_t>& dims, double cond, const torch::TensorOptions& options) {
    int64_t n_diag = *std::min_element(dims.begin(), dims.end());

    torch::Tensor sigma = torch::logspace(0, -std::log10(cond), n_diag, 10.0, torch::kFloat64).to(options.dtype());

    // flat offset between (i, ..., i) and (i+1, ..., i+1)
    torch::Tensor X = torch::zeros(dims, options);
    int64_t diag_step = 0;
    for (int64_t s : X.strides()) diag_step += s;
    X.view({-1}).index_put_({torch::arange(n_diag, torch::kLong) * diag_step}, sigma);

    for (size_t k = 0; k < dims.size(); ++k) {
        torch::Tensor Q = std::get<0>(torch::linalg_qr(torch::randn({dims[k], dims[k]}, options)));
        X = utils::mode_product(X, Q, k);
    }
    return X;
}

std::vector<int64_t> parse_dims(const std::string& text) {
    std::vector<int64_t> dims;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        dims.push_back(std::stoll(item));
    }
    if (dims.empty()) {
        throw std::invalid_argument("empty --dims");
    }
    return dims;
}

// Build one of the named formats
StructuredTensor build(const torch::Tensor& X,
                       const std::string& format,
                       std::optional<double> eps,
                       std::optional<int64_t> rank,
                       std::optional<int64_t> rank_tucker) {
    DecompositionRequest req;

    if (format == "tt") {
        // plain TT, no Tucker stage even when driven by eps
        if (rank && eps) throw std::invalid_argument("tt takes --rank or --eps, not both");
        if (rank) return make_tt(X, {*rank});
        if (eps) return make_tt_eps(X, *eps);
        throw std::invalid_argument("tt needs --rank or --eps");
    } else if (format == "tucker") {
        if (rank_tucker && eps) throw std::invalid_argument("tucker takes --rank-tucker or --eps, not both");
        if (eps) return make_tucker_eps(X, *eps);
        if (!rank_tucker) throw std::invalid_argument("tucker needs --rank-tucker or --eps");
        req.rank_tucker = std::vector<int64_t>{*rank_tucker};
    } else if (format == "tt-tucker") {
        if (rank) req.rank_tt = std::vector<int64_t>{*rank};
        if (rank_tucker) req.rank_tucker = std::vector<int64_t>{*rank_tucker};
        req.eps = eps;
    } else if (format == "cp" || format == "cp-tucker") {
        if (!rank) throw std::invalid_argument(format + " needs --rank");
        req.rank_cp = *rank;
        if (format == "cp-tucker") {
            if (!rank_tucker) throw std::invalid_argument("cp-tucker needs --rank-tucker");
            req.rank_tucker = std::vector<int64_t>{*rank_tucker};
        }
        req.eps = eps;
    } else {
        throw std::invalid_argument("Unknown format: " + format);
    }

    return decompose(X, req);
}

int main(int argc, char* argv[]) {
    torch::manual_seed(42);
    torch::NoGradGuard no_grad;

    if (argc < 3) {
        std::cerr << "Usage: ./bench_compression --format <tt|tucker|tt-tucker|cp|cp-tucker> "
                  << "[--eps <val>] [--rank <val>] [--rank-tucker <val>] "
                  << "[--cond <val>] [--prec <float|double>] [--dims n0,n1,...]" << std::endl;
        return 1;
    }

    std::string format = "";
    double cond = 1.0;
    std::optional<double> eps;
    std::optional<int64_t> rank;
    std::optional<int64_t> rank_tucker;
    std::string prec = "double";
    std::vector<int64_t> dims = {32, 32, 16, 8, 8};

    try {
        for(int i=1; i<argc; i+=2) {
            std::string key = argv[i];
            if (i+1 >= argc) break;
            std::string val = argv[i+1];
            if (key == "--format") format = val;
            else if (key == "--cond") cond = std::stod(val);
            else if (key == "--eps") eps = std::stod(val);
            else if (key == "--rank") rank = std::stoll(val);
            else if (key == "--rank-tucker") rank_tucker = std::stoll(val);
            else if (key == "--prec") prec = val;
            else if (key == "--dims") dims = parse_dims(val);
            else std::cerr << "Ignoring unknown option " << key << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid option value: " << e.what() << std::endl;
        return 1;
    }

    auto options = torch::TensorOptions().dtype(torch::kFloat64);
    if (prec == "float") {
        options = torch::TensorOptions().dtype(torch::kFloat32);
    }

    torch::Tensor X = generate_conditioned_tensor(dims, cond, options);

    try {
        long mem_baseline = get_peak_memory_kb();
        auto start = std::chrono::high_resolution_clock::now();

        StructuredTensor T = build(X, format, eps, rank, rank_tucker);

        auto end = std::chrono::high_resolution_clock::now();
        long mem_peak = get_peak_memory_kb();
        double runtime_sec = std::chrono::duration<double>(end - start).count();

        double error = relative_error(X, T);

        std::cout << format << ","
                  << prec << ","
                  << std::scientific << std::setprecision(2) << cond << ","
                  << std::scientific << std::setprecision(2) << eps.value_or(0.0) << ","
                  << std::fixed << std::setprecision(6) << runtime_sec << ","
                  << (mem_peak - mem_baseline) << ","
                  << std::scientific << std::setprecision(6) << error << ","
                  << std::scientific << std::setprecision(6) << rmse(X, T) << ","
                  << std::fixed << std::setprecision(6) << r_squared(X, T) << ","
                  << std::fixed << std::setprecision(2) << T.compression_ratio() << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error running " << format << ": " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
