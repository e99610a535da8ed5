#include "metrics.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace tcomp {

namespace {
    torch::Tensor residual(const torch::Tensor& ref, const torch::Tensor& approx) {
        if (!ref.sizes().equals(approx.sizes())) {
            throw std::runtime_error("metrics: reference and approximation differ in shape");
        }
        return ref.to(torch::kFloat64) - approx.to(torch::kFloat64);
    }
}

double relative_error(const torch::Tensor& ref, const torch::Tensor& approx) {
    double diff = residual(ref, approx).norm().item<double>();
    double norm_ref = ref.to(torch::kFloat64).norm().item<double>();

    if (norm_ref == 0.0) {
        return (diff == 0.0) ? 0.0 : std::numeric_limits<double>::infinity();
    }
    return diff / norm_ref;
}

double relative_error(const torch::Tensor& ref, const StructuredTensor& approx) {
    return relative_error(ref, approx.full());
}

double rmse(const torch::Tensor& ref, const torch::Tensor& approx) {
    torch::Tensor res = residual(ref, approx);
    if (res.numel() == 0) {
        return 0.0;
    }
    return std::sqrt(res.pow(2).mean().item<double>());
}

double rmse(const torch::Tensor& ref, const StructuredTensor& approx) {
    return rmse(ref, approx.full());
}

double r_squared(const torch::Tensor& ref, const torch::Tensor& approx) {
    double ss_res = residual(ref, approx).pow(2).sum().item<double>();

    torch::Tensor ref64 = ref.to(torch::kFloat64);
    double ss_tot = (ref64 - ref64.mean()).pow(2).sum().item<double>();

    if (ss_tot == 0.0) {
        // constant reference: perfect or not at all
        return (ss_res == 0.0) ? 1.0 : 0.0;
    }
    return 1.0 - ss_res / ss_tot;
}

double r_squared(const torch::Tensor& ref, const StructuredTensor& approx) {
    return r_squared(ref, approx.full());
}

}
