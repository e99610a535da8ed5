#pragma once
#include <torch/torch.h>

#include "structured_tensor.hpp"

namespace tcomp {

// ||ref - approx||_F / ||ref||_F
double relative_error(const torch::Tensor& ref, const torch::Tensor& approx);
double relative_error(const torch::Tensor& ref, const StructuredTensor& approx);

// root mean squared error over all entries
double rmse(const torch::Tensor& ref, const torch::Tensor& approx);
double rmse(const torch::Tensor& ref, const StructuredTensor& approx);

// coefficient of determination, 1 - SS_res / SS_tot
double r_squared(const torch::Tensor& ref, const torch::Tensor& approx);
double r_squared(const torch::Tensor& ref, const StructuredTensor& approx);

}
