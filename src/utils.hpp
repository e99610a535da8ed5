#pragma once

#include <torch/torch.h>
#include <vector>
#include <string>
#include <stdexcept>

namespace tcomp {
namespace utils {

    inline void check_mode(int64_t ndim, int64_t mode) {
        if (mode < 0 || mode >= ndim) {
            throw std::runtime_error("Invalid mode " + std::to_string(mode) +
                                     " for a tensor with " + std::to_string(ndim) + " modes");
        }
    }

    // Unfold tensor into a matrix along a specific mode (0-indexed).
    // Rows index the mode, columns run row-major over the remaining modes
    // in their original order.
    inline torch::Tensor unfold(const torch::Tensor& tensor, int64_t mode) {
        int64_t ndim = tensor.dim();
        check_mode(ndim, mode);

        std::vector<int64_t> perm;
        perm.reserve(ndim);
        perm.push_back(mode);
        for (int64_t i = 0; i < ndim; ++i) {
            if (i != mode) {
                perm.push_back(i);
            }
        }

        int64_t rows = tensor.size(mode);
        int64_t cols = 1;
        for (int64_t i = 0; i < ndim; ++i) {
            if (i != mode) cols *= tensor.size(i);
        }
        return tensor.permute(perm).reshape({rows, cols});
    }

    // Fold matrix back into a tensor (inverse of unfold)
    inline torch::Tensor fold(const torch::Tensor& matrix, int64_t mode, c10::IntArrayRef shape) {
        int64_t ndim = shape.size();
        check_mode(ndim, mode);

        std::vector<int64_t> perm_shape;
        perm_shape.reserve(ndim);
        perm_shape.push_back(shape[mode]);
        for (int64_t i = 0; i < ndim; ++i) {
            if (i != mode) perm_shape.push_back(shape[i]);
        }

        int64_t expected = 1;
        for (int64_t d : shape) expected *= d;
        if (matrix.dim() != 2 || matrix.size(0) != shape[mode] || matrix.numel() != expected) {
            throw std::runtime_error("fold: matrix does not match the requested shape");
        }

        torch::Tensor reshaped = matrix.reshape(perm_shape);

        std::vector<int64_t> inv_perm(ndim);
        int64_t counter = 1;
        inv_perm[mode] = 0;
        for (int64_t i = 0; i < ndim; ++i) {
            if (i != mode) {
                inv_perm[i] = counter++;
            }
        }

        return reshaped.permute(inv_perm).contiguous();
    }

    // Mode-n Product: Tensor x_n Matrix
    inline torch::Tensor mode_product(const torch::Tensor& tensor, const torch::Tensor& matrix, int64_t mode) {
        check_mode(tensor.dim(), mode);
        if (matrix.dim() != 2 || matrix.size(1) != tensor.size(mode)) {
            throw std::runtime_error("mode_product: matrix columns must match mode " + std::to_string(mode));
        }

        torch::Tensor unfolded = unfold(tensor, mode);

        torch::Tensor res_mat = torch::matmul(matrix, unfolded);

        std::vector<int64_t> new_shape = tensor.sizes().vec();
        new_shape[mode] = matrix.size(0);

        return fold(res_mat, mode, new_shape);
    }

    // Column-wise Kronecker product of (n_k x R) matrices.
    // Row index is row-major over the inputs, the last matrix varying fastest,
    // which matches the column ordering of unfold().
    inline torch::Tensor khatri_rao(const std::vector<torch::Tensor>& mats) {
        if (mats.empty()) {
            throw std::runtime_error("khatri_rao: no matrices given");
        }

        int64_t R = mats[0].size(1);
        torch::Tensor result = mats[0];
        for (size_t i = 1; i < mats.size(); ++i) {
            if (mats[i].size(1) != R) {
                throw std::runtime_error("khatri_rao: all matrices need the same number of columns");
            }
            int64_t rows = result.size(0) * mats[i].size(0);
            result = (result.unsqueeze(1) * mats[i].unsqueeze(0)).reshape({rows, R});
        }
        return result;
    }

    inline int64_t product(const std::vector<int64_t>& dims) {
        int64_t p = 1;
        for (int64_t d : dims) p *= d;
        return p;
    }
}
}
