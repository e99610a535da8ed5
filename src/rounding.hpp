#pragma once
#include <torch/torch.h>
#include <vector>

#include "structured_tensor.hpp"

namespace tcomp {

// Recompression without forming the dense array.
// round_* modify the tensor in place; on error the tensor is left unchanged.
// CP tensors are rejected with std::invalid_argument: convert with cp_to_tt() first.

// TT ranks: N-1 bond ranks or a single value
void round_tt(StructuredTensor& t, const std::vector<int64_t>& ranks);

// relative error of the rounding <= eps (each bond gets eps/sqrt(N-1))
void round_tt_eps(StructuredTensor& t, double eps);

// Tucker ranks: N values or a single value.
// Modes without a factor get one, so a plain TT becomes TT-Tucker.
void round_tucker(StructuredTensor& t, const std::vector<int64_t>& ranks);

// relative error of the rounding <= eps (each mode gets eps/sqrt(N))
void round_tucker_eps(StructuredTensor& t, double eps);

// Exact TT form of a CP (or CP-Tucker) tensor, the diagonal made explicit.
// Returns a new tensor; the input keeps its format.
StructuredTensor cp_to_tt(const StructuredTensor& t);

// cp_to_tt followed by round_tt / round_tt_eps
StructuredTensor round_cp(const StructuredTensor& t, const std::vector<int64_t>& ranks);
StructuredTensor round_cp_eps(const StructuredTensor& t, double eps);

// QR sweeps on a TT chain.
// orthogonalize_right leaves cores 1..N-1 right-orthonormal and the norm in core 0,
// orthogonalize_left leaves cores 0..N-2 left-orthonormal and the norm in core N-1.
void orthogonalize_right(std::vector<torch::Tensor>& cores);
void orthogonalize_left(std::vector<torch::Tensor>& cores);

}
