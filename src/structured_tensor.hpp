#pragma once
#include <torch/torch.h>
#include <ostream>
#include <string>
#include <vector>

namespace tcomp {

// How the cores are linked:
//   tt : cores (r_{k-1}, n_k, r_k), r_0 = r_N = 1
//   cp : cores (n_k, R) joined by an implicit diagonal
enum class Layout { tt, cp };

//
// Compressed tensor in TT, CP, TT-Tucker or CP-Tucker format.
// factors[k] is either undefined (no Tucker stage on mode k) or an (n_k, s_k)
// matrix, in which case cores[k] lives in the reduced coordinates s_k.
// Every array is exclusively owned by this object.
//
class StructuredTensor {
public:
    StructuredTensor(Layout layout,
                     std::vector<torch::Tensor> cores,
                     std::vector<torch::Tensor> factors = {});

    Layout layout() const { return _layout; }
    bool is_tt() const { return _layout == Layout::tt; }
    bool is_cp() const { return _layout == Layout::cp; }
    bool has_factor(int64_t k) const;
    bool has_tucker() const;

    // "TT", "TT-Tucker", "CP" or "CP-Tucker"
    std::string format_name() const;

    const std::vector<int64_t>& shape() const { return _shape; }
    int64_t ndim() const { return static_cast<int64_t>(_shape.size()); }
    torch::ScalarType dtype() const { return _cores[0].scalar_type(); }

    const std::vector<torch::Tensor>& cores() const { return _cores; }
    const std::vector<torch::Tensor>& factors() const { return _factors; }

    // N+1 bond ranks including the boundaries, TT layout only
    std::vector<int64_t> ranks_tt() const;

    // s_k per mode, n_k where no factor is present
    std::vector<int64_t> ranks_tucker() const;

    // shared rank R, CP layout only
    int64_t rank_cp() const;

    // number of stored coefficients over all cores and factors
    int64_t numcoef() const;

    // dense entries per stored coefficient; +infinity for a zero tensor
    // stored without coefficients (printed as "inf")
    double compression_ratio() const;

    // dense reconstruction
    torch::Tensor full() const;

    // Frobenius norm, computed from the cores without reconstructing
    double norm() const;

    // multi-line sketch of the network: sizes, Tucker ranks, nodes, bonds
    std::string diagram() const;

private:
    int64_t modal_size(int64_t k) const;

    // cores with their factor multiplied in
    torch::Tensor expanded_core(int64_t k) const;

private:
    Layout _layout;
    std::vector<torch::Tensor> _cores;
    std::vector<torch::Tensor> _factors;
    std::vector<int64_t> _shape;
};

std::ostream& operator<<(std::ostream& os, const StructuredTensor& t);

}
