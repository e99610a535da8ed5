#include "structured_tensor.hpp"
#include "cp_als.hpp"
#include "tt_svd.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace tcomp {

namespace {
    std::string join(const std::vector<int64_t>& v) {
        std::ostringstream os;
        os << "[";
        for (size_t i = 0; i < v.size(); ++i) {
            if (i > 0) os << ", ";
            os << v[i];
        }
        os << "]";
        return os.str();
    }
}

StructuredTensor::StructuredTensor(Layout layout,
                                   std::vector<torch::Tensor> cores,
                                   std::vector<torch::Tensor> factors)
    : _layout(layout)
    , _cores(std::move(cores))
    , _factors(std::move(factors))
{
    if (_cores.empty()) {
        throw std::runtime_error("StructuredTensor: at least one core is required");
    }

    int64_t N = _cores.size();
    if (_factors.empty()) {
        _factors.resize(N);
    }
    if (static_cast<int64_t>(_factors.size()) != N) {
        throw std::runtime_error("StructuredTensor: got " + std::to_string(_factors.size()) +
                                 " factors for " + std::to_string(N) + " cores");
    }

    // one scalar field for all arrays
    if (!_cores[0].defined() || !_cores[0].is_floating_point()) {
        throw std::runtime_error("StructuredTensor: cores must be defined floating point arrays");
    }
    torch::ScalarType dtype = _cores[0].scalar_type();

    for (int64_t k = 0; k < N; ++k) {
        const torch::Tensor& G = _cores[k];
        if (!G.defined() || G.scalar_type() != dtype) {
            throw std::runtime_error("StructuredTensor: core " + std::to_string(k) + " has a different scalar type");
        }

        if (_layout == Layout::tt) {
            if (G.dim() != 3) {
                throw std::runtime_error("StructuredTensor: TT core " + std::to_string(k) + " must have 3 dimensions");
            }
            if (k == 0 && G.size(0) != 1) {
                throw std::runtime_error("StructuredTensor: first TT rank must be 1");
            }
            if (k == N - 1 && G.size(2) != 1) {
                throw std::runtime_error("StructuredTensor: last TT rank must be 1");
            }
            if (k > 0 && _cores[k - 1].size(2) != G.size(0)) {
                throw std::runtime_error("StructuredTensor: TT rank mismatch between cores " +
                                         std::to_string(k - 1) + " and " + std::to_string(k));
            }
        } else {
            if (G.dim() != 2) {
                throw std::runtime_error("StructuredTensor: CP core " + std::to_string(k) + " must have 2 dimensions");
            }
            if (G.size(1) != _cores[0].size(1)) {
                throw std::runtime_error("StructuredTensor: CP cores must share one rank");
            }
        }

        const torch::Tensor& U = _factors[k];
        if (U.defined()) {
            if (U.dim() != 2 || U.scalar_type() != dtype) {
                throw std::runtime_error("StructuredTensor: factor " + std::to_string(k) + " must be a matrix of the core type");
            }
            if (U.size(1) != modal_size(k)) {
                throw std::runtime_error("StructuredTensor: factor " + std::to_string(k) +
                                         " has " + std::to_string(U.size(1)) + " columns, core expects " +
                                         std::to_string(modal_size(k)));
            }
        }
    }

    _shape.reserve(N);
    for (int64_t k = 0; k < N; ++k) {
        _shape.push_back(_factors[k].defined() ? _factors[k].size(0) : modal_size(k));
    }
}

int64_t StructuredTensor::modal_size(int64_t k) const {
    return (_layout == Layout::tt) ? _cores[k].size(1) : _cores[k].size(0);
}

bool StructuredTensor::has_factor(int64_t k) const {
    utils::check_mode(ndim(), k);
    return _factors[k].defined();
}

bool StructuredTensor::has_tucker() const {
    for (const auto& U : _factors) {
        if (U.defined()) return true;
    }
    return false;
}

std::string StructuredTensor::format_name() const {
    std::string name = is_tt() ? "TT" : "CP";
    if (has_tucker()) name += "-Tucker";
    return name;
}

std::vector<int64_t> StructuredTensor::ranks_tt() const {
    if (!is_tt()) {
        throw std::runtime_error("ranks_tt: tensor is in " + format_name() + " format");
    }

    std::vector<int64_t> ranks;
    ranks.reserve(_cores.size() + 1);
    ranks.push_back(_cores[0].size(0));
    for (const auto& G : _cores) ranks.push_back(G.size(2));
    return ranks;
}

std::vector<int64_t> StructuredTensor::ranks_tucker() const {
    std::vector<int64_t> ranks;
    ranks.reserve(_cores.size());
    for (int64_t k = 0; k < ndim(); ++k) ranks.push_back(modal_size(k));
    return ranks;
}

int64_t StructuredTensor::rank_cp() const {
    if (!is_cp()) {
        throw std::runtime_error("rank_cp: tensor is in " + format_name() + " format");
    }
    return _cores[0].size(1);
}

int64_t StructuredTensor::numcoef() const {
    int64_t n = 0;
    for (const auto& G : _cores) n += G.numel();
    for (const auto& U : _factors) {
        if (U.defined()) n += U.numel();
    }
    return n;
}

double StructuredTensor::compression_ratio() const {
    int64_t n = numcoef();
    if (n == 0) {
        return std::numeric_limits<double>::infinity();
    }
    return static_cast<double>(utils::product(_shape)) / static_cast<double>(n);
}

torch::Tensor StructuredTensor::expanded_core(int64_t k) const {
    const torch::Tensor& G = _cores[k];
    const torch::Tensor& U = _factors[k];
    if (!U.defined()) {
        return G;
    }
    if (is_tt()) {
        return torch::einsum("ijk,lj->ilk", {G, U});
    }
    return torch::matmul(U, G);
}

torch::Tensor StructuredTensor::full() const {
    std::vector<torch::Tensor> expanded;
    expanded.reserve(_cores.size());
    for (int64_t k = 0; k < ndim(); ++k) expanded.push_back(expanded_core(k));

    return is_tt() ? tt_full(expanded) : cp_full(expanded);
}

double StructuredTensor::norm() const {
    if (is_tt()) {
        // W_k = sum_i G_k[:, i, :]^T W_{k-1} G_k[:, i, :], starting from W_0 = 1
        torch::Tensor W = torch::ones({1, 1}, _cores[0].options());
        for (int64_t k = 0; k < ndim(); ++k) {
            torch::Tensor G = expanded_core(k);
            W = torch::einsum("ab,aic,bid->cd", {W, G, G});
        }
        return std::sqrt(std::max(W.item<double>(), 0.0));
    }

    // ||sum_r a_r o b_r o ...||^2 = sum of the Hadamard product of all Gram matrices
    int64_t R = rank_cp();
    torch::Tensor V = torch::ones({R, R}, _cores[0].options());
    for (int64_t k = 0; k < ndim(); ++k) {
        torch::Tensor A = expanded_core(k);
        V = V * torch::matmul(A.t(), A);
    }
    return std::sqrt(std::max(V.sum().item<double>(), 0.0));
}

std::string StructuredTensor::diagram() const {
    const int w = 5;
    int64_t N = ndim();
    std::ostringstream os;

    os << N << "D " << format_name() << " tensor:\n\n";

    for (int64_t k = 0; k < N; ++k) os << std::setw(w) << _shape[k];
    os << "\n";
    for (int64_t k = 0; k < N; ++k) os << std::setw(w) << "|";
    os << "\n";

    if (has_tucker()) {
        for (int64_t k = 0; k < N; ++k) {
            if (_factors[k].defined()) os << std::setw(w) << modal_size(k);
            else os << std::setw(w) << "|";
        }
        os << "\n";
        for (int64_t k = 0; k < N; ++k) os << std::setw(w) << "|";
        os << "\n";
    }

    const char* open = is_tt() ? "(" : "<";
    const char* close = is_tt() ? ")" : ">";
    for (int64_t k = 0; k < N; ++k) {
        os << std::setw(w) << (open + std::to_string(k) + close);
    }
    os << "\n";
    for (int64_t k = 0; k < N; ++k) os << std::setw(w) << "/ \\";
    os << "\n";

    if (is_tt()) {
        std::vector<int64_t> ranks = ranks_tt();
        os << std::setw(w - 2) << ranks[0];
        for (int64_t k = 1; k <= N; ++k) os << std::setw(w) << ranks[k];
    } else {
        int64_t R = rank_cp();
        os << std::setw(w - 2) << R;
        for (int64_t k = 1; k <= N; ++k) os << std::setw(w) << R;
    }
    os << "\n";

    return os.str();
}

std::ostream& operator<<(std::ostream& os, const StructuredTensor& t) {
    os << t.ndim() << "D " << t.format_name() << " tensor with shape " << join(t.shape());
    if (t.is_tt()) {
        os << ", ranks_tt " << join(t.ranks_tt());
    } else {
        os << ", rank_cp " << t.rank_cp();
    }
    if (t.has_tucker()) {
        os << ", ranks_tucker " << join(t.ranks_tucker());
    }
    // formatted apart so the caller's stream keeps its flags
    std::ostringstream ratio;
    ratio << std::fixed << std::setprecision(2) << t.compression_ratio();
    os << ", " << t.numcoef() << " coefficients (ratio " << ratio.str() << ")";
    return os;
}

}
