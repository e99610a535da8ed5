#include "error_budget.hpp"
#include <cmath>
#include <stdexcept>

namespace tcomp {

namespace {
    void check_eps(double eps) {
        if (!(eps >= 0.0 && std::isfinite(eps))) {
            throw std::invalid_argument("eps must be finite and non-negative");
        }
    }
}

double tt_step_tolerance(double eps, int64_t ndim) {
    check_eps(eps);
    if (ndim <= 1) {
        return eps;
    }
    return eps / std::sqrt(static_cast<double>(ndim - 1));
}

double tucker_mode_tolerance(double eps, int64_t ndim) {
    check_eps(eps);
    if (ndim <= 0) {
        throw std::invalid_argument("tucker_mode_tolerance: tensor needs at least one mode");
    }
    return eps / std::sqrt(static_cast<double>(ndim));
}

double split_budget(double eps, int stages) {
    check_eps(eps);
    if (stages <= 0) {
        throw std::invalid_argument("split_budget: number of stages must be positive");
    }
    return eps / std::sqrt(static_cast<double>(stages));
}

}
