#pragma once
#include <cstdint>

namespace tcomp {

// Relative tolerance of each of the N-1 factorization steps of a TT sweep.
// Step errors are near-orthogonal, so N-1 steps at eps/sqrt(N-1) stay within eps.
double tt_step_tolerance(double eps, int64_t ndim);

// Relative tolerance of each mode of an HOSVD: eps/sqrt(N)
double tucker_mode_tolerance(double eps, int64_t ndim);

// Share of a global budget given to each of `stages` sequential stages
// with mutually orthogonal errors: eps/sqrt(stages).
double split_budget(double eps, int stages);

}
