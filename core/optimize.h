#ifndef PHYLOTRAITS_OPTIMIZE_H_
#define PHYLOTRAITS_OPTIMIZE_H_

#include <functional>
#include <ostream>

namespace phylotraits {

// One-dimensional derivative-free minimization
// ============================================
//
// The models with a single transformation parameter (lambda, scalingHybrid) are fitted by minimizing
// the negative profile log-likelihood over that parameter.  We use Brent's method (golden-section
// search accelerated by parabolic interpolation) on a bounded interval, preceded by a bracketing
// search when the parameter is unbounded.

struct Optimizer_config {
  double ftol_rel{1e-10};
  double ftol_abs{1e-10};
  double xtol_rel{1e-10};
  double xtol_abs{1e-10};
  int max_evaluations{1000};
};

struct Optimization_result {
  double x_min;
  double f_min;
  int num_evaluations;
  bool converged;  // false if the evaluation budget ran out first
};

auto operator<<(std::ostream& os, const Optimization_result& result) -> std::ostream&;

// Objective values that are NaN are treated as +infinity
using Objective_1d = std::function<double(double)>;

// Minimizes `f` over [lower, upper], starting the search at `start` (clamped into the interval)
auto minimize_bounded(
    const Objective_1d& f,
    double lower,
    double upper,
    double start,
    const Optimizer_config& config = {})
    -> Optimization_result;

// A triple a < b < c (or a > b > c) with f(b) <= f(a) and f(b) <= f(c)
struct Bracket {
  double a, b, c;
  double fa, fb, fc;
};

// Expands downhill from [start, start + step] until a minimum is bracketed.  `num_evaluations` is
// incremented by the number of calls to `f`.  Throws if no bracket is found within the evaluation budget.
auto bracket_minimum(
    const Objective_1d& f,
    double start,
    double step,
    int& num_evaluations,
    const Optimizer_config& config = {})
    -> Bracket;

// Minimizes `f` over the whole real line, starting at `start`
auto minimize_unbounded(
    const Objective_1d& f,
    double start,
    const Optimizer_config& config = {})
    -> Optimization_result;

}  // namespace phylotraits

#endif // PHYLOTRAITS_OPTIMIZE_H_
