#include "optimize.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

#include "absl/strings/str_format.h"

namespace phylotraits {

static constexpr auto k_golden_section = 0.3819660112501051;  // (3 - sqrt(5)) / 2
static constexpr auto k_golden_ratio = 1.618033988749895;
static constexpr auto k_inf = std::numeric_limits<double>::infinity();

auto operator<<(std::ostream& os, const Optimization_result& result) -> std::ostream& {
  return os << absl::StreamFormat("Optimization_result{x_min=%g, f_min=%g, num_evaluations=%d, converged=%s}",
                                  result.x_min, result.f_min, result.num_evaluations,
                                  result.converged ? "true" : "false");
}

static auto evaluate(const Objective_1d& f, double x, int& num_evaluations) -> double {
  ++num_evaluations;
  auto fx = f(x);
  return std::isnan(fx) ? k_inf : fx;
}

// Brent's method on [a, b] from x, with the evaluation count carried in `num_evaluations`
static auto brent(
    const Objective_1d& f,
    double a,
    double b,
    double x,
    double fx,
    int& num_evaluations,
    const Optimizer_config& config)
    -> Optimization_result {

  auto w = x;
  auto v = x;
  auto fw = fx;
  auto fv = fx;
  auto d = 0.0;
  auto e = 0.0;

  while (num_evaluations < config.max_evaluations) {
    auto midpoint = 0.5 * (a + b);
    auto tol1 = config.xtol_rel * std::abs(x) + config.xtol_abs;
    auto tol2 = 2.0 * tol1;

    if (std::abs(x - midpoint) <= (tol2 - 0.5 * (b - a))) {
      return {.x_min = x, .f_min = fx, .num_evaluations = num_evaluations, .converged = true};
    }

    // Parabolic step if acceptable, golden-section step otherwise
    auto use_golden = true;
    if (std::abs(e) > tol1) {
      auto r = (x - w) * (fx - fv);
      auto q = (x - v) * (fx - fw);
      auto p = (x - v) * q - (x - w) * r;
      q = 2.0 * (q - r);
      if (q > 0.0) {
        p = -p;
      } else {
        q = -q;
      }
      r = e;
      e = d;

      if (std::abs(p) < std::abs(0.5 * q * r) && p > q * (a - x) && p < q * (b - x)) {
        d = p / q;
        auto u = x + d;
        if ((u - a) < tol2 || (b - u) < tol2) {
          d = (x < midpoint) ? tol1 : -tol1;
        }
        use_golden = false;
      }
    }
    if (use_golden) {
      e = (x < midpoint) ? (b - x) : (a - x);
      d = k_golden_section * e;
    }

    auto u = x + ((std::abs(d) >= tol1) ? d : ((d > 0) ? tol1 : -tol1));
    auto fu = evaluate(f, u, num_evaluations);

    if (fu <= fx) {
      auto improvement = fx - fu;
      if (u < x) { b = x; } else { a = x; }
      v = w; fv = fw;
      w = x; fw = fx;
      x = u; fx = fu;
      if (improvement <= config.ftol_rel * std::abs(fx) + config.ftol_abs && std::isfinite(fx)) {
        return {.x_min = x, .f_min = fx, .num_evaluations = num_evaluations, .converged = true};
      }
    } else {
      if (u < x) { a = u; } else { b = u; }
      if (fu <= fw || w == x) {
        v = w; fv = fw;
        w = u; fw = fu;
      } else if (fu <= fv || v == x || v == w) {
        v = u; fv = fu;
      }
    }
  }

  return {.x_min = x, .f_min = fx, .num_evaluations = num_evaluations, .converged = false};
}

auto minimize_bounded(
    const Objective_1d& f,
    double lower,
    double upper,
    double start,
    const Optimizer_config& config)
    -> Optimization_result {

  if (not (lower < upper)) {
    throw std::invalid_argument(absl::StrFormat(
        "Invalid interval for 1-d minimization: [%g, %g]", lower, upper));
  }
  auto num_evaluations = 0;
  auto x = std::clamp(start, lower, upper);
  auto fx = evaluate(f, x, num_evaluations);
  return brent(f, lower, upper, x, fx, num_evaluations, config);
}

auto bracket_minimum(
    const Objective_1d& f,
    double start,
    double step,
    int& num_evaluations,
    const Optimizer_config& config)
    -> Bracket {

  auto a = start;
  auto b = start + step;
  auto fa = evaluate(f, a, num_evaluations);
  auto fb = evaluate(f, b, num_evaluations);
  if (fb > fa) {
    std::swap(a, b);
    std::swap(fa, fb);
  }
  auto c = b + k_golden_ratio * (b - a);
  auto fc = evaluate(f, c, num_evaluations);

  while (fb > fc) {
    if (num_evaluations >= config.max_evaluations) {
      throw std::runtime_error(absl::StrFormat(
          "Could not bracket a minimum within %d evaluations (last tried x = %g, f(x) = %g)",
          config.max_evaluations, c, fc));
    }
    a = b; fa = fb;
    b = c; fb = fc;
    c = b + k_golden_ratio * (b - a);
    fc = evaluate(f, c, num_evaluations);
  }

  return {.a = a, .b = b, .c = c, .fa = fa, .fb = fb, .fc = fc};
}

auto minimize_unbounded(
    const Objective_1d& f,
    double start,
    const Optimizer_config& config)
    -> Optimization_result {

  auto num_evaluations = 0;
  auto step = std::max(0.1 * std::abs(start), 0.1);
  auto bracket = bracket_minimum(f, start, step, num_evaluations, config);
  auto lower = std::min(bracket.a, bracket.c);
  auto upper = std::max(bracket.a, bracket.c);
  return brent(f, lower, upper, bracket.b, bracket.fb, num_evaluations, config);
}

}  // namespace phylotraits
