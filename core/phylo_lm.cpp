#include "phylo_lm.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <stdexcept>

#include "absl/log/check.h"
#include "absl/strings/str_format.h"
#include "boost/math/distributions/fisher_f.hpp"
#include "boost/math/distributions/students_t.hpp"

namespace phylotraits {

static constexpr auto k_inf = std::numeric_limits<double>::infinity();
static constexpr auto k_nan = std::numeric_limits<double>::quiet_NaN();

auto to_string(Trait_model model) -> std::string_view {
  switch (model) {
    case Trait_model::k_bm:
      return "BM";
    case Trait_model::k_lambda:
      return "lambda";
    case Trait_model::k_scaling_hybrid:
      return "scalingHybrid";
    default:
      throw std::logic_error(absl::StrFormat(
          "Unknown trait model: %d", static_cast<std::underlying_type<Trait_model>::type>(model)));
  }
}

auto parse_trait_model(std::string_view s) -> Trait_model {
  if (s == "BM") { return Trait_model::k_bm; }
  if (s == "lambda") { return Trait_model::k_lambda; }
  if (s == "scalingHybrid") { return Trait_model::k_scaling_hybrid; }
  throw std::invalid_argument(absl::StrFormat(
      "Unknown model '%s' (expected one of BM, lambda or scalingHybrid)", s));
}

namespace {

// Whitened least-squares solution for a given tip covariance
struct Gls_solution {
  Eigen::MatrixXd L;
  double logdet;
  Eigen::MatrixXd Xw;
  Eigen::VectorXd Yw;
  Eigen::VectorXd coef;
  double deviance;
};

auto solve_gls(const Eigen::MatrixXd& X, const Eigen::VectorXd& Y, const Eigen::MatrixXd& Vy)
    -> std::optional<Gls_solution> {

  auto llt = Eigen::LLT<Eigen::MatrixXd>{Vy};
  if (llt.info() != Eigen::Success) {
    return std::nullopt;
  }

  auto result = Gls_solution{};
  result.L = llt.matrixL();
  if ((result.L.diagonal().array() <= 0.0).any()) {
    return std::nullopt;
  }
  result.logdet = 2.0 * result.L.diagonal().array().log().sum();
  result.Xw = result.L.triangularView<Eigen::Lower>().solve(X);
  result.Yw = result.L.triangularView<Eigen::Lower>().solve(Y);
  if (X.cols() == 0) {
    result.coef = Eigen::VectorXd(0);
    result.deviance = result.Yw.squaredNorm();
  } else {
    result.coef = result.Xw.colPivHouseholderQr().solve(result.Yw);
    result.deviance = (result.Yw - result.Xw * result.coef).squaredNorm();
  }
  return result;
}

// Log-likelihood of an ordinary least squares fit with deviance `dev` on `n` observations (ML variance)
auto ols_loglikelihood(double dev, int n) -> double {
  return -n / 2.0 * (std::log(2 * std::numbers::pi * dev / n) + 1);
}

auto check_dimensions(
    const Eigen::MatrixXd& X,
    const Eigen::VectorXd& Y,
    const Topological_matrix& V,
    const std::vector<bool>& observed)
    -> void {

  if (X.rows() != Y.size()) {
    throw std::invalid_argument(absl::StrFormat(
        "The design matrix has %d rows, but there are %d trait values", X.rows(), Y.size()));
  }
  if (not observed.empty() && std::ssize(observed) != V.num_tips()) {
    throw std::invalid_argument(absl::StrFormat(
        "Mask of observed tips has %d entries, but the network has %d tips", std::ssize(observed), V.num_tips()));
  }
  auto num_observed = observed.empty() ? V.num_tips() : static_cast<int>(std::ranges::count(observed, true));
  if (Y.size() != num_observed) {
    throw std::invalid_argument(absl::StrFormat(
        "There are %d trait values, but %d observed tips", Y.size(), num_observed));
  }
  if (num_observed == 0) {
    throw std::invalid_argument("Cannot fit a model without any observed tip");
  }
  if (X.cols() > 0) {
    auto rank = Eigen::ColPivHouseholderQR<Eigen::MatrixXd>{X}.rank();
    if (rank < X.cols()) {
      throw std::invalid_argument(absl::StrFormat(
          "The design matrix has %d columns but rank %d: some predictors are collinear", X.cols(), rank));
    }
  }
}

auto apply_options(Phylo_network_linear_model& fit, const Phylo_lm_options& options) -> void {
  if (not options.coef_names.empty()) {
    fit.set_coef_names(options.coef_names);
  }
  fit.set_has_intercept(options.has_intercept);
}

}  // namespace

// Phylo_network_linear_model
// ==========================

Phylo_network_linear_model::Phylo_network_linear_model(
    Eigen::MatrixXd X,
    Eigen::VectorXd Y,
    Topological_matrix V,
    std::vector<bool> observed,
    std::vector<int> reorder,
    Trait_model model,
    double lambda)
    : X_{std::move(X)},
      Y_{std::move(Y)},
      V_{std::move(V)},
      observed_{std::move(observed)},
      reorder_{std::move(reorder)},
      model_{model},
      lambda_{lambda},
      lambda_in_model_{model != Trait_model::k_bm} {

  check_dimensions(X_, Y_, V_, observed_);

  Vy_ = V_.tips(reorder_, observed_);
  auto solution = solve_gls(X_, Y_, Vy_);
  if (not solution.has_value()) {
    throw std::runtime_error(absl::StrFormat(
        "The covariance matrix between the %d observed tips is not positive definite "
        "(non-positive-definite correlation structure; look for tips at zero distance from each other)",
        Vy_.rows()));
  }
  L_ = std::move(solution->L);
  logdet_Vy_ = solution->logdet;
  Xw_ = std::move(solution->Xw);
  Yw_ = std::move(solution->Yw);
  coef_ = std::move(solution->coef);
  deviance_ = solution->deviance;

  for (auto j = 0; j != num_coefficients(); ++j) {
    coef_names_.push_back(absl::StrFormat("x%d", j + 1));
  }
}

auto Phylo_network_linear_model::set_coef_names(std::vector<std::string> names) -> void {
  if (std::ssize(names) != num_coefficients()) {
    throw std::invalid_argument(absl::StrFormat(
        "Got %d coefficient names for %d coefficients", std::ssize(names), num_coefficients()));
  }
  coef_names_ = std::move(names);
}

auto Phylo_network_linear_model::vcov() const -> Eigen::MatrixXd {
  auto p = num_coefficients();
  if (p == 0) {
    return Eigen::MatrixXd(0, 0);
  }
  if (dof_residual() <= 0) {
    return Eigen::MatrixXd::Constant(p, p, k_nan);  // Saturated fit: no residual variance left
  }
  Eigen::MatrixXd XtX = Xw_.transpose() * Xw_;
  Eigen::MatrixXd XtX_inv = XtX.llt().solve(Eigen::MatrixXd::Identity(p, p));
  return deviance_ / dof_residual() * XtX_inv;
}

auto Phylo_network_linear_model::stderror() const -> Eigen::VectorXd {
  return vcov().diagonal().array().sqrt();
}

auto Phylo_network_linear_model::confint(double level) const -> Eigen::MatrixXd {
  if (not (level > 0.0 && level < 1.0)) {
    throw std::invalid_argument(absl::StrFormat("Confidence level must be in (0, 1), not %g", level));
  }
  auto p = num_coefficients();
  auto result = Eigen::MatrixXd(p, 2);
  if (p == 0) {
    return result;
  }
  if (dof_residual() <= 0) {
    result.setConstant(k_nan);
    return result;
  }
  auto t_dist = boost::math::students_t{static_cast<double>(dof_residual())};
  auto q = boost::math::quantile(t_dist, (1.0 + level) / 2.0);
  auto se = stderror();
  result.col(0) = coef_ - q * se;
  result.col(1) = coef_ + q * se;
  return result;
}

auto Phylo_network_linear_model::coef_table(double level) const -> Coef_table {
  auto p = num_coefficients();
  auto table = Coef_table{
    .names = coef_names_,
    .estimate = coef_,
    .std_error = stderror(),
    .t_value = Eigen::VectorXd(p),
    .p_value = Eigen::VectorXd(p),
    .lower = Eigen::VectorXd(p),
    .upper = Eigen::VectorXd(p),
    .level = level};
  if (p == 0) {
    return table;
  }

  auto ci = confint(level);
  table.lower = ci.col(0);
  table.upper = ci.col(1);
  if (dof_residual() <= 0) {
    table.t_value.setConstant(k_nan);
    table.p_value.setConstant(k_nan);
    return table;
  }
  auto t_dist = boost::math::students_t{static_cast<double>(dof_residual())};
  for (auto j = 0; j != p; ++j) {
    table.t_value(j) = table.estimate(j) / table.std_error(j);
    table.p_value(j) = 2 * boost::math::cdf(boost::math::complement(t_dist, std::abs(table.t_value(j))));
  }
  return table;
}

auto Phylo_network_linear_model::dof() const -> int {
  auto result = num_coefficients() + 1;  // +1: variance rate
  if (lambda_in_model_) {
    result += 1;  // lambda
  }
  return result;
}

auto Phylo_network_linear_model::residuals() const -> Eigen::VectorXd {
  if (num_coefficients() == 0) {
    return L_ * Yw_;
  }
  return L_ * (Yw_ - Xw_ * coef_);
}

auto Phylo_network_linear_model::predict() const -> Eigen::VectorXd {
  if (num_coefficients() == 0) {
    return Eigen::VectorXd::Zero(nobs());
  }
  return L_ * (Xw_ * coef_);
}

auto Phylo_network_linear_model::loglikelihood() const -> double {
  return ols_loglikelihood(deviance_, nobs()) - 0.5 * logdet_Vy_;
}

auto Phylo_network_linear_model::null_deviance() const -> double {
  Eigen::VectorXd vo = L_.triangularView<Eigen::Lower>().solve(Eigen::VectorXd::Ones(nobs()));
  auto bo = vo.dot(Yw_) / vo.squaredNorm();
  return (Yw_ - bo * vo).squaredNorm();
}

auto Phylo_network_linear_model::null_loglikelihood() const -> double {
  return ols_loglikelihood(null_deviance(), nobs()) - 0.5 * logdet_Vy_;
}

auto Phylo_network_linear_model::r2() const -> double {
  return 1.0 - deviance() / null_deviance();
}

auto Phylo_network_linear_model::adjr2() const -> double {
  auto n = static_cast<double>(nobs());
  auto p = static_cast<double>(dof() - 1);  // dof() includes the variance rate
  return 1.0 - (1.0 - r2()) * (n - 1) / (n - p);
}

auto Phylo_network_linear_model::aic() const -> double {
  return -2 * loglikelihood() + 2 * dof();
}

auto Phylo_network_linear_model::aicc() const -> double {
  auto k = static_cast<double>(dof());
  auto n = static_cast<double>(nobs());
  return aic() + 2 * k * (k + 1) / (n - k - 1);
}

auto Phylo_network_linear_model::bic() const -> double {
  return -2 * loglikelihood() + dof() * std::log(static_cast<double>(nobs()));
}

auto Phylo_network_linear_model::mu_estim(const Trait_warning_hook& warning_hook) const -> double {
  if (has_intercept_.has_value() && not has_intercept_.value()) {
    throw std::invalid_argument("The fit was done without intercept, so I cannot estimate mu");
  }
  if (num_coefficients() == 0) {
    throw std::invalid_argument("The fit has no coefficients, so I cannot estimate mu");
  }
  if (not has_intercept_.has_value()) {
    warning_hook(Trait_warnings::Mu_from_first_coefficient{});
  }
  return coef_(0);
}

auto operator<<(std::ostream& os, const Coef_table& table) -> std::ostream& {
  auto pct = 100.0 * table.level;
  os << absl::StreamFormat("%-16s %12s %12s %10s %10s %12s %12s\n",
                           "", "Estimate", "Std.Error", "t value", "Pr(>|t|)",
                           absl::StrFormat("Lower %g%%", pct), absl::StrFormat("Upper %g%%", pct));
  for (auto j = 0; j != std::ssize(table.names); ++j) {
    os << absl::StreamFormat("%-16s %12.6g %12.6g %10.4g %10.4g %12.6g %12.6g\n",
                             table.names[j], table.estimate(j), table.std_error(j),
                             table.t_value(j), table.p_value(j), table.lower(j), table.upper(j));
  }
  return os;
}

auto operator<<(std::ostream& os, const Phylo_network_linear_model& fit) -> std::ostream& {
  os << absl::StreamFormat("Phylogenetic network linear model (model: %s)\n\n", to_string(fit.model()));
  os << "Parameter(s) Estimates:\n";
  os << absl::StreamFormat("Sigma2: %.6g\n", fit.sigma2_estim());
  if (fit.model() != Trait_model::k_bm) {
    os << absl::StreamFormat("Lambda: %.6g\n", fit.lambda_estim());
  }
  os << "\nCoefficients:\n";
  if (fit.num_coefficients() == 0) {
    os << "(none: the expected value is fixed at 0)\n";
  } else {
    os << fit.coef_table();
  }
  os << absl::StreamFormat("\nLog Likelihood: %.10g\n", fit.loglikelihood());
  os << absl::StreamFormat("AIC: %.10g\n", fit.aic());
  return os;
}


// Fitting
// =======

auto bm_negative_loglikelihood(const Eigen::MatrixXd& X, const Eigen::VectorXd& Y, const Eigen::MatrixXd& Vy)
    -> double {
  auto solution = solve_gls(X, Y, Vy);
  if (not solution.has_value()) {
    return k_inf;
  }
  return -(ols_loglikelihood(solution->deviance, static_cast<int>(Y.size())) - 0.5 * solution->logdet);
}

auto phylo_network_lm_bm(
    const Eigen::MatrixXd& X,
    const Eigen::VectorXd& Y,
    const Topological_matrix& V,
    const std::vector<bool>& observed,
    const std::vector<int>& reorder)
    -> Phylo_network_linear_model {
  return Phylo_network_linear_model{X, Y, V, observed, reorder};
}

auto phylo_network_lm_lambda(
    const Eigen::MatrixXd& X,
    const Eigen::VectorXd& Y,
    const Topological_matrix& V,
    const Lambda_transform_weights& weights,
    const Phylo_lm_options& options)
    -> Phylo_network_linear_model {

  check_dimensions(X, Y, V, options.observed);

  auto lambda = 1.0;
  auto optimization = std::optional<Optimization_result>{};
  if (options.fixed_value.has_value()) {
    lambda = options.fixed_value.value();
  } else {
    auto up = max_lambda(V, weights);
    auto upper = up - up / 1000;
    auto lower = options.lambda_lower_bound;
    if (not (lower < upper)) {
      throw std::invalid_argument(absl::StrFormat(
          "Lower bound for lambda (%g) must be below its upper bound (%g)", lower, upper));
    }
    auto objective = [&](double lam) -> double {
      auto V_lambda = lambda_transformed(V, lam, weights);
      return bm_negative_loglikelihood(X, Y, V_lambda.tips(options.reorder, options.observed));
    };
    optimization = minimize_bounded(objective, lower, upper, options.starting_value, options.optimizer);
    if (not std::isfinite(optimization->f_min)) {
      throw std::runtime_error(absl::StrFormat(
          "Could not find a value of lambda in [%g, %g] with a positive definite tip covariance", lower, upper));
    }
    lambda = optimization->x_min;
  }

  auto fit = Phylo_network_linear_model{
    X, Y, lambda_transformed(V, lambda, weights), options.observed, options.reorder, Trait_model::k_lambda, lambda};
  if (optimization.has_value()) {
    fit.set_optimization(*optimization);
  }
  apply_options(fit, options);
  return fit;
}

auto phylo_network_lm_scaling_hybrid(
    const Eigen::MatrixXd& X,
    const Eigen::VectorXd& Y,
    const Network& net,
    const Phylo_lm_options& options,
    const Trait_warning_hook& warning_hook)
    -> Phylo_network_linear_model {

  auto lambda = 1.0;
  auto optimization = std::optional<Optimization_result>{};
  if (net.num_hybrids() == 0) {
    warning_hook(Trait_warnings::No_hybrids_to_scale{});
  } else if (options.fixed_value.has_value()) {
    lambda = options.fixed_value.value();
  } else {
    check_dimensions(X, Y, calc_shared_path_matrix(net), options.observed);
    auto objective = [&](double lam) -> double {
      auto V_lambda = calc_scaled_hybrid_matrix(net, lam);
      return bm_negative_loglikelihood(X, Y, V_lambda.tips(options.reorder, options.observed));
    };
    optimization = minimize_unbounded(objective, options.starting_value, options.optimizer);
    if (not std::isfinite(optimization->f_min)) {
      throw std::runtime_error("Could not find a hybrid scaling with a positive definite tip covariance");
    }
    lambda = optimization->x_min;
  }

  auto fit = Phylo_network_linear_model{
    X, Y, calc_scaled_hybrid_matrix(net, lambda), options.observed, options.reorder,
    Trait_model::k_scaling_hybrid, lambda};
  if (optimization.has_value()) {
    fit.set_optimization(*optimization);
  }
  if (net.num_hybrids() == 0) {
    fit.set_lambda_in_model(false);
  }
  apply_options(fit, options);
  return fit;
}

auto phylo_network_lm(
    const Eigen::MatrixXd& X,
    const Eigen::VectorXd& Y,
    const Network& net,
    const Phylo_lm_options& options,
    const Trait_warning_hook& warning_hook)
    -> Phylo_network_linear_model {

  switch (options.model) {
    case Trait_model::k_bm: {
      auto fit = phylo_network_lm_bm(X, Y, calc_shared_path_matrix(net), options.observed, options.reorder);
      apply_options(fit, options);
      return fit;
    }
    case Trait_model::k_lambda:
      return phylo_network_lm_lambda(
          X, Y, calc_shared_path_matrix(net), calc_lambda_transform_weights(net), options);
    case Trait_model::k_scaling_hybrid:
      return phylo_network_lm_scaling_hybrid(X, Y, net, options, warning_hook);
    default:
      throw std::logic_error(absl::StrFormat("Unknown trait model %s", to_string(options.model)));
  }
}


// Analysis of variance
// ====================

auto operator<<(std::ostream& os, const Anova_table& table) -> std::ostream& {
  os << absl::StreamFormat("%8s %14s %6s %14s %12s %12s\n", "dof_res", "RSS", "dof", "SS", "F", "Pr(>F)");
  for (const auto& row : table.rows) {
    os << absl::StreamFormat("%8d %14.6g %6d %14.6g %12.6g %12.6g\n",
                             row.dof_res, row.rss, row.dof, row.ss, row.F, row.p_value);
  }
  return os;
}

static auto anova_pair(const Phylo_network_linear_model& fit1, const Phylo_network_linear_model& fit2) -> Anova_row {
  if (not (fit1.num_coefficients() < fit2.num_coefficients())) {
    throw std::invalid_argument(absl::StrFormat(
        "Models must be nested, from the smallest to the largest (got %d then %d coefficients).",
        fit1.num_coefficients(), fit2.num_coefficients()));
  }
  auto dof2 = fit2.dof_residual();
  auto dev2 = fit2.deviance();
  auto dof1 = fit1.dof_residual() - dof2;
  auto dev1 = fit1.deviance() - dev2;
  if (dof2 <= 0) {
    throw std::invalid_argument(absl::StrFormat(
        "The largest model leaves %d residual degrees of freedom; cannot compute an F statistic", dof2));
  }

  auto F = (dev1 / dof1) / (dev2 / dof2);
  auto f_dist = boost::math::fisher_f{static_cast<double>(dof1), static_cast<double>(dof2)};
  auto p_value = boost::math::cdf(boost::math::complement(f_dist, std::max(F, 0.0)));
  return Anova_row{.dof_res = dof2, .rss = dev2, .dof = dof1, .ss = dev1, .F = F, .p_value = p_value};
}

auto anova(const std::vector<const Phylo_network_linear_model*>& fits) -> Anova_table {
  if (std::ssize(fits) < 2) {
    throw std::invalid_argument(absl::StrFormat("Need at least 2 nested fits for an anova, got %d", std::ssize(fits)));
  }
  auto result = Anova_table{};
  for (auto i = 0; i + 1 < std::ssize(fits); ++i) {
    CHECK_NE(fits[i], nullptr);
    CHECK_NE(fits[i + 1], nullptr);
    result.rows.push_back(anova_pair(*fits[i], *fits[i + 1]));
  }
  return result;
}

}  // namespace phylotraits
