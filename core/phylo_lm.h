#ifndef PHYLOTRAITS_PHYLO_LM_H_
#define PHYLOTRAITS_PHYLO_LM_H_

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <Eigen/Dense>

#include "network.h"
#include "optimize.h"
#include "shared_path.h"
#include "topological_matrix.h"
#include "warnings.h"

namespace phylotraits {

// Phylogenetic regression on a network
// ====================================
//
// The trait values Y at the observed tips are modelled as Y = X b + e, where e follows a BM process
// along the network: Var(e) = sigma2 * Vy, with Vy the shared-path matrix restricted to the observed tips.
// The fit is a generalized least squares: with Vy = L L^T (Cholesky), the whitened problem
// L^-1 Y = L^-1 X b + L^-1 e is an ordinary least squares problem with iid errors.
//
// Two variants transform Vy with a single scalar parameter, fitted by maximum (profile) likelihood:
// - lambda: Pagel's lambda, interpolating between a star tree (0) and the network (1);
// - scalingHybrid: moves every hybrid's inheritance weights towards its major tree (0) or away from it.

enum class Trait_model {
  k_bm,
  k_lambda,
  k_scaling_hybrid
};
auto to_string(Trait_model model) -> std::string_view;  // "BM", "lambda" or "scalingHybrid"
auto parse_trait_model(std::string_view s) -> Trait_model;

struct Phylo_lm_options {
  Trait_model model{Trait_model::k_bm};

  // observed[k] is false if data row k has no trait value (X and Y only contain the observed rows)
  std::vector<bool> observed{};
  // reorder[k] is the position (in network tip order) of the tip of data row k
  std::vector<int> reorder{};

  // Transformation parameter: optimization start, or fixed value (no optimization)
  double starting_value{0.5};
  std::optional<double> fixed_value{};
  Optimizer_config optimizer{};
  double lambda_lower_bound{1e-100};

  // Names of the columns of X ("x1", "x2", ... if empty)
  std::vector<std::string> coef_names{};
  // Whether the first column of X is an intercept (unknown for a bare design matrix)
  std::optional<bool> has_intercept{};
};

struct Coef_table {
  std::vector<std::string> names;
  Eigen::VectorXd estimate;
  Eigen::VectorXd std_error;
  Eigen::VectorXd t_value;
  Eigen::VectorXd p_value;
  Eigen::VectorXd lower;
  Eigen::VectorXd upper;
  double level;
};
auto operator<<(std::ostream& os, const Coef_table& table) -> std::ostream&;

class Phylo_network_linear_model {
 public:
  // Fits X b to Y with the covariance of the observed tips extracted from V (see `Topological_matrix::tips`).
  // Throws if the tip covariance is not positive definite.
  Phylo_network_linear_model(
      Eigen::MatrixXd X,
      Eigen::VectorXd Y,
      Topological_matrix V,
      std::vector<bool> observed = {},
      std::vector<int> reorder = {},
      Trait_model model = Trait_model::k_bm,
      double lambda = 1.0);

  auto X() const -> const Eigen::MatrixXd& { return X_; }
  auto V() const -> const Topological_matrix& { return V_; }
  auto Vy() const -> const Eigen::MatrixXd& { return Vy_; }
  auto L() const -> const Eigen::MatrixXd& { return L_; }       // Lower Cholesky factor of Vy
  auto logdet_Vy() const -> double { return logdet_Vy_; }
  auto observed() const -> const std::vector<bool>& { return observed_; }
  auto reorder() const -> const std::vector<int>& { return reorder_; }
  auto model() const -> Trait_model { return model_; }
  auto optimization() const -> const std::optional<Optimization_result>& { return optimization_; }
  auto coef_names() const -> const std::vector<std::string>& { return coef_names_; }
  auto has_intercept() const -> std::optional<bool> { return has_intercept_; }

  // False when the model's scalar parameter drops out of the fit (scalingHybrid without hybrids)
  auto lambda_in_model() const -> bool { return lambda_in_model_; }

  auto set_optimization(Optimization_result result) -> void { optimization_ = result; }
  auto set_lambda_in_model(bool in_model) -> void { lambda_in_model_ = in_model; }
  auto set_coef_names(std::vector<std::string> names) -> void;
  auto set_has_intercept(std::optional<bool> has_intercept) -> void { has_intercept_ = has_intercept; }

  // Whitened design and response, L^-1 X and L^-1 Y
  auto whitened_X() const -> const Eigen::MatrixXd& { return Xw_; }
  auto whitened_Y() const -> const Eigen::VectorXd& { return Yw_; }

  auto num_coefficients() const -> int { return static_cast<int>(X_.cols()); }
  auto nobs() const -> int { return static_cast<int>(Y_.size()); }
  auto coef() const -> const Eigen::VectorXd& { return coef_; }
  auto vcov() const -> Eigen::MatrixXd;
  auto stderror() const -> Eigen::VectorXd;
  auto confint(double level = 0.95) const -> Eigen::MatrixXd;  // One row per coefficient: lower, upper
  auto coef_table(double level = 0.95) const -> Coef_table;

  auto dof_residual() const -> int { return nobs() - num_coefficients(); }
  auto dof() const -> int;
  auto deviance() const -> double { return deviance_; }
  auto residuals() const -> Eigen::VectorXd;
  auto response() const -> const Eigen::VectorXd& { return Y_; }
  auto predict() const -> Eigen::VectorXd;

  auto loglikelihood() const -> double;
  auto null_deviance() const -> double;
  auto null_loglikelihood() const -> double;
  auto r2() const -> double;
  auto adjr2() const -> double;
  auto aic() const -> double;
  auto aicc() const -> double;
  auto bic() const -> double;

  auto sigma2_estim() const -> double { return deviance_ / nobs(); }
  auto mu_estim(const Trait_warning_hook& warning_hook = default_trait_warning_hook) const -> double;
  auto lambda_estim() const -> double { return lambda_; }

 private:
  Eigen::MatrixXd X_;
  Eigen::VectorXd Y_;
  Topological_matrix V_;
  std::vector<bool> observed_;
  std::vector<int> reorder_;
  Trait_model model_;
  double lambda_;
  bool lambda_in_model_;

  Eigen::MatrixXd Vy_;
  Eigen::MatrixXd L_;
  double logdet_Vy_;
  Eigen::MatrixXd Xw_;
  Eigen::VectorXd Yw_;
  Eigen::VectorXd coef_;
  double deviance_;

  std::optional<Optimization_result> optimization_{};
  std::vector<std::string> coef_names_;
  std::optional<bool> has_intercept_{};
};

auto operator<<(std::ostream& os, const Phylo_network_linear_model& fit) -> std::ostream&;


// Fitting
// =======

// Plain BM against an already built shared-path matrix
auto phylo_network_lm_bm(
    const Eigen::MatrixXd& X,
    const Eigen::VectorXd& Y,
    const Topological_matrix& V,
    const std::vector<bool>& observed = {},
    const std::vector<int>& reorder = {})
    -> Phylo_network_linear_model;

// Negative log-likelihood of the BM fit of X to Y for tip covariance Vy (+infinity if Vy is not positive definite)
auto bm_negative_loglikelihood(const Eigen::MatrixXd& X, const Eigen::VectorXd& Y, const Eigen::MatrixXd& Vy) -> double;

auto phylo_network_lm_lambda(
    const Eigen::MatrixXd& X,
    const Eigen::VectorXd& Y,
    const Topological_matrix& V,
    const Lambda_transform_weights& weights,
    const Phylo_lm_options& options)
    -> Phylo_network_linear_model;

auto phylo_network_lm_scaling_hybrid(
    const Eigen::MatrixXd& X,
    const Eigen::VectorXd& Y,
    const Network& net,
    const Phylo_lm_options& options,
    const Trait_warning_hook& warning_hook = default_trait_warning_hook)
    -> Phylo_network_linear_model;

// Builds whatever the model in `options` needs from the network and fits it
auto phylo_network_lm(
    const Eigen::MatrixXd& X,
    const Eigen::VectorXd& Y,
    const Network& net,
    const Phylo_lm_options& options = {},
    const Trait_warning_hook& warning_hook = default_trait_warning_hook)
    -> Phylo_network_linear_model;


// Analysis of variance
// ====================

struct Anova_row {
  int dof_res;
  double rss;
  int dof;
  double ss;
  double F;
  double p_value;
};

struct Anova_table {
  std::vector<Anova_row> rows;
};
auto operator<<(std::ostream& os, const Anova_table& table) -> std::ostream&;

// F tests between consecutive fits of the same data, from the smallest to the largest model
auto anova(const std::vector<const Phylo_network_linear_model*>& fits) -> Anova_table;

}  // namespace phylotraits

#endif // PHYLOTRAITS_PHYLO_LM_H_
