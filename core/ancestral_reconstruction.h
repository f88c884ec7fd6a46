#ifndef PHYLOTRAITS_ANCESTRAL_RECONSTRUCTION_H_
#define PHYLOTRAITS_ANCESTRAL_RECONSTRUCTION_H_

#include <optional>
#include <ostream>
#include <vector>

#include <Eigen/Dense>

#include "network.h"
#include "phylo_lm.h"
#include "simulation.h"
#include "topological_matrix.h"
#include "warnings.h"

namespace phylotraits {

// Ancestral state reconstruction
// ==============================
//
// The trait values at the "missing" nodes Z (internal nodes, then tips without data) and at the observed
// tips Y are jointly Gaussian.  Given Y, the best linear unbiased prediction of Z is its conditional law:
//
//   E[Z | Y]   = m_z + Vzy Vy^-1 (Y - m_y)
//   Var[Z | Y] = sigma2 (Vz - Vzy Vy^-1 Vyz)
//
// computed through the Cholesky factor L of Vy (Vzy Vy^-1 Vyz = (L^-1 Vyz)^T (L^-1 Vyz)).
// When the means come from a fitted regression, the uncertainty on the coefficients adds U Cov(b) U^T to the
// variance, with U = X_z - (L^-1 Vyz)^T (L^-1 X_y).  The uncertainty on sigma2 itself is ignored.

class Reconstructed_states {
 public:
  Reconstructed_states(
      Eigen::VectorXd traits_nodes,
      Eigen::MatrixXd variances_nodes,
      std::vector<int> node_numbers,
      Eigen::VectorXd traits_tips,
      std::vector<int> tip_numbers,
      std::optional<int> dof_residual = {});

  // Conditional expectations and covariances at the missing nodes, with their numbers
  auto traits_nodes() const -> const Eigen::VectorXd& { return traits_nodes_; }
  auto variances_nodes() const -> const Eigen::MatrixXd& { return variances_nodes_; }
  auto node_numbers() const -> const std::vector<int>& { return node_numbers_; }

  // Observed values at the tips, with their numbers
  auto traits_tips() const -> const Eigen::VectorXd& { return traits_tips_; }
  auto tip_numbers() const -> const std::vector<int>& { return tip_numbers_; }

  // Residual degrees of freedom of the fit the means came from (none if the parameters were known)
  auto dof_residual() const -> std::optional<int> { return dof_residual_; }

  // Node numbers (missing nodes, then observed tips) and their (conditional) expected values
  struct Expectations {
    std::vector<int> node_numbers;
    Eigen::VectorXd cond_expectation;
  };
  auto expectations() const -> Expectations;

  // Standard errors at the missing nodes
  auto stderror() const -> Eigen::VectorXd;

  // Prediction intervals (lower, upper) at the missing nodes, then the observed tips (degenerate intervals).
  // Quantiles are from a Student t with the fit's residual dof, or from a standard normal if the parameters were known.
  auto predint(double level = 0.95) const -> Eigen::MatrixXd;

 private:
  Eigen::VectorXd traits_nodes_;
  Eigen::MatrixXd variances_nodes_;
  std::vector<int> node_numbers_;
  Eigen::VectorXd traits_tips_;
  std::vector<int> tip_numbers_;
  std::optional<int> dof_residual_;
};

auto operator<<(std::ostream& os, const Reconstructed_states& states) -> std::ostream&;

// From all the needed quantities: `VyzVyinvchol` is L^-1 Vyz, and `add_var` (if non-empty) is added to the
// conditional variance
auto ancestral_state_reconstruction(
    const Eigen::MatrixXd& Vz,
    const Eigen::MatrixXd& VyzVyinvchol,
    const Eigen::MatrixXd& L,
    const Eigen::VectorXd& Y,
    const Eigen::VectorXd& m_y,
    const Eigen::VectorXd& m_z,
    std::vector<int> node_numbers,
    std::vector<int> tip_numbers,
    double sigma2,
    const Eigen::MatrixXd& add_var = {},
    std::optional<int> dof_residual = {})
    -> Reconstructed_states;

// Known BM parameters (fixed root), with trait values Y at all tips in network tip order.
// Expected values at the nodes include the shifts of `params`, if any.
auto ancestral_state_reconstruction(
    const Topological_matrix& V,
    const Eigen::VectorXd& Y,
    const Params_bm& params,
    const Network& net)
    -> Reconstructed_states;
auto ancestral_state_reconstruction(
    const Network& net,
    const Eigen::VectorXd& Y,
    const Params_bm& params)
    -> Reconstructed_states;

// From a fitted model, with the predictors X_n at the missing nodes (internal nodes, then tips without data)
auto ancestral_state_reconstruction(
    const Phylo_network_linear_model& fit,
    const Eigen::MatrixXd& X_n,
    const Trait_warning_hook& warning_hook = default_trait_warning_hook)
    -> Reconstructed_states;

// From a fitted model whose only predictor is an intercept
auto ancestral_state_reconstruction(
    const Phylo_network_linear_model& fit,
    const Trait_warning_hook& warning_hook = default_trait_warning_hook)
    -> Reconstructed_states;

}  // namespace phylotraits

#endif // PHYLOTRAITS_ANCESTRAL_RECONSTRUCTION_H_
