#include "ancestral_reconstruction.h"

#include <cmath>
#include <stdexcept>

#include "absl/log/check.h"
#include "absl/strings/str_format.h"
#include "boost/math/distributions/normal.hpp"
#include "boost/math/distributions/students_t.hpp"

#include "shared_path.h"

namespace phylotraits {

Reconstructed_states::Reconstructed_states(
    Eigen::VectorXd traits_nodes,
    Eigen::MatrixXd variances_nodes,
    std::vector<int> node_numbers,
    Eigen::VectorXd traits_tips,
    std::vector<int> tip_numbers,
    std::optional<int> dof_residual)
    : traits_nodes_{std::move(traits_nodes)},
      variances_nodes_{std::move(variances_nodes)},
      node_numbers_{std::move(node_numbers)},
      traits_tips_{std::move(traits_tips)},
      tip_numbers_{std::move(tip_numbers)},
      dof_residual_{dof_residual} {

  CHECK_EQ(traits_nodes_.size(), std::ssize(node_numbers_));
  CHECK_EQ(variances_nodes_.rows(), traits_nodes_.size());
  CHECK_EQ(variances_nodes_.cols(), traits_nodes_.size());
  CHECK_EQ(traits_tips_.size(), std::ssize(tip_numbers_));
}

auto Reconstructed_states::expectations() const -> Expectations {
  auto result = Expectations{};
  result.node_numbers = node_numbers_;
  result.node_numbers.insert(result.node_numbers.end(), tip_numbers_.begin(), tip_numbers_.end());
  result.cond_expectation = Eigen::VectorXd(traits_nodes_.size() + traits_tips_.size());
  result.cond_expectation.head(traits_nodes_.size()) = traits_nodes_;
  result.cond_expectation.tail(traits_tips_.size()) = traits_tips_;
  return result;
}

auto Reconstructed_states::stderror() const -> Eigen::VectorXd {
  return variances_nodes_.diagonal().array().sqrt();
}

auto Reconstructed_states::predint(double level) const -> Eigen::MatrixXd {
  if (not (level > 0.0 && level < 1.0)) {
    throw std::invalid_argument(absl::StrFormat("Prediction level must be in (0, 1), not %g", level));
  }

  auto q = 0.0;
  if (dof_residual_.has_value()) {
    if (dof_residual_.value() <= 0) {
      throw std::runtime_error(absl::StrFormat(
          "Cannot compute prediction intervals with %d residual degrees of freedom", dof_residual_.value()));
    }
    auto t_dist = boost::math::students_t{static_cast<double>(dof_residual_.value())};
    q = boost::math::quantile(t_dist, (1.0 + level) / 2.0);
  } else {
    auto normal = boost::math::normal{};
    q = boost::math::quantile(normal, (1.0 + level) / 2.0);
  }

  auto num_nodes = traits_nodes_.size();
  auto num_tips = traits_tips_.size();
  auto result = Eigen::MatrixXd(num_nodes + num_tips, 2);
  auto se = stderror();
  result.block(0, 0, num_nodes, 1) = traits_nodes_ - q * se;
  result.block(0, 1, num_nodes, 1) = traits_nodes_ + q * se;
  result.block(num_nodes, 0, num_tips, 1) = traits_tips_;
  result.block(num_nodes, 1, num_tips, 1) = traits_tips_;
  return result;
}

auto operator<<(std::ostream& os, const Reconstructed_states& states) -> std::ostream& {
  auto expectations = states.expectations();
  auto intervals = states.predint();
  os << absl::StreamFormat("%12s %14s %14s %14s\n", "Node index", "Pred.", "Min.", "Max. (95%)");
  for (auto i = 0; i != std::ssize(expectations.node_numbers); ++i) {
    os << absl::StreamFormat("%12d %14.6g %14.6g %14.6g\n",
                             expectations.node_numbers[i], expectations.cond_expectation(i),
                             intervals(i, 0), intervals(i, 1));
  }
  return os;
}

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
    const Eigen::MatrixXd& add_var,
    std::optional<int> dof_residual)
    -> Reconstructed_states {

  CHECK_EQ(Y.size(), m_y.size());
  CHECK_EQ(L.rows(), Y.size());
  CHECK_EQ(VyzVyinvchol.rows(), Y.size());
  CHECK_EQ(VyzVyinvchol.cols(), Vz.rows());
  CHECK_EQ(m_z.size(), Vz.rows());

  Eigen::VectorXd whitened_residuals = L.triangularView<Eigen::Lower>().solve(Y - m_y);
  Eigen::VectorXd m_z_cond_y = m_z + VyzVyinvchol.transpose() * whitened_residuals;
  Eigen::MatrixXd V_z_cond_y = sigma2 * (Vz - VyzVyinvchol.transpose() * VyzVyinvchol);
  if (add_var.size() != 0) {
    CHECK_EQ(add_var.rows(), Vz.rows());
    CHECK_EQ(add_var.cols(), Vz.cols());
    V_z_cond_y += add_var;
  }
  return Reconstructed_states{
    std::move(m_z_cond_y), std::move(V_z_cond_y), std::move(node_numbers),
    Y, std::move(tip_numbers), dof_residual};
}

namespace {

// Expected trait value at every node under a BM with parameters `params` (row 0, nodes in topological order)
class Bm_expectation_rules : public Pre_order_rules {
 public:
  Bm_expectation_rules(const Network& net, const Params_bm& params) : net_{&net}, params_{&params} {}

  auto init(const Network& /*net*/, const std::vector<Node_index>& nodes) -> Eigen::MatrixXd override {
    nodes_ = nodes;
    return Eigen::MatrixXd::Zero(1, std::ssize(nodes));
  }
  auto at_root(Eigen::MatrixXd& M, int i) -> void override {
    M(0, i) = params_->mu;
  }
  auto at_tree_node(Eigen::MatrixXd& M, int i, int parent, Edge_index /*edge*/) -> void override {
    auto shift = params_->shift.has_value() ? params_->shift->shift_at(nodes_[i]) : 0.0;
    M(0, i) = M(0, parent) + shift;
  }
  auto at_hybrid_node(
      Eigen::MatrixXd& M,
      int i,
      int parent1,
      int parent2,
      Edge_index edge1,
      Edge_index edge2)
      -> void override {
    M(0, i) = net_->edge_at(edge1).gamma * M(0, parent1) + net_->edge_at(edge2).gamma * M(0, parent2);
  }

 private:
  const Network* net_;
  const Params_bm* params_;
  std::vector<Node_index> nodes_{};
};

}  // namespace

auto ancestral_state_reconstruction(
    const Topological_matrix& V,
    const Eigen::VectorXd& Y,
    const Params_bm& params,
    const Network& net)
    -> Reconstructed_states {

  check_params_bm(params);
  if (params.random_root) {
    throw std::invalid_argument("Ancestral state reconstruction with known parameters needs a BM with a fixed root");
  }
  if (Y.size() != V.num_tips()) {
    throw std::invalid_argument(absl::StrFormat(
        "Got %d trait values for a network with %d tips", Y.size(), V.num_tips()));
  }
  if (params.shift.has_value() && params.shift->num_nodes() != net.num_nodes()) {
    throw std::invalid_argument(absl::StrFormat(
        "Shifts are given for %d nodes, but the network has %d nodes", params.shift->num_nodes(), net.num_nodes()));
  }

  auto Vy = V.tips();
  auto Vz = V.internal_nodes();
  auto Vyz = V.tips_nodes();
  auto llt = Eigen::LLT<Eigen::MatrixXd>{Vy};
  if (llt.info() != Eigen::Success) {
    throw std::runtime_error(absl::StrFormat(
        "The covariance matrix between the %d tips is not positive definite "
        "(non-positive-definite correlation structure)", Vy.rows()));
  }
  Eigen::MatrixXd L = llt.matrixL();
  Eigen::MatrixXd temp = L.triangularView<Eigen::Lower>().solve(Vyz);

  auto rules = Bm_expectation_rules{net, params};
  auto expected = recursion_pre_order(net, rules, Indexation::k_columns);
  Eigen::VectorXd m_y = expected.tips().row(0).transpose();
  Eigen::VectorXd m_z = expected.internal_nodes().row(0).transpose();

  return ancestral_state_reconstruction(
      Vz, temp, L, Y, m_y, m_z, V.internal_node_numbers(), V.tip_numbers(), params.sigma2);
}

auto ancestral_state_reconstruction(
    const Network& net,
    const Eigen::VectorXd& Y,
    const Params_bm& params)
    -> Reconstructed_states {
  return ancestral_state_reconstruction(calc_shared_path_matrix(net), Y, params, net);
}

auto ancestral_state_reconstruction(
    const Phylo_network_linear_model& fit,
    const Eigen::MatrixXd& X_n,
    const Trait_warning_hook& warning_hook)
    -> Reconstructed_states {

  const auto& V = fit.V();
  const auto& reorder = fit.reorder();
  const auto& observed = fit.observed();
  auto node_numbers = V.missing_node_numbers(reorder, observed);

  if (X_n.cols() != fit.num_coefficients()) {
    throw std::invalid_argument(absl::StrFormat(
        "The number of predictors for the ancestral states (%d columns) does not match "
        "the number of predictors at the tips (%d)", X_n.cols(), fit.num_coefficients()));
  }
  if (X_n.rows() != std::ssize(node_numbers)) {
    throw std::invalid_argument(absl::StrFormat(
        "The number of lines of the predictors (%d) does not match the number of internal nodes (%d) "
        "plus the number of missing tips (%d)",
        X_n.rows(), V.num_internal_nodes(), std::ssize(node_numbers) - V.num_internal_nodes()));
  }

  if (reorder.empty()) {
    warning_hook(Trait_warnings::Tip_order_assumed{});
  }

  Eigen::VectorXd m_y = fit.predict();
  Eigen::VectorXd m_z = X_n * fit.coef();

  auto Vyz = V.tips_nodes(reorder, observed);
  auto Vz = V.internal_nodes(reorder, observed);
  Eigen::MatrixXd temp = fit.L().triangularView<Eigen::Lower>().solve(Vyz);
  Eigen::MatrixXd U = X_n - temp.transpose() * fit.whitened_X();
  Eigen::MatrixXd add_var = U * fit.vcov() * U.transpose();

  warning_hook(Trait_warnings::Variance_rate_uncertainty_ignored{});

  return ancestral_state_reconstruction(
      Vz, temp, fit.L(), fit.response(), m_y, m_z,
      std::move(node_numbers), V.observed_tip_numbers(reorder, observed),
      fit.sigma2_estim(), add_var, fit.dof_residual());
}

auto ancestral_state_reconstruction(
    const Phylo_network_linear_model& fit,
    const Trait_warning_hook& warning_hook)
    -> Reconstructed_states {

  if (fit.num_coefficients() != 1 || not (fit.X().array() == 1.0).all()) {
    throw std::invalid_argument(
        "Predictor(s) other than a plain intercept are used in this fitted model. "
        "These predictors are unobserved at ancestral nodes, so they cannot be used for the ancestral state "
        "reconstruction. If these ancestral predictor values are known, please provide them as a matrix argument.");
  }
  auto num_missing = std::ssize(fit.V().missing_node_numbers(fit.reorder(), fit.observed()));
  return ancestral_state_reconstruction(fit, Eigen::MatrixXd::Ones(num_missing, 1), warning_hook);
}

}  // namespace phylotraits
