#include "shared_path.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "absl/log/check.h"

namespace phylotraits {

// Shared-path matrix
// ==================

Shared_path_rules::Shared_path_rules(const Network& net, Edge_vector<double> gammas)
    : net_{&net}, gammas_{std::move(gammas)} {
  CHECK_EQ(std::ssize(gammas_), net.num_edges());
}

auto Shared_path_rules::init(const Network& /*net*/, const std::vector<Node_index>& nodes) -> Eigen::MatrixXd {
  auto n = std::ssize(nodes);
  return Eigen::MatrixXd::Zero(n, n);
}

auto Shared_path_rules::at_root(Eigen::MatrixXd& M, int i) -> void {
  M(i, i) = 0.0;
}

auto Shared_path_rules::at_tree_node(Eigen::MatrixXd& M, int i, int parent, Edge_index edge) -> void {
  for (auto j = 0; j != i; ++j) {
    M(i, j) = M(j, parent);
    M(j, i) = M(j, parent);
  }
  M(i, i) = M(parent, parent) + net_->edge_at(edge).length;
}

auto Shared_path_rules::at_hybrid_node(
    Eigen::MatrixXd& M,
    int i,
    int parent1,
    int parent2,
    Edge_index edge1,
    Edge_index edge2)
    -> void {

  auto g1 = gammas_[edge1];
  auto g2 = gammas_[edge2];
  for (auto j = 0; j != i; ++j) {
    auto v = g1 * M(j, parent1) + g2 * M(j, parent2);
    M(i, j) = v;
    M(j, i) = v;
  }
  M(i, i) = g1 * g1 * (M(parent1, parent1) + net_->edge_at(edge1).length)
      + g2 * g2 * (M(parent2, parent2) + net_->edge_at(edge2).length)
      + 2 * g1 * g2 * M(parent1, parent2);
}

auto calc_shared_path_matrix(const Network& net) -> Topological_matrix {
  return calc_shared_path_matrix(net, edge_gammas(net));
}

auto calc_shared_path_matrix(const Network& net, const Edge_vector<double>& gammas) -> Topological_matrix {
  auto rules = Shared_path_rules{net, gammas};
  return recursion_pre_order(net, rules, Indexation::k_both);
}

// Incidence matrix
// ================

Incidence_rules::Incidence_rules(const Network& net) : net_{&net} {}

auto Incidence_rules::init(const Network& /*net*/, const std::vector<Node_index>& nodes) -> Eigen::MatrixXd {
  auto n = std::ssize(nodes);
  return Eigen::MatrixXd::Identity(n, n);
}

auto Incidence_rules::at_tip(Eigen::MatrixXd& /*M*/, int /*i*/) -> void {}

auto Incidence_rules::at_internal_node(
    Eigen::MatrixXd& M,
    int i,
    const std::vector<int>& children,
    const std::vector<Edge_index>& child_edges)
    -> void {

  DCHECK_EQ(std::ssize(children), std::ssize(child_edges));
  for (auto k = 0; k != std::ssize(children); ++k) {
    M.col(i) += net_->edge_at(child_edges[k]).gamma * M.col(children[k]);
  }
}

auto calc_incidence_matrix(const Network& net) -> Topological_matrix {
  auto rules = Incidence_rules{net};
  return recursion_post_order(net, rules, Indexation::k_rows);
}

// Node heights & Pagel's lambda
// =============================

auto calc_node_heights(const Network& net) -> Eigen::VectorXd {
  auto major_only = gammas_with_major(net, Node_vector<double>(net.num_nodes(), 1.0));
  return calc_shared_path_matrix(net, major_only).V().diagonal();
}

auto calc_lambda_transform_weights(const Network& net) -> Lambda_transform_weights {
  auto nodes = nodes_in_topological_order(net);
  auto gammas = major_gammas(net);
  auto result = Lambda_transform_weights{
    .major_gammas = Eigen::VectorXd(std::ssize(nodes)),
    .heights = calc_node_heights(net)};
  for (auto i = 0; i != std::ssize(nodes); ++i) {
    result.major_gammas(i) = gammas[nodes[i]];
  }
  return result;
}

auto transform_matrix_lambda(
    Topological_matrix& V,
    double lambda,
    const Lambda_transform_weights& weights)
    -> void {

  if (V.indexation() != Indexation::k_both) {
    throw std::invalid_argument("The lambda transform needs a matrix indexed by nodes on both rows and columns");
  }
  CHECK_EQ(weights.heights.size(), V.num_nodes());
  CHECK_EQ(weights.major_gammas.size(), V.num_nodes());

  auto& M = V.V();
  M *= lambda;
  for (const auto& i : V.tip_positions()) {
    auto g = weights.major_gammas(i);
    M(i, i) += (1 - lambda) * (g * g + (1 - g) * (1 - g)) * weights.heights(i);
  }
}

auto lambda_transformed(
    const Topological_matrix& V,
    double lambda,
    const Lambda_transform_weights& weights)
    -> Topological_matrix {
  auto result = V;
  transform_matrix_lambda(result, lambda, weights);
  return result;
}

auto max_lambda(const Topological_matrix& V, const Lambda_transform_weights& weights) -> double {
  auto max_tip_height = 0.0;
  for (const auto& i : V.tip_positions()) {
    max_tip_height = std::max(max_tip_height, weights.heights(i));
  }
  auto max_internal_height = 0.0;
  for (const auto& i : V.internal_positions()) {
    max_internal_height = std::max(max_internal_height, weights.heights(i));
  }
  if (max_internal_height <= 0.0) {
    return 1.0;
  }
  return max_tip_height / max_internal_height;
}

// Scaling of hybrid inheritance weights
// =====================================

auto scaled_hybrid_gammas(const Network& net, double lambda) -> Edge_vector<double> {
  auto major = major_gammas(net);
  for (const auto& node : net.hybrid_nodes()) {
    major[node] = 1.0 - lambda * (1.0 - major[node]);
  }
  return gammas_with_major(net, major);
}

auto calc_scaled_hybrid_matrix(const Network& net, double lambda) -> Topological_matrix {
  return calc_shared_path_matrix(net, scaled_hybrid_gammas(net, lambda));
}

}  // namespace phylotraits
