#ifndef PHYLOTRAITS_SHARED_PATH_H_
#define PHYLOTRAITS_SHARED_PATH_H_

#include <Eigen/Dense>

#include "network.h"
#include "topological_matrix.h"

namespace phylotraits {

// Shared-path matrix
// ==================
//
// V[i,j] is the expected length of the path shared by nodes i and j from the root, i.e., the
// covariance between the trait values at i and j under a BM process with unit variance rate.
// Along a hybrid node, paths through each parent are weighted by the inheritance weights.
// The matrix is indexed by nodes on both rows and columns.

class Shared_path_rules : public Pre_order_rules {
 public:
  Shared_path_rules(const Network& net, Edge_vector<double> gammas);

  auto init(const Network& net, const std::vector<Node_index>& nodes) -> Eigen::MatrixXd override;
  auto at_root(Eigen::MatrixXd& M, int i) -> void override;
  auto at_tree_node(Eigen::MatrixXd& M, int i, int parent, Edge_index edge) -> void override;
  auto at_hybrid_node(
      Eigen::MatrixXd& M,
      int i,
      int parent1,
      int parent2,
      Edge_index edge1,
      Edge_index edge2)
      -> void override;

 private:
  const Network* net_;
  Edge_vector<double> gammas_;
};

auto calc_shared_path_matrix(const Network& net) -> Topological_matrix;

// As above, but with the inheritance weight of every edge taken from `gammas` instead of the network
auto calc_shared_path_matrix(const Network& net, const Edge_vector<double>& gammas) -> Topological_matrix;


// Incidence matrix
// ================
//
// T[tip,node] is the total inheritance weight of the paths from `node` down to `tip` (1 if `node` is
// an ancestor of `tip` in a tree, 0 if it is not an ancestor at all).  Rows are indexed by nodes.

class Incidence_rules : public Post_order_rules {
 public:
  explicit Incidence_rules(const Network& net);

  auto init(const Network& net, const std::vector<Node_index>& nodes) -> Eigen::MatrixXd override;
  auto at_tip(Eigen::MatrixXd& M, int i) -> void override;
  auto at_internal_node(
      Eigen::MatrixXd& M,
      int i,
      const std::vector<int>& children,
      const std::vector<Edge_index>& child_edges)
      -> void override;

 private:
  const Network* net_;
};

auto calc_incidence_matrix(const Network& net) -> Topological_matrix;


// Node heights & Pagel's lambda
// =============================

// Distance from the root to every node (in topological order), ignoring inheritance weights:
// along every hybrid node, the path through its major edge is followed
auto calc_node_heights(const Network& net) -> Eigen::VectorXd;

// The per-node quantities that the lambda transform depends on, in topological order
struct Lambda_transform_weights {
  Eigen::VectorXd major_gammas;
  Eigen::VectorXd heights;
};
auto calc_lambda_transform_weights(const Network& net) -> Lambda_transform_weights;

// Multiplies every entry of V by lambda, then adds (1-lambda) * (g^2 + (1-g)^2) * height to the
// diagonal entries of tips, where g is the major inheritance weight into the tip.
// Applying it with lambda and then 1/lambda restores the original matrix.
auto transform_matrix_lambda(
    Topological_matrix& V,
    double lambda,
    const Lambda_transform_weights& weights)
    -> void;

// Same as above, on a copy
auto lambda_transformed(
    const Topological_matrix& V,
    double lambda,
    const Lambda_transform_weights& weights)
    -> Topological_matrix;

// Largest lambda that keeps V positive: max tip height / max internal node height.
// Returns 1.0 when no internal node lies above the root.
auto max_lambda(const Topological_matrix& V, const Lambda_transform_weights& weights) -> double;


// Scaling of hybrid inheritance weights
// =====================================

// Inheritance weights where the major weight g of every hybrid node becomes 1 - lambda * (1 - g)
// (and the minor weight its complement).  lambda = 1 leaves the weights unchanged; lambda = 0
// turns the network into its major tree.
auto scaled_hybrid_gammas(const Network& net, double lambda) -> Edge_vector<double>;

auto calc_scaled_hybrid_matrix(const Network& net, double lambda) -> Topological_matrix;

}  // namespace phylotraits

#endif // PHYLOTRAITS_SHARED_PATH_H_
