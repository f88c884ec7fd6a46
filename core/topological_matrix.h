#ifndef PHYLOTRAITS_TOPOLOGICAL_MATRIX_H_
#define PHYLOTRAITS_TOPOLOGICAL_MATRIX_H_

#include <ostream>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "network.h"

namespace phylotraits {

// Which dimensions of a Topological_matrix are indexed by the nodes of the network
enum class Indexation {
  k_rows,
  k_columns,
  k_both
};
auto to_string(Indexation indexation) -> std::string_view;

// A matrix whose rows and/or columns correspond to the nodes of a network, listed in
// topological order (every node after all of its ancestors).  Besides the order itself, it records
// which nodes are tips (with their names) and which are internal, so that blocks can be extracted.
//
// Sub-matrix extraction takes two optional arguments describing how data rows relate to the tips:
// - `reorder[k]` is the position (in network tip order) of the tip whose data is in row k (empty = identity);
// - `observed[k]` is false if the data row k has no trait value (empty = all observed).
// Unobserved tips are grouped with the internal nodes, after them.
class Topological_matrix {
 public:
  Topological_matrix(
      Eigen::MatrixXd V,
      std::vector<int> node_numbers_top_order,
      std::vector<int> internal_node_numbers,
      std::vector<int> tip_numbers,
      std::vector<std::string> tip_names,
      Indexation indexation);

  auto V() const -> const Eigen::MatrixXd& { return V_; }
  auto V() -> Eigen::MatrixXd& { return V_; }
  auto node_numbers_top_order() const -> const std::vector<int>& { return node_numbers_top_order_; }
  auto internal_node_numbers() const -> const std::vector<int>& { return internal_node_numbers_; }
  auto tip_numbers() const -> const std::vector<int>& { return tip_numbers_; }
  auto tip_names() const -> const std::vector<std::string>& { return tip_names_; }
  auto indexation() const -> Indexation { return indexation_; }

  auto num_nodes() const -> int { return static_cast<int>(std::ssize(node_numbers_top_order_)); }
  auto num_tips() const -> int { return static_cast<int>(std::ssize(tip_numbers_)); }
  auto num_internal_nodes() const -> int { return static_cast<int>(std::ssize(internal_node_numbers_)); }

  // Position of a node (given by its number) in the topological order
  auto position_of(int node_number) const -> int;

  // Positions of all tips (in network tip order) and of all internal nodes
  auto tip_positions() const -> const std::vector<int>& { return tip_positions_; }
  auto internal_positions() const -> const std::vector<int>& { return internal_positions_; }

  // Positions in topological order of the observed tips (in data order), and of the
  // internal nodes followed by the unobserved tips (in data order)
  auto observed_tip_positions(
      const std::vector<int>& reorder = {},
      const std::vector<bool>& observed = {}) const
      -> std::vector<int>;
  auto missing_node_positions(
      const std::vector<int>& reorder = {},
      const std::vector<bool>& observed = {}) const
      -> std::vector<int>;

  // Node numbers matching `missing_node_positions` / `observed_tip_positions`
  auto missing_node_numbers(
      const std::vector<int>& reorder = {},
      const std::vector<bool>& observed = {}) const
      -> std::vector<int>;
  auto observed_tip_numbers(
      const std::vector<int>& reorder = {},
      const std::vector<bool>& observed = {}) const
      -> std::vector<int>;

  // Rows and/or columns (according to `indexation()`) of the observed tips
  auto tips(
      const std::vector<int>& reorder = {},
      const std::vector<bool>& observed = {}) const
      -> Eigen::MatrixXd;

  // Rows and/or columns (according to `indexation()`) of the internal nodes, then the unobserved tips
  auto internal_nodes(
      const std::vector<int>& reorder = {},
      const std::vector<bool>& observed = {}) const
      -> Eigen::MatrixXd;

  // Rows of observed tips vs. columns of internal nodes and unobserved tips.  Only for `Indexation::k_both`.
  auto tips_nodes(
      const std::vector<int>& reorder = {},
      const std::vector<bool>& observed = {}) const
      -> Eigen::MatrixXd;

  auto all() const -> const Eigen::MatrixXd& { return V_; }

 private:
  Eigen::MatrixXd V_;
  std::vector<int> node_numbers_top_order_;
  std::vector<int> internal_node_numbers_;
  std::vector<int> tip_numbers_;
  std::vector<std::string> tip_names_;
  Indexation indexation_;

  std::vector<int> tip_positions_;
  std::vector<int> internal_positions_;

  auto ordered_tip_positions(const std::vector<int>& reorder) const -> std::vector<int>;
  auto check_observed(const std::vector<bool>& observed) const -> void;
  auto select(const std::vector<int>& positions) const -> Eigen::MatrixXd;
};

auto operator<<(std::ostream& os, const Topological_matrix& matrix) -> std::ostream&;


// Topological-order recursion
// ===========================
//
// A matrix indexed by nodes in topological order is filled in one node at a time, by visiting
// the nodes in pre-order (ancestors first) or post-order (descendants first).  The recursion
// itself only dispatches on the shape of each node; what gets computed is supplied by a set of rules.
// In the calls below, `i`, `parent`, `children` etc. are positions in the topological order
// (i.e., row/column indices into the matrix).

class Pre_order_rules {
 public:
  virtual ~Pre_order_rules() = default;

  virtual auto init(const Network& net, const std::vector<Node_index>& nodes) -> Eigen::MatrixXd = 0;
  virtual auto at_root(Eigen::MatrixXd& M, int i) -> void = 0;
  virtual auto at_tree_node(Eigen::MatrixXd& M, int i, int parent, Edge_index edge) -> void = 0;
  virtual auto at_hybrid_node(
      Eigen::MatrixXd& M,
      int i,
      int parent1,
      int parent2,
      Edge_index edge1,
      Edge_index edge2)
      -> void = 0;
};

class Post_order_rules {
 public:
  virtual ~Post_order_rules() = default;

  virtual auto init(const Network& net, const std::vector<Node_index>& nodes) -> Eigen::MatrixXd = 0;
  virtual auto at_tip(Eigen::MatrixXd& M, int i) -> void = 0;
  virtual auto at_internal_node(
      Eigen::MatrixXd& M,
      int i,
      const std::vector<int>& children,
      const std::vector<Edge_index>& child_edges)
      -> void = 0;
};

// Throws if the network is not rooted, or if some node has more than 2 parents or a hybrid node
// is attached to its parents through non-hybrid edges
auto check_network_for_recursion(const Network& net) -> void;

auto recursion_pre_order(const Network& net, Pre_order_rules& rules, Indexation indexation) -> Topological_matrix;
auto recursion_post_order(const Network& net, Post_order_rules& rules, Indexation indexation) -> Topological_matrix;

}  // namespace phylotraits

#endif // PHYLOTRAITS_TOPOLOGICAL_MATRIX_H_
