#ifndef PHYLOTRAITS_SHIFTS_H_
#define PHYLOTRAITS_SHIFTS_H_

#include <ostream>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "network.h"
#include "topological_matrix.h"

namespace phylotraits {

// Shifts in the mean of a BM process
// ==================================
//
// A shift of value s on the edge above node v means that v and all of its descendants (until another
// shift is met) inherit the ancestral mean plus s.  Shifts are stored per node (the child of the
// shifted edge), and are only allowed on tree edges.
class Shift_net {
 public:
  // No shifts anywhere
  explicit Shift_net(const Network& net);

  // Shift values[k] on the edge above nodes[k]
  Shift_net(const std::vector<Node_index>& nodes, const std::vector<double>& values, const Network& net);

  auto num_nodes() const -> int { return static_cast<int>(std::ssize(shift_)); }
  auto shift_at(Node_index node) const -> double { return shift_.at(node); }
  auto shifts() const -> const Node_vector<double>& { return shift_; }
  auto any_shift() const -> bool;

  // Numbers of the edges carrying a nonzero shift, and the matching shift values
  auto edge_numbers() const -> std::vector<int>;
  auto values() const -> std::vector<double>;

  // Merges two sets of shifts on the same network.  Throws if both put different nonzero values on the same edge.
  friend auto operator*(const Shift_net& a, const Shift_net& b) -> Shift_net;

 private:
  Node_vector<double> shift_;
  Node_vector<int> edge_number_;  // Number of the edge above each node (0 for the root)

  Shift_net() = default;
};

// Shift values[k] on edges[k]
auto shift_on_edges(const std::vector<Edge_index>& edges, const std::vector<double>& values, const Network& net)
    -> Shift_net;

// One shift on the edge below each hybrid node (in index order).  There must be exactly one value per hybrid node.
auto shift_hybrid(const std::vector<double>& values, const Network& net) -> Shift_net;

auto operator<<(std::ostream& os, const Shift_net& shift) -> std::ostream&;


// Shift regressors
// ================

// Design-matrix columns for shifts on a set of edges: column k is the column of the incidence matrix
// for the k-th node, restricted to the tips (in network tip order)
struct Shift_regressor {
  std::vector<std::string> column_names;
  Eigen::MatrixXd columns;
  std::vector<std::string> tip_names;

  auto num_columns() const -> int { return static_cast<int>(columns.cols()); }
  auto column(std::string_view name) const -> Eigen::VectorXd;
};

// "shift_5" for node number 5, "shift_m5" for node number -5
auto shift_column_name(int node_number) -> std::string;

auto regressor_shift(const std::vector<Node_index>& nodes, const Network& net) -> Shift_regressor;
auto regressor_shift(
    const std::vector<Node_index>& nodes,
    const Network& net,
    const Topological_matrix& incidence)
    -> Shift_regressor;
auto regressor_shift_on_edges(const std::vector<Edge_index>& edges, const Network& net) -> Shift_regressor;

// One shift column per hybrid node (on the edge below it), plus a final column "sum" adding them all up
auto regressor_hybrid(const Network& net) -> Shift_regressor;

auto operator<<(std::ostream& os, const Shift_regressor& regressor) -> std::ostream&;

}  // namespace phylotraits

#endif // PHYLOTRAITS_SHIFTS_H_
