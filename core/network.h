#ifndef PHYLOTRAITS_NETWORK_H_
#define PHYLOTRAITS_NETWORK_H_

#include <ostream>
#include <string>
#include <vector>

#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/log/check.h"
#include "cppcoro/generator.hpp"

#include "estd.h"

namespace phylotraits {

// Networks, Nodes and Edges
// =========================

// A rooted phylogenetic network consists of a contiguous list of nodes and a contiguous list of edges.
// Nodes and edges are referred to by their index into those lists (`Node_index` and `Edge_index`).
// As with trees, variables holding indices have names like `node` or `edge`, not `node_index`,
// and the node and edge objects themselves are accessed indirectly through the network,
// e.g., `net.at(node).child_edges` or `net.edge_at(edge).gamma`.
//
// Unlike a tree, a node may have two parents.  Such a node is a *hybrid node*, and the two edges
// leading into it are *hybrid edges*, each carrying an inheritance weight `gamma` (the two weights add up to 1).
// The hybrid edge with the larger weight is the *major* edge.  Tree edges always have gamma = 1 and are major.
//
// Besides its index, every node has a signed `number` used to label it in outputs:
// tips are numbered 1..n in the order in which they appear in the Newick text, internal nodes
// are numbered -1, -2, ... in topological order (so the root is always -1).
using Node_index = int;
using Edge_index = int;

// Sentinel values for blank references (like `nullptr`)
inline constexpr Node_index k_no_node = -1;
inline constexpr Edge_index k_no_edge = -1;

// Stores a `T` for every node (edge) of a network, indexed by a node's (edge's) index
template<typename T>
using Node_vector = std::vector<T>;
template<typename T>
using Edge_vector = std::vector<T>;

struct Network_node {
  int number{0};
  std::string name{};
  bool hybrid{false};
  std::vector<Edge_index> parent_edges{};  // 0 (root), 1 (tree node) or 2 (hybrid node)
  std::vector<Edge_index> child_edges{};

  auto is_tip() const -> bool { return child_edges.empty(); }
  auto is_inner_node() const -> bool { return not child_edges.empty(); }
  auto is_root() const -> bool { return parent_edges.empty(); }
  auto num_parents() const -> int { return static_cast<int>(std::ssize(parent_edges)); }
};

struct Network_edge {
  int number{0};
  Node_index parent{k_no_node};
  Node_index child{k_no_node};
  double length{0.0};
  double gamma{1.0};
  bool hybrid{false};
  bool major{true};
};

auto operator<<(std::ostream& os, const Network_node& node) -> std::ostream&;
auto operator<<(std::ostream& os, const Network_edge& edge) -> std::ostream&;

struct Network {
  Node_index root{k_no_node};
  Node_vector<Network_node> nodes{};
  Edge_vector<Network_edge> edges{};

  auto num_nodes() const -> int { return static_cast<int>(std::ssize(nodes)); }
  auto num_edges() const -> int { return static_cast<int>(std::ssize(edges)); }
  auto num_tips() const -> int;
  auto num_hybrids() const -> int;

  auto at(Node_index i) -> Network_node& { return nodes.at(i); }
  auto at(Node_index i) const -> const Network_node& { return nodes.at(i); }
  auto edge_at(Edge_index e) -> Network_edge& { return edges.at(e); }
  auto edge_at(Edge_index e) const -> const Network_edge& { return edges.at(e); }

  auto is_rooted() const -> bool { return root != k_no_node; }

  // Adding nodes and edges keeps the node <-> edge cross-references consistent
  auto add_node(Network_node node = {}) -> Node_index;
  auto add_edge(Node_index parent, Node_index child, double length,
                double gamma = 1.0, bool hybrid = false, bool major = true) -> Edge_index;

  auto parents_of(Node_index node) const -> std::vector<Node_index>;
  auto children_of(Node_index node) const -> std::vector<Node_index>;

  // The edge joining `a` and `b` (in either direction).  Throws if they are not adjacent.
  auto edge_between(Node_index a, Node_index b) const -> Edge_index;

  // Tips and internal nodes, each in index order
  auto tips() const -> std::vector<Node_index>;
  auto internal_nodes() const -> std::vector<Node_index>;
  auto hybrid_nodes() const -> std::vector<Node_index>;
  auto tip_names() const -> std::vector<std::string>;

  auto find_node_by_number(int number) const -> Node_index;

  // Transient mutation of inheritance weights (prefer passing explicit weight vectors, see `gammas_with_major`)
  auto set_gamma(Edge_index edge, double gamma) -> void;
};


// Traversals
// ==========

// Visits every node after all of its parents.  A hybrid node is only visited after both of its
// parents have been visited; otherwise children are visited in order, depth first.
auto pre_order_traversal(const Network& net) -> cppcoro::generator<Node_index>;

// Visits every node after all of its children (the reverse of `pre_order_traversal`)
auto post_order_traversal(const Network& net) -> cppcoro::generator<Node_index>;

// Materialized pre-order traversal.  Throws if the network is not rooted or some nodes are unreachable.
auto nodes_in_topological_order(const Network& net) -> std::vector<Node_index>;

// Inheritance weights
// ===================

// Per node: the weight of the major hybrid edge into it for hybrid nodes, 1.0 for every other node
auto major_gammas(const Network& net) -> Node_vector<double>;

// Current weight of every edge
auto edge_gammas(const Network& net) -> Edge_vector<double>;

// Edge weights where the major edge into each hybrid node `h` gets weight `major[h]` and the
// minor edge gets `1 - major[h]`.  Tree edges keep weight 1.
auto gammas_with_major(const Network& net, const Node_vector<double>& major) -> Edge_vector<double>;

// Numbering
// =========

// Tips get numbers 1..n in index order, internal nodes -1, -2, ... in topological order.
// Edges get numbers 1..m in index order.
auto renumber_network(Network& net) -> void;

// Assertions
// ==========

auto assert_network_integrity(const Network& net, bool force = false) -> void;

}  // namespace phylotraits

#endif // PHYLOTRAITS_NETWORK_H_
