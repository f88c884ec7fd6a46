#include "network.h"

#include <cmath>
#include <iostream>
#include <stack>
#include <stdexcept>

namespace phylotraits {

auto operator<<(std::ostream& os, const Network_node& node) -> std::ostream& {
  return os << absl::StreamFormat(
      "Network_node{number=%d, name='%s', hybrid=%s, parent_edges=[%s], child_edges=[%s]}",
      node.number,
      node.name,
      node.hybrid ? "true" : "false",
      absl::StrJoin(node.parent_edges, ", "),
      absl::StrJoin(node.child_edges, ", "));
}

auto operator<<(std::ostream& os, const Network_edge& edge) -> std::ostream& {
  return os << absl::StreamFormat(
      "Network_edge{number=%d, parent=%d, child=%d, length=%g, gamma=%g, hybrid=%s, major=%s}",
      edge.number,
      edge.parent,
      edge.child,
      edge.length,
      edge.gamma,
      edge.hybrid ? "true" : "false",
      edge.major ? "true" : "false");
}

auto Network::num_tips() const -> int {
  return static_cast<int>(std::ranges::count_if(nodes, [](const auto& n) { return n.is_tip(); }));
}

auto Network::num_hybrids() const -> int {
  return static_cast<int>(std::ranges::count_if(nodes, [](const auto& n) { return n.hybrid; }));
}

auto Network::add_node(Network_node node) -> Node_index {
  auto new_node = num_nodes();
  nodes.push_back(std::move(node));
  return new_node;
}

auto Network::add_edge(
    Node_index parent,
    Node_index child,
    double length,
    double gamma,
    bool hybrid,
    bool major)
    -> Edge_index {
  CHECK_GE(parent, 0);
  CHECK_LT(parent, num_nodes());
  CHECK_GE(child, 0);
  CHECK_LT(child, num_nodes());

  auto new_edge = num_edges();
  edges.push_back(Network_edge{
      .number = new_edge + 1,
      .parent = parent,
      .child = child,
      .length = length,
      .gamma = gamma,
      .hybrid = hybrid,
      .major = major});
  at(parent).child_edges.push_back(new_edge);
  at(child).parent_edges.push_back(new_edge);
  return new_edge;
}

auto Network::parents_of(Node_index node) const -> std::vector<Node_index> {
  auto result = std::vector<Node_index>{};
  for (const auto& edge : at(node).parent_edges) {
    result.push_back(edge_at(edge).parent);
  }
  return result;
}

auto Network::children_of(Node_index node) const -> std::vector<Node_index> {
  auto result = std::vector<Node_index>{};
  for (const auto& edge : at(node).child_edges) {
    result.push_back(edge_at(edge).child);
  }
  return result;
}

auto Network::edge_between(Node_index a, Node_index b) const -> Edge_index {
  for (const auto& edge : at(a).parent_edges) {
    if (edge_at(edge).parent == b) { return edge; }
  }
  for (const auto& edge : at(a).child_edges) {
    if (edge_at(edge).child == b) { return edge; }
  }
  throw std::invalid_argument(absl::StrFormat(
      "Nodes %d and %d are not joined by an edge", at(a).number, at(b).number));
}

auto Network::tips() const -> std::vector<Node_index> {
  auto result = std::vector<Node_index>{};
  for (auto node = 0; node != num_nodes(); ++node) {
    if (at(node).is_tip()) { result.push_back(node); }
  }
  return result;
}

auto Network::internal_nodes() const -> std::vector<Node_index> {
  auto result = std::vector<Node_index>{};
  for (auto node = 0; node != num_nodes(); ++node) {
    if (at(node).is_inner_node()) { result.push_back(node); }
  }
  return result;
}

auto Network::hybrid_nodes() const -> std::vector<Node_index> {
  auto result = std::vector<Node_index>{};
  for (auto node = 0; node != num_nodes(); ++node) {
    if (at(node).hybrid) { result.push_back(node); }
  }
  return result;
}

auto Network::tip_names() const -> std::vector<std::string> {
  auto result = std::vector<std::string>{};
  for (const auto& tip : tips()) {
    result.push_back(at(tip).name);
  }
  return result;
}

auto Network::find_node_by_number(int number) const -> Node_index {
  for (auto node = 0; node != num_nodes(); ++node) {
    if (at(node).number == number) { return node; }
  }
  throw std::invalid_argument(absl::StrFormat("No node with number %d in network", number));
}

auto Network::set_gamma(Edge_index edge, double gamma) -> void {
  if (gamma < 0.0 || gamma > 1.0) {
    throw std::out_of_range(absl::StrFormat(
        "Inheritance weight of edge %d must lie in [0,1] (got %g)", edge_at(edge).number, gamma));
  }
  edge_at(edge).gamma = gamma;
}

auto pre_order_traversal(const Network& net) -> cppcoro::generator<Node_index> {
  if (not net.is_rooted()) { co_return; }

  auto parents_seen = Node_vector<int>(net.num_nodes(), 0);
  auto work_stack = std::stack<Node_index>{};
  work_stack.push(net.root);

  while (not work_stack.empty()) {
    auto node = work_stack.top();
    work_stack.pop();

    co_yield Node_index{node};

    const auto& child_edges = net.at(node).child_edges;
    for (auto i = std::ssize(child_edges) - 1; i >= 0; --i) {
      auto child = net.edge_at(child_edges[i]).child;
      ++parents_seen[child];
      if (parents_seen[child] == net.at(child).num_parents()) {
        work_stack.push(child);
      }
    }
  }
}

auto post_order_traversal(const Network& net) -> cppcoro::generator<Node_index> {
  auto order = nodes_in_topological_order(net);
  for (auto i = std::ssize(order) - 1; i >= 0; --i) {
    co_yield Node_index{order[i]};
  }
}

auto nodes_in_topological_order(const Network& net) -> std::vector<Node_index> {
  if (not net.is_rooted()) {
    throw std::runtime_error("Network needs to be rooted to be placed in topological order");
  }
  auto result = estd::ranges::to_vec(pre_order_traversal(net));
  if (std::ssize(result) != net.num_nodes()) {
    throw std::runtime_error(absl::StrFormat(
        "Only %d of the %d nodes of the network can be placed in topological order "
        "(is every node reachable from the root, and is the network free of cycles?)",
        std::ssize(result), net.num_nodes()));
  }
  return result;
}

auto major_gammas(const Network& net) -> Node_vector<double> {
  auto result = Node_vector<double>(net.num_nodes(), 1.0);
  for (const auto& node : net.hybrid_nodes()) {
    for (const auto& edge : net.at(node).parent_edges) {
      if (net.edge_at(edge).hybrid && net.edge_at(edge).major) {
        result[node] = net.edge_at(edge).gamma;
        break;
      }
    }
  }
  return result;
}

auto edge_gammas(const Network& net) -> Edge_vector<double> {
  auto result = Edge_vector<double>(net.num_edges(), 1.0);
  for (auto edge = 0; edge != net.num_edges(); ++edge) {
    result[edge] = net.edge_at(edge).gamma;
  }
  return result;
}

auto gammas_with_major(const Network& net, const Node_vector<double>& major) -> Edge_vector<double> {
  CHECK_EQ(std::ssize(major), net.num_nodes());

  auto result = edge_gammas(net);
  for (const auto& node : net.hybrid_nodes()) {
    auto major_edge = k_no_edge;
    auto minor_edge = k_no_edge;
    for (const auto& edge : net.at(node).parent_edges) {
      if (net.edge_at(edge).major && major_edge == k_no_edge) {
        major_edge = edge;
      } else {
        minor_edge = edge;
      }
    }
    CHECK_NE(major_edge, k_no_edge) << net.at(node);
    result[major_edge] = major[node];
    if (minor_edge != k_no_edge) {
      result[minor_edge] = 1.0 - major[node];
    }
  }
  return result;
}

auto renumber_network(Network& net) -> void {
  auto next_tip_number = 1;
  for (auto node = 0; node != net.num_nodes(); ++node) {
    if (net.at(node).is_tip()) {
      net.at(node).number = next_tip_number;
      ++next_tip_number;
    }
  }

  auto next_internal_number = -1;
  for (const auto& node : nodes_in_topological_order(net)) {
    if (net.at(node).is_inner_node()) {
      net.at(node).number = next_internal_number;
      --next_internal_number;
    }
  }

  for (auto edge = 0; edge != net.num_edges(); ++edge) {
    net.edge_at(edge).number = edge + 1;
  }
}

auto assert_network_integrity(const Network& net, bool force) -> void {
  if (estd::is_debug_enabled || force) {
    if (net.num_nodes() == 0) {
      CHECK_EQ(net.root, k_no_node);
      return;
    }

    CHECK_NE(net.root, k_no_node);
    CHECK_GE(net.root, 0);
    CHECK_LT(net.root, net.num_nodes());
    CHECK(net.at(net.root).is_root()) << net.at(net.root);

    for (auto edge = 0; edge != net.num_edges(); ++edge) {
      const auto& e = net.edge_at(edge);
      CHECK_GE(e.parent, 0);
      CHECK_LT(e.parent, net.num_nodes());
      CHECK_GE(e.child, 0);
      CHECK_LT(e.child, net.num_nodes());
      CHECK_EQ(std::ranges::count(net.at(e.parent).child_edges, edge), 1) << e;
      CHECK_EQ(std::ranges::count(net.at(e.child).parent_edges, edge), 1) << e;
      CHECK_GE(e.length, 0.0) << e;
      CHECK_GE(e.gamma, 0.0) << e;
      CHECK_LE(e.gamma, 1.0) << e;
      if (not e.hybrid) {
        CHECK_EQ(e.gamma, 1.0) << e;
        CHECK(e.major) << e;
      }
    }

    for (auto node = 0; node != net.num_nodes(); ++node) {
      const auto& n = net.at(node);
      CHECK_LE(n.num_parents(), 2) << n;
      CHECK_EQ(n.num_parents() == 2, n.hybrid) << n;
      if (node != net.root) {
        CHECK_GE(n.num_parents(), 1) << n;
      }
      if (n.hybrid) {
        const auto& e1 = net.edge_at(n.parent_edges[0]);
        const auto& e2 = net.edge_at(n.parent_edges[1]);
        CHECK(e1.hybrid && e2.hybrid) << n;
        CHECK_NE(e1.major, e2.major) << n;
        CHECK_LT(std::abs(e1.gamma + e2.gamma - 1.0), 1e-8) << n;
      }
    }

    // Also checks that every node is reachable from the root
    auto order = nodes_in_topological_order(net);
    auto visited = Node_vector<bool>(net.num_nodes(), false);
    for (const auto& node : order) {
      CHECK(not visited[node]) << node;
      visited[node] = true;
    }
  }
}

}  // namespace phylotraits
