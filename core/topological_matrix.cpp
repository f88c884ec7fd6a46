#include "topological_matrix.h"

#include <stdexcept>

#include "absl/log/check.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"

#include "estd.h"

namespace phylotraits {

auto to_string(Indexation indexation) -> std::string_view {
  switch (indexation) {
    case Indexation::k_rows:
      return "rows";
    case Indexation::k_columns:
      return "columns";
    case Indexation::k_both:
      return "both";
    default:
      throw std::logic_error(absl::StrFormat(
          "Unknown indexation: %d", static_cast<std::underlying_type<Indexation>::type>(indexation)));
  }
}

Topological_matrix::Topological_matrix(
    Eigen::MatrixXd V,
    std::vector<int> node_numbers_top_order,
    std::vector<int> internal_node_numbers,
    std::vector<int> tip_numbers,
    std::vector<std::string> tip_names,
    Indexation indexation)
    : V_{std::move(V)},
      node_numbers_top_order_{std::move(node_numbers_top_order)},
      internal_node_numbers_{std::move(internal_node_numbers)},
      tip_numbers_{std::move(tip_numbers)},
      tip_names_{std::move(tip_names)},
      indexation_{indexation} {

  CHECK_EQ(std::ssize(tip_numbers_), std::ssize(tip_names_));
  CHECK_EQ(std::ssize(tip_numbers_) + std::ssize(internal_node_numbers_), std::ssize(node_numbers_top_order_));
  if (indexation_ != Indexation::k_columns) { CHECK_EQ(V_.rows(), num_nodes()); }
  if (indexation_ != Indexation::k_rows) { CHECK_EQ(V_.cols(), num_nodes()); }

  for (const auto& number : tip_numbers_) {
    tip_positions_.push_back(position_of(number));
  }
  for (const auto& number : internal_node_numbers_) {
    internal_positions_.push_back(position_of(number));
  }
}

auto Topological_matrix::position_of(int node_number) const -> int {
  auto pos = estd::ranges::index_of(node_numbers_top_order_, node_number);
  if (pos == -1) {
    throw std::out_of_range(absl::StrFormat("Node number %d is not in the topological order", node_number));
  }
  return pos;
}

auto Topological_matrix::ordered_tip_positions(const std::vector<int>& reorder) const -> std::vector<int> {
  if (reorder.empty()) {
    return tip_positions_;
  }
  if (std::ssize(reorder) != num_tips()) {
    throw std::invalid_argument(absl::StrFormat(
        "Tip reordering index has %d entries, but there are %d tips", std::ssize(reorder), num_tips()));
  }
  auto seen = std::vector<bool>(num_tips(), false);
  auto result = std::vector<int>{};
  for (const auto& k : reorder) {
    if (k < 0 || k >= num_tips() || seen[k]) {
      throw std::invalid_argument(absl::StrFormat(
          "Tip reordering index [%s] is not a permutation of the %d tips", absl::StrJoin(reorder, ", "), num_tips()));
    }
    seen[k] = true;
    result.push_back(tip_positions_[k]);
  }
  return result;
}

auto Topological_matrix::check_observed(const std::vector<bool>& observed) const -> void {
  if (not observed.empty() && std::ssize(observed) != num_tips()) {
    throw std::invalid_argument(absl::StrFormat(
        "Mask of observed tips has %d entries, but there are %d tips", std::ssize(observed), num_tips()));
  }
}

auto Topological_matrix::observed_tip_positions(
    const std::vector<int>& reorder,
    const std::vector<bool>& observed) const
    -> std::vector<int> {
  check_observed(observed);
  auto ordered = ordered_tip_positions(reorder);
  auto result = std::vector<int>{};
  for (auto k = 0; k != std::ssize(ordered); ++k) {
    if (observed.empty() || observed[k]) { result.push_back(ordered[k]); }
  }
  return result;
}

auto Topological_matrix::missing_node_positions(
    const std::vector<int>& reorder,
    const std::vector<bool>& observed) const
    -> std::vector<int> {
  check_observed(observed);
  auto ordered = ordered_tip_positions(reorder);
  auto result = internal_positions_;
  for (auto k = 0; k != std::ssize(ordered); ++k) {
    if (not observed.empty() && not observed[k]) { result.push_back(ordered[k]); }
  }
  return result;
}

auto Topological_matrix::missing_node_numbers(
    const std::vector<int>& reorder,
    const std::vector<bool>& observed) const
    -> std::vector<int> {
  auto result = std::vector<int>{};
  for (const auto& pos : missing_node_positions(reorder, observed)) {
    result.push_back(node_numbers_top_order_[pos]);
  }
  return result;
}

auto Topological_matrix::observed_tip_numbers(
    const std::vector<int>& reorder,
    const std::vector<bool>& observed) const
    -> std::vector<int> {
  auto result = std::vector<int>{};
  for (const auto& pos : observed_tip_positions(reorder, observed)) {
    result.push_back(node_numbers_top_order_[pos]);
  }
  return result;
}

auto Topological_matrix::select(const std::vector<int>& positions) const -> Eigen::MatrixXd {
  switch (indexation_) {
    case Indexation::k_both:
      return V_(positions, positions);
    case Indexation::k_columns:
      return V_(Eigen::all, positions);
    case Indexation::k_rows:
      return V_(positions, Eigen::all);
    default:
      throw std::logic_error(absl::StrFormat("Unknown indexation %s", to_string(indexation_)));
  }
}

auto Topological_matrix::tips(
    const std::vector<int>& reorder,
    const std::vector<bool>& observed) const
    -> Eigen::MatrixXd {
  return select(observed_tip_positions(reorder, observed));
}

auto Topological_matrix::internal_nodes(
    const std::vector<int>& reorder,
    const std::vector<bool>& observed) const
    -> Eigen::MatrixXd {
  return select(missing_node_positions(reorder, observed));
}

auto Topological_matrix::tips_nodes(
    const std::vector<int>& reorder,
    const std::vector<bool>& observed) const
    -> Eigen::MatrixXd {
  if (indexation_ != Indexation::k_both) {
    throw std::invalid_argument(absl::StrFormat(
        "Both rows and columns must be indexed by nodes to take the submatrix of tips vs. internal nodes "
        "(this matrix is indexed by %s)", to_string(indexation_)));
  }
  return V_(observed_tip_positions(reorder, observed), missing_node_positions(reorder, observed));
}

auto operator<<(std::ostream& os, const Topological_matrix& matrix) -> std::ostream& {
  return os << absl::StreamFormat("Topological_matrix (indexed by %s, nodes [%s]):\n",
                                  to_string(matrix.indexation()),
                                  absl::StrJoin(matrix.node_numbers_top_order(), ", "))
            << matrix.V() << "\n";
}


auto check_network_for_recursion(const Network& net) -> void {
  if (not net.is_rooted()) {
    throw std::runtime_error("Network needs to be rooted to build a matrix in topological order");
  }
  for (auto node = 0; node != net.num_nodes(); ++node) {
    const auto& n = net.at(node);
    if (n.num_parents() > 2) {
      throw std::runtime_error(absl::StrFormat(
          "Network must be resolved/binary at hybrid nodes: node %d has %d parents", n.number, n.num_parents()));
    }
    if (n.num_parents() == 2) {
      for (const auto& edge : n.parent_edges) {
        if (not net.edge_at(edge).hybrid) {
          throw std::runtime_error(absl::StrFormat(
              "Connecting edge between node %d and %d should be a hybrid edge",
              n.number, net.at(net.edge_at(edge).parent).number));
        }
      }
    }
  }
}

static auto make_topological_matrix(
    const Network& net,
    const std::vector<Node_index>& nodes,
    Eigen::MatrixXd M,
    Indexation indexation)
    -> Topological_matrix {
  auto node_numbers = std::vector<int>{};
  for (const auto& node : nodes) {
    node_numbers.push_back(net.at(node).number);
  }
  auto internal_node_numbers = std::vector<int>{};
  for (const auto& node : net.internal_nodes()) {
    internal_node_numbers.push_back(net.at(node).number);
  }
  auto tip_numbers = std::vector<int>{};
  for (const auto& node : net.tips()) {
    tip_numbers.push_back(net.at(node).number);
  }
  return Topological_matrix{
    std::move(M),
    std::move(node_numbers),
    std::move(internal_node_numbers),
    std::move(tip_numbers),
    net.tip_names(),
    indexation};
}

auto recursion_pre_order(const Network& net, Pre_order_rules& rules, Indexation indexation) -> Topological_matrix {
  check_network_for_recursion(net);

  auto nodes = nodes_in_topological_order(net);
  auto position = Node_vector<int>(net.num_nodes(), -1);
  for (auto i = 0; i != std::ssize(nodes); ++i) {
    position[nodes[i]] = i;
  }

  auto M = rules.init(net, nodes);
  for (auto i = 0; i != std::ssize(nodes); ++i) {
    const auto& parent_edges = net.at(nodes[i]).parent_edges;
    switch (std::ssize(parent_edges)) {
      case 0:
        rules.at_root(M, i);
        break;
      case 1: {
        auto edge = parent_edges[0];
        rules.at_tree_node(M, i, position[net.edge_at(edge).parent], edge);
        break;
      }
      case 2: {
        auto edge1 = parent_edges[0];
        auto edge2 = parent_edges[1];
        rules.at_hybrid_node(
            M, i,
            position[net.edge_at(edge1).parent],
            position[net.edge_at(edge2).parent],
            edge1, edge2);
        break;
      }
      default:
        CHECK(false) << "Unchecked node arity: " << net.at(nodes[i]);
    }
  }

  return make_topological_matrix(net, nodes, std::move(M), indexation);
}

auto recursion_post_order(const Network& net, Post_order_rules& rules, Indexation indexation) -> Topological_matrix {
  check_network_for_recursion(net);

  auto nodes = nodes_in_topological_order(net);
  auto position = Node_vector<int>(net.num_nodes(), -1);
  for (auto i = 0; i != std::ssize(nodes); ++i) {
    position[nodes[i]] = i;
  }

  auto M = rules.init(net, nodes);
  for (auto i = std::ssize(nodes) - 1; i >= 0; --i) {
    const auto& n = net.at(nodes[i]);
    if (n.is_tip()) {
      rules.at_tip(M, static_cast<int>(i));
    } else {
      auto children = std::vector<int>{};
      for (const auto& edge : n.child_edges) {
        children.push_back(position[net.edge_at(edge).child]);
      }
      rules.at_internal_node(M, static_cast<int>(i), children, n.child_edges);
    }
  }

  return make_topological_matrix(net, nodes, std::move(M), indexation);
}

}  // namespace phylotraits
