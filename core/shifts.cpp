#include "shifts.h"

#include <stdexcept>

#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"

#include "shared_path.h"

namespace phylotraits {

static auto check_no_hybrid_shift(const Network& net, Node_index node) -> void {
  if (net.at(node).hybrid) {
    throw std::invalid_argument(absl::StrFormat(
        "Shifts on hybrid edges are not allowed (node %d is a hybrid node)", net.at(node).number));
  }
}

static auto first_child_of_hybrids(const Network& net) -> std::vector<Node_index> {
  auto result = std::vector<Node_index>{};
  for (const auto& node : net.hybrid_nodes()) {
    const auto& child_edges = net.at(node).child_edges;
    if (child_edges.empty()) {
      throw std::invalid_argument(absl::StrFormat(
          "Hybrid node %d has no child edge to put a shift on", net.at(node).number));
    }
    result.push_back(net.edge_at(child_edges.front()).child);
  }
  return result;
}

// Shift_net
// =========

Shift_net::Shift_net(const Network& net)
    : shift_(net.num_nodes(), 0.0),
      edge_number_(net.num_nodes(), 0) {
  for (auto node = 0; node != net.num_nodes(); ++node) {
    if (not net.at(node).parent_edges.empty()) {
      edge_number_[node] = net.edge_at(net.at(node).parent_edges.front()).number;
    }
  }
}

Shift_net::Shift_net(const std::vector<Node_index>& nodes, const std::vector<double>& values, const Network& net)
    : Shift_net{net} {
  if (std::ssize(nodes) != std::ssize(values)) {
    throw std::invalid_argument(absl::StrFormat(
        "The vector of nodes/edges and of values must be of the same length (got %d nodes/edges and %d values)",
        std::ssize(nodes), std::ssize(values)));
  }
  for (auto k = 0; k != std::ssize(nodes); ++k) {
    check_no_hybrid_shift(net, nodes[k]);
    shift_.at(nodes[k]) = values[k];
  }
}

auto Shift_net::any_shift() const -> bool {
  for (const auto& s : shift_) {
    if (s != 0.0) { return true; }
  }
  return false;
}

auto Shift_net::edge_numbers() const -> std::vector<int> {
  auto result = std::vector<int>{};
  for (auto node = 0; node != num_nodes(); ++node) {
    if (shift_[node] != 0.0) { result.push_back(edge_number_[node]); }
  }
  return result;
}

auto Shift_net::values() const -> std::vector<double> {
  auto result = std::vector<double>{};
  for (const auto& s : shift_) {
    if (s != 0.0) { result.push_back(s); }
  }
  return result;
}

auto operator*(const Shift_net& a, const Shift_net& b) -> Shift_net {
  if (a.num_nodes() != b.num_nodes()) {
    throw std::invalid_argument(absl::StrFormat(
        "Shifts to be combined must be on the same network (%d vs %d nodes)", a.num_nodes(), b.num_nodes()));
  }
  auto result = Shift_net{};
  result.edge_number_ = a.edge_number_;
  result.shift_.resize(a.num_nodes(), 0.0);
  for (auto node = 0; node != a.num_nodes(); ++node) {
    auto sa = a.shift_[node];
    auto sb = b.shift_[node];
    if (sa == 0.0) {
      result.shift_[node] = sb;
    } else if (sb == 0.0 || sa == sb) {
      result.shift_[node] = sa;
    } else {
      throw std::invalid_argument(absl::StrFormat(
          "The two shifts vectors you provided affect the same edges (edge %d: %g vs %g), "
          "so I cannot choose which one you want.", a.edge_number_[node], sa, sb));
    }
  }
  return result;
}

auto shift_on_edges(const std::vector<Edge_index>& edges, const std::vector<double>& values, const Network& net)
    -> Shift_net {
  auto nodes = std::vector<Node_index>{};
  for (const auto& edge : edges) {
    nodes.push_back(net.edge_at(edge).child);
  }
  return Shift_net{nodes, values, net};
}

auto shift_hybrid(const std::vector<double>& values, const Network& net) -> Shift_net {
  if (std::ssize(values) != net.num_hybrids()) {
    throw std::invalid_argument(absl::StrFormat(
        "You must provide as many values as the number of hybrid nodes (got %d values for %d hybrid nodes).",
        std::ssize(values), net.num_hybrids()));
  }
  return Shift_net{first_child_of_hybrids(net), values, net};
}

auto operator<<(std::ostream& os, const Shift_net& shift) -> std::ostream& {
  auto edge_numbers = shift.edge_numbers();
  auto values = shift.values();
  os << absl::StreamFormat("%-12s %-12s\n", "Edge Number", "Shift Value");
  for (auto k = 0; k != std::ssize(values); ++k) {
    os << absl::StreamFormat("%-12d %-12g\n", edge_numbers[k], values[k]);
  }
  return os;
}


// Shift regressors
// ================

auto Shift_regressor::column(std::string_view name) const -> Eigen::VectorXd {
  auto k = estd::ranges::index_of(column_names, std::string{name});
  if (k == -1) {
    throw std::out_of_range(absl::StrFormat("No regressor column named '%s'", name));
  }
  return columns.col(k);
}

auto shift_column_name(int node_number) -> std::string {
  if (node_number < 0) {
    return absl::StrFormat("shift_m%d", -node_number);
  } else {
    return absl::StrFormat("shift_%d", node_number);
  }
}

auto regressor_shift(const std::vector<Node_index>& nodes, const Network& net) -> Shift_regressor {
  return regressor_shift(nodes, net, calc_incidence_matrix(net));
}

auto regressor_shift(
    const std::vector<Node_index>& nodes,
    const Network& net,
    const Topological_matrix& incidence)
    -> Shift_regressor {

  auto tip_rows = incidence.tips();
  auto cols = std::vector<int>{};
  auto result = Shift_regressor{};
  for (const auto& node : nodes) {
    check_no_hybrid_shift(net, node);
    cols.push_back(incidence.position_of(net.at(node).number));
    result.column_names.push_back(shift_column_name(net.at(node).number));
  }
  result.columns = tip_rows(Eigen::all, cols);
  result.tip_names = incidence.tip_names();
  return result;
}

auto regressor_shift_on_edges(const std::vector<Edge_index>& edges, const Network& net) -> Shift_regressor {
  auto nodes = std::vector<Node_index>{};
  for (const auto& edge : edges) {
    nodes.push_back(net.edge_at(edge).child);
  }
  return regressor_shift(nodes, net);
}

auto regressor_hybrid(const Network& net) -> Shift_regressor {
  auto result = regressor_shift(first_child_of_hybrids(net), net);
  auto n = result.columns.rows();
  auto k = result.columns.cols();
  Eigen::VectorXd sum = result.columns.rowwise().sum();
  result.columns.conservativeResize(n, k + 1);
  result.columns.col(k) = sum;
  result.column_names.push_back("sum");
  return result;
}

auto operator<<(std::ostream& os, const Shift_regressor& regressor) -> std::ostream& {
  os << absl::StreamFormat("%-12s", "tipNames");
  for (const auto& name : regressor.column_names) {
    os << absl::StreamFormat(" %12s", name);
  }
  os << "\n";
  for (auto i = 0; i != regressor.columns.rows(); ++i) {
    os << absl::StreamFormat("%-12s", regressor.tip_names.at(i));
    for (auto j = 0; j != regressor.columns.cols(); ++j) {
      os << absl::StreamFormat(" %12g", regressor.columns(i, j));
    }
    os << "\n";
  }
  return os;
}

}  // namespace phylotraits
