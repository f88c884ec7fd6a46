#include "simulation.h"

#include <stdexcept>

#include "absl/random/distributions.h"
#include "absl/strings/str_format.h"

namespace phylotraits {

auto check_params_bm(const Params_bm& params) -> void {
  if (not (params.sigma2 > 0.0)) {
    throw std::invalid_argument(absl::StrFormat(
        "The variance rate of a BM process must be positive (got sigma2 = %g)", params.sigma2));
  }
  if (params.random_root && not (params.var_root >= 0.0)) {
    throw std::invalid_argument(absl::StrFormat(
        "A BM process with a random root needs a non-negative root variance (got %g)", params.var_root));
  }
}

auto operator<<(std::ostream& os, const Params_bm& params) -> std::ostream& {
  os << absl::StreamFormat("Parameters of a BM with %s root:\n", params.random_root ? "random" : "fixed")
     << absl::StreamFormat("mu: %g\n", params.mu)
     << absl::StreamFormat("Sigma2: %g\n", params.sigma2);
  if (params.random_root) {
    os << absl::StreamFormat("varRoot: %g\n", params.var_root);
  }
  if (params.any_shift()) {
    os << absl::StreamFormat("\nThere are %d shifts on the network:\n", std::ssize(params.shift->values()))
       << *params.shift;
  }
  return os;
}

namespace {

class Bm_simulation_rules : public Pre_order_rules {
 public:
  Bm_simulation_rules(const Network& net, const Params_bm& params, absl::BitGenRef bitgen)
      : net_{&net}, params_{&params}, bitgen_{bitgen} {}

  auto init(const Network& /*net*/, const std::vector<Node_index>& nodes) -> Eigen::MatrixXd override {
    nodes_ = nodes;
    return Eigen::MatrixXd::Zero(2, std::ssize(nodes));
  }

  auto at_root(Eigen::MatrixXd& M, int i) -> void override {
    M(0, i) = params_->mu;
    if (params_->random_root) {
      M(1, i) = params_->mu + std::sqrt(params_->var_root) * draw();
    } else {
      M(1, i) = params_->mu;
    }
  }

  auto at_tree_node(Eigen::MatrixXd& M, int i, int parent, Edge_index edge) -> void override {
    auto shift = params_->shift.has_value() ? params_->shift->shift_at(nodes_[i]) : 0.0;
    M(0, i) = M(0, parent) + shift;
    M(1, i) = M(1, parent) + shift + std::sqrt(params_->sigma2 * net_->edge_at(edge).length) * draw();
  }

  auto at_hybrid_node(
      Eigen::MatrixXd& M,
      int i,
      int parent1,
      int parent2,
      Edge_index edge1,
      Edge_index edge2)
      -> void override {

    const auto& e1 = net_->edge_at(edge1);
    const auto& e2 = net_->edge_at(edge2);
    M(0, i) = e1.gamma * M(0, parent1) + e2.gamma * M(0, parent2);
    auto x1 = M(1, parent1) + std::sqrt(params_->sigma2 * e1.length) * draw();
    auto x2 = M(1, parent2) + std::sqrt(params_->sigma2 * e2.length) * draw();
    M(1, i) = e1.gamma * x1 + e2.gamma * x2;
  }

 private:
  const Network* net_;
  const Params_bm* params_;
  absl::BitGenRef bitgen_;
  std::vector<Node_index> nodes_{};

  auto draw() -> double { return absl::Gaussian<double>(bitgen_, 0.0, 1.0); }
};

}  // namespace

auto Trait_simulation::tips(Simulated_quantity quantity) const -> Eigen::VectorXd {
  auto row = quantity == Simulated_quantity::k_expectation ? 0 : 1;
  return M_.tips().row(row).transpose();
}

auto Trait_simulation::internal_nodes(Simulated_quantity quantity) const -> Eigen::VectorXd {
  auto row = quantity == Simulated_quantity::k_expectation ? 0 : 1;
  return M_.internal_nodes().row(row).transpose();
}

auto operator<<(std::ostream& os, const Trait_simulation& sim) -> std::ostream& {
  return os << absl::StreamFormat(
      "Trait simulation results on a network with %d tips, using a %s model, with parameters:\n",
      sim.matrix().num_tips(), sim.model())
            << sim.params();
}

auto simulate(const Network& net, const Params_bm& params, absl::BitGenRef bitgen) -> Trait_simulation {
  check_params_bm(params);
  if (params.shift.has_value() && params.shift->num_nodes() != net.num_nodes()) {
    throw std::invalid_argument(absl::StrFormat(
        "Shifts are given for %d nodes, but the network has %d nodes", params.shift->num_nodes(), net.num_nodes()));
  }

  auto rules = Bm_simulation_rules{net, params, bitgen};
  return Trait_simulation{recursion_pre_order(net, rules, Indexation::k_columns), params};
}

}  // namespace phylotraits
