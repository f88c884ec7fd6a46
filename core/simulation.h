#ifndef PHYLOTRAITS_SIMULATION_H_
#define PHYLOTRAITS_SIMULATION_H_

#include <cmath>
#include <limits>
#include <optional>
#include <ostream>

#include "absl/random/bit_gen_ref.h"

#include "network.h"
#include "shifts.h"
#include "topological_matrix.h"

namespace phylotraits {

// Parameters of a BM process on a network
struct Params_bm {
  double mu{0.0};                  // Value (or mean, if random) at the root
  double sigma2{1.0};              // Variance rate per unit of branch length
  bool random_root{false};
  double var_root{std::numeric_limits<double>::quiet_NaN()};  // Variance at the root, if random
  std::optional<Shift_net> shift{};

  auto any_shift() const -> bool { return shift.has_value() && shift->any_shift(); }
};

// Throws if sigma2 is not positive, or if a random root has no (or a negative) variance
auto check_params_bm(const Params_bm& params) -> void;

auto operator<<(std::ostream& os, const Params_bm& params) -> std::ostream&;


enum class Simulated_quantity {
  k_expectation,
  k_simulated
};

// Result of a simulation: row 0 holds the expected values at every node (in topological order),
// row 1 the simulated values
class Trait_simulation {
 public:
  Trait_simulation(Topological_matrix M, Params_bm params)
      : M_{std::move(M)}, params_{std::move(params)} {}

  auto matrix() const -> const Topological_matrix& { return M_; }
  auto params() const -> const Params_bm& { return params_; }
  auto model() const -> std::string_view { return "BM"; }
  auto tip_names() const -> const std::vector<std::string>& { return M_.tip_names(); }

  // Values at the tips (in network tip order), and at the internal nodes
  auto tips(Simulated_quantity quantity = Simulated_quantity::k_simulated) const -> Eigen::VectorXd;
  auto internal_nodes(Simulated_quantity quantity = Simulated_quantity::k_simulated) const -> Eigen::VectorXd;

 private:
  Topological_matrix M_;
  Params_bm params_;
};

auto operator<<(std::ostream& os, const Trait_simulation& sim) -> std::ostream&;

// Simulates a BM process with parameters `params` along the network
auto simulate(const Network& net, const Params_bm& params, absl::BitGenRef bitgen) -> Trait_simulation;

}  // namespace phylotraits

#endif // PHYLOTRAITS_SIMULATION_H_
