#include <cstdlib>
#include <exception>
#include <iostream>
#include <random>

#include <absl/log/initialize.h>
#include <absl/strings/str_format.h>

#include "ancestral_reconstruction.h"
#include "cmdline.h"
#include "phylo_lm.h"
#include "simulation.h"
#include "trait_table.h"

namespace phylotraits {

static auto run_simulation(const Processed_cmd_line& c) -> int {
  auto prng = std::mt19937{c.seed};
  auto sim = simulate(c.net, c.sim_params, prng);
  std::cerr << sim;

  // Simulated tip values, readable back with --traits
  auto table = Trait_table{};
  table.tip_names = sim.tip_names();
  table.column_names = {"trait"};
  auto& column = table.columns.emplace_back();
  auto values = sim.tips(Simulated_quantity::k_simulated);
  for (auto i = 0; i != values.size(); ++i) {
    column.push_back(values(i));
  }
  write_trait_table(std::cout, table);
  return EXIT_SUCCESS;
}

static auto run_regression(const Processed_cmd_line& c) -> int {
  auto fit = phylo_network_lm(c.traits.value(), c.formula, c.net, c.lm_options, c.ignore_names);
  std::cout << fit;
  if (c.level != 0.95 && fit.num_coefficients() > 0) {
    std::cout << "\n" << fit.coef_table(c.level);
  }
  std::cout << absl::StreamFormat("Observations: %d, R2: %.6g, adjusted R2: %.6g, AICc: %.10g, BIC: %.10g\n",
                                  fit.nobs(), fit.r2(), fit.adjr2(), fit.aicc(), fit.bic());
  if (fit.optimization().has_value()) {
    std::cerr << "Optimization: " << fit.optimization().value() << "\n";
  }

  if (c.ancestral) {
    auto states = ancestral_state_reconstruction(fit);
    auto intervals = states.predint(c.level);
    auto expectations = states.expectations();
    std::cout << "\nAncestral state reconstruction\n";
    std::cout << absl::StreamFormat("%12s %14s %14s %14s\n", "Node index", "Pred.", "Min.",
                                    absl::StrFormat("Max. (%g%%)", 100.0 * c.level));
    for (auto i = 0; i != std::ssize(expectations.node_numbers); ++i) {
      std::cout << absl::StreamFormat("%12d %14.6g %14.6g %14.6g\n",
                                      expectations.node_numbers[i], expectations.cond_expectation(i),
                                      intervals(i, 0), intervals(i, 1));
    }
  }
  return EXIT_SUCCESS;
}

}  // namespace phylotraits

auto main(int argc, char** argv) -> int {
  using namespace phylotraits;

  absl::InitializeLog();

  try {
    auto c = process_args(argc, argv);
    if (c.simulate) {
      return run_simulation(c);
    }
    return run_regression(c);
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return EXIT_FAILURE;
  }
}
