#ifndef PHYLOTRAITS_CMDLINE_H_
#define PHYLOTRAITS_CMDLINE_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "network.h"
#include "phylo_lm.h"
#include "simulation.h"
#include "trait_table.h"

namespace phylotraits {

struct Processed_cmd_line {
  Network net;

  // Regression (if `traits` is set)
  std::optional<Trait_table> traits;
  Trait_formula formula;
  Phylo_lm_options lm_options;
  bool ignore_names;
  bool ancestral;
  double level;

  // Simulation
  bool simulate;
  Params_bm sim_params;
  std::uint32_t seed;
};
auto process_args(int argc, char** argv) -> Processed_cmd_line;

}  // namespace phylotraits

#endif // PHYLOTRAITS_CMDLINE_H_
