#include "warnings.h"

#include <iostream>

#include "absl/strings/str_format.h"

#include "estd.h"

namespace phylotraits {

auto describe_trait_warning(const Trait_warning& warning) -> std::string {
  return std::visit(estd::overloaded{
      [](const Trait_warnings::Default_hybrid_gammas& w) -> std::string {
        return absl::StrFormat(
            "no inheritance weights given for hybrid node %s; using 0.9 for the edge carrying its subtree "
            "and 0.1 for the other", w.hybrid_label);
      },
      [](const Trait_warnings::Complementary_hybrid_gamma& w) -> std::string {
        return absl::StrFormat(
            "only one inheritance weight (%g) given for hybrid node %s; the other edge gets %g",
            w.given_gamma, w.hybrid_label, 1.0 - w.given_gamma);
      },
      [](const Trait_warnings::Tree_edge_gamma_ignored& w) -> std::string {
        return absl::StrFormat(
            "inheritance weight %g on the tree edge above %s ignored (tree edges have weight 1)",
            w.gamma, w.child_label);
      },
      [](const Trait_warnings::Hybrid_polytomy_resolved& w) -> std::string {
        return absl::StrFormat(
            "hybrid node %s has %d children; inserted a zero-length tree edge below it",
            w.hybrid_label, w.num_children);
      },
      [](const Trait_warnings::Variance_rate_uncertainty_ignored&) -> std::string {
        return "prediction intervals show uncertainty in ancestral values assuming that the estimated "
            "variance rate of evolution is correct; additional uncertainty in the estimation of this "
            "variance rate is ignored, so prediction intervals should be larger";
      },
      [](const Trait_warnings::Tip_order_assumed&) -> std::string {
        return "no indication of the position of the tips on the network was given; assuming that "
            "data rows follow the network's tip order";
      },
      [](const Trait_warnings::Mu_from_first_coefficient&) -> std::string {
        return "the fit used a custom design matrix, so the root mean is taken to be the first coefficient "
            "(make sure the first column is the intercept)";
      },
      [](const Trait_warnings::Tip_names_ignored&) -> std::string {
        return "ignoring tip names in the network and in the trait table, as requested; data rows are assumed "
            "to follow the network's tip order";
      },
      [](const Trait_warnings::Unreadable_trait_value& w) -> std::string {
        return absl::StrFormat("line %d: value '%s' in column '%s' treated as missing", w.line, w.text, w.column);
      },
      [](const Trait_warnings::No_hybrids_to_scale&) -> std::string {
        return "the network has no hybrid nodes, so the scaling-hybrid model reduces to plain BM "
            "(scaling parameter fixed at 1)";
      }
    }, warning);
}

auto default_trait_warning_hook(const Trait_warning& warning) -> void {
  std::cerr << absl::StreamFormat("WARNING: %s\n", describe_trait_warning(warning));
}

}  // namespace phylotraits
