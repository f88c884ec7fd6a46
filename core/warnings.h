#ifndef PHYLOTRAITS_WARNINGS_H_
#define PHYLOTRAITS_WARNINGS_H_

#include <functional>
#include <string>
#include <variant>

namespace phylotraits {

// Warning objects for degenerate-but-legal inputs.  None of these stop a computation.
namespace Trait_warnings {
struct Default_hybrid_gammas {
  std::string hybrid_label;
};
struct Complementary_hybrid_gamma {
  std::string hybrid_label;
  double given_gamma;
};
struct Tree_edge_gamma_ignored {
  std::string child_label;
  double gamma;
};
struct Hybrid_polytomy_resolved {
  std::string hybrid_label;
  int num_children;
};
struct Variance_rate_uncertainty_ignored {};
struct Tip_order_assumed {};
struct Mu_from_first_coefficient {};
struct Tip_names_ignored {};
struct Unreadable_trait_value {
  int line;
  std::string column;
  std::string text;
};
struct No_hybrids_to_scale {};
}  // namespace Trait_warnings

using Trait_warning = std::variant<
  Trait_warnings::Default_hybrid_gammas,
  Trait_warnings::Complementary_hybrid_gamma,
  Trait_warnings::Tree_edge_gamma_ignored,
  Trait_warnings::Hybrid_polytomy_resolved,
  Trait_warnings::Variance_rate_uncertainty_ignored,
  Trait_warnings::Tip_order_assumed,
  Trait_warnings::Mu_from_first_coefficient,
  Trait_warnings::Tip_names_ignored,
  Trait_warnings::Unreadable_trait_value,
  Trait_warnings::No_hybrids_to_scale
>;

using Trait_warning_hook = std::function<void(const Trait_warning&)>;

auto describe_trait_warning(const Trait_warning& warning) -> std::string;
auto default_trait_warning_hook(const Trait_warning& warning) -> void;

}  // namespace phylotraits

#endif // PHYLOTRAITS_WARNINGS_H_
