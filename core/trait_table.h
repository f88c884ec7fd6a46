#ifndef PHYLOTRAITS_TRAIT_TABLE_H_
#define PHYLOTRAITS_TRAIT_TABLE_H_

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Eigen/Dense>

#include "network.h"
#include "phylo_lm.h"
#include "warnings.h"

namespace phylotraits {

// Trait tables
// ============
//
// A comma-separated table with a header line.  A column labelled `tipNames` holds the taxon of each row;
// every other column is numeric, with `NA` or an empty cell for a missing value.

inline constexpr auto k_tip_names_column = std::string_view{"tipNames"};

struct Trait_table {
  std::vector<std::string> column_names;                    // Numeric columns only
  std::vector<std::vector<std::optional<double>>> columns;  // columns[j][row]
  std::optional<std::vector<std::string>> tip_names;        // Contents of the `tipNames` column, if present

  auto num_rows() const -> int;
  auto num_columns() const -> int { return static_cast<int>(std::ssize(column_names)); }
  auto has_column(std::string_view name) const -> bool;
  auto column(std::string_view name) const -> const std::vector<std::optional<double>>&;
};

auto read_trait_table(
    std::istream& is,
    const Trait_warning_hook& warning_hook = default_trait_warning_hook)
    -> Trait_table;
auto read_trait_table(
    std::string_view text,
    const Trait_warning_hook& warning_hook = default_trait_warning_hook)
    -> Trait_table;

// Writes `table` in the format read by `read_trait_table` (missing values as `NA`)
auto write_trait_table(std::ostream& os, const Trait_table& table) -> void;

// For each row of `table`, the position of its tip in network tip order.  Throws if the names cannot be
// matched unambiguously.
auto match_tip_names(const Network& net, const Trait_table& table) -> std::vector<int>;

// Assume rows are in network tip order and ignore all names
auto no_names(
    const Network& net,
    const Trait_table& table,
    const Trait_warning_hook& warning_hook = default_trait_warning_hook)
    -> std::vector<int>;

struct Trait_formula {
  std::string response;
  std::vector<std::string> predictors{};
  bool intercept{true};
};

// Regression data extracted from a table.  `reorder` covers all the tips of the network: tips absent from
// the table come after the table rows and are unobserved.  A row is observed if the response and all the
// predictors are present.
struct Trait_design {
  Eigen::MatrixXd X;
  Eigen::VectorXd Y;
  std::vector<bool> observed;
  std::vector<int> reorder;
  std::vector<std::string> coef_names;
  bool has_intercept;
};

auto build_design(
    const Trait_table& table,
    const Trait_formula& formula,
    const std::vector<int>& row_positions,
    int num_tips)
    -> Trait_design;

// Matches the table on the network (unless `ignore_names`) and fits the model of `options`
auto phylo_network_lm(
    const Trait_table& table,
    const Trait_formula& formula,
    const Network& net,
    Phylo_lm_options options = {},
    bool ignore_names = false,
    const Trait_warning_hook& warning_hook = default_trait_warning_hook)
    -> Phylo_network_linear_model;

}  // namespace phylotraits

#endif // PHYLOTRAITS_TRAIT_TABLE_H_
