#include "trait_table.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"

#include "estd.h"

namespace phylotraits {

auto Trait_table::num_rows() const -> int {
  if (tip_names.has_value()) {
    return static_cast<int>(std::ssize(tip_names.value()));
  }
  return columns.empty() ? 0 : static_cast<int>(std::ssize(columns.front()));
}

auto Trait_table::has_column(std::string_view name) const -> bool {
  return estd::ranges::index_of(column_names, std::string{name}) != -1;
}

auto Trait_table::column(std::string_view name) const -> const std::vector<std::optional<double>>& {
  auto j = estd::ranges::index_of(column_names, std::string{name});
  if (j == -1) {
    throw std::invalid_argument(absl::StrFormat(
        "No column named '%s' in the trait table (columns: %s)", name, absl::StrJoin(column_names, ", ")));
  }
  return columns[j];
}

static auto clean_cell(std::string_view cell) -> std::string_view {
  cell = absl::StripAsciiWhitespace(cell);
  if (cell.size() >= 2 && cell.front() == '"' && cell.back() == '"') {
    cell.remove_prefix(1);
    cell.remove_suffix(1);
  }
  return cell;
}

auto read_trait_table(std::istream& is, const Trait_warning_hook& warning_hook) -> Trait_table {
  auto result = Trait_table{};
  auto header = std::vector<std::string>{};
  auto tip_names_col = -1;
  auto line_num = 0;

  for (auto line = std::string{}; getline(is, line);) {
    ++line_num;
    if (absl::StripAsciiWhitespace(line).empty()) {
      continue;  // ignore blank lines
    }

    std::vector<std::string_view> cells = absl::StrSplit(line, ',');
    for (auto& cell : cells) {
      cell = clean_cell(cell);
    }

    if (header.empty()) {
      auto seen = absl::flat_hash_set<std::string_view>{};
      for (auto j = 0; j != std::ssize(cells); ++j) {
        if (cells[j].empty()) {
          throw std::runtime_error(absl::StrFormat(
              "Line %d: column %d of the trait table header has no name", line_num, j + 1));
        }
        if (not seen.insert(cells[j]).second) {
          throw std::runtime_error(absl::StrFormat(
              "Line %d: column name '%s' appears more than once in the trait table header", line_num, cells[j]));
        }
        header.emplace_back(cells[j]);
        if (cells[j] == k_tip_names_column) {
          tip_names_col = j;
          result.tip_names = std::vector<std::string>{};
        } else {
          result.column_names.emplace_back(cells[j]);
          result.columns.emplace_back();
        }
      }
      continue;
    }

    if (std::ssize(cells) != std::ssize(header)) {
      throw std::runtime_error(absl::StrFormat(
          "Line %d: expected %d fields in trait table, found %d", line_num, std::ssize(header), std::ssize(cells)));
    }

    auto numeric_col = 0;
    for (auto j = 0; j != std::ssize(cells); ++j) {
      if (j == tip_names_col) {
        result.tip_names->emplace_back(cells[j]);
        continue;
      }
      auto value = std::optional<double>{};
      if (not cells[j].empty() && cells[j] != "NA") {
        auto x = 0.0;
        if (absl::SimpleAtod(cells[j], &x)) {
          value = x;
        } else {
          warning_hook(Trait_warnings::Unreadable_trait_value{
              .line = line_num, .column = header[j], .text = std::string{cells[j]}});
        }
      }
      result.columns[numeric_col].push_back(value);
      ++numeric_col;
    }
  }

  if (header.empty()) {
    throw std::runtime_error("Trait table is empty (no header line)");
  }
  return result;
}

auto read_trait_table(std::string_view text, const Trait_warning_hook& warning_hook) -> Trait_table {
  auto is = std::istringstream{std::string{text}};
  return read_trait_table(is, warning_hook);
}

auto write_trait_table(std::ostream& os, const Trait_table& table) -> void {
  auto header = std::vector<std::string>{};
  if (table.tip_names.has_value()) {
    header.emplace_back(k_tip_names_column);
  }
  header.insert(header.end(), table.column_names.begin(), table.column_names.end());
  os << absl::StrJoin(header, ",") << "\n";

  for (auto k = 0; k != table.num_rows(); ++k) {
    auto cells = std::vector<std::string>{};
    if (table.tip_names.has_value()) {
      cells.push_back(table.tip_names.value()[k]);
    }
    for (const auto& column : table.columns) {
      cells.push_back(column[k].has_value() ? absl::StrFormat("%.17g", column[k].value()) : std::string{"NA"});
    }
    os << absl::StrJoin(cells, ",") << "\n";
  }
}

auto match_tip_names(const Network& net, const Trait_table& table) -> std::vector<int> {
  auto net_names = net.tip_names();
  auto net_has_names = std::ranges::none_of(net_names, [](const auto& name) { return name.empty(); });
  auto table_has_names = table.tip_names.has_value();

  if (not net_has_names && not table_has_names) {
    throw std::invalid_argument(
        "The network provided has no tip names, and the trait table has no column labelled tipNames, "
        "so I can't match the data on the network unambiguously. If you are sure that the tips of the network "
        "are in the same order as the rows of the table, then please ignore the names explicitly.");
  }
  if (not net_has_names) {
    throw std::invalid_argument(
        "The network provided has no tip names, so I can't match the data on the network unambiguously. "
        "If you are sure that the tips of the network are in the same order as the rows of the table, "
        "then please ignore the names explicitly.");
  }
  if (not table_has_names) {
    throw std::invalid_argument(
        "The trait table has no column labelled tipNames, so I can't match the data on the network "
        "unambiguously. If you are sure that the tips of the network are in the same order as the rows "
        "of the table, then please ignore the names explicitly.");
  }

  auto position_of_name = absl::flat_hash_map<std::string, int>{};
  for (auto k = 0; k != std::ssize(net_names); ++k) {
    position_of_name.try_emplace(net_names[k], k);
  }

  auto result = std::vector<int>{};
  auto used = std::vector<bool>(net_names.size(), false);
  for (const auto& name : table.tip_names.value()) {
    auto it = position_of_name.find(name);
    if (it == position_of_name.end() || used[it->second]) {
      throw std::invalid_argument(
          "Tips names of the network and names provided in column tipNames of the trait table do not match.");
    }
    used[it->second] = true;
    result.push_back(it->second);
  }
  return result;
}

auto no_names(const Network& net, const Trait_table& table, const Trait_warning_hook& warning_hook)
    -> std::vector<int> {
  if (table.num_rows() != net.num_tips()) {
    throw std::invalid_argument(absl::StrFormat(
        "Ignoring tip names requires one row per tip, but the trait table has %d rows and the network %d tips",
        table.num_rows(), net.num_tips()));
  }
  warning_hook(Trait_warnings::Tip_names_ignored{});
  auto result = std::vector<int>{};
  for (auto k = 0; k != net.num_tips(); ++k) {
    result.push_back(k);
  }
  return result;
}

auto build_design(
    const Trait_table& table,
    const Trait_formula& formula,
    const std::vector<int>& row_positions,
    int num_tips)
    -> Trait_design {

  auto num_rows = table.num_rows();
  if (std::ssize(row_positions) != num_rows) {
    throw std::invalid_argument(absl::StrFormat(
        "Got tip positions for %d rows, but the trait table has %d rows", std::ssize(row_positions), num_rows));
  }
  if (num_rows > num_tips) {
    throw std::invalid_argument(absl::StrFormat(
        "The trait table has %d rows, more than the %d tips of the network", num_rows, num_tips));
  }

  const auto& response = table.column(formula.response);
  auto predictors = std::vector<const std::vector<std::optional<double>>*>{};
  for (const auto& name : formula.predictors) {
    predictors.push_back(&table.column(name));
  }

  auto result = Trait_design{};
  result.has_intercept = formula.intercept;
  if (formula.intercept) {
    result.coef_names.push_back("(Intercept)");
  }
  result.coef_names.insert(result.coef_names.end(), formula.predictors.begin(), formula.predictors.end());

  // Rows of the table, then the tips without a row
  result.reorder = row_positions;
  auto in_table = std::vector<bool>(num_tips, false);
  for (const auto& pos : row_positions) {
    if (pos < 0 || pos >= num_tips || in_table[pos]) {
      throw std::invalid_argument(absl::StrFormat(
          "Tip positions [%s] do not select distinct tips among %d", absl::StrJoin(row_positions, ", "), num_tips));
    }
    in_table[pos] = true;
  }
  for (auto pos = 0; pos != num_tips; ++pos) {
    if (not in_table[pos]) { result.reorder.push_back(pos); }
  }

  result.observed.assign(num_tips, false);
  auto observed_rows = std::vector<int>{};
  for (auto k = 0; k != num_rows; ++k) {
    auto complete = response[k].has_value() &&
        std::ranges::all_of(predictors, [k](const auto* col) { return (*col)[k].has_value(); });
    if (complete) {
      result.observed[k] = true;
      observed_rows.push_back(k);
    }
  }

  auto num_observed = std::ssize(observed_rows);
  auto num_coefs = std::ssize(result.coef_names);
  result.X = Eigen::MatrixXd(num_observed, num_coefs);
  result.Y = Eigen::VectorXd(num_observed);
  for (auto i = 0; i != num_observed; ++i) {
    auto k = observed_rows[i];
    result.Y(i) = response[k].value();
    auto j = 0;
    if (formula.intercept) {
      result.X(i, j++) = 1.0;
    }
    for (const auto* col : predictors) {
      result.X(i, j++) = (*col)[k].value();
    }
  }
  return result;
}

auto phylo_network_lm(
    const Trait_table& table,
    const Trait_formula& formula,
    const Network& net,
    Phylo_lm_options options,
    bool ignore_names,
    const Trait_warning_hook& warning_hook)
    -> Phylo_network_linear_model {

  auto row_positions = ignore_names ? no_names(net, table, warning_hook) : match_tip_names(net, table);
  auto design = build_design(table, formula, row_positions, net.num_tips());

  options.observed = std::move(design.observed);
  options.reorder = std::move(design.reorder);
  options.coef_names = std::move(design.coef_names);
  options.has_intercept = design.has_intercept;
  return phylo_network_lm(design.X, design.Y, net, options, warning_hook);
}

}  // namespace phylotraits
