#include "extended_newick.h"

#include <cctype>
#include <cmath>
#include <sstream>

#include <boost/algorithm/string/replace.hpp>
#include "absl/container/flat_hash_map.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

namespace phylotraits {

// Extended Newick grammar for rooted phylogenetic networks (ANTLR v4 notation).
//
// References:
//  - https://evolution.genetics.washington.edu/phylip/newick_doc.html
//  - Cardona, Rosselló & Valiente (2008), "Extended Newick: it is time for a standard representation
//    of phylogenetic networks", BMC Bioinformatics 9:532
//
// network
//   : root=node ';'
//   ;
//
// node
//   : ( '(' children+=node (',' children+=node)* ')' )?
//     label=( UNQUOTED_LABEL | QUOTED_LABEL | NUMBER )?           // "name", "name#H1" or "#H1"
//     ( ':' length=NUMBER? ( ':' support=NUMBER? ( ':' gamma=NUMBER? )? )? )?
//   ;
//
//WS             : [ \r\n\t]+ -> skip ;
//COMMENT        : '[' .*? ']' -> skip ;
//NUMBER         : [+-]? ([0-9]+ ('.' [0-9]+)? | '.' [0-9]+) ([eE] [+-]? [0-9]+)? ;
//UNQUOTED_LABEL : (~[ \r\n\t()[\]':;,])+ ;  // Note: a whole word that matches NUMBER is a NUMBER
//QUOTED_LABEL   : '\'' ([^'] | '\'\'')* '\'';

auto Extended_newick_lexer::to_string(Extended_newick_lexer::Token_kind token_kind) -> std::string_view {
  switch (token_kind) {
    case Token_kind::k_number:
      return "NUMBER";
    case Token_kind::k_unquoted_label:
      return "UNQUOTED_LABEL";
    case Token_kind::k_quoted_label:
      return "QUOTED_LABEL";
    case Token_kind::k_left_paren:
      return "'('";
    case Token_kind::k_comma:
      return "','";
    case Token_kind::k_right_paren:
      return "')'";
    case Token_kind::k_colon:
      return "':'";
    case Token_kind::k_semicolon:
      return "';'";
    case Token_kind::k_invalid:
      return "INVALID";
    case Token_kind::k_eof:
      return "EOF";
    default:
      throw std::logic_error(absl::StrFormat(
          "Unknown token kind: %d", static_cast<std::underlying_type<Token_kind>::type>(token_kind)));
  }
}

auto Extended_newick_lexer::prime() -> void {
  peek_c = is_->get();
  started = true;
}

auto Extended_newick_lexer::get() -> Extended_newick_lexer::int_type {
  auto c = peek_c;
  if (c != eof) {
    lexeme_ += static_cast<char>(peek_c);
    peek_c = is_->get();
  }
  return c;
}

auto Extended_newick_lexer::lex_next_token() -> Extended_newick_lexer::Token_kind {
  if (!started) {
    prime();
  }

  while (true) {
    lexeme_.clear();
    switch (peek_c) {
      case eof:
        return Token_kind::k_eof;

      case ' ':
      case '\r':
      case '\n':
      case '\t':
        if (not lex_whitespace()) { return Token_kind::k_invalid; }
        break;  // Whitespace => loop and lex another token

      case '(':
        return get(), Token_kind::k_left_paren;
      case ')':
        return get(), Token_kind::k_right_paren;
      case ',':
        return get(), Token_kind::k_comma;
      case ':':
        return get(), Token_kind::k_colon;
      case ';':
        return get(), Token_kind::k_semicolon;

      case ']':
        return get(), Token_kind::k_invalid;

      case '[':
        if (not lex_comment()) { return Token_kind::k_invalid; }
        break;  // Comment => loop and lex another token

      case '\'':
        return lex_quoted_label() ? Token_kind::k_quoted_label : Token_kind::k_invalid;

      default:
        // A word is a NUMBER only if all of it reads as one ("1a" is a label, ".5" a number)
        if (not lex_unquoted_label()) { return Token_kind::k_invalid; }
        return is_number(lexeme_) ? Token_kind::k_number : Token_kind::k_unquoted_label;
    }
  }
}

auto Extended_newick_lexer::lex_whitespace() -> bool {
  auto empty = true;
  while (true) {
    switch (peek_c) {
      case ' ':
      case '\r':
      case '\n':
      case '\t':
        get();
        empty = false;
        break;
      default:
        return not empty;
    }
  }
}

auto Extended_newick_lexer::is_number(std::string_view word) -> bool {
  auto i = std::size_t{0};
  auto n = word.size();
  auto digits = [&]() {
    auto start = i;
    while (i != n && std::isdigit(static_cast<unsigned char>(word[i]))) { ++i; }
    return i != start;
  };

  if (i != n && (word[i] == '-' || word[i] == '+')) { ++i; }
  auto int_digits = digits();
  auto frac_digits = false;
  if (i != n && word[i] == '.') {
    ++i;
    frac_digits = digits();
    if (not frac_digits) { return false; }
  }
  if (not int_digits && not frac_digits) { return false; }
  if (i != n && (word[i] == 'e' || word[i] == 'E')) {
    ++i;
    if (i != n && (word[i] == '-' || word[i] == '+')) { ++i; }
    if (not digits()) { return false; }
  }
  return i == n;
}

auto Extended_newick_lexer::lex_quoted_label() -> bool {
  if (peek_c != '\'') { return false; }
  get();
  while (true) {
    switch (get()) {
      case eof:
        return false;
      case '\'':
        if (peek_c == '\'') { get(); break; }
        else { return true; }
      default:
        break;
    }
  }
}

auto Extended_newick_lexer::lex_unquoted_label() -> bool {
  auto empty = true;
  while (true) {
    switch (peek_c) {
      case eof:
      case ' ':
      case '\r':
      case '\n':
      case '\t':
      case '(':
      case ')':
      case '[':
      case ']':
      case '\'':
      case ':':
      case ';':
      case ',':
        return not empty;
      default:
        get();
        empty = false;
        break;
    }
  }
}

auto Extended_newick_lexer::lex_comment() -> bool {
  get();
  while (peek_c != eof && peek_c != ']') { get(); }
  if (peek_c == ']') { return get(), true; }
  else { return false; }
}

static auto unquote(std::string_view quoted_label) -> std::string {
  CHECK(quoted_label.starts_with('\'') && quoted_label.ends_with('\''));
  auto unquoted_label = std::string{quoted_label.substr(1, quoted_label.size() - 2)};
  boost::replace_all(unquoted_label, "\'\'", "\'");
  return unquoted_label;
}

static auto quote_if_needed(std::string_view label) -> std::string {
  if (label.find_first_of(" \r\n\t()[]':;,") == std::string_view::npos) {
    return std::string{label};
  }
  auto quoted_label = std::string{label};
  boost::replace_all(quoted_label, "\'", "\'\'");
  return absl::StrCat("'", quoted_label, "'");
}

auto Extended_newick_parser::match(Extended_newick_lexer::Token_kind token_kind) -> void {
  if (lexer_.token_kind() != token_kind) {
    throw std::runtime_error(absl::StrFormat(
        "Expected %s, but got '%s' instead",
        Extended_newick_lexer::to_string(token_kind), lexer_.lexeme()));
  }
  lexer_.next_token();
}

auto Extended_newick_parser::maybe_match(Extended_newick_lexer::Token_kind token_kind) -> bool {
  if (lexer_.token_kind() == token_kind) {
    lexer_.next_token();
    return true;
  } else {
    return false;
  }
}

auto Extended_newick_parser::maybe_parse_number(std::string_view what) -> std::optional<double> {
  if (lexer_.token_kind() != Extended_newick_lexer::Token_kind::k_number) {
    return std::nullopt;
  }
  auto value = 0.0;
  if (not absl::SimpleAtod(lexer_.lexeme(), &value)) {
    throw std::runtime_error(absl::StrFormat("Could not parse %s '%s'", what, lexer_.lexeme()));
  }
  lexer_.next_token();
  return value;
}

auto Extended_newick_parser::parse_occurrences() -> std::vector<Newick_occurrence> {
  auto occurrences = std::vector<Newick_occurrence>{};
  parse_occurrence(occurrences);
  match(Extended_newick_lexer::Token_kind::k_semicolon);
  return occurrences;
}

auto Extended_newick_parser::parse_occurrence(std::vector<Newick_occurrence>& occurrences) -> int {
  auto occ = static_cast<int>(std::ssize(occurrences));
  occurrences.emplace_back();

  // ( '(' children+=node (',' children+=node)* ')' )?
  if (maybe_match(Extended_newick_lexer::Token_kind::k_left_paren)) {
    auto children = std::vector<int>{};
    children.push_back(parse_occurrence(occurrences));
    while (true) {
      if (maybe_match(Extended_newick_lexer::Token_kind::k_comma)) {
        children.push_back(parse_occurrence(occurrences));
      } else if (maybe_match(Extended_newick_lexer::Token_kind::k_right_paren)) {
        break;
      } else {
        throw std::runtime_error(absl::StrFormat(
            "Expected ',' or ')', but got '%s' instead", lexer_.lexeme()));
      }
    }
    occurrences[occ].children = std::move(children);  // `occurrences` may have been reallocated above
  }

  // label=( UNQUOTED_LABEL | QUOTED_LABEL | NUMBER )?
  auto label = std::string{};
  switch (lexer_.token_kind()) {
    case Extended_newick_lexer::Token_kind::k_unquoted_label:
    case Extended_newick_lexer::Token_kind::k_number: {
      label = lexer_.lexeme();
      lexer_.next_token();
      break;
    }
    case Extended_newick_lexer::Token_kind::k_quoted_label: {
      label = unquote(lexer_.lexeme());
      lexer_.next_token();
      break;
    }
    default: {
      // No label
      break;
    }
  }
  if (auto pound = label.find('#'); pound != std::string::npos) {
    occurrences[occ].name = label.substr(0, pound);
    occurrences[occ].hybrid_key = label.substr(pound + 1);
    if (occurrences[occ].hybrid_key.empty()) {
      throw std::runtime_error(absl::StrFormat("Hybrid label '%s' has nothing after '#'", label));
    }
  } else {
    occurrences[occ].name = label;
  }

  // ( ':' length=NUMBER? ( ':' support=NUMBER? ( ':' gamma=NUMBER? )? )? )?
  if (maybe_match(Extended_newick_lexer::Token_kind::k_colon)) {
    occurrences[occ].length = maybe_parse_number("branch length");
    if (maybe_match(Extended_newick_lexer::Token_kind::k_colon)) {
      occurrences[occ].support = maybe_parse_number("support value");
      if (maybe_match(Extended_newick_lexer::Token_kind::k_colon)) {
        occurrences[occ].gamma = maybe_parse_number("inheritance weight");
      }
    }
  }

  return occ;
}

namespace {

struct Hybrid_record {
  std::string label{};
  Node_index node{k_no_node};
  std::vector<Edge_index> edges{};
  std::vector<std::optional<double>> gammas{};
  Edge_index edge_with_children{k_no_edge};
};

class Network_builder {
 public:
  Network_builder(const std::vector<Newick_occurrence>& occurrences, const Trait_warning_hook& warning_hook)
      : occurrences_{&occurrences}, warning_hook_{&warning_hook} {}

  auto build() -> Network {
    if (occurrences_->empty()) {
      throw std::runtime_error("Network has no nodes");
    }
    if (occurrences_->front().is_hybrid()) {
      throw std::runtime_error("The root of a network cannot be a hybrid node");
    }

    add_occurrence(0, k_no_node);
    net_.root = 0;

    for (auto& hybrid : hybrids_) {
      settle_hybrid_edges(hybrid);
      resolve_hybrid_polytomy(hybrid);
    }

    renumber_network(net_);
    assert_network_integrity(net_);
    return std::move(net_);
  }

 private:
  const std::vector<Newick_occurrence>* occurrences_;
  const Trait_warning_hook* warning_hook_;
  Network net_{};
  std::vector<Hybrid_record> hybrids_{};
  absl::flat_hash_map<std::string, int> hybrid_by_key_{};

  auto add_occurrence(int occ, Node_index parent) -> void {
    const auto& o = occurrences_->at(occ);

    auto node = k_no_node;
    auto hybrid = -1;
    if (o.is_hybrid()) {
      if (auto it = hybrid_by_key_.find(o.hybrid_key); it != hybrid_by_key_.end()) {
        hybrid = it->second;
        node = hybrids_[hybrid].node;
        if (not o.name.empty()) {
          if (net_.at(node).name.empty()) {
            net_.at(node).name = o.name;
          } else if (net_.at(node).name != o.name) {
            throw std::runtime_error(absl::StrFormat(
                "Hybrid node #%s is named both '%s' and '%s'", o.hybrid_key, net_.at(node).name, o.name));
          }
        }
      } else {
        node = net_.add_node(Network_node{.name = o.name, .hybrid = true});
        hybrid = static_cast<int>(std::ssize(hybrids_));
        hybrids_.push_back(Hybrid_record{.label = absl::StrCat("#", o.hybrid_key), .node = node});
        hybrid_by_key_.try_emplace(o.hybrid_key, hybrid);
      }
    } else {
      node = net_.add_node(Network_node{.name = o.name});
    }

    if (o.gamma.has_value() && (*o.gamma < 0.0 || *o.gamma > 1.0)) {
      throw std::runtime_error(absl::StrFormat(
          "Inheritance weight %g above node '%s' is not in [0,1]", *o.gamma, describe(o)));
    }

    if (parent != k_no_node) {
      auto length = o.length.value_or(0.0);
      if (length < 0.0) {
        throw std::runtime_error(absl::StrFormat(
            "Negative branch length %g above node '%s'", length, describe(o)));
      }
      auto edge = net_.add_edge(parent, node, length);
      if (hybrid != -1) {
        hybrids_[hybrid].edges.push_back(edge);
        hybrids_[hybrid].gammas.push_back(o.gamma);
        if (not o.children.empty()) {
          hybrids_[hybrid].edge_with_children = edge;
        }
      } else if (o.gamma.has_value() && *o.gamma != 1.0) {
        (*warning_hook_)(Trait_warnings::Tree_edge_gamma_ignored{
            .child_label = describe(o), .gamma = *o.gamma});
      }
    }

    if (not o.children.empty()) {
      if (hybrid != -1 && net_.at(node).is_inner_node()) {
        throw std::runtime_error(absl::StrFormat(
            "Hybrid node %s is given children more than once", hybrids_[hybrid].label));
      }
      for (const auto& child : o.children) {
        add_occurrence(child, node);
      }
    }
  }

  auto describe(const Newick_occurrence& o) const -> std::string {
    if (o.is_hybrid()) { return absl::StrCat(o.name, "#", o.hybrid_key); }
    if (not o.name.empty()) { return o.name; }
    return "(unnamed)";
  }

  auto settle_hybrid_edges(Hybrid_record& hybrid) -> void {
    if (std::ssize(hybrid.edges) != 2) {
      throw std::runtime_error(absl::StrFormat(
          "Hybrid node %s has %d parent edge(s), but a hybrid node must have exactly 2",
          hybrid.label, std::ssize(hybrid.edges)));
    }
    if (net_.at(hybrid.node).is_tip() && net_.at(hybrid.node).name.empty()) {
      throw std::runtime_error(absl::StrFormat(
          "Hybrid node %s has neither children nor a name", hybrid.label));
    }

    // The occurrence that carries the subtree comes first (it wins ties for the major edge)
    auto first = 0;
    if (hybrid.edge_with_children == hybrid.edges[1]) { first = 1; }
    auto second = 1 - first;

    auto gamma_first = hybrid.gammas[first];
    auto gamma_second = hybrid.gammas[second];
    if (not gamma_first.has_value() && not gamma_second.has_value()) {
      gamma_first = 0.9;
      gamma_second = 0.1;
      (*warning_hook_)(Trait_warnings::Default_hybrid_gammas{.hybrid_label = hybrid.label});
    } else if (not gamma_second.has_value()) {
      gamma_second = 1.0 - *gamma_first;
      (*warning_hook_)(Trait_warnings::Complementary_hybrid_gamma{
          .hybrid_label = hybrid.label, .given_gamma = *gamma_first});
    } else if (not gamma_first.has_value()) {
      gamma_first = 1.0 - *gamma_second;
      (*warning_hook_)(Trait_warnings::Complementary_hybrid_gamma{
          .hybrid_label = hybrid.label, .given_gamma = *gamma_second});
    } else if (std::abs(*gamma_first + *gamma_second - 1.0) > 1e-8) {
      throw std::runtime_error(absl::StrFormat(
          "Inheritance weights %g and %g of the hybrid edges into %s do not add up to 1",
          *gamma_first, *gamma_second, hybrid.label));
    }

    auto& edge_first = net_.edge_at(hybrid.edges[first]);
    auto& edge_second = net_.edge_at(hybrid.edges[second]);
    edge_first.hybrid = edge_second.hybrid = true;
    edge_first.gamma = *gamma_first;
    edge_second.gamma = *gamma_second;
    edge_first.major = *gamma_first >= *gamma_second;
    edge_second.major = not edge_first.major;
  }

  auto resolve_hybrid_polytomy(const Hybrid_record& hybrid) -> void {
    auto num_children = static_cast<int>(std::ssize(net_.at(hybrid.node).child_edges));
    if (num_children <= 1) { return; }

    auto child_edges = std::move(net_.at(hybrid.node).child_edges);
    net_.at(hybrid.node).child_edges.clear();
    auto resolved = net_.add_node();
    net_.add_edge(hybrid.node, resolved, 0.0);
    for (const auto& edge : child_edges) {
      net_.edge_at(edge).parent = resolved;
      net_.at(resolved).child_edges.push_back(edge);
    }

    (*warning_hook_)(Trait_warnings::Hybrid_polytomy_resolved{
        .hybrid_label = hybrid.label, .num_children = num_children});
  }
};

}  // namespace

auto build_network(
    const std::vector<Newick_occurrence>& occurrences,
    const Trait_warning_hook& warning_hook)
    -> Network {
  return Network_builder{occurrences, warning_hook}.build();
}

auto read_extended_newick(std::istream& is, const Trait_warning_hook& warning_hook) -> Network {
  auto parser = Extended_newick_parser{is};
  return build_network(parser.parse_occurrences(), warning_hook);
}

auto read_extended_newick(std::string_view text, const Trait_warning_hook& warning_hook) -> Network {
  auto is = std::istringstream{std::string{text}};
  return read_extended_newick(is, warning_hook);
}

static auto write_node(
    const Network& net,
    Node_index node,
    Edge_index in_edge,
    const Node_vector<int>& hybrid_ids,
    std::ostream& os)
    -> void {
  const auto& n = net.at(node);

  auto expand = in_edge == k_no_edge || not n.hybrid || net.edge_at(in_edge).major;
  if (expand && n.is_inner_node()) {
    os << '(';
    auto first = true;
    for (const auto& child_edge : n.child_edges) {
      if (not first) { os << ','; }
      first = false;
      write_node(net, net.edge_at(child_edge).child, child_edge, hybrid_ids, os);
    }
    os << ')';
  }

  os << quote_if_needed(n.name);
  if (n.hybrid) {
    os << "#H" << hybrid_ids[node];
  }

  if (in_edge != k_no_edge) {
    const auto& e = net.edge_at(in_edge);
    os << absl::StreamFormat(":%.10g", e.length);
    if (e.hybrid) {
      os << absl::StreamFormat("::%.10g", e.gamma);
    }
  }
}

auto to_extended_newick(const Network& net) -> std::string {
  if (not net.is_rooted()) {
    throw std::runtime_error("Cannot write an unrooted network");
  }

  auto hybrid_ids = Node_vector<int>(net.num_nodes(), 0);
  auto next_id = 1;
  for (const auto& node : net.hybrid_nodes()) {
    hybrid_ids[node] = next_id;
    ++next_id;
  }

  auto os = std::ostringstream{};
  write_node(net, net.root, k_no_edge, hybrid_ids, os);
  os << ';';
  return os.str();
}

}  // namespace phylotraits
