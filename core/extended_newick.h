#ifndef PHYLOTRAITS_EXTENDED_NEWICK_H_
#define PHYLOTRAITS_EXTENDED_NEWICK_H_

#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "network.h"
#include "warnings.h"

namespace phylotraits {

// One occurrence of a node in extended Newick text.  A hybrid node appears several times
// (once per parent edge), each time with the same hybrid key (e.g., "H1" in "#H1").
struct Newick_occurrence {
  std::string name{};
  std::string hybrid_key{};  // Empty for tree nodes
  std::optional<double> length{};
  std::optional<double> support{};
  std::optional<double> gamma{};
  std::vector<int> children{};  // Indices of child occurrences

  auto is_hybrid() const -> bool { return not hybrid_key.empty(); }
};

class Extended_newick_lexer {
 public:
  enum class Token_kind {
    k_number,
    k_unquoted_label,
    k_quoted_label,
    k_left_paren,
    k_comma,
    k_right_paren,
    k_colon,
    k_semicolon,
    k_invalid,
    k_eof
  };
  static auto to_string(Extended_newick_lexer::Token_kind token_kind) -> std::string_view;

  explicit Extended_newick_lexer(std::istream& is) : is_{&is} {}

  auto next_token() -> Token_kind { return token_kind_ = lex_next_token(); }

  // Info on last token read in
  auto token_kind() -> Token_kind { return token_kind_; }
  auto lexeme() -> std::string_view { return lexeme_; }  // Invalidated by subsequent call to next()

 private:
  std::istream* is_;
  Token_kind token_kind_{Token_kind::k_invalid};
  std::string lexeme_{};

  using int_type = std::istream::int_type;
  static constexpr int_type eof = std::istream::traits_type::eof();

  bool started = false;
  int_type peek_c = eof;

  auto prime() -> void;
  auto get() -> int_type;

  auto lex_next_token() -> Token_kind;
  auto lex_whitespace() -> bool;
  auto lex_quoted_label() -> bool;
  auto lex_unquoted_label() -> bool;
  auto lex_comment() -> bool;

  static auto is_number(std::string_view word) -> bool;
};

class Extended_newick_parser {
 public:
  explicit Extended_newick_parser(std::istream& is) : lexer_{is} { lexer_.next_token(); }

  // Parses one network, terminated by ';', into a flat list of occurrences (the first one is the root)
  auto parse_occurrences() -> std::vector<Newick_occurrence>;

 private:
  Extended_newick_lexer lexer_;

  auto match(Extended_newick_lexer::Token_kind token_kind) -> void;
  auto maybe_match(Extended_newick_lexer::Token_kind token_kind) -> bool;
  auto maybe_parse_number(std::string_view what) -> std::optional<double>;
  auto parse_occurrence(std::vector<Newick_occurrence>& occurrences) -> int;
};

// Merges the occurrences of every hybrid node, settles inheritance weights and major edges,
// resolves polytomies below hybrid nodes and numbers the nodes (see `renumber_network`).
auto build_network(
    const std::vector<Newick_occurrence>& occurrences,
    const Trait_warning_hook& warning_hook = default_trait_warning_hook)
    -> Network;

auto read_extended_newick(
    std::istream& is,
    const Trait_warning_hook& warning_hook = default_trait_warning_hook)
    -> Network;
auto read_extended_newick(
    std::string_view text,
    const Trait_warning_hook& warning_hook = default_trait_warning_hook)
    -> Network;

// Writes the subtree of each hybrid node below its major edge, and a reference `#Hk` at its minor edge
auto to_extended_newick(const Network& net) -> std::string;

}  // namespace phylotraits

#endif // PHYLOTRAITS_EXTENDED_NEWICK_H_
