#ifndef PHYLOTRAITS_TEST_NETWORKS_H_
#define PHYLOTRAITS_TEST_NETWORKS_H_

#include <stdexcept>
#include <string_view>

#include "absl/strings/str_format.h"

#include "network.h"

namespace phylotraits {

//
//        +---1--- x ---1--- A
//   r ---+        +---1--- B
//        +---2--- C
//
inline constexpr auto k_three_tip_tree = std::string_view{"((A:1,B:1):1,C:2);"};

//
//        +---1--- x ---1--- A
//        |        +--0.5-(0.6)--+
//   r ---+                      H ---0.5--- B
//        |        +---1--(0.4)--+
//        +---1--- y ---1--- C
//
// Topological order: r, x, A, y, H, B, C
// Node numbers: A = 1, B = 2, C = 3; r = -1, x = -2, y = -3, H = -4
inline constexpr auto k_one_hybrid = std::string_view{"((A:1,(B:0.5)#H1:0.5::0.6):1,(#H1:1::0.4,C:1):1);"};

// Six tips, one hybrid (parent of C), not ultrametric
inline constexpr auto k_six_tips = std::string_view{
  "(((A:1,B:1):1,(C:0.5)#H1:1.5::0.7):1,((#H1:0.5::0.3,D:1):1,(E:2,F:1):0.5):1);"};

// Eight tips, two hybrids
inline constexpr auto k_eight_tips = std::string_view{
  "((((A:0.4,B:0.6):0.8,(C:0.7)#H1:0.3::0.8):0.5,(#H1:0.6::0.2,D:1.1):0.9):0.4,"
  "(((E:0.9)#H2:0.5::0.65,F:1.2):0.7,((G:0.5,I:0.8):0.6,#H2:0.2::0.35):0.4):1.0);"};

inline auto node_named(const Network& net, std::string_view name) -> Node_index {
  for (auto node = 0; node != net.num_nodes(); ++node) {
    if (net.at(node).name == name) { return node; }
  }
  throw std::invalid_argument(absl::StrFormat("No node named '%s'", name));
}

}  // namespace phylotraits

#endif // PHYLOTRAITS_TEST_NETWORKS_H_
