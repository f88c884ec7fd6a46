#ifndef PHYLOTRAITS_ESTD_H_
#define PHYLOTRAITS_ESTD_H_

#include <algorithm>
#include <ranges>
#include <vector>

// estd contains extensions to std that probably should have been there
namespace estd {

// Debug support (we try very hard not to use conditional compilation)
#ifndef NDEBUG
inline constexpr bool is_debug_enabled = true;
#else
inline constexpr bool is_debug_enabled = false;
#endif

// The usual helper for std::visit with a set of lambdas
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

namespace ranges {

template<std::ranges::range R>
auto to_vec(R&& range) {
  auto result = std::vector<std::ranges::range_value_t<R>>{};
  for (auto&& elem : range) {
    result.push_back(elem);
  }
  return result;
}

template<std::ranges::range R, typename T>
auto index_of(const R& range, const T& value) -> int {
  auto it = std::ranges::find(range, value);
  return it == std::ranges::end(range) ? -1 : static_cast<int>(it - std::ranges::begin(range));
}

}  // namespace ranges

}  // namespace estd

#endif // PHYLOTRAITS_ESTD_H_
