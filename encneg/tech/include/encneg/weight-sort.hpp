#pragma once

#include <algorithm>
#include <concepts>
#include <functional>
#include <iterator>
#include <ranges>

namespace encneg {

// An item carrying an optional weight, with 1.0 as the value used when no weight is set.
template <class T>
concept Weighted = requires(const T &item) {
  { item.weightOrDefault() } -> std::convertible_to<float>;
};

// Sorts items by descending weight.
// Among items of equal weight, the item declared later in the range comes first: clients list a directive after
// another of the same precedence to override it.
template <std::ranges::random_access_range R>
  requires Weighted<std::ranges::range_value_t<R>> && std::permutable<std::ranges::iterator_t<R>>
void SortByWeight(R &&items) {
  std::ranges::reverse(items);
  std::ranges::stable_sort(items, std::ranges::greater{}, [](const auto &item) { return item.weightOrDefault(); });
}

}  // namespace encneg
