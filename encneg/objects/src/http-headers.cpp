#include "encneg/http-headers.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string_view>

#include "encneg/http-header.hpp"
#include "encneg/string-equal-ignore-case.hpp"
#include "encneg/vector.hpp"

namespace encneg::http {

namespace {

auto NameIs(std::string_view name) {
  return [name](const Header &header) { return CaseInsensitiveEqual(header.name(), name); };
}

}  // namespace

void Headers::append(std::string_view name, std::string_view value) { _headers.emplace_back(name, value); }

void Headers::insert(std::string_view name, std::string_view value) {
  auto it = std::ranges::find_if(_headers, NameIs(name));
  if (it == _headers.end()) {
    _headers.emplace_back(name, value);
    return;
  }
  // The first occurrence keeps its position and its name spelling.
  it->setValue(value);
  auto removed = std::ranges::remove_if(it + 1, _headers.end(), NameIs(name));
  _headers.erase(removed.begin(), removed.end());
}

std::size_t Headers::erase(std::string_view name) {
  auto removed = std::ranges::remove_if(_headers, NameIs(name));
  const auto nbRemoved = static_cast<std::size_t>(removed.size());
  _headers.erase(removed.begin(), removed.end());
  return nbRemoved;
}

bool Headers::contains(std::string_view name) const noexcept { return std::ranges::any_of(_headers, NameIs(name)); }

std::optional<std::string_view> Headers::get(std::string_view name) const noexcept {
  auto it = std::ranges::find_if(_headers, NameIs(name));
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return it->value();
}

vector<std::string_view> Headers::getAll(std::string_view name) const {
  vector<std::string_view> values;
  for (const Header &header : _headers) {
    if (CaseInsensitiveEqual(header.name(), name)) {
      values.push_back(header.value());
    }
  }
  return values;
}

}  // namespace encneg::http
