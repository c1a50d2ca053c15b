#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "encneg/http-header.hpp"
#include "encneg/vector.hpp"

namespace encneg::http {

// Ordered collection of HTTP header fields. A name may appear several times; each appearance is an occurrence.
// Name lookups are case-insensitive, insertion order is kept.
class Headers {
 public:
  using const_iterator = vector<Header>::const_iterator;

  // Adds one more occurrence of 'name'.
  // Throws invalid_argument if the name or the value is invalid.
  void append(std::string_view name, std::string_view value);

  // Replaces all occurrences of 'name' by a single one holding 'value', at the place of the first occurrence.
  // Throws invalid_argument if the name or the value is invalid.
  void insert(std::string_view name, std::string_view value);

  // Removes all occurrences of 'name', returning how many were removed.
  std::size_t erase(std::string_view name);

  [[nodiscard]] bool contains(std::string_view name) const noexcept;

  // Returns the value of the first occurrence of 'name', or std::nullopt if the header is absent.
  [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept;

  // Returns the values of all occurrences of 'name', in order. Empty when the header is absent.
  [[nodiscard]] vector<std::string_view> getAll(std::string_view name) const;

  [[nodiscard]] const_iterator begin() const noexcept { return _headers.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _headers.end(); }

  [[nodiscard]] std::size_t size() const noexcept { return _headers.size(); }
  [[nodiscard]] bool empty() const noexcept { return _headers.empty(); }

 private:
  vector<Header> _headers;
};

}  // namespace encneg::http
