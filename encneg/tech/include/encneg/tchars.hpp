#pragma once

#include <algorithm>
#include <array>
#include <string_view>

namespace encneg {

namespace detail {

// tchar = "!" / "#" / "$" / "%" / "&" / "'" / "*" / "+" / "-" / "." / "^" / "_" / "`" / "|" / "~" / DIGIT / ALPHA
inline constexpr std::array<bool, 256> kTcharTable = [] {
  std::array<bool, 256> table{};
  for (char ch = '0'; ch <= '9'; ++ch) {
    table[static_cast<unsigned char>(ch)] = true;
  }
  for (char ch = 'a'; ch <= 'z'; ++ch) {
    table[static_cast<unsigned char>(ch)] = true;
    table[static_cast<unsigned char>(ch - 'a' + 'A')] = true;
  }
  for (char ch : std::string_view("!#$%&'*+-.^_`|~")) {
    table[static_cast<unsigned char>(ch)] = true;
  }
  return table;
}();

}  // namespace detail

// RFC 7230 §3.2.6
constexpr bool is_tchar(unsigned char uc) noexcept { return detail::kTcharTable[uc]; }

constexpr bool is_tchar(char ch) noexcept { return is_tchar(static_cast<unsigned char>(ch)); }

// token = 1*tchar
constexpr bool IsToken(std::string_view str) noexcept {
  return !str.empty() && std::ranges::all_of(str, [](char ch) { return is_tchar(ch); });
}

}  // namespace encneg
