#pragma once

#include <string_view>

namespace encneg {

inline constexpr std::string_view kOwsChars = " \t";

// Removes the leading and trailing OWS (SP and HTAB only, RFC 7230 §3.2.3) of 'sv'.
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  const auto first = sv.find_first_not_of(kOwsChars);
  if (first == std::string_view::npos) {
    return sv.substr(sv.size());
  }
  return sv.substr(first, sv.find_last_not_of(kOwsChars) - first + 1);
}

}  // namespace encneg
