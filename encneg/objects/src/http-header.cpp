#include "encneg/http-header.hpp"

#include <algorithm>
#include <string_view>

#include "encneg/invalid_argument_exception.hpp"
#include "encneg/string-trim.hpp"
#include "encneg/tchars.hpp"

namespace encneg::http {

namespace {

constexpr bool IsFieldValueChar(unsigned char ch) noexcept { return ch == '\t' || (ch >= 0x20 && ch < 0x7F); }

std::string_view CheckedValue(std::string_view value) {
  value = TrimOws(value);
  if (!IsValidHeaderValue(value)) {
    throw invalid_argument("HTTP header value contains forbidden characters");
  }
  return value;
}

}  // namespace

Header::Header(std::string_view name, std::string_view value) {
  if (!IsValidHeaderName(name)) {
    throw invalid_argument("HTTP header name '{}' is not a token", name);
  }
  _value = CheckedValue(value);
  _name = name;
}

void Header::setValue(std::string_view value) { _value = CheckedValue(value); }

bool IsValidHeaderName(std::string_view name) noexcept { return IsToken(name); }

bool IsValidHeaderValue(std::string_view value) noexcept {
  return std::ranges::all_of(value, [](char ch) { return IsFieldValueChar(static_cast<unsigned char>(ch)); });
}

}  // namespace encneg::http
