#pragma once

#include <string>
#include <string_view>

namespace encneg::http {

// One header field of an http::Headers collection.
// Both parts are checked on construction; the value is stored without its surrounding OWS.
class Header {
 public:
  // Throws invalid_argument if the name is not a token or if the value contains control characters.
  Header(std::string_view name, std::string_view value);

  [[nodiscard]] std::string_view name() const noexcept { return _name; }

  [[nodiscard]] std::string_view value() const noexcept { return _value; }

  // Replaces the value, keeping the name as is. Same checks as the constructor.
  void setValue(std::string_view value);

  bool operator==(const Header &) const = default;

 private:
  std::string _name;
  std::string _value;
};

// SP or HTAB, the only characters allowed as OWS (RFC 7230 §3.2.3).
constexpr bool IsHeaderWhitespace(char ch) noexcept { return ch == ' ' || ch == '\t'; }

// field-name = token
bool IsValidHeaderName(std::string_view name) noexcept;

// Accepts HTAB and visible ASCII (SP included), rejects CR, LF and any other control or non-ASCII byte.
bool IsValidHeaderValue(std::string_view value) noexcept;

}  // namespace encneg::http
