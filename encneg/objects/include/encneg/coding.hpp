#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "encneg/encoding.hpp"

namespace encneg {

// A content-coding identifier: either one of the known Encoding values, or an opaque token
// (a coding we do not model, kept verbatim so that it can still be compared and emitted).
class Coding {
 public:
  // Implicit so that an Encoding can be used wherever a Coding is expected.
  Coding(Encoding enc) noexcept : _value(enc) {}  // NOLINT(google-explicit-constructor)

  // Builds a coding from a token that does not name a known Encoding.
  // Throws invalid_argument if the token is not a valid RFC 7230 token, or if it names a known Encoding.
  static Coding Other(std::string_view token);

  // Builds a coding from any token: the known Encoding if the token names one, an opaque coding otherwise.
  // Throws invalid_argument if the token is not a valid RFC 7230 token.
  static Coding Parse(std::string_view token);

  [[nodiscard]] bool isKnown() const noexcept { return std::holds_alternative<Encoding>(_value); }

  // Returns the known Encoding, or std::nullopt for an opaque coding.
  [[nodiscard]] std::optional<Encoding> encoding() const noexcept;

  // Returns the token as it should appear in a header value.
  [[nodiscard]] std::string_view str() const noexcept;

  // Opaque codings compare case-insensitively.
  bool operator==(const Coding &other) const noexcept;

  bool operator==(Encoding enc) const noexcept {
    const auto *pEnc = std::get_if<Encoding>(&_value);
    return pEnc != nullptr && *pEnc == enc;
  }

 private:
  explicit Coding(std::string token) noexcept : _value(std::move(token)) {}

  std::variant<Encoding, std::string> _value;
};

}  // namespace encneg
