#include "encneg/coding.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "encneg/encoding.hpp"
#include "encneg/invalid_argument_exception.hpp"
#include "encneg/string-equal-ignore-case.hpp"
#include "encneg/tchars.hpp"

namespace encneg {

Coding Coding::Other(std::string_view token) {
  if (!IsToken(token)) {
    throw invalid_argument("Invalid content-coding token '{}'", token);
  }
  if (EncodingFromStr(token)) {
    throw invalid_argument("Content-coding '{}' is a known encoding", token);
  }
  return Coding(std::string(token));
}

Coding Coding::Parse(std::string_view token) {
  auto enc = EncodingFromStr(token);
  if (enc) {
    return *enc;
  }
  return Other(token);
}

std::optional<Encoding> Coding::encoding() const noexcept {
  if (const auto *pEnc = std::get_if<Encoding>(&_value)) {
    return *pEnc;
  }
  return std::nullopt;
}

std::string_view Coding::str() const noexcept {
  if (const auto *pEnc = std::get_if<Encoding>(&_value)) {
    return GetEncodingStr(*pEnc);
  }
  return std::get<std::string>(_value);
}

bool Coding::operator==(const Coding &other) const noexcept {
  if (_value.index() != other._value.index()) {
    return false;
  }
  if (isKnown()) {
    return std::get<Encoding>(_value) == std::get<Encoding>(other._value);
  }
  return CaseInsensitiveEqual(std::get<std::string>(_value), std::get<std::string>(other._value));
}

}  // namespace encneg
