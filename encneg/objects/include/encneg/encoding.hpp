#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

#include "encneg/http-constants.hpp"
#include "encneg/string-equal-ignore-case.hpp"

namespace encneg {

// Content-codings known to encneg (IANA HTTP Content Coding Registry).
enum class Encoding : std::uint8_t {
  gzip,
  deflate,
  br,
  zstd,
  compress,
  identity,  // should be last
};

inline constexpr std::underlying_type_t<Encoding> kNbContentEncodings =
    static_cast<std::underlying_type_t<Encoding>>(Encoding::identity) + 1;

// Get string representation of encoding for use in HTTP headers.
constexpr std::string_view GetEncodingStr(Encoding enc) {
  constexpr std::string_view kEncodingStrs[kNbContentEncodings] = {
      http::gzip, http::deflate, http::br, http::zstd, http::compress, http::identity,
  };
  if (static_cast<std::underlying_type_t<Encoding>>(enc) >= kNbContentEncodings) [[unlikely]] {
    return "unknown";
  }
  return kEncodingStrs[static_cast<std::underlying_type_t<Encoding>>(enc)];
}

// Maps a content-coding token to its Encoding, ignoring case.
// The legacy 'x-gzip' and 'x-compress' aliases map to gzip and compress.
// Returns std::nullopt for tokens that are not known.
constexpr std::optional<Encoding> EncodingFromStr(std::string_view token) {
  for (std::underlying_type_t<Encoding> pos = 0; pos < kNbContentEncodings; ++pos) {
    if (CaseInsensitiveEqual(token, GetEncodingStr(static_cast<Encoding>(pos)))) {
      return static_cast<Encoding>(pos);
    }
  }
  if (CaseInsensitiveEqual(token, http::xgzip)) {
    return Encoding::gzip;
  }
  if (CaseInsensitiveEqual(token, http::xcompress)) {
    return Encoding::compress;
  }
  return std::nullopt;
}

}  // namespace encneg
