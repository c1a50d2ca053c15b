#pragma once

#include <optional>
#include <string_view>
#include <utility>

#include "encneg/coding.hpp"
#include "encneg/encoding.hpp"
#include "encneg/http-constants.hpp"
#include "encneg/http-headers.hpp"

namespace encneg {

// The coding applied to a representation, as carried by the Content-Encoding header.
// This is the result of an Accept-Encoding negotiation.
class ContentEncoding {
 public:
  ContentEncoding(Coding coding) noexcept : _coding(std::move(coding)) {}  // NOLINT(google-explicit-constructor)
  ContentEncoding(Encoding enc) noexcept : _coding(enc) {}                  // NOLINT(google-explicit-constructor)

  // Reads the Content-Encoding header. When several codings are listed (in one or several occurrences), the last one
  // is returned as it is the outermost coding applied.
  // Returns std::nullopt if the header is absent or lists no coding.
  // Throws invalid_argument if a listed coding is not a valid token.
  static std::optional<ContentEncoding> FromHeaders(const http::Headers &headers);

  // Sets the Content-Encoding header, replacing any previous occurrence.
  void apply(http::Headers &headers) const;

  static constexpr std::string_view name() noexcept { return http::ContentEncoding; }

  [[nodiscard]] std::string_view value() const noexcept { return _coding.str(); }

  [[nodiscard]] const Coding &coding() const noexcept { return _coding; }

  [[nodiscard]] std::optional<Encoding> encoding() const noexcept { return _coding.encoding(); }

  bool operator==(const ContentEncoding &) const = default;

  bool operator==(Encoding enc) const noexcept { return _coding == enc; }

 private:
  Coding _coding;
};

}  // namespace encneg
