#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "encneg/coding.hpp"
#include "encneg/content-encoding.hpp"
#include "encneg/encoding-proposal.hpp"
#include "encneg/http-constants.hpp"
#include "encneg/http-headers.hpp"
#include "encneg/vector.hpp"

namespace encneg {

// Client preferences for content-codings, as advertised by the Accept-Encoding header.
// RFC 7231 section 5.3.4 (RFC 9110 section 12.5.3).
//
// Entries are kept in declaration order until sort() (or negotiate()) reorders them by weight. The wildcard directive
// '*' is not an entry, it is remembered as a flag.
//
// Example:
//   AcceptEncoding accept;
//   accept.push(EncodingProposal(Encoding::br, 0.8F));
//   accept.push(EncodingProposal(Encoding::gzip, 0.4F));
//   accept.push(Encoding::identity);
//   ContentEncoding enc = accept.negotiate(available);  // br if available contains it
class AcceptEncoding {
 public:
  using Entries = vector<EncodingProposal>;
  using iterator = Entries::iterator;
  using const_iterator = Entries::const_iterator;

  AcceptEncoding() noexcept = default;

  // Parses all occurrences of the Accept-Encoding header, as if they were joined with commas.
  // Returns std::nullopt if the header is absent. A present header yields an object even if it has no usable
  // directive.
  // Directives naming a coding we do not know are skipped.
  // Throws HttpError (without status) if a directive has a malformed weight, in which case nothing is returned.
  static std::optional<AcceptEncoding> FromHeaders(const http::Headers &headers);

  // Parses a single Accept-Encoding header value, with the same rules as FromHeaders.
  static AcceptEncoding Parse(std::string_view value);

  void push(EncodingProposal proposal) { _entries.push_back(std::move(proposal)); }

  // Whether the wildcard directive '*' was given.
  [[nodiscard]] bool wildcard() const noexcept { return _wildcard; }

  void setWildcard(bool wildcard) noexcept { _wildcard = wildcard; }

  // Sort the entries by weight, highest first.
  // If two entries have the same weight, the one declared later comes first.
  void sort();

  // Determines the most suitable coding among 'available', given in server preference order.
  // Entries are sorted first, then the first entry present in 'available' wins. If none is and the wildcard was
  // given, the first available coding is returned.
  // Throws HttpError with status 406 if no suitable coding is found.
  ContentEncoding negotiate(std::span<const Coding> available);

  // Sets the Accept-Encoding header, replacing any previous occurrence.
  void apply(http::Headers &headers) const;

  static constexpr std::string_view name() noexcept { return http::AcceptEncoding; }

  // Renders the header value from the entries in their current order.
  [[nodiscard]] std::string value() const;

  [[nodiscard]] iterator begin() noexcept { return _entries.begin(); }
  [[nodiscard]] iterator end() noexcept { return _entries.end(); }
  [[nodiscard]] const_iterator begin() const noexcept { return _entries.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _entries.end(); }

  [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }
  [[nodiscard]] bool empty() const noexcept { return _entries.empty(); }

 private:
  void parseValue(std::string_view value);

  Entries _entries;
  bool _wildcard{false};
};

}  // namespace encneg
