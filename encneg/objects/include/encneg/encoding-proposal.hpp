#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "encneg/coding.hpp"
#include "encneg/encoding.hpp"

namespace encneg {

// One client preference of an Accept-Encoding header: a coding with an optional weight (the 'q' parameter).
// A proposal without weight is ordered as if it had weight 1, but still compares different from an explicit 1.
class EncodingProposal {
 public:
  // Implicit so that a Coding (or an Encoding) can be pushed directly as an unweighted proposal.
  EncodingProposal(Coding coding) noexcept : _coding(std::move(coding)) {}  // NOLINT(google-explicit-constructor)
  EncodingProposal(Encoding enc) noexcept : _coding(enc) {}                  // NOLINT(google-explicit-constructor)

  // Throws HttpError (without status) if weight is not within [0, 1].
  EncodingProposal(Coding coding, std::optional<float> weight);

  // Parses a single directive of the form '<coding>' or '<coding>;q=<value>'.
  // Returns std::nullopt if the coding is not a known Encoding: such directives are to be skipped.
  // Throws HttpError (without status, the caller decides) if the weight is malformed or outside [0, 1].
  static std::optional<EncodingProposal> Parse(std::string_view directive);

  [[nodiscard]] const Coding &coding() const noexcept { return _coding; }

  void setCoding(Coding coding) noexcept { _coding = std::move(coding); }

  [[nodiscard]] std::optional<float> weight() const noexcept { return _weight; }

  [[nodiscard]] float weightOrDefault() const noexcept { return _weight.value_or(1.0F); }

  // Throws HttpError (without status) if weight is not within [0, 1].
  void setWeight(std::optional<float> weight);

  // Appends the directive form of this proposal to 'out'.
  // The weight is written in the shortest decimal form that parses back to the same value ("0.8", "1", "0.0004").
  void appendTo(std::string &out) const;

  [[nodiscard]] std::string str() const;

  bool operator==(const EncodingProposal &) const = default;

  bool operator==(Encoding enc) const noexcept { return _coding == enc; }

 private:
  Coding _coding;
  std::optional<float> _weight;
};

}  // namespace encneg
