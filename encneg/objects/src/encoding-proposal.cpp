#include "encneg/encoding-proposal.hpp"

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "encneg/coding.hpp"
#include "encneg/encoding.hpp"
#include "encneg/http-constants.hpp"
#include "encneg/http-error.hpp"
#include "encneg/string-equal-ignore-case.hpp"
#include "encneg/string-trim.hpp"

namespace encneg {

namespace {

// Checks that the weight is within [0, 1] and turns -0 into 0.
std::optional<float> ValidatedWeight(std::optional<float> weight) {
  if (!weight) {
    return weight;
  }
  // written so that NaN is rejected as well
  if (!(*weight >= 0.0F && *weight <= 1.0F)) {
    throw HttpError("Accept-Encoding weight {} is not within [0, 1]", *weight);
  }
  if (*weight == 0.0F) {
    return 0.0F;
  }
  return weight;
}

// Only the first parameter is examined, and it must be the weight.
float ParseWeight(std::string_view params) {
  const std::string_view param = TrimOws(params.substr(0, params.find(http::kParamSep)));
  const auto eqPos = param.find('=');
  if (eqPos == std::string_view::npos || !CaseInsensitiveEqual(TrimOws(param.substr(0, eqPos)), "q")) {
    throw HttpError("Invalid weight parameter '{}' in Accept-Encoding", param);
  }
  const std::string_view value = TrimOws(param.substr(eqPos + 1));
  const char *end = value.data() + value.size();
  float weight{};
  const auto [ptr, errc] = std::from_chars(value.data(), end, weight);
  if (errc != std::errc() || ptr != end) {
    throw HttpError("Invalid weight value '{}' in Accept-Encoding", value);
  }
  return weight;
}

}  // namespace

EncodingProposal::EncodingProposal(Coding coding, std::optional<float> weight)
    : _coding(std::move(coding)), _weight(ValidatedWeight(weight)) {}

std::optional<EncodingProposal> EncodingProposal::Parse(std::string_view directive) {
  const auto paramPos = directive.find(http::kParamSep);
  const auto enc = EncodingFromStr(TrimOws(directive.substr(0, paramPos)));
  if (!enc) {
    return std::nullopt;
  }
  if (paramPos == std::string_view::npos) {
    return EncodingProposal(*enc);
  }
  return EncodingProposal(*enc, ParseWeight(directive.substr(paramPos + 1)));
}

void EncodingProposal::setWeight(std::optional<float> weight) { _weight = ValidatedWeight(weight); }

void EncodingProposal::appendTo(std::string &out) const {
  out.append(_coding.str());
  if (!_weight) {
    return;
  }
  // Shortest fixed notation that parses back to the same float. 64 chars hold any float within [0, 1].
  char buf[64];
  const auto [ptr, errc] = std::to_chars(buf, buf + sizeof(buf), *_weight, std::chars_format::fixed);
  const std::string_view qvalue(buf, errc == std::errc() ? ptr : buf);
  out.push_back(http::kParamSep);
  out.append("q=");
  out.append(qvalue);
}

std::string EncodingProposal::str() const {
  std::string ret;
  appendTo(ret);
  return ret;
}

}  // namespace encneg
