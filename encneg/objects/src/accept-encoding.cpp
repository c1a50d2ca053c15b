#include "encneg/accept-encoding.hpp"

#include <algorithm>
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "encneg/coding.hpp"
#include "encneg/content-encoding.hpp"
#include "encneg/encoding-proposal.hpp"
#include "encneg/http-constants.hpp"
#include "encneg/http-error.hpp"
#include "encneg/http-headers.hpp"
#include "encneg/http-status-code.hpp"
#include "encneg/log.hpp"
#include "encneg/string-trim.hpp"
#include "encneg/weight-sort.hpp"

namespace encneg {

std::optional<AcceptEncoding> AcceptEncoding::FromHeaders(const http::Headers &headers) {
  const auto values = headers.getAll(http::AcceptEncoding);
  if (values.empty()) {
    return std::nullopt;
  }
  AcceptEncoding ret;
  for (std::string_view value : values) {
    ret.parseValue(value);
  }
  return ret;
}

AcceptEncoding AcceptEncoding::Parse(std::string_view value) {
  AcceptEncoding ret;
  ret.parseValue(value);
  return ret;
}

void AcceptEncoding::parseValue(std::string_view value) {
  for (auto part : value | std::views::split(http::kListSep)) {
    const std::string_view directive = TrimOws(std::string_view(part.begin(), part.end()));
    if (directive.empty()) {
      continue;
    }
    if (directive.size() == 1 && directive.front() == http::kWildcard) {
      _wildcard = true;
      continue;
    }
    auto proposal = EncodingProposal::Parse(directive);
    if (proposal) {
      _entries.push_back(std::move(*proposal));
    } else {
      log::debug("Skipping unknown content-coding in Accept-Encoding directive '{}'", directive);
    }
  }
}

void AcceptEncoding::sort() { SortByWeight(_entries); }

ContentEncoding AcceptEncoding::negotiate(std::span<const Coding> available) {
  sort();

  // Client preference drives the choice when it names a coding explicitly.
  for (const EncodingProposal &proposal : _entries) {
    if (std::ranges::find(available, proposal.coding()) != available.end()) {
      return proposal.coding();
    }
  }

  // Otherwise the wildcard accepts anything, we pick our own preferred coding.
  if (_wildcard && !available.empty()) {
    return available.front();
  }

  throw HttpError(http::StatusCodeNotAcceptable, "No suitable Content-Encoding found");
}

void AcceptEncoding::apply(http::Headers &headers) const { headers.insert(http::AcceptEncoding, value()); }

std::string AcceptEncoding::value() const {
  std::string out;
  for (const EncodingProposal &proposal : _entries) {
    if (!out.empty()) {
      out.append(http::kListSepWithSpace);
    }
    proposal.appendTo(out);
  }
  if (_wildcard) {
    if (!out.empty()) {
      out.append(http::kListSepWithSpace);
    }
    out.push_back(http::kWildcard);
  }
  return out;
}

}  // namespace encneg
