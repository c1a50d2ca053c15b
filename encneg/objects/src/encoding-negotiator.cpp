#include "encneg/encoding-negotiator.hpp"

#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "encneg/accept-encoding.hpp"
#include "encneg/content-encoding.hpp"
#include "encneg/encoding-format.hpp"
#include "encneg/encoding.hpp"
#include "encneg/http-constants.hpp"
#include "encneg/http-error.hpp"
#include "encneg/http-headers.hpp"
#include "encneg/http-status-code.hpp"
#include "encneg/log.hpp"
#include "encneg/negotiation-config.hpp"
#include "encneg/string-equal-ignore-case.hpp"
#include "encneg/string-trim.hpp"

namespace encneg {

namespace {

bool VaryListsAcceptEncoding(const http::Headers &headers) {
  for (std::string_view value : headers.getAll(http::Vary)) {
    for (auto part : value | std::views::split(http::kListSep)) {
      const std::string_view token = TrimOws(std::string_view(part.begin(), part.end()));
      if (token.size() == 1 && token.front() == http::kWildcard) {
        return true;
      }
      if (CaseInsensitiveEqual(token, http::AcceptEncoding)) {
        return true;
      }
    }
  }
  return false;
}

}  // namespace

EncodingNegotiator::EncodingNegotiator(NegotiationConfig config) : _config(std::move(config)) { _config.validate(); }

ContentEncoding EncodingNegotiator::select(const http::Headers &requestHeaders) const {
  try {
    auto accept = AcceptEncoding::FromHeaders(requestHeaders);
    if (!accept) {
      return _config.missingHeaderEncoding;
    }
    ContentEncoding ret = accept->negotiate(std::span<const Coding>(_config.availableEncodings.data(),
                                                                    _config.availableEncodings.size()));
    log::debug("Negotiated Content-Encoding '{}' from Accept-Encoding {:d}", ret, *accept);
    return ret;
  } catch (HttpError &err) {
    if (!err.status()) {
      err.setStatus(http::StatusCodeBadRequest);
    }
    log::warn("Accept-Encoding negotiation failed with status {}: {}", err.statusOr(http::StatusCodeBadRequest),
              err.what());
    throw;
  }
}

ContentEncoding EncodingNegotiator::apply(const http::Headers &requestHeaders, http::Headers &responseHeaders) const {
  ContentEncoding ret = select(requestHeaders);
  if (ret != Encoding::identity) {
    ret.apply(responseHeaders);
    if (_config.addVaryHeader && !VaryListsAcceptEncoding(responseHeaders)) {
      responseHeaders.append(http::Vary, http::AcceptEncoding);
    }
  }
  return ret;
}

}  // namespace encneg
