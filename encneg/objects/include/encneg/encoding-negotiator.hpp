#pragma once

#include "encneg/content-encoding.hpp"
#include "encneg/http-headers.hpp"
#include "encneg/negotiation-config.hpp"

namespace encneg {

// Selects the Content-Encoding of responses from the Accept-Encoding header of requests, according to a
// NegotiationConfig. Immutable once constructed, it can be shared between threads.
class EncodingNegotiator {
 public:
  // Throws invalid_argument if the configuration is invalid.
  explicit EncodingNegotiator(NegotiationConfig config);

  // Selects the coding for a response to a request with the given headers.
  // A request without Accept-Encoding gets the configured missingHeaderEncoding.
  // Throws HttpError: with status 406 if nothing acceptable is available, with status 400 if the header is malformed.
  [[nodiscard]] ContentEncoding select(const http::Headers &requestHeaders) const;

  // Same as select, and in addition sets the Content-Encoding header of the response (unless identity is selected)
  // and adds Vary: Accept-Encoding if configured.
  ContentEncoding apply(const http::Headers &requestHeaders, http::Headers &responseHeaders) const;

  [[nodiscard]] const NegotiationConfig &config() const noexcept { return _config; }

 private:
  NegotiationConfig _config;
};

}  // namespace encneg
