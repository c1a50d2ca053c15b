#pragma once

#include <string_view>

#include "encneg/http-status-code.hpp"

namespace encneg::http {

// Header names, in the spelling we emit. Lookups compare them ignoring case.
inline constexpr std::string_view AcceptEncoding = "Accept-Encoding";
inline constexpr std::string_view ContentEncoding = "Content-Encoding";
inline constexpr std::string_view Vary = "Vary";

inline constexpr std::string_view HeaderSep = ": ";

// Content-coding tokens (IANA HTTP Content Coding Registry), lowercase
inline constexpr std::string_view identity = "identity";
inline constexpr std::string_view gzip = "gzip";
inline constexpr std::string_view deflate = "deflate";
inline constexpr std::string_view zstd = "zstd";          // RFC 8878
inline constexpr std::string_view br = "br";              // RFC 7932 (Brotli)
inline constexpr std::string_view compress = "compress";  // RFC 9110 §8.4.1.1 (LZW)

// Legacy aliases that recipients SHOULD treat as equivalent (RFC 9110 §8.4.1)
inline constexpr std::string_view xgzip = "x-gzip";
inline constexpr std::string_view xcompress = "x-compress";

// Accept-Encoding directive syntax
inline constexpr char kWildcard = '*';
inline constexpr char kListSep = ',';
inline constexpr char kParamSep = ';';
inline constexpr std::string_view kListSepWithSpace = ", ";

// Reason phrases of the statuses negotiation can end with
inline constexpr std::string_view ReasonOK = "OK";                                        // 200
inline constexpr std::string_view ReasonBadRequest = "Bad Request";                       // 400
inline constexpr std::string_view ReasonNotAcceptable = "Not Acceptable";                 // 406
inline constexpr std::string_view ReasonUnsupportedMediaType = "Unsupported Media Type";  // 415
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";    // 500

// Empty for statuses not listed above.
constexpr std::string_view ReasonPhraseFor(http::StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeBadRequest:
      return ReasonBadRequest;
    case StatusCodeNotAcceptable:
      return ReasonNotAcceptable;
    case StatusCodeUnsupportedMediaType:
      return ReasonUnsupportedMediaType;
    case StatusCodeInternalServerError:
      return ReasonInternalServerError;
    default:
      return {};
  }
}

}  // namespace encneg::http
