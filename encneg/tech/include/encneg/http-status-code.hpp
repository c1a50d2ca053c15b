#pragma once

#include <cstdint>

namespace encneg::http {

using StatusCode = int16_t;

inline constexpr StatusCode StatusCodeOK = 200;

inline constexpr StatusCode StatusCodeBadRequest = 400;
inline constexpr StatusCode StatusCodeNotAcceptable = 406;
inline constexpr StatusCode StatusCodeUnsupportedMediaType = 415;

inline constexpr StatusCode StatusCodeInternalServerError = 500;

}  // namespace encneg::http
