#pragma once

#include <fmt/format.h>

#include <optional>
#include <utility>

#include "encneg/exception.hpp"
#include "encneg/http-status-code.hpp"

namespace encneg {

// Error raised while interpreting HTTP content, optionally tagged with the HTTP status the caller should answer with.
class HttpError : public exception {
 public:
  template <unsigned N>
  explicit HttpError(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
      : exception(str) {}

  template <unsigned N>
  HttpError(http::StatusCode status, const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
      : exception(str), _status(status) {}

  template <typename... Args>
  explicit HttpError(fmt::format_string<Args...> fmtStr, Args &&...args)
      : exception(fmtStr, std::forward<Args>(args)...) {}

  template <typename... Args>
  HttpError(http::StatusCode status, fmt::format_string<Args...> fmtStr, Args &&...args)
      : exception(fmtStr, std::forward<Args>(args)...), _status(status) {}

  // The HTTP status attached to this error, if any.
  [[nodiscard]] std::optional<http::StatusCode> status() const noexcept { return _status; }

  [[nodiscard]] http::StatusCode statusOr(http::StatusCode defaultStatus) const noexcept {
    return _status.value_or(defaultStatus);
  }

  void setStatus(http::StatusCode status) noexcept { _status = status; }

 private:
  std::optional<http::StatusCode> _status;
};

}  // namespace encneg
