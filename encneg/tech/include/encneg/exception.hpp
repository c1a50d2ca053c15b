#pragma once

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <iterator>
#include <utility>

namespace encneg {

// Base exception of the project. The message is stored inline (no dynamic allocation) and truncated with "..." when
// it does not fit.
class exception : public std::exception {
 public:
  static constexpr std::size_t kMsgMaxLen = 87;

  template <unsigned N>
  explicit exception(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
  {
    std::copy_n(str, N, _msg);
  }

  template <typename... Args>
  explicit exception(fmt::format_string<Args...> fmtStr, Args&&... args) {
    const auto res = fmt::format_to_n(_msg, kMsgMaxLen, fmtStr, std::forward<Args>(args)...);
    if (res.size > kMsgMaxLen) {
      static constexpr char kEllipsis[] = "...";
      std::copy_n(kEllipsis, sizeof(kEllipsis), _msg + kMsgMaxLen - (sizeof(kEllipsis) - 1U));
    } else {
      *res.out = '\0';
    }
  }

  [[nodiscard]] const char* what() const noexcept override { return _msg; }

 private:
  char _msg[kMsgMaxLen + 1];
};

}  // namespace encneg
