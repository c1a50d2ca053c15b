#include "encneg/content-encoding.hpp"

#include <optional>
#include <ranges>
#include <string_view>

#include "encneg/coding.hpp"
#include "encneg/http-constants.hpp"
#include "encneg/http-headers.hpp"
#include "encneg/string-trim.hpp"

namespace encneg {

std::optional<ContentEncoding> ContentEncoding::FromHeaders(const http::Headers &headers) {
  std::optional<ContentEncoding> ret;
  for (std::string_view value : headers.getAll(http::ContentEncoding)) {
    for (auto part : value | std::views::split(http::kListSep)) {
      const std::string_view token = TrimOws(std::string_view(part.begin(), part.end()));
      if (!token.empty()) {
        ret.emplace(Coding::Parse(token));
      }
    }
  }
  return ret;
}

void ContentEncoding::apply(http::Headers &headers) const { headers.insert(http::ContentEncoding, value()); }

}  // namespace encneg
