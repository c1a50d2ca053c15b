#pragma once

#include <fmt/format.h>

#include <string_view>

#include "encneg/accept-encoding.hpp"
#include "encneg/coding.hpp"
#include "encneg/content-encoding.hpp"
#include "encneg/encoding-proposal.hpp"
#include "encneg/encoding.hpp"

template <>
struct fmt::formatter<::encneg::Encoding> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(::encneg::Encoding enc, FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(::encneg::GetEncodingStr(enc), ctx);
  }
};

template <>
struct fmt::formatter<::encneg::Coding> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const ::encneg::Coding &coding, FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(coding.str(), ctx);
  }
};

template <>
struct fmt::formatter<::encneg::ContentEncoding> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const ::encneg::ContentEncoding &contentEncoding, FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(contentEncoding.value(), ctx);
  }
};

template <>
struct fmt::formatter<::encneg::EncodingProposal> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    if (ctx.begin() != ctx.end() && *ctx.begin() != '}') {
      throw format_error("invalid format");
    }
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const ::encneg::EncodingProposal &proposal, FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{}", proposal.str());
  }
};

template <>
struct fmt::formatter<::encneg::AcceptEncoding> {
  ///  - '{}' -> header value. For instance: "gzip;q=0.5, br, *"
  ///  - '{:d}' -> entries in their current order and wildcard flag. For instance: "{[gzip;q=0.5, br], wildcard: true}"
  bool detailed = false;

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin();
    auto end = ctx.end();
    if (it != end && *it == 'd') {
      detailed = true;
      ++it;
    }
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const ::encneg::AcceptEncoding &accept, FormatContext &ctx) const -> decltype(ctx.out()) {
    if (!detailed) {
      return fmt::format_to(ctx.out(), "{}", accept.value());
    }
    auto out = fmt::format_to(ctx.out(), "{{[");
    for (auto it = accept.begin(); it != accept.end(); ++it) {
      if (it != accept.begin()) {
        out = fmt::format_to(out, ", ");
      }
      out = fmt::format_to(out, "{}", *it);
    }
    return fmt::format_to(out, "], wildcard: {}}}", accept.wildcard());
  }
};
