#include <gtest/gtest.h>

#include <string_view>

#include "encneg/encneg.hpp"
#include "encneg/gtest-printers.hpp"

namespace encneg {

namespace {

http::Headers BrowserRequest() {
  http::Headers headers;
  headers.append("Host", "example.com");
  headers.append("User-Agent", "curl/8.5.0");
  headers.append(http::AcceptEncoding, "gzip;q=0.5");
  headers.append("Accept", "*/*");
  headers.append(http::AcceptEncoding, "br;q=0.9, deflate;q=0.2");
  return headers;
}

}  // namespace

TEST(ContentNegotiation, SeveralAcceptEncodingOccurrencesAreCombined) {
  EncodingNegotiator negotiator{NegotiationConfig{}};
  http::Headers response;
  response.append("Content-Type", "text/html");

  ContentEncoding selected = negotiator.apply(BrowserRequest(), response);

  EXPECT_EQ(selected, Encoding::br);
  EXPECT_EQ(response.get(http::ContentEncoding), "br");
  EXPECT_EQ(response.get(http::Vary), http::AcceptEncoding);
  EXPECT_EQ(response.size(), 3U);
}

TEST(ContentNegotiation, ServerPreferenceOnlyMattersForWildcard) {
  EncodingNegotiator negotiator{NegotiationConfig{}.withAvailableEncodings({Encoding::zstd, Encoding::gzip})};
  http::Headers request = BrowserRequest();

  EXPECT_EQ(negotiator.select(request), Encoding::gzip);

  request.append(http::AcceptEncoding, "*");
  EXPECT_EQ(negotiator.select(request), Encoding::gzip);

  request.insert(http::AcceptEncoding, "*");
  EXPECT_EQ(negotiator.select(request), Encoding::zstd);
}

TEST(ContentNegotiation, ExistingVaryIsKept) {
  EncodingNegotiator negotiator{NegotiationConfig{}};
  http::Headers response;
  response.append(http::Vary, "Origin, accept-encoding");

  static_cast<void>(negotiator.apply(BrowserRequest(), response));

  EXPECT_EQ(response.getAll(http::Vary).size(), 1U);
  EXPECT_EQ(response.get(http::Vary), "Origin, accept-encoding");
}

TEST(ContentNegotiation, IdentityLeavesResponseUntouched) {
  EncodingNegotiator negotiator{NegotiationConfig{}};
  http::Headers request;
  request.append(http::AcceptEncoding, "identity");
  http::Headers response;

  EXPECT_EQ(negotiator.apply(request, response), Encoding::identity);
  EXPECT_TRUE(response.empty());
}

TEST(ContentNegotiation, ResponseContentEncodingReadsBack) {
  EncodingNegotiator negotiator{NegotiationConfig{}.withVaryHeader(false)};
  http::Headers response;

  static_cast<void>(negotiator.apply(BrowserRequest(), response));

  auto contentEncoding = ContentEncoding::FromHeaders(response);
  ASSERT_TRUE(contentEncoding.has_value());
  EXPECT_EQ(contentEncoding->encoding(), Encoding::br);
  EXPECT_FALSE(response.contains(http::Vary));
}

TEST(ContentNegotiation, ErrorsCarryHttpStatus) {
  EncodingNegotiator negotiator{NegotiationConfig{}.withAvailableEncodings({Encoding::zstd})};

  http::Headers request;
  request.append(http::AcceptEncoding, "gzip, br");
  try {
    static_cast<void>(negotiator.select(request));
    FAIL() << "expected HttpError";
  } catch (const HttpError &err) {
    EXPECT_EQ(err.status(), http::StatusCodeNotAcceptable);
  }

  request.insert(http::AcceptEncoding, "zstd;q=high");
  try {
    static_cast<void>(negotiator.select(request));
    FAIL() << "expected HttpError";
  } catch (const HttpError &err) {
    EXPECT_EQ(err.status(), http::StatusCodeBadRequest);
  }

  request.insert(http::AcceptEncoding, "zstd;q=2");
  try {
    static_cast<void>(negotiator.select(request));
    FAIL() << "expected HttpError";
  } catch (const HttpError &err) {
    EXPECT_EQ(err.status(), http::StatusCodeBadRequest);
  }
}

}  // namespace encneg
