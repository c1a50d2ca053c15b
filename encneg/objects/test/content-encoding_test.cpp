#include "encneg/content-encoding.hpp"

#include <gtest/gtest.h>

#include <optional>

#include "encneg/coding.hpp"
#include "encneg/encoding.hpp"
#include "encneg/gtest-printers.hpp"
#include "encneg/http-constants.hpp"
#include "encneg/http-headers.hpp"
#include "encneg/invalid_argument_exception.hpp"

namespace encneg {

TEST(ContentEncodingTest, Accessors) {
  ContentEncoding enc(Encoding::br);
  EXPECT_EQ(ContentEncoding::name(), "Content-Encoding");
  EXPECT_EQ(enc.value(), "br");
  EXPECT_EQ(enc.encoding(), Encoding::br);
  EXPECT_EQ(enc.coding(), Encoding::br);
  EXPECT_EQ(enc, Encoding::br);
  EXPECT_NE(enc, Encoding::identity);
}

TEST(ContentEncodingTest, OpaqueCoding) {
  ContentEncoding enc(Coding::Other("lz4"));
  EXPECT_EQ(enc.value(), "lz4");
  EXPECT_EQ(enc.encoding(), std::nullopt);
  EXPECT_EQ(enc, ContentEncoding(Coding::Other("LZ4")));
}

TEST(ContentEncodingTest, ApplyThenRead) {
  http::Headers headers;
  ContentEncoding(Encoding::gzip).apply(headers);
  EXPECT_EQ(headers.get(http::ContentEncoding), "gzip");
  EXPECT_EQ(ContentEncoding::FromHeaders(headers), ContentEncoding(Encoding::gzip));

  ContentEncoding(Encoding::zstd).apply(headers);
  EXPECT_EQ(headers.getAll(http::ContentEncoding).size(), 1U);
  EXPECT_EQ(ContentEncoding::FromHeaders(headers), ContentEncoding(Encoding::zstd));
}

TEST(ContentEncodingTest, FromHeadersAbsent) {
  http::Headers headers;
  EXPECT_EQ(ContentEncoding::FromHeaders(headers), std::nullopt);
  headers.append(http::ContentEncoding, " , ");
  EXPECT_EQ(ContentEncoding::FromHeaders(headers), std::nullopt);
}

TEST(ContentEncodingTest, FromHeadersLastCodingIsOutermost) {
  http::Headers headers;
  headers.append(http::ContentEncoding, "deflate, gzip");
  EXPECT_EQ(ContentEncoding::FromHeaders(headers), ContentEncoding(Encoding::gzip));
  headers.append("content-encoding", "snappy");
  EXPECT_EQ(ContentEncoding::FromHeaders(headers), ContentEncoding(Coding::Other("snappy")));
}

TEST(ContentEncodingTest, FromHeadersInvalidToken) {
  http::Headers headers;
  headers.append(http::ContentEncoding, "gzip;q=1");
  EXPECT_THROW(ContentEncoding::FromHeaders(headers), invalid_argument);
}

}  // namespace encneg
