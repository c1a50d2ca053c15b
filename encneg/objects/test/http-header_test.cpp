#include "encneg/http-header.hpp"

#include <gtest/gtest.h>

#include <string_view>

#include "encneg/invalid_argument_exception.hpp"

namespace encneg {

TEST(HttpHeader, OwsCharacters) {
  for (char ch : std::string_view(" \t")) {
    EXPECT_TRUE(http::IsHeaderWhitespace(ch));
  }
  for (char ch : std::string_view("\r\n\v\fx,")) {
    EXPECT_FALSE(http::IsHeaderWhitespace(ch)) << static_cast<int>(ch);
  }
}

TEST(HttpHeader, NamesAreTokens) {
  for (std::string_view name : {"Accept-Encoding", "content-encoding", "VARY", "X-Forwarded-For", "a"}) {
    EXPECT_TRUE(http::IsValidHeaderName(name)) << name;
  }
  for (std::string_view name : {"", "Accept Encoding", "Accept-Encoding:", "Vary\r", "(Vary)", "Accept/Encoding"}) {
    EXPECT_FALSE(http::IsValidHeaderName(name)) << name;
  }
}

TEST(HttpHeader, ValuesWithoutControlCharacters) {
  EXPECT_TRUE(http::IsValidHeaderValue(""));
  EXPECT_TRUE(http::IsValidHeaderValue("gzip;q=0.5, br, *"));
  EXPECT_TRUE(http::IsValidHeaderValue("br,\tgzip ~ \"quoted\""));

  EXPECT_FALSE(http::IsValidHeaderValue("gzip\r\n"));
  EXPECT_FALSE(http::IsValidHeaderValue("gzip\nX-Injected: 1"));
  EXPECT_FALSE(http::IsValidHeaderValue(std::string_view("gz\0ip", 5)));
  EXPECT_FALSE(http::IsValidHeaderValue("del\x7F"));
  EXPECT_FALSE(http::IsValidHeaderValue("caf\xC3\xA9"));
}

TEST(HttpHeader, NameAndValue) {
  http::Header header("Accept-Encoding", "gzip, br");
  EXPECT_EQ(header.name(), "Accept-Encoding");
  EXPECT_EQ(header.value(), "gzip, br");
  EXPECT_EQ(header, http::Header("Accept-Encoding", " gzip, br\t"));
  EXPECT_NE(header, http::Header("accept-encoding", "gzip, br"));
}

TEST(HttpHeader, ValueIsStoredWithoutOws) {
  EXPECT_EQ(http::Header("Accept-Encoding", " \t br;q=0.5 \t").value(), "br;q=0.5");
  EXPECT_EQ(http::Header("Accept-Encoding", "\t\t").value(), "");
}

TEST(HttpHeader, SetValue) {
  http::Header header("Vary", "Origin");
  header.setValue("  Accept-Encoding ");
  EXPECT_EQ(header.name(), "Vary");
  EXPECT_EQ(header.value(), "Accept-Encoding");

  EXPECT_THROW(header.setValue("Origin\r\nX-Injected: 1"), invalid_argument);
  EXPECT_EQ(header.value(), "Accept-Encoding");
}

TEST(HttpHeader, ConstructionRejectsInvalidParts) {
  EXPECT_THROW(http::Header("Accept Encoding", "gzip"), invalid_argument);
  EXPECT_THROW(http::Header("", "gzip"), invalid_argument);
  EXPECT_THROW(http::Header("Accept-Encoding", "gzip\r\nX-Injected: 1"), invalid_argument);
  EXPECT_THROW(http::Header("Content-Encoding", "br\n"), invalid_argument);
}

}  // namespace encneg
