// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for object key encoding and decoding
 */

#include <gtest/gtest.h>

#include <string>

#include "object_key.hpp"
#include "upload_limits.hpp"

using namespace folio::upload;

namespace {
const std::string kSig = "24a7d564de30e1fd";
}

TEST(ObjectKeyTest, EncodesPlainName) {
  auto key = encodeKey(kSig, "book.pdf");
  ASSERT_TRUE(key.ok());
  EXPECT_EQ(key.value(), "uploads/24a7d564de30e1fd/book.pdf");
}

TEST(ObjectKeyTest, PercentEncodesReservedAndNonAscii) {
  EXPECT_EQ(urlEncode("my book (final) v2.pdf"), "my%20book%20%28final%29%20v2.pdf");
  EXPECT_EQ(urlEncode("a/b+c%.pdf"), "a%2Fb%2Bc%25.pdf");
  EXPECT_EQ(
    urlEncode("\xC3\x9Cn\xC3\xAF" "code r\xC3\xA9sum\xC3\xA9.pdf"),
    "%C3%9Cn%C3%AFcode%20r%C3%A9sum%C3%A9.pdf"
  );
  EXPECT_EQ(urlEncode("A-z_0.9~"), "A-z_0.9~");
}

TEST(ObjectKeyTest, DecodeReversesEncode) {
  const std::string name = "Chapter 3/4: notes & figures.pdf";
  auto key = encodeKey(kSig, name);
  ASSERT_TRUE(key.ok());

  auto decoded = decodeKey(key.value());
  ASSERT_TRUE(decoded.ok());
  EXPECT_EQ(decoded.value().signature, kSig);
  EXPECT_EQ(decoded.value().file_name, name);
}

TEST(ObjectKeyTest, UrlDecodeAcceptsLowercaseHex) {
  auto decoded = urlDecode("a%2fb");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, "a/b");
}

TEST(ObjectKeyTest, UrlDecodeRejectsBrokenEscapes) {
  EXPECT_FALSE(urlDecode("abc%").has_value());
  EXPECT_FALSE(urlDecode("abc%4").has_value());
  EXPECT_FALSE(urlDecode("abc%zz").has_value());
}

TEST(ObjectKeyTest, KeyLengthCeiling) {
  // "uploads/" + 16 + "/" leaves 999 bytes for the encoded name
  auto at_limit = encodeKey(kSig, std::string(999, 'a'));
  ASSERT_TRUE(at_limit.ok());
  EXPECT_EQ(at_limit.value().size(), kMaxKeyLength);

  auto over = encodeKey(kSig, std::string(1000, 'a'));
  ASSERT_FALSE(over.ok());
  EXPECT_EQ(over.error().code, ErrorCode::KeyTooLong);
}

TEST(ObjectKeyTest, LengthCountsEncodedBytes) {
  // 334 spaces encode to 1002 bytes
  auto over = encodeKey(kSig, std::string(334, ' '));
  ASSERT_FALSE(over.ok());
  EXPECT_EQ(over.error().code, ErrorCode::KeyTooLong);

  EXPECT_TRUE(encodeKey(kSig, std::string(333, ' ')).ok());
}

TEST(ObjectKeyTest, EncodeRejectsBadInput) {
  EXPECT_EQ(encodeKey("not-a-signature!", "a.pdf").error().code, ErrorCode::MalformedKey);
  EXPECT_EQ(encodeKey("24A7D564DE30E1FD", "a.pdf").error().code, ErrorCode::MalformedKey);
  EXPECT_EQ(encodeKey(kSig, "").error().code, ErrorCode::MalformedKey);
}

TEST(ObjectKeyTest, DecodeRejectsMalformedKeys) {
  const char* bad[] = {
    "",
    "book.pdf",
    "downloads/24a7d564de30e1fd/book.pdf",
    "uploads/24a7d564de30e1fd",
    "uploads/24a7d564de30e1fd/",
    "uploads/24a7d564de30e1fd/dir/book.pdf",
    "uploads/xyz/book.pdf",
    "uploads/24a7d564de30e1fd/bad%escape",
    "24a7d564de30e1fd_book.pdf",
  };
  for (const char* key : bad) {
    auto decoded = decodeKey(key);
    ASSERT_FALSE(decoded.ok()) << key;
    EXPECT_EQ(decoded.error().code, ErrorCode::MalformedKey) << key;
  }
}

TEST(ObjectKeyTest, SignaturePrefixScopesListing) {
  EXPECT_EQ(signaturePrefix(kSig), "uploads/24a7d564de30e1fd/");
  auto key = encodeKey(kSig, "x.pdf");
  ASSERT_TRUE(key.ok());
  EXPECT_EQ(key.value().rfind(signaturePrefix(kSig), 0), 0u);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
