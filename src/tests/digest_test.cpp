#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "crypto/digest.hpp"
#include "test_utils.hpp"

using namespace gridstore::crypto;

TEST(DigestTest, KnownVectors) {
  EXPECT_EQ(md5_hex(std::string()), "d41d8cd98f00b204e9800998ecf8427e");
  EXPECT_EQ(md5_hex(std::string("abc")), "900150983cd24fb0d6963f7d28e17f72");
  EXPECT_EQ(md5_hex(to_bytes("abcdefghi")), "8aa99b1f439ff71293e95357bac6fd94");
}

TEST(DigestTest, IncrementalMatchesOneShot) {
  Md5 md5;
  md5.update(std::string("abc"));
  md5.update(std::string("def"));
  md5.update(to_bytes("ghi"));
  EXPECT_EQ(md5.hex_digest(), md5_hex(std::string("abcdefghi")));
}

TEST(DigestTest, FinalizedDigestRejectsUpdates) {
  Md5 md5;
  md5.update(std::string("abc"));
  auto bytes = md5.digest();
  EXPECT_EQ(bytes.size(), Md5::DIGEST_SIZE);
  EXPECT_THROW(md5.update(std::string("more")), DigestError);
  EXPECT_THROW(md5.digest(), DigestError);
}

TEST(DigestTest, HexEncoding) {
  const uint8_t bytes[] = {0x00, 0x0f, 0xab, 0xff};
  EXPECT_EQ(to_hex(bytes, sizeof(bytes)), "000fabff");
}

TEST(DigestTest, RandomBytes) {
  EXPECT_TRUE(random_bytes(0).empty());
  auto first = random_bytes(32);
  auto second = random_bytes(32);
  EXPECT_EQ(first.size(), 32u);
  EXPECT_NE(first, second);
}
