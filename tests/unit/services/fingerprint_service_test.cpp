#include <gtest/gtest.h>

#include <string>

#include "docsage_core/services/fingerprint_service.hpp"

namespace docsage_core {

TEST(FingerprintServiceTest, Sha256MatchesKnownDigests) {
  EXPECT_EQ(FingerprintService::sha256_hex(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(FingerprintService::sha256_hex("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(FingerprintServiceTest, FingerprintIsLowercaseHex) {
  std::string digest = FingerprintService::fingerprint(Document({"one page"}));

  ASSERT_EQ(digest.size(), 64u);
  for (char c : digest) {
    EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << c;
  }
}

TEST(FingerprintServiceTest, SameContentSameFingerprint) {
  Document first({"alpha", "beta"}, "a.txt");
  Document second({"alpha", "beta"}, "elsewhere/b.txt");

  // The source path is not part of the content
  EXPECT_EQ(FingerprintService::fingerprint(first), FingerprintService::fingerprint(second));
}

TEST(FingerprintServiceTest, PageBoundariesChangeFingerprint) {
  Document split({"alpha", "beta"});
  Document moved({"alph", "abeta"});
  Document joined({"alphabeta"});

  std::string split_digest = FingerprintService::fingerprint(split);
  EXPECT_NE(split_digest, FingerprintService::fingerprint(moved));
  EXPECT_NE(split_digest, FingerprintService::fingerprint(joined));
}

TEST(FingerprintServiceTest, TextEditsChangeFingerprint) {
  EXPECT_NE(FingerprintService::fingerprint(Document({"version 1"})),
            FingerprintService::fingerprint(Document({"version 2"})));
}

TEST(FingerprintServiceTest, EmptyPagesStillCount) {
  EXPECT_NE(FingerprintService::fingerprint(Document({"text"})),
            FingerprintService::fingerprint(Document({"text", ""})));
}

}  // namespace docsage_core
