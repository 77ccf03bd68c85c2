#include "engine/hasher.hpp"
#include "engine/identifier.hpp"

#include <format>
#include <unordered_set>

#include <gtest/gtest.h>

using sid::engine::CanonicalForm;
using sid::engine::ErrorCode;
using sid::engine::Identifier;
using sid::engine::IdentifierMatch;

TEST(Hasher, DigestIsDeterministic) {
  auto a = sid::engine::hash_bytes("schema");
  auto b = sid::engine::hash_bytes("schema");
  ASSERT_EQ(a, b);
  ASSERT_EQ(a.hex().size(), 32u);
}

TEST(Hasher, DigestSeparatesInputs) {
  ASSERT_NE(sid::engine::hash_bytes("schema"), sid::engine::hash_bytes("schemb"));
  ASSERT_NE(sid::engine::hash_bytes(""), sid::engine::hash_bytes(std::string_view("\0", 1)));
}

TEST(Hasher, IncrementalMatchesOneShot) {
  sid::engine::Blake3Hasher hasher;
  hasher.update("sch");
  hasher.update("ema");
  ASSERT_EQ(hasher.finish(), sid::engine::hash_bytes("schema"));
}

TEST(Hasher, CanonicalDigestIsVersionTagged) {
  CanonicalForm form;
  form.bytes = {0x01, 0x02, 0x03};
  auto id = sid::engine::hash_canonical(form, 32);
  ASSERT_EQ(id.algorithm_version, sid::engine::kAlgorithmVersion);
  ASSERT_EQ(id.digest.size(), 32u);
  ASSERT_EQ(id.to_string(), "v1:" + id.digest);
}

TEST(Hasher, TruncatedDigestIsPrefix) {
  CanonicalForm form;
  form.bytes = {0xde, 0xad, 0xbe, 0xef};
  auto full = sid::engine::hash_canonical(form, 32);
  auto shorter = sid::engine::hash_canonical(form, 12);
  ASSERT_EQ(shorter.digest.size(), 12u);
  ASSERT_EQ(full.digest.substr(0, 12), shorter.digest);
}

TEST(Identifier, ParseRoundTrip) {
  auto parsed = Identifier::parse("v1:3F9AC21b");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->algorithm_version, 1u);
  EXPECT_EQ(parsed->digest, "3f9ac21b");
  EXPECT_EQ(parsed->to_string(), "v1:3f9ac21b");
  EXPECT_EQ(std::format("{}", *parsed), "v1:3f9ac21b");
}

TEST(Identifier, ParseRejectsMalformed) {
  for (const char *text : {"", "1:abcd", "v:abcd", "v0:abcd", "v1abcd", "v1:", "v1:xyz", "v1:ab cd"}) {
    auto parsed = Identifier::parse(text);
    ASSERT_FALSE(parsed.has_value()) << text;
    EXPECT_EQ(parsed.error().code, ErrorCode::InvalidIdentifier) << text;
  }
}

TEST(Identifier, VersionsAreNeverEqual) {
  Identifier v1{1, "3f9ac21b"};
  Identifier v2{2, "3f9ac21b"};
  EXPECT_NE(v1, v2);
  EXPECT_EQ(sid::engine::compare_identifiers(v1, v2), IdentifierMatch::Incomparable);
  EXPECT_EQ(sid::engine::compare_identifiers(v1, Identifier{1, "3f9ac21b"}), IdentifierMatch::Equal);
  EXPECT_EQ(sid::engine::compare_identifiers(v1, Identifier{1, "00000000"}), IdentifierMatch::Different);
}

TEST(Identifier, HashableInContainers) {
  std::unordered_set<Identifier> ids;
  ids.insert(Identifier{1, "aa"});
  ids.insert(Identifier{1, "aa"});
  ids.insert(Identifier{2, "aa"});
  EXPECT_EQ(ids.size(), 2u);
}
