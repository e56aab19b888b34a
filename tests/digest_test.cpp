#include "memobuild/digest.hpp"
#include "memobuild/fingerprint.hpp"

#include <gtest/gtest.h>

#include <unordered_set>

using namespace memobuild;

TEST(Digest, Sha256OfKnownInput) {
    EXPECT_EQ(sha256("hello").hex(), "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
    EXPECT_EQ(sha256("").hex(), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Digest, HexRoundTripAndShortForm) {
    Digest d = sha256("abc");
    auto parsed = Digest::from_hex(d.hex());
    ASSERT_TRUE(parsed);
    EXPECT_EQ(*parsed, d);
    EXPECT_EQ(d.short_hex(), d.hex().substr(0, 8));

    auto upper = Digest::from_hex("2CF24DBA5FB0A30E26E83B2AC5B9E29E1B161E5C1FA7425E73043362938B9824");
    ASSERT_TRUE(upper);
    EXPECT_EQ(*upper, sha256("hello"));
}

TEST(Digest, RejectsMalformedHex) {
    EXPECT_FALSE(Digest::from_hex("abc"));
    EXPECT_FALSE(Digest::from_hex(std::string(64, 'g')));
}

TEST(Digest, FieldsAreLengthPrefixed) {
    Hasher a;
    a.update_field("ab").update_field("c");
    Hasher b;
    b.update_field("a").update_field("bc");
    EXPECT_NE(a.finish(), b.finish());
}

TEST(Digest, UsableAsHashKey) {
    std::unordered_set<Digest> set{sha256("a"), sha256("b"), sha256("a")};
    EXPECT_EQ(set.size(), 2u);
}
