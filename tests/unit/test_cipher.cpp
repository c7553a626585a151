/**
 * Codeveil - Key-derived Primitive Tests
 *
 * Tests for the seed hash, the keyed LCG and the XOR cipher shared by
 * lana-vortex and string-conceal.
 */

#include <gtest/gtest.h>
#include "codecs/cipher/cipher_base.hpp"

using namespace codeveil;
using namespace codeveil::cipher;

// ============================================================================
// Seed hash
// ============================================================================

TEST(SeedHashTest, KnownValues) {
    EXPECT_EQ(createSeed(""), 0);
    EXPECT_EQ(createSeed("a"), 97);
    EXPECT_EQ(createSeed("ab"), 97 * 31 + 98);
    EXPECT_EQ(createSeed("hello world"), 1794106052);
}

TEST(SeedHashTest, WrapsToSigned32) {
    EXPECT_EQ(createSeed("secret"), -906277200);
    EXPECT_EQ(createSeed("zzzzzzzzzz"), -1580979136);
}

TEST(SeedHashTest, UsesBytes) {
    // high-bit bytes count as 0..255, not as negative chars
    EXPECT_EQ(createSeed("\xff"), 255);
}

// ============================================================================
// KeyedRandom
// ============================================================================

TEST(KeyedRandomTest, SequenceFromZero) {
    KeyedRandom rng(0);

    EXPECT_NEAR(rng.next(), 49297.0 / 233280.0, 1e-12);
    EXPECT_EQ(rng.state(), 49297);

    EXPECT_NEAR(rng.next(), 165494.0 / 233280.0, 1e-12);
    EXPECT_EQ(rng.state(), 165494);
}

TEST(KeyedRandomTest, DrawsInUnitRangeForPositiveSeed) {
    KeyedRandom rng(createSeed("ab"));

    for (int i = 0; i < 1000; i++) {
        double draw = rng.next();
        EXPECT_GE(draw, 0.0);
        EXPECT_LT(draw, 1.0);
    }
}

TEST(KeyedRandomTest, NegativeSeedKeepsSign) {
    KeyedRandom rng(-10);

    double draw = rng.next();
    EXPECT_EQ(rng.state(), -43713);
    EXPECT_LT(draw, 0.0);
    EXPECT_GT(draw, -1.0);
}

TEST(KeyedRandomTest, SameSeedSameSequence) {
    KeyedRandom a(createSeed("secret"));
    KeyedRandom b(createSeed("secret"));

    for (int i = 0; i < 100; i++) {
        EXPECT_DOUBLE_EQ(a.next(), b.next());
    }
}

// ============================================================================
// XOR cipher
// ============================================================================

TEST(XorCipherTest, KnownValue) {
    EXPECT_EQ(xorCipher("hi", "k"), std::string("\x03\x02", 2));
}

TEST(XorCipherTest, KeyRepeats) {
    std::string out = xorCipher("aaaa", "ab");

    EXPECT_EQ(out[0], '\0');
    EXPECT_EQ(out[1], static_cast<char>('a' ^ 'b'));
    EXPECT_EQ(out[2], '\0');
    EXPECT_EQ(out[3], static_cast<char>('a' ^ 'b'));
}

TEST(XorCipherTest, SelfInverse) {
    std::string text = "function f(){ return \"\xc3\xa9\"; }";
    std::string key = "k3y!";

    std::string once = xorCipher(text, key);
    EXPECT_NE(once, text);
    EXPECT_EQ(xorCipher(once, key), text);
}

TEST(XorCipherTest, EmptyInputs) {
    EXPECT_EQ(xorCipher("", "key"), "");
    EXPECT_EQ(xorCipher("text", ""), "text");
}
