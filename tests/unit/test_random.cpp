/**
 * Codeveil - Random Number Generator Tests
 */

#include <gtest/gtest.h>
#include "common/random.hpp"

#include <set>

using namespace codeveil;

TEST(RandomTest, NextIntRange) {
    Random rng(12345);

    for (int i = 0; i < 100; i++) {
        int val = rng.nextInt(0, 10);
        EXPECT_GE(val, 0);
        EXPECT_LE(val, 10);
    }
}

TEST(RandomTest, NextSizeRange) {
    Random rng(12345);

    for (int i = 0; i < 100; i++) {
        EXPECT_LT(rng.nextSize(36), 36u);
    }
    EXPECT_THROW(rng.nextSize(0), std::invalid_argument);
}

TEST(RandomTest, ChooseFromVector) {
    Random rng(12345);

    std::vector<std::string> items = {"a", "b", "c"};
    std::string chosen = rng.choose(items);

    EXPECT_TRUE(chosen == "a" || chosen == "b" || chosen == "c");

    std::vector<std::string> none;
    EXPECT_THROW(rng.choose(none), std::runtime_error);
}

TEST(RandomTest, TokenUsesAlphabet) {
    Random rng(7);
    const std::string alphabet = "0123456789abcdefghijklmnopqrstuvwxyz";

    std::string token = rng.nextToken(alphabet, 16);
    EXPECT_EQ(token.size(), 16u);
    for (char c : token) {
        EXPECT_NE(alphabet.find(c), std::string::npos);
    }

    EXPECT_EQ(rng.nextToken(alphabet, 0), "");
    EXPECT_THROW(rng.nextToken("", 4), std::invalid_argument);
}

TEST(RandomTest, TokensVary) {
    Random rng(99);

    std::set<std::string> seen;
    for (int i = 0; i < 50; i++) {
        seen.insert(rng.nextToken("abcdefghijklmnopqrstuvwxyz", 8));
    }
    EXPECT_GT(seen.size(), 45u);
}

TEST(RandomTest, Reproducibility) {
    Random rng1(42);
    Random rng2(42);

    for (int i = 0; i < 100; i++) {
        EXPECT_EQ(rng1.nextInt(0, 1000), rng2.nextInt(0, 1000));
    }
}

TEST(RandomTest, Reseed) {
    Random rng(1);
    std::string first = rng.nextToken("abcdef", 12);

    rng.seed(1);
    EXPECT_EQ(rng.getSeed(), 1u);
    EXPECT_EQ(rng.nextToken("abcdef", 12), first);
}
