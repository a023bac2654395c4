#include <gtest/gtest.h>
#include "utils/utf8.hpp"

TEST(utf8, length) {
    EXPECT_EQ(0u, utf8_length(""));
    EXPECT_EQ(5u, utf8_length("plain"));
    EXPECT_EQ(4u, utf8_length("café"));
    EXPECT_EQ(3u, utf8_length("▏▌█"));
    EXPECT_EQ(1u, utf8_length("\xf0\x9f\x98\x80"));
}

TEST(utf8, offset) {
    EXPECT_EQ(0u, utf8_offset("café", 0));
    EXPECT_EQ(3u, utf8_offset("café", 3));
    EXPECT_EQ(5u, utf8_offset("café", 4));
    EXPECT_EQ(5u, utf8_offset("café", 100));
    EXPECT_EQ(6u, utf8_offset("▏▌█", 2));
    EXPECT_EQ(0u, utf8_offset("", 3));
}
