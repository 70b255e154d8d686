#include "Color.h"

#include <gtest/gtest.h>

TEST(ColorTest, ParseHexAcceptsOptionalHashAndAnyCase) {
  EXPECT_EQ(ColorUtil::ParseHex("#FF8000"), (Rgb{255, 128, 0}));
  EXPECT_EQ(ColorUtil::ParseHex("ff8000"), (Rgb{255, 128, 0}));
  EXPECT_EQ(ColorUtil::ParseHex("#a1B2c3"), (Rgb{0xA1, 0xB2, 0xC3}));
}

TEST(ColorTest, MalformedHexIsBlack) {
  EXPECT_EQ(ColorUtil::ParseHex(""), (Rgb{0, 0, 0}));
  EXPECT_EQ(ColorUtil::ParseHex("#"), (Rgb{0, 0, 0}));
  EXPECT_EQ(ColorUtil::ParseHex("#12345"), (Rgb{0, 0, 0}));
  EXPECT_EQ(ColorUtil::ParseHex("#1234567"), (Rgb{0, 0, 0}));
  EXPECT_EQ(ColorUtil::ParseHex("#GG0000"), (Rgb{0, 0, 0}));
}

TEST(ColorTest, ToHexIsUppercaseAndClamped) {
  EXPECT_EQ(ColorUtil::ToHex(Rgb{171, 205, 239}), "#ABCDEF");
  EXPECT_EQ(ColorUtil::ToHex(Rgb{300, -5, 0}), "#FF0000");
}

TEST(ColorTest, Luminosity) {
  EXPECT_DOUBLE_EQ(ColorUtil::Luminosity(0, 0, 0), 0.0);
  EXPECT_NEAR(ColorUtil::Luminosity(255, 255, 255), 255.0, 1e-9);
  EXPECT_NEAR(ColorUtil::Luminosity(255, 0, 0), 76.245, 1e-9);
}

TEST(ColorTest, DistanceIsEuclidean) {
  EXPECT_DOUBLE_EQ(ColorUtil::Distance(0, 0, 0, 3, 4, 0), 5.0);
  EXPECT_DOUBLE_EQ(ColorUtil::Distance(Rgb{9, 9, 9}, Rgb{9, 9, 9}), 0.0);
}

TEST(ColorTest, MixRoundsPerChannel) {
  EXPECT_EQ(ColorUtil::Mix(Rgb{0, 0, 0}, Rgb{255, 255, 255}, 0.5), (Rgb{128, 128, 128}));
  EXPECT_EQ(ColorUtil::Mix(Rgb{200, 100, 0}, Rgb{0, 0, 0}, 0.0), (Rgb{200, 100, 0}));
  EXPECT_EQ(ColorUtil::Mix(Rgb{200, 100, 0}, Rgb{0, 0, 0}, 1.0), (Rgb{0, 0, 0}));
}

TEST(ColorTest, ClampInt) {
  EXPECT_EQ(ColorUtil::ClampInt(-3, 0, 255), 0);
  EXPECT_EQ(ColorUtil::ClampInt(300, 0, 255), 255);
  EXPECT_EQ(ColorUtil::ClampInt(42, 1, 256), 42);
}
