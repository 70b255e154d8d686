#include "EdgeField.h"
#include "GuideGenerator.h"
#include "LevelReducer.h"
#include "PaletteSynthesizer.h"
#include "TestImages.h"

#include <set>
#include <stdexcept>

#include <gtest/gtest.h>

TEST(GuideGeneratorTest, BlocksDarkenPixelsBeforeAColorChange) {
  const PixelBuffer in = TestImages::SplitVertical(4, 2, Rgb{200, 200, 200}, Rgb{40, 40, 40});
  const PixelBuffer out = GuideGenerator::Generate(in, GuideGenerator::Mode::Blocks, 5);

  // Posterize(5): 200 -> 153, 40 -> 0. Only x=1 has a differing right neighbor.
  for (int y = 0; y < 2; ++y) {
    EXPECT_EQ(TestImages::GetPixel(out, 0, y), (Rgb{153, 153, 153}));
    EXPECT_EQ(TestImages::GetPixel(out, 1, y), (Rgb{130, 130, 130}));
    EXPECT_EQ(TestImages::GetPixel(out, 2, y), (Rgb{0, 0, 0}));
    EXPECT_EQ(TestImages::GetPixel(out, 3, y), (Rgb{0, 0, 0}));
  }
}

TEST(GuideGeneratorTest, BlocksDarkenAboveHorizontalBorder) {
  const PixelBuffer in = TestImages::SplitHorizontal(2, 4, Rgb{255, 255, 255}, Rgb{0, 0, 0});
  const PixelBuffer out = GuideGenerator::Generate(in, GuideGenerator::Mode::Blocks, 2);

  // Posterize(2): 255 -> 128, 0 -> 0; row 1 sits above the change.
  EXPECT_EQ(TestImages::GetPixel(out, 0, 0), (Rgb{128, 128, 128}));
  EXPECT_EQ(TestImages::GetPixel(out, 0, 1), (Rgb{109, 109, 109}));
  EXPECT_EQ(TestImages::GetPixel(out, 1, 1), (Rgb{109, 109, 109}));
  EXPECT_EQ(TestImages::GetPixel(out, 0, 2), (Rgb{0, 0, 0}));
}

TEST(GuideGeneratorTest, BlocksKeepAlphaAndGeometry) {
  const PixelBuffer in = TestImages::Solid(7, 5, Rgb{10, 120, 240}, 77);
  const PixelBuffer out = GuideGenerator::Generate(in, GuideGenerator::Mode::Blocks, 5);
  EXPECT_EQ(out.width, 7);
  EXPECT_EQ(out.height, 5);
  EXPECT_EQ(out.data, LevelReducer::Posterize(in, 5).data);
}

TEST(GuideGeneratorTest, BlocksWithPaletteUseSynthesizedColors) {
  const std::vector<std::string> palette = {"#000000", "#FFFFFF"};
  const PixelBuffer in = TestImages::Solid(6, 6, Rgb{128, 128, 128});
  const PixelBuffer out = GuideGenerator::Generate(in, GuideGenerator::Mode::Blocks, 5, palette);

  std::set<std::vector<int>> allowed;
  for (const PaletteEntry& e : PaletteSynthesizer::Synthesize(palette)) allowed.insert({e.r, e.g, e.b});
  for (size_t i = 0; i < out.data.size(); i += 4) {
    EXPECT_EQ(allowed.count({out.data[i], out.data[i + 1], out.data[i + 2]}), 1u);
  }
}

TEST(GuideGeneratorTest, LinesOnUniformImageAreBlank) {
  const PixelBuffer in = TestImages::Solid(10, 10, Rgb{60, 60, 60});
  for (int level = 1; level <= 10; ++level) {
    const PixelBuffer out = GuideGenerator::Generate(in, GuideGenerator::Mode::Lines, level);
    EXPECT_EQ(EdgeField::CountEdgePixels(out), 0u) << "level=" << level;
  }
}

TEST(GuideGeneratorTest, LowDetailDrawsThickerLines) {
  const PixelBuffer in = TestImages::SplitVertical(10, 10, Rgb{0, 0, 0}, Rgb{255, 255, 255});
  const size_t fine = EdgeField::CountEdgePixels(GuideGenerator::Generate(in, GuideGenerator::Mode::Lines, 10));
  const size_t coarse = EdgeField::CountEdgePixels(GuideGenerator::Generate(in, GuideGenerator::Mode::Lines, 1));
  EXPECT_EQ(fine, 16u);
  EXPECT_GT(coarse, fine);
}

TEST(GuideGeneratorTest, ContoursCarryRegionColors) {
  const PixelBuffer in = TestImages::SplitVertical(20, 20, Rgb{255, 0, 0}, Rgb{0, 0, 255});
  const std::vector<GuideGenerator::GuideContour> contours = GuideGenerator::GenerateContours(in, 10);
  ASSERT_EQ(contours.size(), 2u);
  EXPECT_EQ(contours[0].color, (Rgb{250, 0, 0}));
  EXPECT_EQ(contours[1].color, (Rgb{0, 0, 250}));
  for (const GuideGenerator::GuideContour& c : contours) EXPECT_GE(c.points.size(), 2u);
}

TEST(GuideGeneratorTest, ContoursSkipSmallRegions) {
  const PixelBuffer in = TestImages::SplitVertical(6, 6, Rgb{255, 0, 0}, Rgb{0, 0, 255});
  EXPECT_TRUE(GuideGenerator::GenerateContours(in, 10).empty());
  EXPECT_EQ(GuideGenerator::GenerateContours(in, 10, {}, 5).size(), 2u);
}

TEST(GuideGeneratorTest, ContoursAcceptNegativeEpsilon) {
  const PixelBuffer in = TestImages::SplitVertical(20, 20, Rgb{255, 0, 0}, Rgb{0, 0, 255});
  EXPECT_EQ(GuideGenerator::GenerateContours(in, 10, {}, 50, -2.0).size(), 2u);
}

TEST(GuideGeneratorTest, ParseMode) {
  EXPECT_EQ(GuideGenerator::ParseMode("lines"), GuideGenerator::Mode::Lines);
  EXPECT_EQ(GuideGenerator::ParseMode("LINES"), GuideGenerator::Mode::Lines);
  EXPECT_EQ(GuideGenerator::ParseMode("Blocks"), GuideGenerator::Mode::Blocks);
  EXPECT_THROW(GuideGenerator::ParseMode("dots"), std::invalid_argument);
  EXPECT_THROW(GuideGenerator::ParseMode(""), std::invalid_argument);
  EXPECT_STREQ(GuideGenerator::ModeName(GuideGenerator::Mode::Blocks), "blocks");
}

TEST(GuideGeneratorTest, RejectsMalformedBuffer) {
  const PixelBuffer bad(4, 4, std::vector<uint8_t>(60, 0));
  EXPECT_THROW(GuideGenerator::Generate(bad, GuideGenerator::Mode::Lines, 5), GeometryError);
  EXPECT_THROW(GuideGenerator::GenerateContours(bad, 5), GeometryError);
}
