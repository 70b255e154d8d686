#include "LevelReducer.h"
#include "TestImages.h"

#include <gtest/gtest.h>

TEST(LevelReducerTest, QuantizeIsIdempotentForEveryLevel) {
  const PixelBuffer all = TestImages::AllByteValues();
  for (int levels = 1; levels <= 256; ++levels) {
    const PixelBuffer once = LevelReducer::Quantize(all, levels);
    const PixelBuffer twice = LevelReducer::Quantize(once, levels);
    ASSERT_EQ(once.data, twice.data) << "levels=" << levels;
  }
}

TEST(LevelReducerTest, QuantizeTwoLevels) {
  const PixelBuffer in = TestImages::Solid(1, 1, Rgb{200, 200, 200});
  const PixelBuffer out = LevelReducer::Quantize(in, 2);
  EXPECT_EQ(TestImages::GetPixel(out, 0, 0), (Rgb{128, 128, 128}));
}

TEST(LevelReducerTest, PosterizeFloorsToBucket) {
  const PixelBuffer in = TestImages::Solid(1, 1, Rgb{200, 63, 255});
  const PixelBuffer out = LevelReducer::Posterize(in, 4);
  EXPECT_EQ(TestImages::GetPixel(out, 0, 0), (Rgb{192, 0, 192}));
}

TEST(LevelReducerTest, AlphaIsPreserved) {
  const PixelBuffer all = TestImages::AllByteValues();
  const PixelBuffer quantized = LevelReducer::Quantize(all, 3);
  const PixelBuffer posterized = LevelReducer::Posterize(all, 3);
  const PixelBuffer gray = LevelReducer::Grayscale(all);
  for (size_t i = 3; i < all.data.size(); i += 4) {
    EXPECT_EQ(quantized.data[i], all.data[i]);
    EXPECT_EQ(posterized.data[i], all.data[i]);
    EXPECT_EQ(gray.data[i], all.data[i]);
  }
}

TEST(LevelReducerTest, LevelsAreClamped) {
  const PixelBuffer in = TestImages::Solid(2, 2, Rgb{250, 10, 128});
  EXPECT_EQ(LevelReducer::Quantize(in, 0).data, LevelReducer::Quantize(in, 1).data);
  EXPECT_EQ(LevelReducer::Posterize(in, 1000).data, in.data);
}

TEST(LevelReducerTest, InputIsNotModified) {
  const PixelBuffer in = TestImages::AllByteValues();
  const std::vector<uint8_t> before = in.data;
  LevelReducer::Posterize(in, 2);
  EXPECT_EQ(in.data, before);
}

TEST(LevelReducerTest, GrayscaleTruncatesLuminosity) {
  const PixelBuffer in = TestImages::Solid(1, 1, Rgb{255, 0, 0});
  EXPECT_EQ(TestImages::GetPixel(LevelReducer::Grayscale(in), 0, 0), (Rgb{76, 76, 76}));
}

TEST(LevelReducerTest, EmptyBufferYieldsEmptyBuffer) {
  EXPECT_TRUE(LevelReducer::Quantize(PixelBuffer(), 4).Empty());
}
