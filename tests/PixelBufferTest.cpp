#include "LevelReducer.h"
#include "PixelBuffer.h"

#include <string>

#include <gtest/gtest.h>

TEST(PixelBufferTest, FilledSetsEveryPixel) {
  const PixelBuffer buf = PixelBuffer::Filled(3, 2, 10, 20, 30, 40);
  ASSERT_EQ(buf.data.size(), 3u * 2u * 4u);
  EXPECT_EQ(buf.PixelCount(), 6u);
  for (size_t i = 0; i < buf.data.size(); i += 4) {
    EXPECT_EQ(buf.data[i], 10);
    EXPECT_EQ(buf.data[i + 1], 20);
    EXPECT_EQ(buf.data[i + 2], 30);
    EXPECT_EQ(buf.data[i + 3], 40);
  }
}

TEST(PixelBufferTest, AsMatSharesStorage) {
  PixelBuffer buf(2, 2);
  cv::Mat m = buf.AsMat();
  m.at<cv::Vec4b>(1, 0) = cv::Vec4b(1, 2, 3, 4);
  EXPECT_EQ(buf.At(0, 1)[0], 1);
  EXPECT_EQ(buf.At(0, 1)[3], 4);
}

TEST(PixelBufferTest, ValidateGeometryAcceptsConsistentBuffers) {
  EXPECT_NO_THROW(ValidateGeometry(PixelBuffer(4, 3), "Test"));
  EXPECT_NO_THROW(ValidateGeometry(PixelBuffer(), "Test"));
}

TEST(PixelBufferTest, ValidateGeometryRejectsNegativeDimensions) {
  const PixelBuffer buf(-1, 2, std::vector<uint8_t>());
  EXPECT_THROW(ValidateGeometry(buf, "Test"), GeometryError);
}

TEST(PixelBufferTest, ValidateGeometryRejectsPartialPixels) {
  const PixelBuffer buf(1, 1, std::vector<uint8_t>(5, 0));
  EXPECT_THROW(ValidateGeometry(buf, "Test"), GeometryError);
}

TEST(PixelBufferTest, ValidateGeometryRejectsLengthMismatch) {
  const PixelBuffer buf(2, 2, std::vector<uint8_t>(12, 0));
  try {
    ValidateGeometry(buf, "Quantize");
    FAIL() << "expected GeometryError";
  } catch (const GeometryError& e) {
    const std::string msg = e.what();
    EXPECT_NE(msg.find("Quantize"), std::string::npos);
    EXPECT_NE(msg.find("12"), std::string::npos);
    EXPECT_NE(msg.find("2x2"), std::string::npos);
  }
}

TEST(PixelBufferTest, GeometryErrorIsInvalidArgument) {
  const PixelBuffer buf(2, 2, std::vector<uint8_t>(4, 0));
  EXPECT_THROW(LevelReducer::Posterize(buf, 4), std::invalid_argument);
}
