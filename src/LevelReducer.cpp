#include "LevelReducer.h"

#include "Color.h"

#include <algorithm>
#include <cmath>

#include <opencv2/core.hpp>

PixelBuffer LevelReducer::Quantize(const PixelBuffer& rgba, int levels) {
  ValidateGeometry(rgba, "Quantize");
  levels = ColorUtil::ClampInt(levels, 1, 256);
  const int step = 256 / levels;

  uchar table[256];
  for (int v = 0; v < 256; ++v) {
    table[v] = static_cast<uchar>(std::lround(static_cast<double>((v / step) * step)));
  }
  return ApplyChannelTable(rgba, table);
}

PixelBuffer LevelReducer::Posterize(const PixelBuffer& rgba, int levels) {
  ValidateGeometry(rgba, "Posterize");
  levels = ColorUtil::ClampInt(levels, 1, 256);
  const int factor = 256 / levels;

  uchar table[256];
  for (int v = 0; v < 256; ++v) {
    table[v] = static_cast<uchar>((v / factor) * factor);
  }
  return ApplyChannelTable(rgba, table);
}

PixelBuffer LevelReducer::Grayscale(const PixelBuffer& rgba) {
  ValidateGeometry(rgba, "Grayscale");
  PixelBuffer out(rgba.width, rgba.height);

  for (size_t i = 0; i < rgba.data.size(); i += 4) {
    const double lum = ColorUtil::Luminosity(rgba.data[i], rgba.data[i + 1], rgba.data[i + 2]);
    const uchar gray = static_cast<uchar>(ColorUtil::ClampInt(static_cast<int>(lum), 0, 255));
    out.data[i] = gray;
    out.data[i + 1] = gray;
    out.data[i + 2] = gray;
    out.data[i + 3] = rgba.data[i + 3];
  }
  return out;
}

PixelBuffer LevelReducer::ApplyChannelTable(const PixelBuffer& rgba, const uchar (&table)[256]) {
  PixelBuffer out(rgba.width, rgba.height);
  if (rgba.Empty()) return out;

  // 4-channel LUT: the same table on R,G,B and identity on A.
  cv::Mat lut(1, 256, CV_8UC4);
  for (int v = 0; v < 256; ++v) {
    lut.at<cv::Vec4b>(0, v) = cv::Vec4b(table[v], table[v], table[v], static_cast<uchar>(v));
  }

  cv::Mat dst = out.AsMat();
  cv::LUT(rgba.AsMat(), lut, dst);
  return out;
}
