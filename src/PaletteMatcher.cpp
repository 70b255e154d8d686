#include "PaletteMatcher.h"

#include "Color.h"

#include <cmath>
#include <limits>

#include <glog/logging.h>

PixelBuffer PaletteMatcher::RemapToPalette(const PixelBuffer& rgba, const std::vector<std::string>& baseHex) {
  ValidateGeometry(rgba, "RemapToPalette");
  if (baseHex.empty()) {
    LOG(WARNING) << "RemapToPalette called with an empty palette; returning the image unchanged";
    return rgba;
  }
  return RemapToEntries(rgba, PaletteSynthesizer::Synthesize(baseHex));
}

PixelBuffer PaletteMatcher::RemapToEntries(const PixelBuffer& rgba, const std::vector<PaletteEntry>& candidates) {
  ValidateGeometry(rgba, "RemapToEntries");
  if (candidates.empty()) return rgba;

  PixelBuffer out(rgba.width, rgba.height);
  const cv::Mat src = rgba.AsMat();
  cv::Mat dst = out.AsMat();

  for (int y = 0; y < src.rows; ++y) {
    const cv::Vec4b* srcRow = src.ptr<cv::Vec4b>(y);
    cv::Vec4b* dstRow = dst.ptr<cv::Vec4b>(y);

    for (int x = 0; x < src.cols; ++x) {
      const cv::Vec4b& p = srcRow[x];
      const PaletteEntry& best = FindBestMatch(p[0], p[1], p[2], candidates);
      dstRow[x] = cv::Vec4b(static_cast<uchar>(best.r), static_cast<uchar>(best.g),
                            static_cast<uchar>(best.b), p[3]);
    }
  }
  return out;
}

const PaletteEntry& PaletteMatcher::FindBestMatch(int r, int g, int b, const std::vector<PaletteEntry>& candidates) {
  const double pixelLuminosity = ColorUtil::Luminosity(r, g, b);

  double minScore = std::numeric_limits<double>::infinity();
  size_t bestIdx = 0;
  for (size_t i = 0; i < candidates.size(); ++i) {
    const PaletteEntry& c = candidates[i];
    const double luminosityDiff = std::abs(pixelLuminosity - c.luminosity);
    const double colorDist = ColorUtil::Distance(r, g, b, c.r, c.g, c.b);
    const double score = luminosityDiff * kLuminosityWeight + colorDist * kColorDistanceWeight;
    if (score < minScore) {
      minScore = score;
      bestIdx = i;
    }
  }
  return candidates[bestIdx];
}
