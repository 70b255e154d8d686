#include "ImageAnalyzer.h"

#include "Color.h"

#include <algorithm>
#include <cmath>

ImageAnalyzer::AnalysisResult ImageAnalyzer::Analyze(const PixelBuffer& rgba) {
  ValidateGeometry(rgba, "Analyze");
  AnalysisResult result;

  for (size_t i = 0; i < rgba.data.size(); i += 4) {
    if (rgba.data[i + 3] == 0) continue;

    const int r = rgba.data[i];
    const int g = rgba.data[i + 1];
    const int b = rgba.data[i + 2];
    ++result.red[r];
    ++result.green[g];
    ++result.blue[b];

    const int lum = static_cast<int>(ColorUtil::Luminosity(r, g, b));
    ++result.luminosity[std::min(lum, 255)];
  }

  const double totalPixels = static_cast<double>(rgba.PixelCount());
  if (totalPixels > 0.0) {
    double weighted = 0.0;
    for (int i = 0; i < 256; ++i) weighted += static_cast<double>(i) * result.luminosity[i];
    result.averageBrightness = weighted / totalPixels / 255.0;

    const double mean = result.averageBrightness * 255.0;
    double variance = 0.0;
    for (int i = 0; i < 256; ++i) {
      const double diff = static_cast<double>(i) - mean;
      variance += diff * diff * result.luminosity[i];
    }
    variance /= totalPixels;
    result.contrast = std::sqrt(variance) / 255.0;
  }

  result.dominantColors = ColorExtractor::ExtractDominantColors(rgba, kDominantColorCount, kDominantColorStride);
  return result;
}
