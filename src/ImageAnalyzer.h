#pragma once

#include "ColorExtractor.h"
#include "PixelBuffer.h"

#include <array>
#include <cstdint>
#include <vector>

// Tonal summary of an image for the value-study panel.
class ImageAnalyzer {
public:
  using Histogram = std::array<uint32_t, 256>;

  struct AnalysisResult {
    Histogram red{};
    Histogram green{};
    Histogram blue{};
    Histogram luminosity{};
    double averageBrightness = 0.0; // 0..1
    double contrast = 0.0;          // luminosity standard deviation, 0..1
    std::vector<DominantColor> dominantColors;
  };

  static constexpr int kDominantColorCount = 5;
  static constexpr int kDominantColorStride = 4;

  // Fully transparent pixels are left out of the histograms; brightness and
  // contrast are still normalized by the full pixel count.
  static AnalysisResult Analyze(const PixelBuffer& rgba);
};
