#pragma once

#include "Color.h"
#include "PixelBuffer.h"

#include <string>
#include <vector>

struct DominantColor {
  int r = 0;
  int g = 0;
  int b = 0;
  std::string hex; // "#RRGGBB", uppercase
};

// ColorExtractor:
// - Approximate k-means over a decimated pixel sample.
// - Runs a fixed number of refinement passes instead of iterating to convergence,
//   so the cost stays bounded on multi-megapixel buffers.
class ColorExtractor {
public:
  static constexpr int kRefinementPasses = 3;

  // Returns at most `colorCount` colors. `sampleStride` = 1 reads every pixel,
  // 4 reads every fourth pixel, and so on. Both are clamped to >= 1.
  static std::vector<DominantColor> ExtractDominantColors(const PixelBuffer& rgba, int colorCount = 5,
                                                          int sampleStride = 4);

  // Nearest base color by RGB distance, as uppercase "#RRGGBB".
  static std::string FindClosestPaletteColor(const Rgb& color, const std::vector<std::string>& paletteHex);

  // Keeps r/g/b and replaces each hex with the closest palette hex.
  static std::vector<DominantColor> MapColorsToPalette(const std::vector<DominantColor>& colors,
                                                       const std::vector<std::string>& paletteHex);

private:
  static std::vector<Rgb> SamplePixels(const PixelBuffer& rgba, int sampleStride);
  static std::vector<Rgb> InitCentroids(const std::vector<Rgb>& samples, int colorCount);
  static size_t NearestCentroid(const Rgb& sample, const std::vector<Rgb>& centroids);
};
