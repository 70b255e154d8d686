#pragma once

#include "Color.h"
#include "PixelBuffer.h"
#include "RegionTracer.h"

#include <string>
#include <vector>

// GuideGenerator: paint-by-numbers guides.
// - Lines:  Sobel edges on the untouched source, thresholded and thickened per detail level.
// - Blocks: posterize (+ optional palette remap), then darken pixels sitting on a color change.
// - Contours: the blocks pre-processing followed by region tracing, for vector export.
class GuideGenerator {
public:
  enum class Mode {
    Lines,
    Blocks
  };

  struct GuideContour {
    Rgb color;                       // fill color of the traced region
    std::vector<cv::Point> points;   // simplified boundary
  };

  static constexpr double kBorderDarkening = 0.85;

  // Output has the geometry of `rgba`. `paletteHex` is only used in Blocks mode;
  // an empty list disables palette remapping.
  static PixelBuffer Generate(const PixelBuffer& rgba, Mode mode, int level,
                              const std::vector<std::string>& paletteHex = {});

  static std::vector<GuideContour> GenerateContours(const PixelBuffer& rgba, int level,
                                                    const std::vector<std::string>& paletteHex = {},
                                                    int minRegionSize = RegionTracer::kDefaultMinRegionSize,
                                                    double epsilon = RegionTracer::kDefaultEpsilon);

  // "lines" / "blocks", case-insensitive. Throws std::invalid_argument otherwise.
  static Mode ParseMode(const std::string& name);
  static const char* ModeName(Mode mode);

private:
  static PixelBuffer GenerateLines(const PixelBuffer& rgba, int level);
  static PixelBuffer FlattenColors(const PixelBuffer& rgba, int level, const std::vector<std::string>& paletteHex);
  static PixelBuffer DarkenRegionBorders(const PixelBuffer& flat);
};
