#pragma once

#include "GuideGenerator.h"

#include <string>
#include <vector>

// Serializes traced guide contours into a standalone SVG document.
class SvgWriter {
public:
  enum class Style {
    Fill,   // each region filled with its color, no stroke
    Outline // black 1px outlines, no fill
  };

  static std::string Write(const std::vector<GuideGenerator::GuideContour>& contours, int width, int height,
                           Style style = Style::Fill);

  // Writes the document to `path`. Returns false and sets outError on failure.
  static bool WriteFile(const std::string& path, const std::vector<GuideGenerator::GuideContour>& contours,
                        int width, int height, Style style, std::string& outError);

private:
  static std::string PathData(const std::vector<cv::Point>& points);
};
