#include "GuideGenerator.h"

#include "EdgeField.h"
#include "LevelReducer.h"
#include "PaletteMatcher.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

#include <glog/logging.h>

namespace {
bool SameRgb(const cv::Vec4b& a, const cv::Vec4b& b) {
  return a[0] == b[0] && a[1] == b[1] && a[2] == b[2];
}

uchar Darken(uchar v) {
  return static_cast<uchar>(std::max(0L, std::lround(v * GuideGenerator::kBorderDarkening)));
}
} // namespace

PixelBuffer GuideGenerator::Generate(const PixelBuffer& rgba, Mode mode, int level,
                                     const std::vector<std::string>& paletteHex) {
  ValidateGeometry(rgba, "GenerateGuide");

  switch (mode) {
    case Mode::Lines:
      return GenerateLines(rgba, level);
    case Mode::Blocks:
      return DarkenRegionBorders(FlattenColors(rgba, level, paletteHex));
  }
  throw std::invalid_argument("GenerateGuide: unknown mode");
}

PixelBuffer GuideGenerator::GenerateLines(const PixelBuffer& rgba, int level) {
  const EdgeField::DetailParams params = EdgeField::ParamsForDetail(level);
  VLOG(1) << "Lines guide: level " << level << ", threshold " << params.threshold << ", thickness "
          << params.thickness;
  return EdgeField::ThickenLines(EdgeField::DetectEdges(rgba, params.threshold), params.thickness);
}

PixelBuffer GuideGenerator::FlattenColors(const PixelBuffer& rgba, int level,
                                          const std::vector<std::string>& paletteHex) {
  PixelBuffer flat = LevelReducer::Posterize(rgba, level);
  if (!paletteHex.empty()) flat = PaletteMatcher::RemapToPalette(flat, paletteHex);
  return flat;
}

PixelBuffer GuideGenerator::DarkenRegionBorders(const PixelBuffer& flat) {
  PixelBuffer out = flat;
  if (flat.Empty()) return out;

  const cv::Mat src = flat.AsMat();
  cv::Mat dst = out.AsMat();

  for (int y = 0; y < src.rows; ++y) {
    const cv::Vec4b* row = src.ptr<cv::Vec4b>(y);
    const cv::Vec4b* below = (y + 1 < src.rows) ? src.ptr<cv::Vec4b>(y + 1) : nullptr;
    cv::Vec4b* dstRow = dst.ptr<cv::Vec4b>(y);

    for (int x = 0; x < src.cols; ++x) {
      const bool rightDiffers = (x + 1 < src.cols) && !SameRgb(row[x], row[x + 1]);
      const bool belowDiffers = below && !SameRgb(row[x], below[x]);
      if (!rightDiffers && !belowDiffers) continue;

      dstRow[x][0] = Darken(row[x][0]);
      dstRow[x][1] = Darken(row[x][1]);
      dstRow[x][2] = Darken(row[x][2]);
    }
  }
  return out;
}

std::vector<GuideGenerator::GuideContour> GuideGenerator::GenerateContours(const PixelBuffer& rgba, int level,
                                                                           const std::vector<std::string>& paletteHex,
                                                                           int minRegionSize, double epsilon) {
  ValidateGeometry(rgba, "GenerateContours");

  const PixelBuffer flat = FlattenColors(rgba, level, paletteHex);
  const std::map<int, RegionTracer::Region> regions = RegionTracer::SegmentRegions(flat, minRegionSize);
  const std::map<int, RegionTracer::Contour> traced =
      RegionTracer::TraceRegions(regions, flat.width, flat.height, epsilon);

  std::vector<GuideContour> contours;
  contours.reserve(traced.size());
  for (const auto& entry : traced) {
    const RegionTracer::Region& region = regions.at(entry.first);
    contours.push_back(GuideContour{region.color, entry.second});
  }
  return contours;
}

GuideGenerator::Mode GuideGenerator::ParseMode(const std::string& name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "lines") return Mode::Lines;
  if (lower == "blocks") return Mode::Blocks;
  throw std::invalid_argument("Unknown guide mode \"" + name + "\" (expected \"lines\" or \"blocks\")");
}

const char* GuideGenerator::ModeName(Mode mode) {
  switch (mode) {
    case Mode::Lines: return "lines";
    case Mode::Blocks: return "blocks";
  }
  return "";
}
