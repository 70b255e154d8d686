#pragma once

#include "Color.h"
#include "PixelBuffer.h"

#include <map>
#include <vector>

#include <opencv2/core.hpp>

// RegionTracer:
// 1) Segmentation: flood fill into 4-connected regions of near-uniform color.
// 2) Boundary tracing: Moore-neighbor walk along a region's edge.
// 3) Simplification: Ramer-Douglas-Peucker on the traced path.
// All three work with explicit queues/stacks and step caps; nothing recurses.
class RegionTracer {
public:
  static constexpr int kColorTolerance = 5;        // per channel, relative to the seed color
  static constexpr int kDefaultMinRegionSize = 50; // regions of this size or smaller are dropped
  static constexpr double kDefaultEpsilon = 2.5;
  static constexpr size_t kMaxTraceSteps = 10000;

  struct Region {
    Rgb color;                      // seed color
    std::vector<cv::Point> pixels;  // flood-fill order, seed first

    size_t Size() const { return pixels.size(); }
  };

  using Contour = std::vector<cv::Point>;

  // Regions keyed by id (0,1,2,... in raster discovery order). Regions with
  // size <= minSize are discarded but their pixels stay consumed.
  static std::map<int, Region> SegmentRegions(const PixelBuffer& rgba, int minSize = kDefaultMinRegionSize);

  // Moore-neighbor boundary walk from (startX,startY). Returns the raw path, or an
  // empty path when the region has fewer than 3 pixels or the walk yields fewer
  // than 4 points.
  static Contour TraceContour(const Region& region, int width, int height, int startX, int startY);

  // Ramer-Douglas-Peucker. Never longer than the input; keeps first and last point.
  // Inputs with fewer than 3 points are returned unchanged. Negative epsilon counts as 0.
  static Contour SimplifyContour(const Contour& points, double epsilon = kDefaultEpsilon);

  // Trace + simplify every region, starting from its seed pixel. Contours
  // shorter than 2 points are dropped. Keys match the input map.
  static std::map<int, Contour> TraceRegions(const std::map<int, Region>& regions, int width, int height,
                                             double epsilon = kDefaultEpsilon);

private:
  class VisitedMask;

  static Region FloodFillRegion(const PixelBuffer& rgba, int startX, int startY, VisitedMask& visited);
  static double PerpendicularDistance(const cv::Point& p, const cv::Point& lineStart, const cv::Point& lineEnd);
};
