#include "RegionTracer.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <deque>
#include <utility>

#include <glog/logging.h>
#include <opencv2/imgproc.hpp>

namespace {

// 8-neighborhood, counter-clockwise starting with "right" (y grows downward).
const int kDirX[8] = {1, 1, 0, -1, -1, -1, 0, 1};
const int kDirY[8] = {0, -1, -1, -1, 0, 1, 1, 1};

// Membership test for one region, stored over the region's bounding box only.
class RegionMembership {
public:
  explicit RegionMembership(const std::vector<cv::Point>& pixels) {
    if (pixels.empty()) return;
    bounds_ = cv::boundingRect(pixels);
    mask_ = cv::Mat(bounds_.size(), CV_8UC1, cv::Scalar(0));
    for (const cv::Point& p : pixels) {
      mask_.at<uchar>(p.y - bounds_.y, p.x - bounds_.x) = 1;
    }
  }

  bool Contains(int x, int y) const {
    if (mask_.empty() || !bounds_.contains(cv::Point(x, y))) return false;
    return mask_.at<uchar>(y - bounds_.y, x - bounds_.x) != 0;
  }

private:
  cv::Rect bounds_;
  cv::Mat mask_;
};

// A region pixel is on the boundary when any 8-neighbor is outside the image or outside the region.
bool IsBoundary(const RegionMembership& region, int x, int y, int width, int height) {
  for (int d = 0; d < 8; ++d) {
    const int bx = x + kDirX[d];
    const int by = y + kDirY[d];
    if (bx < 0 || bx >= width || by < 0 || by >= height || !region.Contains(bx, by)) return true;
  }
  return false;
}

} // namespace

// Pixels already claimed by a fill during one SegmentRegions call.
class RegionTracer::VisitedMask {
public:
  VisitedMask(int width, int height) : mask_(height, width, CV_8UC1, cv::Scalar(0)) {}

  bool Test(int x, int y) const { return mask_.at<uchar>(y, x) != 0; }
  void Mark(int x, int y) { mask_.at<uchar>(y, x) = 1; }

private:
  cv::Mat mask_;
};

std::map<int, RegionTracer::Region> RegionTracer::SegmentRegions(const PixelBuffer& rgba, int minSize) {
  ValidateGeometry(rgba, "SegmentRegions");

  std::map<int, Region> regions;
  if (rgba.Empty()) return regions;

  VisitedMask visited(rgba.width, rgba.height);
  size_t discarded = 0;

  for (int y = 0; y < rgba.height; ++y) {
    for (int x = 0; x < rgba.width; ++x) {
      if (visited.Test(x, y)) continue;

      Region region = FloodFillRegion(rgba, x, y, visited);
      if (region.Size() > static_cast<size_t>(std::max(0, minSize))) {
        const int id = static_cast<int>(regions.size());
        regions.emplace(id, std::move(region));
      } else {
        ++discarded;
      }
    }
  }

  VLOG(1) << "SegmentRegions: " << regions.size() << " regions kept, " << discarded << " discarded (<= "
          << minSize << " px)";
  return regions;
}

RegionTracer::Region RegionTracer::FloodFillRegion(const PixelBuffer& rgba, int startX, int startY,
                                                   VisitedMask& visited) {
  Region region;
  const uint8_t* seed = rgba.At(startX, startY);
  region.color = Rgb{seed[0], seed[1], seed[2]};

  auto matches = [&](int x, int y) {
    const uint8_t* p = rgba.At(x, y);
    return std::abs(p[0] - region.color.r) <= kColorTolerance &&
           std::abs(p[1] - region.color.g) <= kColorTolerance &&
           std::abs(p[2] - region.color.b) <= kColorTolerance;
  };

  std::deque<cv::Point> queue;
  visited.Mark(startX, startY);
  queue.emplace_back(startX, startY);

  const int dx[4] = {1, -1, 0, 0};
  const int dy[4] = {0, 0, 1, -1};

  while (!queue.empty()) {
    const cv::Point p = queue.front();
    queue.pop_front();
    region.pixels.push_back(p);

    for (int i = 0; i < 4; ++i) {
      const int nx = p.x + dx[i];
      const int ny = p.y + dy[i];
      if (nx < 0 || nx >= rgba.width || ny < 0 || ny >= rgba.height) continue;
      if (visited.Test(nx, ny) || !matches(nx, ny)) continue;
      visited.Mark(nx, ny);
      queue.emplace_back(nx, ny);
    }
  }
  return region;
}

RegionTracer::Contour RegionTracer::TraceContour(const Region& region, int width, int height, int startX,
                                                 int startY) {
  Contour contour;
  if (region.Size() < 3) return contour;

  const RegionMembership membership(region.pixels);
  const size_t maxSteps = std::min(region.Size() * 2, kMaxTraceSteps);

  int x = startX;
  int y = startY;
  int direction = 0;
  size_t steps = 0;

  do {
    contour.emplace_back(x, y);

    bool found = false;
    for (int i = 0; i < 8; ++i) {
      const int d = (direction + i) % 8;
      const int nx = x + kDirX[d];
      const int ny = y + kDirY[d];
      if (membership.Contains(nx, ny) && IsBoundary(membership, nx, ny, width, height)) {
        x = nx;
        y = ny;
        direction = d;
        found = true;
        break;
      }
    }

    if (!found) break;
    ++steps;
  } while ((x != startX || y != startY) && steps < maxSteps && contour.size() < region.Size());

  if (contour.size() < 4) contour.clear();
  return contour;
}

double RegionTracer::PerpendicularDistance(const cv::Point& p, const cv::Point& lineStart,
                                           const cv::Point& lineEnd) {
  const double x = p.x, y = p.y;
  const double x1 = lineStart.x, y1 = lineStart.y;
  const double x2 = lineEnd.x, y2 = lineEnd.y;

  const double numerator = std::abs((y2 - y1) * x - (x2 - x1) * y + x2 * y1 - y2 * x1);
  const double denominator = std::sqrt((y2 - y1) * (y2 - y1) + (x2 - x1) * (x2 - x1));
  return denominator == 0.0 ? 0.0 : numerator / denominator;
}

RegionTracer::Contour RegionTracer::SimplifyContour(const Contour& points, double epsilon) {
  const size_t n = points.size();
  if (n < 3) return points;
  epsilon = std::max(0.0, epsilon);

  std::vector<char> keep(n, 0);
  keep.front() = 1;
  keep.back() = 1;

  // Spans still to examine. Each split adds at most one span net, so the
  // stack never holds more than n entries.
  std::vector<std::pair<size_t, size_t>> spans;
  spans.reserve(n);
  spans.emplace_back(0, n - 1);

  while (!spans.empty()) {
    const std::pair<size_t, size_t> span = spans.back();
    spans.pop_back();
    const size_t first = span.first;
    const size_t last = span.second;
    if (last - first < 2) continue;

    double maxDistance = 0.0;
    size_t index = first;
    for (size_t i = first + 1; i < last; ++i) {
      const double d = PerpendicularDistance(points[i], points[first], points[last]);
      if (d > maxDistance) {
        maxDistance = d;
        index = i;
      }
    }

    if (index > first && maxDistance > epsilon) {
      keep[index] = 1;
      spans.emplace_back(index, last);
      spans.emplace_back(first, index);
    }
  }

  Contour simplified;
  for (size_t i = 0; i < n; ++i) {
    if (keep[i]) simplified.push_back(points[i]);
  }
  return simplified;
}

std::map<int, RegionTracer::Contour> RegionTracer::TraceRegions(const std::map<int, Region>& regions, int width,
                                                                int height, double epsilon) {
  std::map<int, Contour> contours;
  for (const auto& entry : regions) {
    const Region& region = entry.second;
    if (region.pixels.empty()) continue;

    const cv::Point start = region.pixels.front();
    const Contour raw = TraceContour(region, width, height, start.x, start.y);
    if (raw.empty()) continue;

    Contour simplified = SimplifyContour(raw, epsilon);
    if (simplified.size() >= 2) contours.emplace(entry.first, std::move(simplified));
  }

  VLOG(1) << "TraceRegions: " << contours.size() << " of " << regions.size() << " regions traced";
  return contours;
}
