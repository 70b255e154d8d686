#include "EdgeField.h"

#include "Color.h"

#include <glog/logging.h>
#include <opencv2/imgproc.hpp>

namespace {
const cv::Vec4b kEdge(0, 0, 0, 255);
const cv::Vec4b kPaper(255, 255, 255, 255);
} // namespace

EdgeField::DetailParams EdgeField::ParamsForDetail(int level) {
  if (level <= 2) return {100.0, 4}; // only major edges, thick lines
  if (level <= 4) return {70.0, 3};
  if (level <= 6) return {45.0, 2};
  if (level <= 8) return {30.0, 2};
  return {20.0, 1};                  // maximum detail, thin lines
}

cv::Mat EdgeField::LuminosityPlane(const PixelBuffer& rgba) {
  cv::Mat gray(rgba.height, rgba.width, CV_32F);
  const cv::Mat src = rgba.AsMat();
  for (int y = 0; y < src.rows; ++y) {
    const cv::Vec4b* row = src.ptr<cv::Vec4b>(y);
    float* out = gray.ptr<float>(y);
    for (int x = 0; x < src.cols; ++x) {
      out[x] = static_cast<float>(ColorUtil::Luminosity(row[x][0], row[x][1], row[x][2]));
    }
  }
  return gray;
}

PixelBuffer EdgeField::DetectEdges(const PixelBuffer& rgba, double threshold) {
  ValidateGeometry(rgba, "DetectEdges");
  PixelBuffer out = PixelBuffer::Filled(rgba.width, rgba.height, 255, 255, 255, 255);
  if (rgba.width < 3 || rgba.height < 3) return out;

  const cv::Mat gray = LuminosityPlane(rgba);

  // 3x3 Sobel: Gx = [-1 0 1; -2 0 2; -1 0 1], Gy = its transpose.
  // Border pixels get whatever the border mode produces; they are skipped below.
  cv::Mat gx, gy, magnitude;
  cv::Sobel(gray, gx, CV_32F, 1, 0, 3);
  cv::Sobel(gray, gy, CV_32F, 0, 1, 3);
  cv::magnitude(gx, gy, magnitude);

  cv::Mat dst = out.AsMat();
  size_t edgeCount = 0;
  for (int y = 1; y < rgba.height - 1; ++y) {
    const float* magRow = magnitude.ptr<float>(y);
    cv::Vec4b* dstRow = dst.ptr<cv::Vec4b>(y);
    for (int x = 1; x < rgba.width - 1; ++x) {
      if (magRow[x] > threshold) {
        dstRow[x] = kEdge;
        ++edgeCount;
      }
    }
  }

  VLOG(1) << "DetectEdges: threshold " << threshold << ", " << edgeCount << " edge pixels";
  return out;
}

PixelBuffer EdgeField::ThickenLines(const PixelBuffer& edges, int thickness) {
  ValidateGeometry(edges, "ThickenLines");
  if (thickness <= 1 || edges.Empty()) return edges;

  const cv::Mat src = edges.AsMat();
  cv::Mat mask(src.size(), CV_8UC1, cv::Scalar(0));
  for (int y = 0; y < src.rows; ++y) {
    const cv::Vec4b* row = src.ptr<cv::Vec4b>(y);
    uchar* maskRow = mask.ptr<uchar>(y);
    for (int x = 0; x < src.cols; ++x) {
      maskRow[x] = row[x][0] == 0 ? 255 : 0;
    }
  }

  const int radius = thickness / 2;
  const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(2 * radius + 1, 2 * radius + 1));
  cv::dilate(mask, mask, kernel);

  PixelBuffer out(edges.width, edges.height);
  cv::Mat dst = out.AsMat();
  for (int y = 0; y < dst.rows; ++y) {
    const uchar* maskRow = mask.ptr<uchar>(y);
    cv::Vec4b* dstRow = dst.ptr<cv::Vec4b>(y);
    for (int x = 0; x < dst.cols; ++x) {
      dstRow[x] = maskRow[x] ? kEdge : kPaper;
    }
  }
  return out;
}

size_t EdgeField::CountEdgePixels(const PixelBuffer& edges) {
  size_t count = 0;
  for (size_t i = 0; i < edges.data.size(); i += 4) {
    if (edges.data[i] == 0 && edges.data[i + 1] == 0 && edges.data[i + 2] == 0) ++count;
  }
  return count;
}
