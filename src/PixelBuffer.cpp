#include "PixelBuffer.h"

#include <sstream>
#include <utility>

PixelBuffer::PixelBuffer(int w, int h)
    : width(w), height(h), data(static_cast<size_t>(w > 0 ? w : 0) * (h > 0 ? h : 0) * 4, 0) {}

PixelBuffer::PixelBuffer(int w, int h, std::vector<uint8_t> bytes)
    : width(w), height(h), data(std::move(bytes)) {}

PixelBuffer PixelBuffer::Filled(int w, int h, uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
  PixelBuffer out(w, h);
  for (size_t i = 0; i < out.data.size(); i += 4) {
    out.data[i] = r;
    out.data[i + 1] = g;
    out.data[i + 2] = b;
    out.data[i + 3] = a;
  }
  return out;
}

cv::Mat PixelBuffer::AsMat() {
  if (data.empty()) return cv::Mat(height, width, CV_8UC4);
  return cv::Mat(height, width, CV_8UC4, data.data());
}

cv::Mat PixelBuffer::AsMat() const {
  // cv::Mat has no const view type; callers must treat the result as read-only.
  if (data.empty()) return cv::Mat(height, width, CV_8UC4);
  return cv::Mat(height, width, CV_8UC4, const_cast<uint8_t*>(data.data()));
}

void ValidateGeometry(const PixelBuffer& buffer, const char* operation) {
  const char* op = operation ? operation : "pixel operation";

  if (buffer.width < 0 || buffer.height < 0) {
    std::ostringstream msg;
    msg << op << ": invalid dimensions " << buffer.width << "x" << buffer.height;
    throw GeometryError(msg.str());
  }
  if (buffer.data.size() % 4 != 0) {
    std::ostringstream msg;
    msg << op << ": buffer length " << buffer.data.size() << " is not a multiple of 4 (RGBA)";
    throw GeometryError(msg.str());
  }
  const size_t expected = static_cast<size_t>(buffer.width) * static_cast<size_t>(buffer.height) * 4;
  if (buffer.data.size() != expected) {
    std::ostringstream msg;
    msg << op << ": buffer length " << buffer.data.size() << " does not match "
        << buffer.width << "x" << buffer.height << "x4 = " << expected;
    throw GeometryError(msg.str());
  }
}
