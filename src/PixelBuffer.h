#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

// Thrown when a buffer's byte length does not match its declared width/height.
class GeometryError : public std::invalid_argument {
public:
  explicit GeometryError(const std::string& what) : std::invalid_argument(what) {}
};

// Row-major RGBA8 image. Engine operations never modify their input buffer;
// each one returns a freshly allocated buffer with the same geometry.
struct PixelBuffer {
  int width = 0;
  int height = 0;
  std::vector<uint8_t> data; // width * height * 4 bytes, R,G,B,A

  PixelBuffer() = default;
  PixelBuffer(int w, int h);
  PixelBuffer(int w, int h, std::vector<uint8_t> bytes);

  // Buffer of the given size with every pixel set to (r,g,b,a).
  static PixelBuffer Filled(int w, int h, uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255);

  size_t PixelCount() const { return data.size() / 4; }
  bool Empty() const { return data.empty(); }

  uint8_t* At(int x, int y) { return &data[(static_cast<size_t>(y) * width + x) * 4]; }
  const uint8_t* At(int x, int y) const { return &data[(static_cast<size_t>(y) * width + x) * 4]; }

  // CV_8UC4 header over the pixel storage (no copy). Valid while this buffer is alive and unresized.
  cv::Mat AsMat();
  cv::Mat AsMat() const;
};

// Rejects negative dimensions, byte lengths not a multiple of 4, and lengths
// inconsistent with width*height*4. `operation` prefixes the error message.
void ValidateGeometry(const PixelBuffer& buffer, const char* operation);
