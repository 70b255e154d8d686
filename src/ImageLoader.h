#pragma once

#include "PixelBuffer.h"

#include <string>

// ImageLoader: file I/O for the front ends. The engine itself never touches files.
// Images are read through OpenCV and handed over as RGBA8 pixel buffers.
class ImageLoader {
public:
  // Loads any format imread understands; gray, BGR and BGRA inputs become RGBA
  // (opaque alpha unless the file carries one). Returns true on success.
  static bool LoadRGBA(const std::string& path, PixelBuffer& outRgba, std::string& outError);

  // Saves an RGBA buffer; the format follows the file extension.
  static bool Save(const std::string& path, const PixelBuffer& rgba, std::string& outError);
};
