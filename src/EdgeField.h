#pragma once

#include "PixelBuffer.h"

// EdgeField:
// - Sobel gradient magnitude on the luminosity plane, binarized into black lines on white.
// - Detail level (1..10) selects the threshold and the line thickness.
// - Line thickening by square dilation.
class EdgeField {
public:
  struct DetailParams {
    double threshold = 45.0; // gradient magnitude above this is an edge
    int thickness = 2;       // line thickness in pixels
  };

  // Lower levels: fewer, thicker lines. Higher levels: more, thinner lines.
  static DetailParams ParamsForDetail(int level);

  // Output pixels are opaque black (edge) or opaque white. The 1-pixel image
  // border is not convolved and is always white.
  static PixelBuffer DetectEdges(const PixelBuffer& rgba, double threshold);

  // Grows every black pixel (red channel == 0) into a (2*floor(thickness/2)+1)
  // square of opaque black; everything else becomes opaque white.
  // thickness <= 1 returns an unchanged copy.
  static PixelBuffer ThickenLines(const PixelBuffer& edges, int thickness);

  // Number of black (edge) pixels in a DetectEdges/ThickenLines result.
  static size_t CountEdgePixels(const PixelBuffer& edges);

private:
  static cv::Mat LuminosityPlane(const PixelBuffer& rgba);
};
