#pragma once

#include "PixelBuffer.h"

// LevelReducer: per-channel value reduction. Alpha is always preserved.
// Quantize and Posterize use the same bucket size but differ in rounding;
// both are kept because previews and guides depend on their exact output.
class LevelReducer {
public:
  // step = floor(256/levels); channel = round(floor(v/step) * step)
  static PixelBuffer Quantize(const PixelBuffer& rgba, int levels);

  // factor = floor(256/levels); channel = floor(v/factor) * factor
  static PixelBuffer Posterize(const PixelBuffer& rgba, int levels);

  // RGB replaced by truncated luminosity (0.299R + 0.587G + 0.114B).
  static PixelBuffer Grayscale(const PixelBuffer& rgba);

private:
  static PixelBuffer ApplyChannelTable(const PixelBuffer& rgba, const uchar (&table)[256]);
};
