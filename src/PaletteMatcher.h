#pragma once

#include "PaletteSynthesizer.h"
#include "PixelBuffer.h"

#include <string>
#include <vector>

// PaletteMatcher: remaps every pixel to its best synthesized palette entry.
//
// score = 1.5 * |pixelLuminosity - candidateLuminosity| + 0.15 * rgbDistance(pixel, candidate)
//
// Value structure dominates the match; hue only breaks near-ties. Candidates are
// scanned in ascending luminosity and only a strictly lower score replaces the
// current best, so output is deterministic.
class PaletteMatcher {
public:
  static constexpr double kLuminosityWeight = 1.5;
  static constexpr double kColorDistanceWeight = 0.15;

  // Synthesizes the expanded palette from `baseHex` and remaps. Alpha is copied through.
  // An empty base palette returns an unchanged copy.
  static PixelBuffer RemapToPalette(const PixelBuffer& rgba, const std::vector<std::string>& baseHex);

  // Remap against an already expanded, luminosity-sorted candidate list.
  static PixelBuffer RemapToEntries(const PixelBuffer& rgba, const std::vector<PaletteEntry>& candidates);

  // Best candidate for a single color; `candidates` must not be empty.
  static const PaletteEntry& FindBestMatch(int r, int g, int b, const std::vector<PaletteEntry>& candidates);
};
