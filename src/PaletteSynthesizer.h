#pragma once

#include "Color.h"

#include <string>
#include <vector>

struct PaletteEntry {
  int r = 0;
  int g = 0;
  int b = 0;
  double luminosity = 0.0;
};

// PaletteSynthesizer: expands a small base palette the way a painter mixes on a palette.
// For N base colors the result holds N*7 + C(N,2)*3 entries:
//   - each base color
//   - 3 tints (toward white at 0.25 / 0.5 / 0.75)
//   - 3 shades (toward black at 0.25 / 0.5 / 0.75)
//   - 3 blends per unordered pair (0.33 / 0.5 / 0.66)
// Identical entries are not merged. Keep base palettes small (~8 colors):
// the candidate count grows quadratically.
class PaletteSynthesizer {
public:
  // Entries stably sorted by ascending luminosity.
  static std::vector<PaletteEntry> Synthesize(const std::vector<std::string>& baseHex);

  static size_t CandidateCount(size_t baseCount) {
    return baseCount * 7 + (baseCount * (baseCount - 1) / 2) * 3;
  }

private:
  static PaletteEntry MakeEntry(const Rgb& c);
};
