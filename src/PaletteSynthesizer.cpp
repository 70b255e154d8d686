#include "PaletteSynthesizer.h"

#include <algorithm>

#include <glog/logging.h>

namespace {
const double kTintShadeRatios[] = {0.25, 0.5, 0.75};
const double kBlendRatios[] = {0.33, 0.5, 0.66};
const Rgb kWhite{255, 255, 255};
const Rgb kBlack{0, 0, 0};
} // namespace

PaletteEntry PaletteSynthesizer::MakeEntry(const Rgb& c) {
  return PaletteEntry{c.r, c.g, c.b, ColorUtil::Luminosity(c)};
}

std::vector<PaletteEntry> PaletteSynthesizer::Synthesize(const std::vector<std::string>& baseHex) {
  std::vector<Rgb> base;
  base.reserve(baseHex.size());
  for (const std::string& hex : baseHex) base.push_back(ColorUtil::ParseHex(hex));

  std::vector<PaletteEntry> expanded;
  expanded.reserve(CandidateCount(base.size()));

  for (const Rgb& c : base) expanded.push_back(MakeEntry(c));

  for (const Rgb& c : base) {
    for (double ratio : kTintShadeRatios) expanded.push_back(MakeEntry(ColorUtil::Mix(c, kWhite, ratio)));
    for (double ratio : kTintShadeRatios) expanded.push_back(MakeEntry(ColorUtil::Mix(c, kBlack, ratio)));
  }

  for (size_t i = 0; i < base.size(); ++i) {
    for (size_t j = i + 1; j < base.size(); ++j) {
      for (double ratio : kBlendRatios) expanded.push_back(MakeEntry(ColorUtil::Mix(base[i], base[j], ratio)));
    }
  }

  // Matching scans candidates darkest first; equal luminosities keep generation order.
  std::stable_sort(expanded.begin(), expanded.end(),
                   [](const PaletteEntry& a, const PaletteEntry& b) { return a.luminosity < b.luminosity; });

  VLOG(1) << "Synthesize: " << base.size() << " base colors -> " << expanded.size() << " candidates";
  return expanded;
}
