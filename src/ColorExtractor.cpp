#include "ColorExtractor.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include <glog/logging.h>

namespace {

struct ChannelSum {
  long long r = 0;
  long long g = 0;
  long long b = 0;
  long long count = 0;

  void Add(const Rgb& c) {
    r += c.r;
    g += c.g;
    b += c.b;
    ++count;
  }

  Rgb RoundedMean() const {
    const double n = static_cast<double>(count);
    return Rgb{static_cast<int>(std::lround(r / n)),
               static_cast<int>(std::lround(g / n)),
               static_cast<int>(std::lround(b / n))};
  }
};
} // namespace

std::vector<DominantColor> ColorExtractor::ExtractDominantColors(const PixelBuffer& rgba, int colorCount,
                                                                 int sampleStride) {
  ValidateGeometry(rgba, "ExtractDominantColors");
  colorCount = std::max(1, colorCount);
  sampleStride = std::max(1, sampleStride);

  const std::vector<Rgb> samples = SamplePixels(rgba, sampleStride);
  std::vector<Rgb> centroids = InitCentroids(samples, colorCount);

  for (int pass = 0; pass < kRefinementPasses; ++pass) {
    std::vector<ChannelSum> sums(centroids.size());
    for (const Rgb& s : samples) {
      sums[NearestCentroid(s, centroids)].Add(s);
    }

    // A centroid that attracted nothing keeps its previous value.
    for (size_t i = 0; i < centroids.size(); ++i) {
      if (sums[i].count > 0) {
        centroids[i] = sums[i].RoundedMean();
      } else {
        VLOG(2) << "Centroid " << i << " had no samples in pass " << pass;
      }
    }
  }

  VLOG(1) << "ExtractDominantColors: " << samples.size() << " samples, " << centroids.size()
          << " centroids";

  std::vector<DominantColor> result;
  result.reserve(centroids.size());
  for (const Rgb& c : centroids) {
    result.push_back(DominantColor{c.r, c.g, c.b, ColorUtil::ToHex(c)});
  }
  return result;
}

std::vector<Rgb> ColorExtractor::SamplePixels(const PixelBuffer& rgba, int sampleStride) {
  std::vector<Rgb> samples;
  const size_t step = static_cast<size_t>(sampleStride) * 4;
  samples.reserve(rgba.data.size() / step + 1);
  for (size_t i = 0; i < rgba.data.size(); i += step) {
    samples.push_back(Rgb{rgba.data[i], rgba.data[i + 1], rgba.data[i + 2]});
  }
  return samples;
}

std::vector<Rgb> ColorExtractor::InitCentroids(const std::vector<Rgb>& samples, int colorCount) {
  std::vector<Rgb> centroids;
  if (samples.empty()) return centroids;

  // Fewer samples than requested colors: one seed per sample.
  const size_t n = samples.size();
  const size_t k = std::min(n, static_cast<size_t>(colorCount));
  const size_t step = n / k;
  centroids.reserve(k);
  for (size_t i = 0; i < k; ++i) {
    centroids.push_back(samples[i * step]);
  }
  return centroids;
}

size_t ColorExtractor::NearestCentroid(const Rgb& sample, const std::vector<Rgb>& centroids) {
  double minDist = std::numeric_limits<double>::infinity();
  size_t best = 0;
  for (size_t i = 0; i < centroids.size(); ++i) {
    const double d = ColorUtil::Distance(sample, centroids[i]);
    if (d < minDist) {
      minDist = d;
      best = i;
    }
  }
  return best;
}

std::string ColorExtractor::FindClosestPaletteColor(const Rgb& color, const std::vector<std::string>& paletteHex) {
  if (paletteHex.empty()) return ColorUtil::ToHex(color);

  Rgb closest = ColorUtil::ParseHex(paletteHex.front());
  double minDist = std::numeric_limits<double>::infinity();
  for (const std::string& hex : paletteHex) {
    const Rgb candidate = ColorUtil::ParseHex(hex);
    const double d = ColorUtil::Distance(color, candidate);
    if (d < minDist) {
      minDist = d;
      closest = candidate;
    }
  }
  return ColorUtil::ToHex(closest);
}

std::vector<DominantColor> ColorExtractor::MapColorsToPalette(const std::vector<DominantColor>& colors,
                                                              const std::vector<std::string>& paletteHex) {
  std::vector<DominantColor> mapped;
  mapped.reserve(colors.size());
  for (const DominantColor& c : colors) {
    DominantColor m = c;
    const Rgb clamped{ColorUtil::ClampInt(c.r, 0, 255), ColorUtil::ClampInt(c.g, 0, 255),
                      ColorUtil::ClampInt(c.b, 0, 255)};
    m.hex = FindClosestPaletteColor(clamped, paletteHex);
    mapped.push_back(m);
  }
  return mapped;
}
