#pragma once

#include <algorithm>
#include <string>

// 8-bit RGB color used throughout the engine. Alpha lives only in pixel buffers.
struct Rgb {
  int r = 0;
  int g = 0;
  int b = 0;

  bool operator==(const Rgb& other) const { return r == other.r && g == other.g && b == other.b; }
  bool operator!=(const Rgb& other) const { return !(*this == other); }
};

namespace ColorUtil {

inline int ClampInt(int v, int lo, int hi) { return std::max(lo, std::min(v, hi)); }

// Perceptual luminosity: 0.299*R + 0.587*G + 0.114*B.
double Luminosity(int r, int g, int b);
inline double Luminosity(const Rgb& c) { return Luminosity(c.r, c.g, c.b); }

// Euclidean distance in RGB space.
double Distance(int r1, int g1, int b1, int r2, int g2, int b2);
inline double Distance(const Rgb& a, const Rgb& b) { return Distance(a.r, a.g, a.b, b.r, b.g, b.b); }

// Parses "#RRGGBB" or "RRGGBB", case-insensitive. Anything else parses as black.
Rgb ParseHex(const std::string& hex);

// Formats as uppercase "#RRGGBB". Channels are clamped to [0,255].
std::string ToHex(const Rgb& c);

// Linear blend a*(1-ratio) + b*ratio, rounded per channel.
Rgb Mix(const Rgb& a, const Rgb& b, double ratio);

} // namespace ColorUtil
