#include "Color.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace {

int HexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (lower >= 'a' && lower <= 'f') return lower - 'a' + 10;
  return -1;
}
} // namespace

namespace ColorUtil {

double Luminosity(int r, int g, int b) {
  return 0.299 * r + 0.587 * g + 0.114 * b;
}

double Distance(int r1, int g1, int b1, int r2, int g2, int b2) {
  const double dr = static_cast<double>(r1 - r2);
  const double dg = static_cast<double>(g1 - g2);
  const double db = static_cast<double>(b1 - b2);
  return std::sqrt(dr * dr + dg * dg + db * db);
}

Rgb ParseHex(const std::string& hex) {
  size_t start = 0;
  if (!hex.empty() && hex[0] == '#') start = 1;
  if (hex.size() - start != 6) return {};

  int channels[3] = {0, 0, 0};
  for (int i = 0; i < 3; ++i) {
    const int hi = HexDigit(hex[start + i * 2]);
    const int lo = HexDigit(hex[start + i * 2 + 1]);
    if (hi < 0 || lo < 0) return {};
    channels[i] = hi * 16 + lo;
  }
  return Rgb{channels[0], channels[1], channels[2]};
}

std::string ToHex(const Rgb& c) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "#%02X%02X%02X",
                ClampInt(c.r, 0, 255), ClampInt(c.g, 0, 255), ClampInt(c.b, 0, 255));
  return std::string(buf);
}

Rgb Mix(const Rgb& a, const Rgb& b, double ratio) {
  return Rgb{
      static_cast<int>(std::round(a.r * (1.0 - ratio) + b.r * ratio)),
      static_cast<int>(std::round(a.g * (1.0 - ratio) + b.g * ratio)),
      static_cast<int>(std::round(a.b * (1.0 - ratio) + b.b * ratio))};
}

} // namespace ColorUtil
