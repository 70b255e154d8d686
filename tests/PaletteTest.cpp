#include "PaletteCatalog.h"
#include "PaletteMatcher.h"
#include "PaletteSynthesizer.h"
#include "TestImages.h"

#include <set>

#include <gtest/gtest.h>

namespace {
const std::vector<std::string> kBlackWhite = {"#000000", "#FFFFFF"};
} // namespace

TEST(PaletteSynthesizerTest, CandidateCountFormula) {
  EXPECT_EQ(PaletteSynthesizer::CandidateCount(0), 0u);
  EXPECT_EQ(PaletteSynthesizer::CandidateCount(1), 7u);
  EXPECT_EQ(PaletteSynthesizer::CandidateCount(2), 17u);
  EXPECT_EQ(PaletteSynthesizer::CandidateCount(8), 56u + 84u);
}

TEST(PaletteSynthesizerTest, SynthesizedSizeMatchesFormula) {
  const std::vector<std::string> base = {"#FF0000", "#00FF00", "#0000FF", "#808080", "#123456"};
  for (size_t n = 0; n <= base.size(); ++n) {
    const std::vector<std::string> subset(base.begin(), base.begin() + n);
    EXPECT_EQ(PaletteSynthesizer::Synthesize(subset).size(), PaletteSynthesizer::CandidateCount(n));
  }
}

TEST(PaletteSynthesizerTest, BlackAndWhiteGivesSeventeenSortedCandidates) {
  const std::vector<PaletteEntry> entries = PaletteSynthesizer::Synthesize(kBlackWhite);
  ASSERT_EQ(entries.size(), 17u);
  for (size_t i = 1; i < entries.size(); ++i) {
    EXPECT_LE(entries[i - 1].luminosity, entries[i].luminosity);
  }
  EXPECT_EQ(entries.front().r, 0);
  EXPECT_EQ(entries.back().r, 255);
}

TEST(PaletteMatcherTest, MidGrayMapsToMidGray) {
  const PixelBuffer in = TestImages::Solid(1, 1, Rgb{128, 128, 128});
  const PixelBuffer out = PaletteMatcher::RemapToPalette(in, kBlackWhite);
  EXPECT_EQ(TestImages::GetPixel(out, 0, 0), (Rgb{128, 128, 128}));
}

TEST(PaletteMatcherTest, ExactBaseColorWins) {
  const std::vector<PaletteEntry> entries = PaletteSynthesizer::Synthesize({"#FF0000", "#0000FF"});
  const PaletteEntry& best = PaletteMatcher::FindBestMatch(255, 0, 0, entries);
  EXPECT_EQ(best.r, 255);
  EXPECT_EQ(best.g, 0);
  EXPECT_EQ(best.b, 0);
}

TEST(PaletteMatcherTest, EveryOutputPixelIsACandidate) {
  PixelBuffer in(16, 16);
  for (int y = 0; y < 16; ++y) {
    for (int x = 0; x < 16; ++x) TestImages::SetPixel(in, x, y, Rgb{x * 16, y * 16, 255 - x * 8}, 200);
  }
  const std::vector<std::string> base = {"#8B4513", "#FFD700", "#1A1410"};
  const std::vector<PaletteEntry> entries = PaletteSynthesizer::Synthesize(base);
  std::set<std::vector<int>> allowed;
  for (const PaletteEntry& e : entries) allowed.insert({e.r, e.g, e.b});

  const PixelBuffer out = PaletteMatcher::RemapToPalette(in, base);
  ASSERT_EQ(out.data.size(), in.data.size());
  for (size_t i = 0; i < out.data.size(); i += 4) {
    EXPECT_TRUE(allowed.count({out.data[i], out.data[i + 1], out.data[i + 2]}) == 1);
    EXPECT_EQ(out.data[i + 3], 200);
  }
}

TEST(PaletteMatcherTest, EmptyPaletteReturnsUnchangedCopy) {
  const PixelBuffer in = TestImages::SplitVertical(4, 4, Rgb{1, 2, 3}, Rgb{200, 100, 50});
  EXPECT_EQ(PaletteMatcher::RemapToPalette(in, {}).data, in.data);
}

TEST(PaletteCatalogTest, HasAllPalettesWithUniqueKeys) {
  const std::vector<PaletteCatalog::Palette>& all = PaletteCatalog::All();
  EXPECT_EQ(all.size(), 13u);
  std::set<std::string> keys;
  for (const PaletteCatalog::Palette& p : all) {
    EXPECT_TRUE(keys.insert(p.key).second) << p.key;
    EXPECT_FALSE(p.colors.empty()) << p.key;
    for (const std::string& hex : p.colors) {
      EXPECT_EQ(hex.size(), 7u) << p.key;
      EXPECT_EQ(ColorUtil::ToHex(ColorUtil::ParseHex(hex)), hex) << p.key;
    }
  }
}

TEST(PaletteCatalogTest, FindByKey) {
  const PaletteCatalog::Palette* zorn = PaletteCatalog::Find("zorn");
  ASSERT_NE(zorn, nullptr);
  EXPECT_EQ(zorn->category, PaletteCatalog::Category::Artist);
  EXPECT_EQ(PaletteCatalog::Colors("grayscale").front(), "#000000");
  EXPECT_EQ(PaletteCatalog::Find("nope"), nullptr);
  EXPECT_TRUE(PaletteCatalog::Colors("nope").empty());
}

TEST(PaletteMatcherTest, RemapToEntriesMatchesRemapToPalette) {
  const PixelBuffer in = TestImages::SplitHorizontal(5, 4, Rgb{230, 40, 90}, Rgb{20, 160, 200});
  const std::vector<std::string> base = {"#FF0000", "#00FFFF", "#808080"};
  const PixelBuffer viaEntries = PaletteMatcher::RemapToEntries(in, PaletteSynthesizer::Synthesize(base));
  EXPECT_EQ(viaEntries.data, PaletteMatcher::RemapToPalette(in, base).data);
  EXPECT_EQ(PaletteMatcher::RemapToEntries(in, {}).data, in.data);
}
