#include "PaletteCatalog.h"

namespace {

std::vector<PaletteCatalog::Palette> BuildPalettes() {
  using Category = PaletteCatalog::Category;
  std::vector<PaletteCatalog::Palette> palettes;

  // Artist palettes
  palettes.push_back({"zorn", "Anders Zorn", Category::Artist,
                      "Swedish painter known for warm, earthy tones",
                      {
                        "#FFE4B5", // Moccasin
                        "#D2B48C", // Tan
                        "#8B7355", // Burlywood4
                        "#654321", // Dark brown
                        "#C09070", // Burnt sienna
                        "#FF8C00", // Dark orange
                        "#FFFACD", // Lemon chiffon
                        "#228B22"  // Forest green
                      }});
  palettes.push_back({"rubenSargent", "John Singer Sargent", Category::Artist,
                      "Master of rich, saturated colors",
                      {"#4A0E0E", "#8B4513", "#CD853F", "#DAA520", "#FFD700", "#F0E68C", "#DEB887", "#E6E6FA"}});
  palettes.push_back({"rembrandtGold", "Rembrandt Gold", Category::Artist,
                      "Dutch master's signature warm palette",
                      {"#1A1410", "#3E2723", "#5D4037", "#8D6E63", "#A1887F", "#D7CCC8", "#FFCC99", "#FFE082"}});
  palettes.push_back({"vanGogh", "Van Gogh Nights", Category::Artist,
                      "Swirling blues and golds",
                      {"#0F3460", "#1A5FA0", "#3B82D6", "#60A5FA", "#FDB813", "#F7B801", "#1E1B1B", "#E8D5B7"}});

  // Mood palettes
  palettes.push_back({"moodyBlues", "Moody Blues", Category::Mood,
                      "Introspective and calm mood",
                      {"#001F3F", "#003D7A", "#0074D9", "#7FDBCA", "#39CCCC", "#2ECC40", "#AAAAAA", "#F2F2F2"}});
  palettes.push_back({"warmAutumn", "Warm Autumn", Category::Mood,
                      "Cozy and warm mood",
                      {"#8B4513", "#CD853F", "#DAA520", "#FFD700", "#FF8C00", "#FF7F50", "#D2691E", "#F5DEB3"}});
  palettes.push_back({"darkMystery", "Dark Mystery", Category::Mood,
                      "Deep, mysterious mood",
                      {"#1A0033", "#2D0052", "#440055", "#663366", "#9933CC", "#CC66FF", "#2F2F2F", "#666666"}});
  palettes.push_back({"passionRed", "Passion Red", Category::Mood,
                      "Bold, energetic mood",
                      {"#330000", "#660000", "#990000", "#CC0000", "#FF0000", "#FF3333", "#FF9999", "#FFE6E6"}});
  palettes.push_back({"forest", "Forest Whisper", Category::Mood,
                      "Natural, earthy mood",
                      {"#1B3A2C", "#2D5A3D", "#3D7856", "#52A674", "#7AC5A3", "#A8D5BA", "#8B7355", "#D2B48C"}});
  palettes.push_back({"oceanDepths", "Ocean Depths", Category::Mood,
                      "Cool, tranquil mood",
                      {"#0D1B2A", "#1B3A52", "#2A5678", "#4A8FBF", "#7DC3E8", "#B4E7FF", "#4F4F4F", "#CCCCCC"}});

  // Classic palettes
  palettes.push_back({"grayscale", "Grayscale", Category::Classic,
                      "Pure black and white with greys",
                      {"#000000", "#2B2B2B", "#555555", "#808080", "#AAAAAA", "#D3D3D3", "#EEEEEE", "#FFFFFF"}});
  palettes.push_back({"primary", "Primary Colors", Category::Classic,
                      "Red, Yellow, Blue and whites",
                      {"#FF0000", "#0000FF", "#FFFF00", "#FFFFFF", "#000000", "#00FF00", "#FF00FF", "#00FFFF"}});
  palettes.push_back({"pastel", "Pastel Dreams", Category::Classic,
                      "Soft, gentle pastel colors",
                      {
                        "#FFB3BA", // Pastel pink
                        "#FFCCCB", // Light pink
                        "#FFFFBA", // Pastel yellow
                        "#BAFFC9", // Pastel green
                        "#BAE1FF", // Pastel blue
                        "#E0BBE4", // Pastel purple
                        "#FFDFD3", // Pastel peach
                        "#D4F1F4"  // Pastel cyan
                      }});

  return palettes;
}

} // namespace

const std::vector<PaletteCatalog::Palette>& PaletteCatalog::All() {
  static const std::vector<Palette> palettes = BuildPalettes();
  return palettes;
}

const PaletteCatalog::Palette* PaletteCatalog::Find(const std::string& key) {
  for (const Palette& p : All()) {
    if (p.key == key) return &p;
  }
  return nullptr;
}

std::vector<std::string> PaletteCatalog::Colors(const std::string& key) {
  const Palette* p = Find(key);
  return p ? p->colors : std::vector<std::string>{};
}

const char* PaletteCatalog::CategoryName(Category category) {
  switch (category) {
    case Category::Artist: return "Artist Palettes";
    case Category::Mood: return "Mood Palettes";
    case Category::Classic: return "Classic Palettes";
  }
  return "";
}
