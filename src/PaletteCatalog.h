#pragma once

#include <string>
#include <vector>

// Curated base palettes for palette-constrained guides and color snapping.
class PaletteCatalog {
public:
  enum class Category {
    Artist, // palettes associated with a painter
    Mood,   // palettes built around a mood
    Classic // generic palettes (grayscale, primaries, pastels)
  };

  struct Palette {
    std::string key;  // stable lookup key, e.g. "zorn"
    std::string name; // display name
    Category category = Category::Classic;
    std::string description;
    std::vector<std::string> colors; // base colors as "#RRGGBB"
  };

  // All palettes in display order.
  static const std::vector<Palette>& All();

  // nullptr when the key is unknown.
  static const Palette* Find(const std::string& key);

  // Base colors for `key`, or an empty list when the key is unknown.
  static std::vector<std::string> Colors(const std::string& key);

  static const char* CategoryName(Category category);
};
