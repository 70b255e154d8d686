#include <stdio.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <string>
#include <vector>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include "ColorExtractor.h"
#include "GuideGenerator.h"
#include "ImageAnalyzer.h"
#include "ImageLoader.h"
#include "LevelReducer.h"
#include "PaletteCatalog.h"
#include "PaletteMatcher.h"
#include "SvgWriter.h"

using std::string;
using std::vector;

DEFINE_string(input, "", "input image (png/jpg)");
DEFINE_string(output, "", "output image, or .svg for contours mode");
DEFINE_string(mode, "blocks",
              "one of lines, blocks, quantize, posterize, grayscale, remap, colors, analyze, contours");
DEFINE_int32(level, 5, "guide detail level (1..10), or quantize/posterize level count");
DEFINE_string(palette, "", "palette key from the built-in catalog, e.g. zorn");
DEFINE_string(palette_colors, "", "base palette as comma-separated hex; overrides --palette");
DEFINE_int32(colors, 5, "number of dominant colors to extract");
DEFINE_int32(stride, 4, "pixel sampling stride for color extraction");
DEFINE_int32(min_region_size, 50, "regions of this many pixels or fewer are not traced");
DEFINE_double(epsilon, 2.5, "contour simplification tolerance in pixels");
DEFINE_string(svg_style, "fill", "fill or outline");
DEFINE_bool(list_palettes, false, "print the palette catalog and exit");

namespace {

void SplitString(const string& str, char delim, vector<string>* parts) {
  size_t start = 0;
  while (start <= str.size()) {
    size_t pos = str.find(delim, start);
    if (pos == string::npos) pos = str.size();
    string part = str.substr(start, pos - start);
    part.erase(std::remove_if(part.begin(), part.end(), [](unsigned char c) { return std::isspace(c); }),
               part.end());
    if (!part.empty()) parts->push_back(part);
    start = pos + 1;
  }
}

// Empty result means no palette was requested. An unknown key is an error.
bool ResolvePalette(vector<string>* palette) {
  palette->clear();
  if (!FLAGS_palette_colors.empty()) {
    SplitString(FLAGS_palette_colors, ',', palette);
    return true;
  }
  if (FLAGS_palette.empty()) return true;
  *palette = PaletteCatalog::Colors(FLAGS_palette);
  if (palette->empty()) {
    LOG(ERROR) << "Unknown palette: " << FLAGS_palette << " (use --list_palettes)";
    return false;
  }
  return true;
}

void ListPalettes() {
  for (const PaletteCatalog::Palette& p : PaletteCatalog::All()) {
    printf("%-14s %-8s %s\n", p.key.c_str(), PaletteCatalog::CategoryName(p.category), p.name.c_str());
    string colors;
    for (const string& hex : p.colors) colors += " " + hex;
    printf("               %s\n", colors.c_str());
  }
}

void PrintColors(const vector<DominantColor>& colors) {
  for (const DominantColor& c : colors) {
    printf("%s %d %d %d\n", c.hex.c_str(), c.r, c.g, c.b);
  }
}

void PrintAnalysis(const ImageAnalyzer::AnalysisResult& result) {
  printf("average_brightness %.4f\n", result.averageBrightness);
  printf("contrast %.4f\n", result.contrast);
  printf("luminosity");
  for (uint32_t count : result.luminosity) printf(" %u", count);
  printf("\n");
  printf("dominant_colors\n");
  PrintColors(result.dominantColors);
}

bool SaveImage(const PixelBuffer& image) {
  if (FLAGS_output.empty()) {
    LOG(ERROR) << "--output is required for mode " << FLAGS_mode;
    return false;
  }
  string err;
  if (!ImageLoader::Save(FLAGS_output, image, err)) {
    LOG(ERROR) << "Failed to save " << FLAGS_output << ": " << err;
    return false;
  }
  LOG(INFO) << "Wrote " << FLAGS_output;
  return true;
}

bool ExportContours(const PixelBuffer& image, const vector<string>& palette) {
  if (FLAGS_output.empty()) {
    LOG(ERROR) << "--output is required for mode contours";
    return false;
  }
  SvgWriter::Style style;
  if (FLAGS_svg_style == "fill") {
    style = SvgWriter::Style::Fill;
  } else if (FLAGS_svg_style == "outline") {
    style = SvgWriter::Style::Outline;
  } else {
    LOG(ERROR) << "Unknown --svg_style: " << FLAGS_svg_style;
    return false;
  }

  const vector<GuideGenerator::GuideContour> contours =
      GuideGenerator::GenerateContours(image, FLAGS_level, palette, FLAGS_min_region_size, FLAGS_epsilon);
  string err;
  if (!SvgWriter::WriteFile(FLAGS_output, contours, image.width, image.height, style, err)) {
    LOG(ERROR) << "Failed to write " << FLAGS_output << ": " << err;
    return false;
  }
  LOG(INFO) << "Wrote " << contours.size() << " contours to " << FLAGS_output;
  return true;
}

bool Run(const PixelBuffer& image, const vector<string>& palette) {
  const string& mode = FLAGS_mode;
  if (mode == "lines" || mode == "blocks") {
    const GuideGenerator::Mode guideMode = GuideGenerator::ParseMode(mode);
    LOG(INFO) << "Generating " << GuideGenerator::ModeName(guideMode) << " guide at detail level " << FLAGS_level;
    return SaveImage(GuideGenerator::Generate(image, guideMode, FLAGS_level, palette));
  }
  if (mode == "quantize") return SaveImage(LevelReducer::Quantize(image, FLAGS_level));
  if (mode == "posterize") return SaveImage(LevelReducer::Posterize(image, FLAGS_level));
  if (mode == "grayscale") return SaveImage(LevelReducer::Grayscale(image));
  if (mode == "remap") {
    if (palette.empty()) {
      LOG(ERROR) << "Mode remap needs --palette or --palette_colors";
      return false;
    }
    return SaveImage(PaletteMatcher::RemapToPalette(image, palette));
  }
  if (mode == "colors") {
    vector<DominantColor> colors = ColorExtractor::ExtractDominantColors(image, FLAGS_colors, FLAGS_stride);
    if (!palette.empty()) colors = ColorExtractor::MapColorsToPalette(colors, palette);
    PrintColors(colors);
    return true;
  }
  if (mode == "analyze") {
    PrintAnalysis(ImageAnalyzer::Analyze(image));
    return true;
  }
  if (mode == "contours") return ExportContours(image, palette);

  LOG(ERROR) << "Unknown --mode: " << mode;
  return false;
}

} // namespace

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  gflags::SetUsageMessage("paintguide_cli --input=photo.jpg --output=guide.png --mode=blocks");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  if (FLAGS_list_palettes) {
    ListPalettes();
    return 0;
  }
  if (FLAGS_input.empty()) {
    LOG(ERROR) << "--input is required";
    return 1;
  }

  vector<string> palette;
  if (!ResolvePalette(&palette)) return 1;

  LOG(INFO) << "mode=" << FLAGS_mode << " level=" << FLAGS_level << " palette_size=" << palette.size()
            << " input=" << FLAGS_input;

  PixelBuffer image;
  string err;
  if (!ImageLoader::LoadRGBA(FLAGS_input, image, err)) {
    LOG(ERROR) << "Failed to load " << FLAGS_input << ": " << err;
    return 1;
  }

  try {
    return Run(image, palette) ? 0 : 1;
  } catch (const std::exception& e) {
    LOG(ERROR) << "Processing failed: " << e.what();
    return 1;
  }
}
