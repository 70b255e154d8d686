#ifndef APP_H
#define APP_H

#include "ColorExtractor.h"
#include "GLTexture.h"
#include "ImageAnalyzer.h"
#include "PixelBuffer.h"

#include <array>
#include <string>
#include <vector>

#include <imgui.h>

struct GLFWwindow;

// Viewer application: original and result side by side, engine controls on the right.
class App {
public:
  enum class Tool {
    Quantize,    // value simplification preview
    Posterize,
    Grayscale,
    GuideLines,  // paint-by-numbers outline art
    GuideBlocks  // paint-by-numbers flat color blocks
  };

  struct Params {
    Tool tool = Tool::GuideBlocks;
    int level = 5;              // quantize/posterize levels, or guide detail level (1..10)
    bool paletteEnabled = false;
    int paletteIndex = 0;       // index into PaletteCatalog::All()
    int colorCount = 5;         // dominant colors to extract
  };

  App();
  ~App();

  // Initialize GLFW, window, ImGui. Returns true on success.
  bool Initialize();

  // Run the main loop until window is closed
  void Run();

  void Shutdown();

  // Loads an image into the viewer; the status line reports the outcome.
  bool OpenImage(const std::string& path);

private:
  void RenderUI();
  void RenderPreviewPanel(float width, float height, ImGuiWindowFlags flags);
  void RenderControlsPanel(float x, float width, float height, ImGuiWindowFlags flags);
  void RenderColorsSection();
  void RenderAnalysisSection();
  void Render();

  // Runs the selected tool on the loaded image and refreshes the result texture.
  void ProcessImage();
  void ExtractColors();
  void AnalyzeImage();
  void SaveResult();
  void ExportContours();

  std::vector<std::string> SelectedPalette() const;

  static ImVec2 FitSizeKeepAspect(int imgW, int imgH, const ImVec2& maxSize);
  static void SetWindowIcon(GLFWwindow* window, const char* iconPath);
  static void SetupStyle();

private:
  GLFWwindow* window_ = nullptr;

  std::array<char, 1024> loadPath_{};
  std::array<char, 1024> savePath_{};
  std::array<char, 1024> svgPath_{};
  std::string status_;

  Params params_;

  PixelBuffer input_;
  PixelBuffer output_;
  std::vector<DominantColor> colors_;
  ImageAnalyzer::AnalysisResult analysis_;
  bool hasAnalysis_ = false;

  GLTexture inputTex_;
  GLTexture outputTex_;
};

#endif // APP_H
