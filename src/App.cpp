#include "App.h"

#include "GuideGenerator.h"
#include "ImageLoader.h"
#include "LevelReducer.h"
#include "PaletteCatalog.h"
#include "SvgWriter.h"

#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl2.h>

#include <algorithm>
#include <cfloat>
#include <cstdio>
#include <exception>
#include <utility>

#include <GLFW/glfw3.h>
#include <glog/logging.h>

namespace {
const char* kToolNames[] = {
  "Value Simplify (quantize)",
  "Posterize",
  "Grayscale",
  "Paint-by-Numbers: Lines",
  "Paint-by-Numbers: Blocks"
};

void CopyPath(std::array<char, 1024>& dst, const std::string& src) {
  std::snprintf(dst.data(), dst.size(), "%s", src.c_str());
}
} // namespace

App::App() {
  CopyPath(savePath_, "guide.png");
  CopyPath(svgPath_, "guide.svg");
}

App::~App() {
  Shutdown();
}

bool App::Initialize() {
  if (!glfwInit()) {
    LOG(ERROR) << "glfwInit failed";
    return false;
  }

  // OpenGL 2.0 context is enough for ImGui OpenGL2 backend
  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 2);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

  window_ = glfwCreateWindow(1280, 720, "PaintGuide", nullptr, nullptr);
  if (!window_) {
    LOG(ERROR) << "glfwCreateWindow failed";
    glfwTerminate();
    return false;
  }
  glfwMakeContextCurrent(window_);
  glfwSwapInterval(1); // vsync

  SetWindowIcon(window_, "icon.png");

  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGuiIO& io = ImGui::GetIO();
  io.FontGlobalScale = 1.2f;

  SetupStyle();

  ImGui_ImplGlfw_InitForOpenGL(window_, true);
  ImGui_ImplOpenGL2_Init();

  return true;
}

void App::Run() {
  while (!glfwWindowShouldClose(window_)) {
    glfwPollEvents();

    ImGui_ImplOpenGL2_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();

    RenderUI();

    Render();
  }
}

void App::Shutdown() {
  outputTex_.Destroy();
  inputTex_.Destroy();

  if (window_) {
    ImGui_ImplOpenGL2_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
  }
}

bool App::OpenImage(const std::string& path) {
  CopyPath(loadPath_, path);

  std::string err;
  PixelBuffer img;
  if (!ImageLoader::LoadRGBA(path, img, err)) {
    status_ = "Load failed: " + err;
    LOG(WARNING) << status_;
    return false;
  }

  input_ = std::move(img);
  output_ = PixelBuffer();
  colors_.clear();
  hasAnalysis_ = false;
  if (window_) {
    inputTex_.UpdateFromBuffer(input_);
    outputTex_.Destroy();
  }
  status_ = "Loaded: " + path + " (" + std::to_string(input_.width) + "x" + std::to_string(input_.height) + ")";
  LOG(INFO) << status_;
  return true;
}

std::vector<std::string> App::SelectedPalette() const {
  if (!params_.paletteEnabled) return {};
  const auto& palettes = PaletteCatalog::All();
  if (params_.paletteIndex < 0 || params_.paletteIndex >= static_cast<int>(palettes.size())) return {};
  return palettes[params_.paletteIndex].colors;
}

void App::ProcessImage() {
  if (input_.Empty()) {
    status_ = "No input image loaded.";
    return;
  }

  try {
    switch (params_.tool) {
      case Tool::Quantize:
        output_ = LevelReducer::Quantize(input_, params_.level);
        break;
      case Tool::Posterize:
        output_ = LevelReducer::Posterize(input_, params_.level);
        break;
      case Tool::Grayscale:
        output_ = LevelReducer::Grayscale(input_);
        break;
      case Tool::GuideLines:
        output_ = GuideGenerator::Generate(input_, GuideGenerator::Mode::Lines, params_.level);
        break;
      case Tool::GuideBlocks:
        output_ = GuideGenerator::Generate(input_, GuideGenerator::Mode::Blocks, params_.level, SelectedPalette());
        break;
    }
  } catch (const std::exception& e) {
    output_ = PixelBuffer();
    status_ = std::string("Processing failed: ") + e.what();
    LOG(ERROR) << status_;
    return;
  }

  outputTex_.UpdateFromBuffer(output_);
  status_ = std::string("Processed: ") + kToolNames[static_cast<int>(params_.tool)];
}

void App::ExtractColors() {
  if (input_.Empty()) {
    status_ = "No input image loaded.";
    return;
  }
  try {
    colors_ = ColorExtractor::ExtractDominantColors(input_, params_.colorCount, 4);
    const std::vector<std::string> palette = SelectedPalette();
    if (!palette.empty()) colors_ = ColorExtractor::MapColorsToPalette(colors_, palette);
    status_ = "Extracted " + std::to_string(colors_.size()) + " colors.";
  } catch (const std::exception& e) {
    colors_.clear();
    status_ = std::string("Color extraction failed: ") + e.what();
  }
}

void App::AnalyzeImage() {
  if (input_.Empty()) {
    status_ = "No input image loaded.";
    return;
  }
  try {
    analysis_ = ImageAnalyzer::Analyze(input_);
    hasAnalysis_ = true;
    status_ = "Analysis updated.";
  } catch (const std::exception& e) {
    hasAnalysis_ = false;
    status_ = std::string("Analysis failed: ") + e.what();
  }
}

void App::SaveResult() {
  if (output_.Empty()) {
    status_ = "Nothing to save (process an image first).";
    return;
  }
  std::string err;
  if (ImageLoader::Save(savePath_.data(), output_, err)) {
    status_ = "Saved: " + std::string(savePath_.data());
  } else {
    status_ = "Save failed: " + err;
  }
}

void App::ExportContours() {
  if (input_.Empty()) {
    status_ = "No input image loaded.";
    return;
  }
  try {
    const std::vector<GuideGenerator::GuideContour> contours =
        GuideGenerator::GenerateContours(input_, params_.level, SelectedPalette());
    std::string err;
    if (SvgWriter::WriteFile(svgPath_.data(), contours, input_.width, input_.height, SvgWriter::Style::Fill, err)) {
      status_ = "Exported " + std::to_string(contours.size()) + " contours to " + std::string(svgPath_.data());
    } else {
      status_ = "Export failed: " + err;
    }
  } catch (const std::exception& e) {
    status_ = std::string("Export failed: ") + e.what();
  }
}

void App::RenderUI() {
  ImGuiViewport* viewport = ImGui::GetMainViewport();
  const ImVec2 viewportSize = viewport->Size;

  // Preview panel on the left (~60%), controls on the right.
  const float previewWidth = viewportSize.x * 0.6f;
  const float controlsWidth = viewportSize.x - previewWidth;

  const ImGuiWindowFlags windowFlags = ImGuiWindowFlags_NoTitleBar
                                     | ImGuiWindowFlags_NoMove
                                     | ImGuiWindowFlags_NoResize
                                     | ImGuiWindowFlags_NoCollapse
                                     | ImGuiWindowFlags_NoBringToFrontOnFocus
                                     | ImGuiWindowFlags_NoNavFocus;

  RenderPreviewPanel(previewWidth, viewportSize.y, windowFlags);
  RenderControlsPanel(previewWidth, controlsWidth, viewportSize.y, windowFlags);
}

void App::RenderPreviewPanel(float width, float height, ImGuiWindowFlags flags) {
  ImGui::SetNextWindowPos(ImVec2(0, 0));
  ImGui::SetNextWindowSize(ImVec2(width, height));
  ImGui::Begin("Preview", nullptr, flags);

  const ImVec2 avail = ImGui::GetContentRegionAvail();
  float halfW = (avail.x - 10.0f) * 0.5f;
  const float h = avail.y;
  if (halfW < 50.0f) halfW = avail.x;

  ImGui::BeginChild("orig", ImVec2(halfW, h), true);
  ImGui::TextUnformatted("Original");
  if (inputTex_.IsValid()) {
    const ImVec2 sz = FitSizeKeepAspect(inputTex_.Width(), inputTex_.Height(), ImGui::GetContentRegionAvail());
    ImGui::Image(inputTex_.ImGuiID(), sz);
  } else {
    ImGui::TextUnformatted("No image loaded.");
  }
  ImGui::EndChild();

  ImGui::SameLine();

  ImGui::BeginChild("result", ImVec2(0, h), true);
  ImGui::TextUnformatted("Result");
  if (outputTex_.IsValid()) {
    const ImVec2 sz = FitSizeKeepAspect(outputTex_.Width(), outputTex_.Height(), ImGui::GetContentRegionAvail());
    ImGui::Image(outputTex_.ImGuiID(), sz);
  } else {
    ImGui::TextUnformatted("No result yet. Click Apply.");
  }
  ImGui::EndChild();

  ImGui::End();
}

void App::RenderControlsPanel(float x, float width, float height, ImGuiWindowFlags flags) {
  ImGui::SetNextWindowPos(ImVec2(x, 0));
  ImGui::SetNextWindowSize(ImVec2(width, height));
  ImGui::Begin("PaintGuide", nullptr, flags);

  ImGui::TextUnformatted("Load Image (png/jpg):");
  ImGui::InputText("##load_path", loadPath_.data(), loadPath_.size());
  ImGui::SameLine();
  if (ImGui::Button("Load")) {
    OpenImage(loadPath_.data());
  }

  ImGui::Separator();
  int tool = static_cast<int>(params_.tool);
  if (ImGui::Combo("Tool", &tool, kToolNames, IM_ARRAYSIZE(kToolNames))) {
    params_.tool = static_cast<Tool>(tool);
  }

  const bool isGuide = params_.tool == Tool::GuideLines || params_.tool == Tool::GuideBlocks;
  if (params_.tool != Tool::Grayscale) {
    ImGui::SliderInt(isGuide ? "Detail Level" : "Levels", &params_.level, isGuide ? 1 : 2, isGuide ? 10 : 16);
  }

  ImGui::Checkbox("Use Palette", &params_.paletteEnabled);
  if (params_.paletteEnabled) {
    const auto& palettes = PaletteCatalog::All();
    params_.paletteIndex = std::max(0, std::min(params_.paletteIndex, static_cast<int>(palettes.size()) - 1));
    const PaletteCatalog::Palette& current = palettes[params_.paletteIndex];
    if (ImGui::BeginCombo("##palette", current.name.c_str())) {
      for (int i = 0; i < static_cast<int>(palettes.size()); ++i) {
        const PaletteCatalog::Palette& p = palettes[i];
        if (i == 0 || palettes[i - 1].category != p.category) {
          ImGui::TextDisabled("%s", PaletteCatalog::CategoryName(p.category));
        }
        if (ImGui::Selectable(p.name.c_str(), i == params_.paletteIndex)) params_.paletteIndex = i;
      }
      ImGui::EndCombo();
    }
    ImGui::TextDisabled("%s", current.description.c_str());
    for (size_t i = 0; i < current.colors.size(); ++i) {
      const Rgb c = ColorUtil::ParseHex(current.colors[i]);
      ImGui::PushID(static_cast<int>(i));
      ImGui::ColorButton(current.colors[i].c_str(), ImVec4(c.r / 255.0f, c.g / 255.0f, c.b / 255.0f, 1.0f),
                         ImGuiColorEditFlags_NoTooltip, ImVec2(20, 20));
      ImGui::PopID();
      if (i + 1 < current.colors.size()) ImGui::SameLine();
    }
    if (params_.tool != Tool::GuideBlocks) {
      ImGui::TextDisabled("Palette remapping applies to Blocks guides and color snapping.");
    }
  }

  if (ImGui::Button("Apply")) {
    ProcessImage();
  }

  ImGui::Separator();
  RenderColorsSection();

  ImGui::Separator();
  RenderAnalysisSection();

  ImGui::Separator();
  ImGui::TextUnformatted("Save Result:");
  ImGui::InputText("##save_path", savePath_.data(), savePath_.size());
  ImGui::SameLine();
  if (ImGui::Button("Save")) {
    SaveResult();
  }
  ImGui::InputText("##svg_path", svgPath_.data(), svgPath_.size());
  ImGui::SameLine();
  if (ImGui::Button("Export SVG")) {
    ExportContours();
  }

  ImGui::Separator();
  if (!status_.empty()) {
    ImGui::TextWrapped("%s", status_.c_str());
  }
  ImGui::End();
}

void App::RenderColorsSection() {
  ImGui::TextUnformatted("Dominant Colors:");
  ImGui::SliderInt("Count", &params_.colorCount, 1, 12);
  if (ImGui::Button("Extract Colors")) {
    ExtractColors();
  }
  for (size_t i = 0; i < colors_.size(); ++i) {
    const DominantColor& c = colors_[i];
    ImGui::PushID(static_cast<int>(i) + 1000);
    ImGui::ColorButton("##swatch", ImVec4(c.r / 255.0f, c.g / 255.0f, c.b / 255.0f, 1.0f),
                       ImGuiColorEditFlags_NoTooltip, ImVec2(24, 24));
    ImGui::PopID();
    ImGui::SameLine();
    ImGui::Text("%s  (%d, %d, %d)", c.hex.c_str(), c.r, c.g, c.b);
  }
}

void App::RenderAnalysisSection() {
  if (ImGui::Button("Analyze")) {
    AnalyzeImage();
  }
  if (!hasAnalysis_) return;

  float lum[256];
  for (int i = 0; i < 256; ++i) lum[i] = static_cast<float>(analysis_.luminosity[i]);
  ImGui::PlotHistogram("##luminosity", lum, 256, 0, "Luminosity", 0.0f, FLT_MAX, ImVec2(0, 80));
  ImGui::Text("Average brightness: %.2f", analysis_.averageBrightness);
  ImGui::Text("Contrast: %.2f", analysis_.contrast);
}

void App::Render() {
  ImGui::Render();
  int display_w = 0, display_h = 0;
  glfwGetFramebufferSize(window_, &display_w, &display_h);
  glViewport(0, 0, display_w, display_h);
  glClearColor(0.12f, 0.12f, 0.14f, 1.00f);
  glClear(GL_COLOR_BUFFER_BIT);
  ImGui_ImplOpenGL2_RenderDrawData(ImGui::GetDrawData());

  glfwSwapBuffers(window_);
}

ImVec2 App::FitSizeKeepAspect(int imgW, int imgH, const ImVec2& maxSize) {
  if (imgW <= 0 || imgH <= 0) return ImVec2(0, 0);
  const float aspect = static_cast<float>(imgW) / static_cast<float>(imgH);
  const float w = maxSize.x;
  const float h = maxSize.y;
  if (w <= 0.0f || h <= 0.0f) return ImVec2(0, 0);

  float outW = w;
  float outH = outW / aspect;
  if (outH > h) {
    outH = h;
    outW = outH * aspect;
  }
  return ImVec2(outW, outH);
}

void App::SetWindowIcon(GLFWwindow* window, const char* iconPath) {
  if (!window || !iconPath) return;

  PixelBuffer icon;
  std::string err;
  if (!ImageLoader::LoadRGBA(iconPath, icon, err)) {
    VLOG(1) << "No window icon: " << err;
    return;
  }

  // GLFW copies the pixels, so the buffer may go out of scope afterwards.
  GLFWimage glfwImg;
  glfwImg.width = icon.width;
  glfwImg.height = icon.height;
  glfwImg.pixels = icon.data.data();
  glfwSetWindowIcon(window, 1, &glfwImg);
}

void App::SetupStyle() {
  ImGui::StyleColorsDark();
  ImGuiStyle& style = ImGui::GetStyle();

  style.Colors[ImGuiCol_WindowBg] = ImVec4(0.12f, 0.12f, 0.14f, 1.00f);
  style.Colors[ImGuiCol_ChildBg] = ImVec4(0.15f, 0.15f, 0.18f, 1.00f);
  style.Colors[ImGuiCol_Button] = ImVec4(0.25f, 0.25f, 0.28f, 1.00f);
  style.Colors[ImGuiCol_ButtonHovered] = ImVec4(0.35f, 0.35f, 0.40f, 1.00f);
  style.Colors[ImGuiCol_ButtonActive] = ImVec4(0.45f, 0.45f, 0.50f, 1.00f);
  style.Colors[ImGuiCol_SliderGrab] = ImVec4(0.95f, 0.95f, 0.95f, 1.00f);
  style.Colors[ImGuiCol_CheckMark] = ImVec4(0.95f, 0.95f, 0.95f, 1.00f);

  style.WindowPadding = ImVec2(16.0f, 16.0f);
  style.FramePadding = ImVec2(12.0f, 8.0f);
  style.ItemSpacing = ImVec2(12.0f, 10.0f);
  style.WindowRounding = 0.0f;
  style.ChildRounding = 6.0f;
  style.FrameRounding = 3.0f;
  style.GrabRounding = 3.0f;
}
