#pragma once

#include "PixelBuffer.h"

// OpenGL 2.x texture holding an RGBA8 pixel buffer for display in Dear ImGui.
// Owns the GL texture name; not copyable.
class GLTexture {
public:
  GLTexture();
  ~GLTexture();

  GLTexture(const GLTexture&) = delete;
  GLTexture& operator=(const GLTexture&) = delete;

  // Uploads the buffer, reallocating texture storage when the size changes.
  bool UpdateFromBuffer(const PixelBuffer& rgba);

  void Destroy();

  // For ImGui::Image: cast to ImTextureID.
  void* ImGuiID() const;

  int Width() const { return width_; }
  int Height() const { return height_; }
  bool IsValid() const { return textureId_ != 0; }

private:
  unsigned int textureId_ = 0; // GLuint, kept as unsigned int to avoid including gl headers here.
  int width_ = 0;
  int height_ = 0;
};
