#include "GLTexture.h"

#include <cstdint>

#if defined(_WIN32)
  #include <Windows.h>
#endif
#include <GL/gl.h>

#ifndef GL_CLAMP_TO_EDGE
#define GL_CLAMP_TO_EDGE 0x812F
#endif

GLTexture::GLTexture() = default;

GLTexture::~GLTexture() {
  Destroy();
}

void GLTexture::Destroy() {
  if (textureId_ != 0) {
    GLuint id = static_cast<GLuint>(textureId_);
    glDeleteTextures(1, &id);
    textureId_ = 0;
  }
  width_ = 0;
  height_ = 0;
}

void* GLTexture::ImGuiID() const {
  return (void*)(intptr_t)textureId_;
}

bool GLTexture::UpdateFromBuffer(const PixelBuffer& rgba) {
  if (rgba.Empty() || rgba.width <= 0 || rgba.height <= 0) return false;
  if (rgba.data.size() != static_cast<size_t>(rgba.width) * rgba.height * 4) return false;

  if (textureId_ == 0) {
    GLuint id = 0;
    glGenTextures(1, &id);
    textureId_ = static_cast<unsigned int>(id);
  }

  glBindTexture(GL_TEXTURE_2D, static_cast<GLuint>(textureId_));
  // Nearest filtering keeps guide lines and block borders crisp when zoomed.
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
  glPixelStorei(GL_UNPACK_ALIGNMENT, 1);

  if (rgba.width != width_ || rgba.height != height_) {
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, rgba.width, rgba.height, 0, GL_RGBA, GL_UNSIGNED_BYTE, rgba.data.data());
    width_ = rgba.width;
    height_ = rgba.height;
  } else {
    glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, rgba.width, rgba.height, GL_RGBA, GL_UNSIGNED_BYTE, rgba.data.data());
  }

  glBindTexture(GL_TEXTURE_2D, 0);
  return true;
}
