#include "ImageLoader.h"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <utility>

bool ImageLoader::LoadRGBA(const std::string& path, PixelBuffer& outRgba, std::string& outError) {
  outError.clear();
  outRgba = PixelBuffer();

  cv::Mat img;
  try {
    // IMREAD_UNCHANGED keeps the alpha channel when the file has one.
    img = cv::imread(path, cv::IMREAD_UNCHANGED);
  } catch (const cv::Exception& e) {
    outError = std::string("OpenCV error: ") + e.what();
    return false;
  }
  if (img.empty()) {
    outError = "Failed to load image (empty). Check path and supported formats (png/jpg).";
    return false;
  }

  if (img.depth() != CV_8U) {
    cv::Mat scaled;
    img.convertTo(scaled, CV_8U, img.depth() == CV_16U ? 1.0 / 257.0 : 255.0);
    img = scaled;
  }

  PixelBuffer rgba(img.cols, img.rows);
  cv::Mat dst = rgba.AsMat();
  switch (img.channels()) {
    case 4: cv::cvtColor(img, dst, cv::COLOR_BGRA2RGBA); break;
    case 3: cv::cvtColor(img, dst, cv::COLOR_BGR2RGBA); break;
    case 1: cv::cvtColor(img, dst, cv::COLOR_GRAY2RGBA); break;
    default:
      outError = "Unsupported channel count: " + std::to_string(img.channels());
      return false;
  }

  outRgba = std::move(rgba);
  return true;
}

bool ImageLoader::Save(const std::string& path, const PixelBuffer& rgba, std::string& outError) {
  outError.clear();
  if (rgba.Empty()) {
    outError = "Nothing to save (image is empty).";
    return false;
  }
  try {
    ValidateGeometry(rgba, "Save");

    cv::Mat bgra;
    cv::cvtColor(rgba.AsMat(), bgra, cv::COLOR_RGBA2BGRA);
    if (!cv::imwrite(path, bgra)) {
      outError = "cv::imwrite returned false. Check file extension and output path.";
      return false;
    }
  } catch (const cv::Exception& e) {
    outError = std::string("OpenCV error: ") + e.what();
    return false;
  } catch (const GeometryError& e) {
    outError = e.what();
    return false;
  }
  return true;
}
