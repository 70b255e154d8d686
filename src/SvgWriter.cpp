#include "SvgWriter.h"

#include <fstream>
#include <sstream>

std::string SvgWriter::PathData(const std::vector<cv::Point>& points) {
  std::ostringstream ss;
  for (size_t i = 0; i < points.size(); ++i) {
    ss << (i == 0 ? "M " : " L ") << points[i].x << " " << points[i].y;
  }
  ss << " Z";
  return ss.str();
}

std::string SvgWriter::Write(const std::vector<GuideGenerator::GuideContour>& contours, int width, int height,
                             Style style) {
  std::ostringstream ss;
  ss << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
  ss << "<svg width=\"" << width << "\" height=\"" << height << "\" viewBox=\"0 0 " << width << " " << height
     << "\" version=\"1.1\" xmlns=\"http://www.w3.org/2000/svg\">\n";

  if (style == Style::Outline) {
    ss << "<rect width=\"100%\" height=\"100%\" fill=\"#FFFFFF\"/>\n";
  }

  for (const GuideGenerator::GuideContour& contour : contours) {
    if (contour.points.empty()) continue;
    ss << "<path ";
    if (style == Style::Fill) {
      ss << "fill=\"" << ColorUtil::ToHex(contour.color) << "\" stroke=\"none\" ";
    } else {
      ss << "fill=\"none\" stroke=\"#000000\" stroke-width=\"1\" ";
    }
    ss << "d=\"" << PathData(contour.points) << "\"/>\n";
  }

  ss << "</svg>\n";
  return ss.str();
}

bool SvgWriter::WriteFile(const std::string& path, const std::vector<GuideGenerator::GuideContour>& contours,
                          int width, int height, Style style, std::string& outError) {
  outError.clear();
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    outError = "Cannot open \"" + path + "\" for writing.";
    return false;
  }
  out << Write(contours, width, height, style);
  if (!out) {
    outError = "Failed while writing \"" + path + "\".";
    return false;
  }
  return true;
}
