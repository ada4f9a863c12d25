#include "ImageOutput.h"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace ridgeline::app {

bool writePixelsToPng(const std::string& path,
                      int width,
                      int height,
                      int comp,
                      const unsigned char* pixels,
                      std::string* outErr) {
  if (width <= 0 || height <= 0) {
    if (outErr) *outErr = "Invalid image size.";
    return false;
  }
  if (comp <= 0 || comp > 4) {
    if (outErr) *outErr = "Invalid channel count.";
    return false;
  }
  if (!pixels) {
    if (outErr) *outErr = "Null pixel pointer.";
    return false;
  }
  if (path.empty()) {
    if (outErr) *outErr = "Empty output path.";
    return false;
  }

  const int ok = stbi_write_png(path.c_str(), width, height, comp, pixels, width * comp);
  if (!ok) {
    if (outErr) *outErr = "Failed to write PNG: " + path;
    return false;
  }
  return true;
}

} // namespace ridgeline::app
