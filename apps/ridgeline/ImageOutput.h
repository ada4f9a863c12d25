#pragma once

#include <string>

namespace ridgeline::app {

// Writes tightly packed 8-bit pixels (comp channels, top row first) as a PNG.
bool writePixelsToPng(const std::string& path,
                      int width,
                      int height,
                      int comp,
                      const unsigned char* pixels,
                      std::string* outErr = nullptr);

} // namespace ridgeline::app
