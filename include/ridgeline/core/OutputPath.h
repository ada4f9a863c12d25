#pragma once

#include <string>
#include <string_view>

namespace ridgeline::core {

// Where and under what name a generated image is written.
struct OutputRequest {
  // Output directory (relative or absolute). Empty means the working directory.
  std::string outDir{"wallpapers"};

  // Base file name without extension.
  std::string baseName{"ridgeline"};

  // "svg" or "png".
  std::string extension{"svg"};

  // Append "_YYYYMMDD_HHMMSS_mmm" to the base name.
  bool timestamp{true};
};

// Keep only filename-safe ASCII characters: [A-Za-z0-9_-].
// Runs of spaces/tabs become a single '_'. If the result is empty, returns "scene".
std::string sanitizeFileToken(std::string_view s);

// Builds an output path that does not exist yet, creating the directory if
// needed. Taken names get "_2", "_3", ... before the extension.
//
// Returns an empty string on failure and optionally writes the reason to outErr.
std::string buildOutputPath(const OutputRequest& req, std::string* outErr = nullptr);

} // namespace ridgeline::core
