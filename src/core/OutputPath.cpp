#include "ridgeline/core/OutputPath.h"

#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace ridgeline::core {

static constexpr int kMaxNameAttempts = 10000;

std::string sanitizeFileToken(std::string_view s) {
  std::string out;
  out.reserve(s.size());

  for (unsigned char ch : s) {
    if (std::isalnum(ch) || ch == '_' || ch == '-') {
      out.push_back((char)ch);
    } else if (ch == ' ' || ch == '\t') {
      if (out.empty() || out.back() != '_') out.push_back('_');
    }
  }

  while (!out.empty() && out.front() == '_') out.erase(out.begin());
  while (!out.empty() && out.back() == '_') out.pop_back();

  if (out.empty()) out = "scene";
  return out;
}

static std::string fileTimestampNow() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now();
  const auto t = clock::to_time_t(now);

  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif

  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y%m%d_%H%M%S")
      << '_' << std::setw(3) << std::setfill('0') << ms.count();
  return oss.str();
}

static std::string sanitizeExtension(std::string_view ext) {
  std::string out;
  for (unsigned char ch : ext) {
    if (std::isalnum(ch)) out.push_back((char)std::tolower(ch));
  }
  if (out.empty()) out = "svg";
  return out;
}

std::string buildOutputPath(const OutputRequest& req, std::string* outErr) {
  namespace fs = std::filesystem;

  const std::string dir = req.outDir.empty() ? std::string(".") : req.outDir;
  std::error_code ec;
  if (!fs::exists(dir, ec)) {
    if (!fs::create_directories(dir, ec)) {
      if (outErr) *outErr = "Failed to create directory: " + dir;
      return {};
    }
  }

  std::string file = sanitizeFileToken(req.baseName);
  if (req.timestamp) {
    file += '_';
    file += fileTimestampNow();
  }
  const std::string ext = sanitizeExtension(req.extension);

  fs::path p = fs::path(dir) / (file + "." + ext);
  for (int i = 2; fs::exists(p, ec); ++i) {
    if (i >= kMaxNameAttempts) {
      if (outErr) *outErr = "No free file name for: " + file;
      return {};
    }
    p = fs::path(dir) / (file + "_" + std::to_string(i) + "." + ext);
  }

  return p.string();
}

} // namespace ridgeline::core
