#include "ridgeline/scene/SceneParameters.h"

#include "ridgeline/core/Log.h"
#include "ridgeline/proc/Terrain.h"

#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <utility>

namespace ridgeline::scene {

static constexpr const char* kHeader = "RidgelineScene";
static constexpr int kVersion = 1;

static std::string lowerAscii(std::string s) {
  for (char& c : s) c = (char)std::tolower((unsigned char)c);
  return s;
}

bool validateSceneParameters(const SceneParameters& p, std::string* outError) {
  auto fail = [&](const std::string& msg) {
    if (outError) *outError = msg;
    return false;
  };

  if (p.width <= 0 || p.height <= 0) {
    return fail("Image size must be positive (got " + std::to_string(p.width) + "x" +
                std::to_string(p.height) + ")");
  }
  if (p.width > kMaxImageSide || p.height > kMaxImageSide) {
    return fail("Image size " + std::to_string(p.width) + "x" + std::to_string(p.height) +
                " exceeds the limit of " + std::to_string(kMaxImageSide) + " per side");
  }
  // Per-layer sweeps divide by (mountainRangeCount - 1).
  if (p.mountainRangeCount <= 1) {
    return fail("mountainRangeCount must be at least 2 (got " + std::to_string(p.mountainRangeCount) + ")");
  }
  if (p.mountainRangeCount > kMaxMountainRangeCount) {
    return fail("mountainRangeCount must be at most " + std::to_string(kMaxMountainRangeCount) + " (got " +
                std::to_string(p.mountainRangeCount) + ")");
  }
  if (p.mountainPeaksMin < 1) {
    return fail("mountainPeaks minimum must be at least 1 (got " + std::to_string(p.mountainPeaksMin) + ")");
  }
  if (p.mountainPeaksMin > p.mountainPeaksMax) {
    return fail("mountainPeaks range is inverted (" + std::to_string(p.mountainPeaksMin) + " > " +
                std::to_string(p.mountainPeaksMax) + ")");
  }
  if (p.mountainPeaksMax > proc::kMaxPeakCount) {
    return fail("mountainPeaks maximum must be at most " + std::to_string(proc::kMaxPeakCount) + " (got " +
                std::to_string(p.mountainPeaksMax) + ")");
  }

  const std::pair<const char*, double> fractions[] = {
    {"sunHeight", p.sunHeight},
    {"sunSize", p.sunSize},
    {"fogHeight", p.fogHeight},
    {"fogThickness", p.fogThickness},
    {"mountainPositionStart", p.mountainPositionStart},
    {"mountainPositionEnd", p.mountainPositionEnd},
    {"mountainRoughness", p.mountainRoughness},
    {"mountainPeakiness", p.mountainPeakiness},
  };
  for (const auto& [name, value] : fractions) {
    if (!std::isfinite(value) || std::fabs(value) > kMaxFraction) {
      std::ostringstream oss;
      oss << name << " must be finite and within +-" << kMaxFraction << " (got " << value << ")";
      return fail(oss.str());
    }
  }
  return true;
}

std::string defaultSceneParametersPath() {
  return "ridgeline_scene.txt";
}

bool saveSceneParametersToFile(const SceneParameters& p, const std::string& path) {
  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f) {
    core::log(core::LogLevel::Warn, "SceneParameters: failed to open for writing: " + path);
    return false;
  }

  f.setf(std::ios::fixed);
  f.precision(6);

  f << kHeader << " " << kVersion << "\n";
  f << "width " << p.width << "\n";
  f << "height " << p.height << "\n";

  f << "sunHeight " << p.sunHeight << "\n";
  f << "sunSize " << p.sunSize << "\n";

  f << "fogHeight " << p.fogHeight << "\n";
  f << "fogThickness " << p.fogThickness << "\n";

  f << "mountainRangeCount " << p.mountainRangeCount << "\n";
  f << "mountainPosition " << p.mountainPositionStart << " " << p.mountainPositionEnd << "\n";
  f << "mountainPeaks " << p.mountainPeaksMin << " " << p.mountainPeaksMax << "\n";
  f << "mountainRoughness " << p.mountainRoughness << "\n";
  f << "mountainPeakiness " << p.mountainPeakiness << "\n";

  if (!f) {
    core::log(core::LogLevel::Warn, "SceneParameters: write failed: " + path);
    return false;
  }
  return true;
}

bool loadSceneParametersFromFile(const std::string& path, SceneParameters& out) {
  std::ifstream f(path);
  if (!f) {
    core::log(core::LogLevel::Debug, "SceneParameters: file not found: " + path);
    return false;
  }

  std::string header;
  int version = 0;
  if (!(f >> header >> version)) {
    core::log(core::LogLevel::Warn, "SceneParameters: failed to read header");
    return false;
  }
  if (header != kHeader) {
    core::log(core::LogLevel::Warn, "SceneParameters: bad header in " + path);
    return false;
  }
  if (version > kVersion) {
    core::log(core::LogLevel::Warn, "SceneParameters: newer file version " + std::to_string(version) +
                                    ", reading known keys only");
  }

  SceneParameters p{};

  std::string line;
  std::getline(f, line); // rest of the header line
  while (std::getline(f, line)) {
    if (line.empty()) continue;
    if (line[0] == '#') continue;

    std::istringstream ss(line);
    std::string key;
    if (!(ss >> key)) continue;
    key = lowerAscii(key);

    bool ok = true;
    if (key == "width") {
      ok = (bool)(ss >> p.width);
    } else if (key == "height") {
      ok = (bool)(ss >> p.height);
    } else if (key == "size" || key == "dimensions") {
      ok = (bool)(ss >> p.width >> p.height);

    } else if (key == "sunheight") {
      ok = (bool)(ss >> p.sunHeight);
    } else if (key == "sunsize" || key == "sunradius") {
      ok = (bool)(ss >> p.sunSize);

    } else if (key == "fogheight") {
      ok = (bool)(ss >> p.fogHeight);
    } else if (key == "fogthickness" || key == "fog") {
      ok = (bool)(ss >> p.fogThickness);

    } else if (key == "mountainrangecount" || key == "layers") {
      ok = (bool)(ss >> p.mountainRangeCount);
    } else if (key == "mountainposition") {
      ok = (bool)(ss >> p.mountainPositionStart >> p.mountainPositionEnd);
    } else if (key == "mountainpeaks" || key == "peaks") {
      ok = (bool)(ss >> p.mountainPeaksMin >> p.mountainPeaksMax);
    } else if (key == "mountainroughness" || key == "roughness") {
      ok = (bool)(ss >> p.mountainRoughness);
    } else if (key == "mountainpeakiness" || key == "peakiness") {
      ok = (bool)(ss >> p.mountainPeakiness);

    } else {
      core::log(core::LogLevel::Debug, "SceneParameters: ignoring unknown key: " + key);
    }

    if (!ok) {
      core::log(core::LogLevel::Warn, "SceneParameters: bad value on line: " + line);
      return false;
    }
  }

  out = p;
  return true;
}

} // namespace ridgeline::scene
