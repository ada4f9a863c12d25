#include "ImageOutput.h"

#include "ridgeline/core/Args.h"
#include "ridgeline/core/Log.h"
#include "ridgeline/core/OutputPath.h"
#include "ridgeline/core/Random.h"
#include "ridgeline/render/Palette.h"
#include "ridgeline/render/RasterSurface.h"
#include "ridgeline/render/SvgSurface.h"
#include "ridgeline/scene/SceneComposer.h"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

using namespace ridgeline;

static void printHelp() {
  std::cout << "ridgeline - layered mountain landscape generator\n"
            << "  --config <path>        Scene settings file (default: " << scene::defaultSceneParametersPath()
            << " if present)\n"
            << "  --save-config <path>   Write the effective settings to a file\n"
            << "  --seed <u64|text>      Random seed (default: derived from the clock)\n"
            << "  --count <n>            Number of images to generate (default: 1)\n"
            << "  --format <svg|png>     Output format (default: svg)\n"
            << "  --out <dir>            Output directory (default: wallpapers)\n"
            << "  --name <base>          Base file name (default: ridgeline)\n"
            << "  --no-timestamp         Do not append a timestamp to file names\n"
            << "\n"
            << "Scene overrides:\n"
            << "  --size <w h>           Image size in pixels (default: 3840 2160)\n"
            << "  --layers <n>           Mountain ridge count, at least 2 (default: 8)\n"
            << "  --peaks <min max>      Visible peaks per ridge (default: 9 22)\n"
            << "  --position <a b>       Ridge band sweep, fractions of height (default: 0.15 0.7)\n"
            << "  --peakiness <k>        Upper band scale (default: 4)\n"
            << "  --fog <t>              Fog thickness of the back ridge (default: 1)\n"
            << "  --sun <height size>    Sun height and radius fractions (default: 0.85 0.1)\n"
            << "\n"
            << "  --verbose              Debug logging\n"
            << "  --quiet                Warnings and errors only\n"
            << "  -h, --help             This help\n";
}

// Returns false (and logs) on any malformed override.
static bool applyOverrides(const core::Args& args, scene::SceneParameters& p) {
  auto bad = [](const char* key) {
    core::log(core::LogLevel::Error, std::string("Invalid value for --") + key);
    return false;
  };

  // Integer options must parse as int; everything is range checked by
  // validateSceneParameters afterwards.
  if (args.has("size") && !args.getIntPair("size", p.width, p.height)) return bad("size");
  if (args.has("layers") && !args.getInt("layers", p.mountainRangeCount)) return bad("layers");
  if (args.has("peaks") && !args.getIntPair("peaks", p.mountainPeaksMin, p.mountainPeaksMax)) return bad("peaks");
  if (args.has("position") && !args.getDoublePair("position", p.mountainPositionStart, p.mountainPositionEnd)) {
    return bad("position");
  }
  if (args.has("peakiness") && !args.getDouble("peakiness", p.mountainPeakiness)) return bad("peakiness");
  if (args.has("fog") && !args.getDouble("fog", p.fogThickness)) return bad("fog");
  if (args.has("sun") && !args.getDoublePair("sun", p.sunHeight, p.sunSize)) return bad("sun");
  return true;
}

static bool renderOne(const scene::SceneParameters& params,
                      core::u64 seed,
                      const core::OutputRequest& req,
                      std::string& outPath) {
  core::SplitMixRandom rng(seed);

  scene::DrawList list;
  std::string err;
  if (!scene::composeScene(params, render::defaultPalette(), rng, list, &err)) {
    core::log(core::LogLevel::Error, "Scene generation failed: " + err);
    return false;
  }

  outPath = core::buildOutputPath(req, &err);
  if (outPath.empty()) {
    core::log(core::LogLevel::Error, err);
    return false;
  }

  if (req.extension == "png") {
    render::RasterSurface surface(params.width, params.height);
    scene::replay(list, surface);
    const render::Image& img = surface.image();
    if (!app::writePixelsToPng(outPath, img.w, img.h, 4, img.rgba.data(), &err)) {
      core::log(core::LogLevel::Error, err);
      return false;
    }
  } else {
    render::SvgSurface surface(params.width, params.height);
    scene::replay(list, surface);
    if (!surface.writeToFile(outPath, &err)) {
      core::log(core::LogLevel::Error, err);
      return false;
    }
  }
  return true;
}

int main(int argc, char** argv) {
  core::setLogLevel(core::LogLevel::Info);

  core::Args args;
  args.setArity("size", 2);
  args.setArity("peaks", 2);
  args.setArity("position", 2);
  args.setArity("sun", 2);
  args.parse(argc, argv);

  if (args.has("help") || args.hasFlag("h")) {
    printHelp();
    return 0;
  }
  if (args.has("verbose")) core::setLogLevel(core::LogLevel::Debug);
  if (args.has("quiet")) core::setLogLevel(core::LogLevel::Warn);

  scene::SceneParameters params{};
  std::string configPath;
  if (args.getString("config", configPath)) {
    if (!scene::loadSceneParametersFromFile(configPath, params)) {
      core::log(core::LogLevel::Error, "Could not load scene settings: " + configPath);
      return 2;
    }
  } else {
    const std::string def = scene::defaultSceneParametersPath();
    std::error_code ec;
    if (std::filesystem::exists(def, ec) && !scene::loadSceneParametersFromFile(def, params)) {
      core::log(core::LogLevel::Warn, "Ignoring unreadable " + def + ", using defaults");
      params = scene::SceneParameters{};
    }
  }

  if (!applyOverrides(args, params)) return 2;

  std::string err;
  if (!scene::validateSceneParameters(params, &err)) {
    core::log(core::LogLevel::Error, "Invalid scene settings: " + err);
    return 2;
  }

  std::string savePath;
  if (args.getString("save-config", savePath)) {
    if (!scene::saveSceneParametersToFile(params, savePath)) return 1;
    core::log(core::LogLevel::Info, "Saved scene settings to " + savePath);
  }

  core::u64 seed = (core::u64)std::chrono::system_clock::now().time_since_epoch().count();
  std::string seedText;
  if (args.getString("seed", seedText) && !core::parseSeed(seedText, seed)) {
    core::log(core::LogLevel::Error, "Invalid --seed");
    return 2;
  }

  int count = 1;
  if (args.has("count") && (!args.getInt("count", count) || count < 1)) {
    core::log(core::LogLevel::Error, "--count must be a positive integer");
    return 2;
  }

  core::OutputRequest req;
  args.getString("out", req.outDir);
  args.getString("name", req.baseName);
  args.getString("format", req.extension);
  if (req.extension != "svg" && req.extension != "png") {
    core::log(core::LogLevel::Error, "Unknown --format: " + req.extension + " (expected svg or png)");
    return 2;
  }
  req.timestamp = !args.has("no-timestamp");

  int failures = 0;
  for (int i = 0; i < count; ++i) {
    const core::u64 s = core::batchSeed(seed, (core::u64)i);
    std::string path;
    if (!renderOne(params, s, req, path)) {
      ++failures;
      continue;
    }
    std::ostringstream oss;
    oss << "Wrote " << path << " (seed=" << s << ")";
    core::log(core::LogLevel::Info, oss.str());
  }

  return failures == 0 ? 0 : 1;
}
