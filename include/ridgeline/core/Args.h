#pragma once

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ridgeline::core {

// Small argument parser for the ridgeline command line.
//
// Supports:
//  - Flags:         --verbose   -h
//  - KV args:       --key value   --key=value
//  - Multi-value:   --peaks 4 12   (after setArity("peaks", 2))
//  - Positional:    everything else, and everything after "--"
//
// Negative numbers (-1, -.5) are treated as values, never as switches.
class Args {
public:
  Args() = default;
  Args(int argc, char** argv) { parse(argc, argv); }

  void setArity(std::string_view key, int valueCount) {
    if (valueCount <= 0) return;
    arity_[std::string(key)] = valueCount;
  }

  void parse(int argc, char** argv) {
    program_.clear();
    kv_.clear();
    flags_.clear();
    positional_.clear();

    if (argc > 0 && argv && argv[0]) program_ = argv[0];

    for (int i = 1; i < argc; ++i) {
      const std::string a = argv[i] ? std::string(argv[i]) : std::string();
      if (a.empty()) continue;

      if (a == "--") {
        for (int j = i + 1; j < argc; ++j) {
          if (argv[j]) positional_.push_back(std::string(argv[j]));
        }
        break;
      }

      if (a.rfind("--", 0) == 0) {
        const auto eq = a.find('=');
        if (eq != std::string::npos) {
          kv_[a.substr(2, eq - 2)].push_back(a.substr(eq + 1));
          continue;
        }

        const std::string key = a.substr(2);
        const auto ar = arity_.find(key);
        const int need = (ar != arity_.end()) ? ar->second : 1;

        int took = 0;
        while (took < need && i + 1 < argc && argv[i + 1] && !isSwitch(argv[i + 1])) {
          kv_[key].push_back(std::string(argv[++i]));
          ++took;
        }
        if (took == 0) flags_.push_back(key);
        continue;
      }

      if (a.size() >= 2 && a[0] == '-' && !looksLikeNumber(a.c_str())) {
        // Grouped short flags: -hv
        for (std::size_t j = 1; j < a.size(); ++j) {
          if (std::isalnum((unsigned char)a[j])) flags_.push_back(std::string(1, a[j]));
        }
        continue;
      }

      positional_.push_back(a);
    }
  }

  const std::string& program() const { return program_; }

  bool hasFlag(std::string_view key) const {
    for (const auto& f : flags_) {
      if (f == key) return true;
    }
    return false;
  }

  bool has(std::string_view key) const {
    return hasFlag(key) || kv_.find(std::string(key)) != kv_.end();
  }

  std::optional<std::string> last(std::string_view key) const {
    const auto it = kv_.find(std::string(key));
    if (it == kv_.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
  }

  std::vector<std::string> values(std::string_view key) const {
    const auto it = kv_.find(std::string(key));
    if (it == kv_.end()) return {};
    return it->second;
  }

  const std::vector<std::string>& positional() const { return positional_; }

  // Typed getters read the last value given for `key`. They return false, and
  // leave `out` alone, when the key is missing, the whole token doesn't parse,
  // or the value doesn't fit the target type.
  bool getU64(std::string_view key, unsigned long long& out) const {
    const auto v = last(key);
    return v && parseU64(*v, out);
  }

  bool getInt(std::string_view key, int& out) const {
    const auto v = last(key);
    return v && parseInt(*v, out);
  }

  bool getDouble(std::string_view key, double& out) const {
    const auto v = last(key);
    return v && parseDouble(*v, out);
  }

  // The last two values of a multi-value key (see setArity).
  bool getIntPair(std::string_view key, int& a, int& b) const {
    const auto v = values(key);
    int x = 0, y = 0;
    if (v.size() < 2 || !parseInt(v[v.size() - 2], x) || !parseInt(v[v.size() - 1], y)) return false;
    a = x;
    b = y;
    return true;
  }

  bool getDoublePair(std::string_view key, double& a, double& b) const {
    const auto v = values(key);
    double x = 0.0, y = 0.0;
    if (v.size() < 2 || !parseDouble(v[v.size() - 2], x) || !parseDouble(v[v.size() - 1], y)) return false;
    a = x;
    b = y;
    return true;
  }

  bool getString(std::string_view key, std::string& out) const {
    const auto v = last(key);
    if (!v) return false;
    out = *v;
    return true;
  }

  static bool parseInt(const std::string& text, int& out) {
    long long v = 0;
    if (!convert(text, v, [](const char* s, char** end) { return std::strtoll(s, end, 10); })) return false;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return false;
    out = static_cast<int>(v);
    return true;
  }

  static bool parseU64(const std::string& text, unsigned long long& out) {
    // strtoull would accept "-1" and wrap it.
    if (!text.empty() && text[0] == '-') return false;
    return convert(text, out, [](const char* s, char** end) { return std::strtoull(s, end, 10); });
  }

  static bool parseDouble(const std::string& text, double& out) {
    return convert(text, out, [](const char* s, char** end) { return std::strtod(s, end); });
  }

private:
  // Whole-token conversion; out-of-range input (ERANGE) is a failure.
  template <class T, class Convert>
  static bool convert(const std::string& text, T& out, Convert fn) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    const T val = static_cast<T>(fn(text.c_str(), &end));
    if (errno == ERANGE || end != text.c_str() + text.size()) return false;
    out = val;
    return true;
  }

  // Accepts -1, -0.25, -.5, 1e-3, -2.0E+4
  static bool looksLikeNumber(const char* s) {
    if (!s || !*s) return false;
    char* end = nullptr;
    std::strtod(s, &end);
    if (end == s || *end != '\0') return false;
    // strtod also accepts "inf"/"nan"; only digit-bearing tokens count here.
    for (const char* p = s; *p; ++p) {
      if (std::isdigit((unsigned char)*p)) return true;
    }
    return false;
  }

  static bool isSwitch(const char* s) {
    if (!s || s[0] != '-') return false;
    // A lone '-' is a value (stdout placeholder).
    if (s[1] == '\0') return false;
    return !looksLikeNumber(s);
  }

  std::string program_;
  std::unordered_map<std::string, int> arity_;
  std::unordered_map<std::string, std::vector<std::string>> kv_;
  std::vector<std::string> flags_;
  std::vector<std::string> positional_;
};

} // namespace ridgeline::core
