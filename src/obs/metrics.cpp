/***
 * Name: pymarshal::obs::Metrics (impl)
 * Purpose: Implement simple timing and formatting.
 */
#include "pymarshal/obs/metrics.h"

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <map>
#include <sstream>
#include <string>

namespace pymarshal::obs {

namespace {
constexpr double kUsPerMs = 1000.0;
constexpr int kIndent4 = 4;
constexpr uint64_t kDeepNestingDepth = 1000;
} // namespace

static std::string to_lower_copy(std::string s) {
  for (auto& c : s) { if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a'); }
  return s;
}

static void appendDurations(std::ostringstream& oss,
                            const std::map<std::string, uint64_t>& durations) {
  oss << "  \"durations_ms\": {";
  bool first = true;
  for (const auto& [key, val] : durations) {
    if (!first) { oss << ","; }
    first = false;
    const double millis = static_cast<double>(val) / kUsPerMs;
    // JSON uses lowercase stage keys for stability
    oss << "\n    \"" << to_lower_copy(key) << "\": " << std::fixed << std::setprecision(3) << millis;
  }
  oss << "\n  }";
}

static void appendKeyValueObject(std::ostringstream& oss,
                                 const std::map<std::string, uint64_t>& values,
                                 int indent) {
  const std::string pad(indent, ' ');
  bool first = true;
  for (const auto& [key, val] : values) {
    if (!first) { oss << ","; }
    first = false;
    oss << "\n" << pad << "\"" << key << "\": " << val;
  }
}

void Metrics::start(const std::string& name) {
  active_[name] = Clock::now();
}

void Metrics::stop(const std::string& name) {
  auto iter = active_.find(name);
  if (iter == active_.end()) { return; }
  auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - iter->second).count();
  durations_us_[name] += static_cast<uint64_t>(microseconds);
  active_.erase(iter);
}

void Metrics::raiseGauge(const std::string& key, uint64_t value) {
  auto& slot = gauges_[key];
  if (value > slot) { slot = value; }
}

uint64_t Metrics::counter(const std::string& key) const {
  auto it = counters_.find(key);
  return it == counters_.end() ? 0 : it->second;
}

uint64_t Metrics::gauge(const std::string& key) const {
  auto it = gauges_.find(key);
  return it == gauges_.end() ? 0 : it->second;
}

std::string Metrics::summaryText() const {
  std::ostringstream oss;
  oss << "== Metrics ==\n";
  for (const auto& [key, val] : durations_us_) {
    const double millis = static_cast<double>(val) / kUsPerMs;
    oss << "  " << key << ": " << std::fixed << std::setprecision(3) << millis << " ms\n";
  }
  for (const auto& [key, val] : counters_) {
    oss << "  " << key << " = " << val << "\n";
  }
  for (const auto& [key, val] : gauges_) {
    oss << "  " << key << " = " << val << "\n";
  }
  return oss.str();
}

std::string Metrics::summaryJson() const {
  std::ostringstream oss;
  oss << "{\n";
  appendDurations(oss, durations_us_);
  if (!counters_.empty()) {
    oss << ",\n  \"counters\": {";
    appendKeyValueObject(oss, counters_, kIndent4);
    oss << "\n  }";
  }
  if (!gauges_.empty()) {
    oss << ",\n  \"gauges\": {";
    appendKeyValueObject(oss, gauges_, kIndent4);
    oss << "\n  }";
  }
  auto hs = hints();
  if (!hs.empty()) {
    oss << ",\n  \"hints\": [";
    for (size_t i = 0; i < hs.size(); ++i) {
      if (i != 0) oss << ", ";
      oss << "\"" << hs[i] << "\"";
    }
    oss << "]";
  }
  oss << "\n}\n";
  return oss.str();
}

std::vector<std::string> Metrics::hints() const {
  std::vector<std::string> out;
  if (gauge("decode.max_depth") > kDeepNestingDepth) { out.emplace_back("deep_nesting"); }
  const uint64_t backrefs = counter("decode.backreferences") + counter("encode.backreferences");
  if (backrefs > 0) { out.emplace_back("shared_objects_present"); }
  const uint64_t objects = counter("decode.objects") + counter("encode.objects");
  if (objects > 0 && backrefs * 2 > objects) { out.emplace_back("reference_heavy"); }
  return out;
}

} // namespace pymarshal::obs
