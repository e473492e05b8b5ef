/***
 * Name: pymarshal::obs::Metrics
 * Purpose: Collect per-stage timings, counters and gauges for decode/encode calls.
 * Inputs:
 *   - Calls to start/stop timers for named stages ("Decode", "Encode").
 *   - Counter and gauge updates from the codec (objects, references, bytes, depth).
 * Outputs:
 *   - Human-readable text and JSON summaries.
 * Theory of Operation:
 *   Uses steady_clock timestamps to measure durations. Stores a map from stage names
 *   to microseconds. The collector is owned by the caller and handed to a codec call
 *   through Options; it is not synchronized, so concurrent calls need separate instances.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace pymarshal::obs {

class Metrics {
 public:
  using Clock = std::chrono::steady_clock;

  void start(const std::string& name);
  void stop(const std::string& name);

  void incCounter(const std::string& key, uint64_t delta = 1) { counters_[key] += delta; }
  void setCounter(const std::string& key, uint64_t value) { counters_[key] = value; }
  void setGauge(const std::string& key, uint64_t value) { gauges_[key] = value; }
  /*** raiseGauge: Keep the maximum of the current and the new value. */
  void raiseGauge(const std::string& key, uint64_t value);

  uint64_t counter(const std::string& key) const;
  uint64_t gauge(const std::string& key) const;
  const std::map<std::string, uint64_t>& counters() const { return counters_; }
  const std::map<std::string, uint64_t>& gauges() const { return gauges_; }
  const std::map<std::string, uint64_t>& durationsUs() const { return durations_us_; }

  std::vector<std::string> hints() const;
  std::string summaryText() const;
  std::string summaryJson() const;

 private:
  std::map<std::string, Clock::time_point> active_{};
  std::map<std::string, uint64_t> durations_us_{};
  std::map<std::string, uint64_t> counters_{};
  std::map<std::string, uint64_t> gauges_{};
};

}  // namespace pymarshal::obs
