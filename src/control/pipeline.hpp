#pragma once
#include "../core/calibration.hpp"
#include "../core/telemetry.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Sequential calibration pipeline
 *
 * Feeds lines through the extractor one at a time, keeps the running sum
 * and records a telemetry sample per line. Any line without a digit aborts
 * the run; nothing is skipped and no partial result is meant to be reported.
 */
struct CalibrationPipeline {
  bool keep_samples{false};  ///< Retain per-line samples (stats are always kept)

  /**
   * @brief Process one line
   * @param line Trimmed input line
   * @return Calibration value of the line
   * @throws CalibrationError prefixed with the 1-based line number
   */
  unsigned process_line(std::string_view line) {
    std::uint64_t line_number = stats_.line_count + 1;

    CalibrationReading reading;
    try {
      reading = read_calibration(line);
    } catch (const CalibrationError& e) {
      throw CalibrationError("line " + std::to_string(line_number) + ": " + e.what());
    }

    CalibrationSample sample(line_number, reading);
    stats_.record(sample);
    if (keep_samples) {
      samples_.push_back(sample);
    }
    return reading.value;
  }

  /**
   * @brief Process every line in order
   * @return Sum of all calibration values processed so far
   */
  std::uint64_t run(const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
      process_line(line);
    }
    return sum();
  }

  /**
   * @brief Clear the accumulator, statistics and samples
   */
  void reset() {
    stats_.reset();
    samples_.clear();
  }

  std::uint64_t sum() const { return stats_.sum; }
  std::uint64_t lines_processed() const { return stats_.line_count; }
  const CalibrationStats& stats() const { return stats_; }
  const std::vector<CalibrationSample>& samples() const { return samples_; }

private:
  CalibrationStats stats_;
  std::vector<CalibrationSample> samples_;
};
