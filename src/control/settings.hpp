#pragma once
#include <string>

/**
 * @brief Run parameters for the calibration reader
 *
 * Fixed defaults; the program takes no arguments and reads no environment.
 */
struct RunSettings {
  std::string input_path{"res/data.txt"};  ///< Calibration document, relative to the working directory
  bool log_progress{true};                 ///< Progress messages on stderr
  bool log_summary{true};                  ///< JSON statistics summary on stderr
};
