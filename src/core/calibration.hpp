#pragma once
#include "digit_scan.hpp"
#include <stdexcept>
#include <string>
#include <string_view>

/**
 * @brief Raised when a line does not yield a two-digit calibration value
 *
 * This is a contract violation: every input line must contain at least one
 * digit. Callers are not expected to recover from it.
 */
class CalibrationError : public std::runtime_error {
public:
    explicit CalibrationError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Result of reading one line
 */
struct CalibrationReading {
    DigitOccurrence first;  ///< First digit occurrence
    DigitOccurrence last;   ///< Last digit occurrence (same as first for single-digit lines)
    unsigned value;         ///< Two-digit calibration value in [0, 99]
};

/**
 * @brief Extract the calibration reading of one line
 *
 * The first and last digit are located by independent scans, their numeral
 * characters are concatenated and the two-character result is parsed as a
 * decimal number. A line with a single digit yields that digit twice.
 *
 * @param line Trimmed input line
 * @return First/last occurrences and the calibration value
 * @throws CalibrationError if fewer than two digit characters were collected
 */
inline CalibrationReading read_calibration(std::string_view line) {
    auto first = first_digit(line);
    auto last = last_digit(line);

    std::string coord;
    if (first) coord += first->numeral;
    if (last) coord += last->numeral;

    if (coord.size() != 2) {
        throw CalibrationError("no digit found in line \"" + std::string(line) + "\"");
    }

    return CalibrationReading{*first, *last, static_cast<unsigned>(std::stoul(coord))};
}

/**
 * @brief Calibration value of one line
 * @throws CalibrationError if the line contains no digit
 */
inline unsigned extract_calibration_value(std::string_view line) {
    return read_calibration(line).value;
}
