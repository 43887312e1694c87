#pragma once
#include "calibration.hpp"
#include "digit_words.hpp"
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <initializer_list>
#include <string>
#include <nlohmann/json.hpp>
using json = nlohmann::json;

inline const char* digit_source_name(DigitSource source) {
    return source == DigitSource::Word ? "word" : "numeral";
}

/**
 * @brief Per-line telemetry record of the calibration pipeline
 *
 * Captures where the first and last digit were taken from so that a
 * surprising value can be traced back to its line.
 */
struct CalibrationSample {
    std::uint64_t line_number;   ///< 1-based line number in the document
    DigitOccurrence first;       ///< First digit occurrence
    DigitOccurrence last;        ///< Last digit occurrence
    unsigned value;              ///< Calibration value of the line

    /**
     * @brief Default constructor - empty sample
     */
    CalibrationSample()
        : line_number(0)
        , first{'0', 0, DigitSource::Numeral}
        , last{'0', 0, DigitSource::Numeral}
        , value(0)
    {}

    CalibrationSample(std::uint64_t line, const CalibrationReading& reading)
        : line_number(line)
        , first(reading.first)
        , last(reading.last)
        , value(reading.value)
    {}

    /**
     * @brief True if the line held exactly one digit occurrence
     */
    bool is_single_digit() const {
        return first.index == last.index && first.source == last.source;
    }

    /**
     * @brief True if the last digit word starts inside the first digit word
     *
     * "twone" reads as two (first) and one (last) sharing the letter 'o'.
     */
    bool is_overlap() const {
        if (first.source != DigitSource::Word || last.source != DigitSource::Word) {
            return false;
        }
        return last.index > first.index &&
               last.index < first.index + numeral_word_length(first.numeral);
    }

    /**
     * @brief Format sample as human-readable string for debugging
     */
    std::string to_string() const {
        char buffer[256];
        std::snprintf(buffer, sizeof(buffer),
            "CalibrationSample{line=%llu, first=%c@%zu(%s), last=%c@%zu(%s), value=%u%s}",
            static_cast<unsigned long long>(line_number),
            first.numeral, first.index, digit_source_name(first.source),
            last.numeral, last.index, digit_source_name(last.source),
            value, is_overlap() ? ", overlap" : "");
        return std::string(buffer);
    }

    json to_json() const {
        return json{
            {"line", line_number},
            {"first", {{"digit", std::string(1, first.numeral)},
                       {"index", first.index},
                       {"source", digit_source_name(first.source)}}},
            {"last", {{"digit", std::string(1, last.numeral)},
                      {"index", last.index},
                      {"source", digit_source_name(last.source)}}},
            {"value", value},
            {"overlap", is_overlap()}
        };
    }
};

/**
 * @brief Accumulated statistics over a whole calibration document
 */
struct CalibrationStats {
    std::uint64_t line_count{0};
    std::uint64_t sum{0};

    // Digit provenance, counted once for first and once for last
    std::uint64_t word_digits{0};
    std::uint64_t numeral_digits{0};

    std::uint64_t single_digit_lines{0};
    std::uint64_t overlap_lines{0};

    unsigned min_value{0};
    unsigned max_value{0};

    void record(const CalibrationSample& sample) {
        if (line_count == 0) {
            min_value = sample.value;
            max_value = sample.value;
        } else {
            min_value = std::min(min_value, sample.value);
            max_value = std::max(max_value, sample.value);
        }

        ++line_count;
        sum += sample.value;

        for (const auto& digit : {sample.first, sample.last}) {
            if (digit.source == DigitSource::Word) {
                ++word_digits;
            } else {
                ++numeral_digits;
            }
        }

        if (sample.is_single_digit()) ++single_digit_lines;
        if (sample.is_overlap()) ++overlap_lines;
    }

    /**
     * @brief Reset all statistics
     */
    void reset() {
        *this = CalibrationStats{};
    }

    json to_json() const {
        return json{
            {"lines", line_count},
            {"sum", sum},
            {"word_digits", word_digits},
            {"numeral_digits", numeral_digits},
            {"single_digit_lines", single_digit_lines},
            {"overlap_lines", overlap_lines},
            {"min_value", min_value},
            {"max_value", max_value}
        };
    }
};
