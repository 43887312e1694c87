#pragma once
#include "digit_words.hpp"
#include <cstddef>
#include <optional>
#include <string_view>

/**
 * @brief Where a digit occurrence came from
 */
enum class DigitSource {
    Numeral,  ///< ASCII character '0'..'9'
    Word      ///< One of DIGIT_WORDS, matched as a raw substring
};

/**
 * @brief A single digit found in a line
 *
 * Indices are byte offsets into the (already trimmed) line.
 */
struct DigitOccurrence {
    char numeral;        ///< Digit value as a character '0'..'9'
    std::size_t index;   ///< Byte offset of the occurrence
    DigitSource source;  ///< Numeral or spelled-out word
};

inline bool is_ascii_numeral(char c) {
    return c >= '0' && c <= '9';
}

/**
 * @brief Leftmost ASCII numeral in the line
 */
inline std::optional<DigitOccurrence> find_first_numeral(std::string_view line) {
    for (std::size_t i = 0; i < line.size(); ++i) {
        if (is_ascii_numeral(line[i])) {
            return DigitOccurrence{line[i], i, DigitSource::Numeral};
        }
    }
    return std::nullopt;
}

/**
 * @brief Rightmost ASCII numeral in the line
 */
inline std::optional<DigitOccurrence> find_last_numeral(std::string_view line) {
    for (std::size_t i = line.size(); i > 0; --i) {
        if (is_ascii_numeral(line[i - 1])) {
            return DigitOccurrence{line[i - 1], i - 1, DigitSource::Numeral};
        }
    }
    return std::nullopt;
}

/**
 * @brief Leftmost digit word in the line
 *
 * Every word is searched independently as a plain substring, so words
 * embedded in other words ("zoneight") and overlapping words ("twone")
 * are all candidates. The smallest index across the nine words wins.
 */
inline std::optional<DigitOccurrence> find_first_word(std::string_view line) {
    std::optional<DigitOccurrence> best;
    for (auto word : DIGIT_WORDS) {
        auto index = line.find(word);
        if (index == std::string_view::npos) continue;
        if (!best || index < best->index) {
            best = DigitOccurrence{*word_to_numeral(word), index, DigitSource::Word};
        }
    }
    return best;
}

/**
 * @brief Rightmost digit word in the line
 *
 * Each word contributes only its own rightmost occurrence; a later word in
 * the table replaces the current best only if it starts strictly further right.
 */
inline std::optional<DigitOccurrence> find_last_word(std::string_view line) {
    std::optional<DigitOccurrence> best;
    for (auto word : DIGIT_WORDS) {
        auto index = line.rfind(word);
        if (index == std::string_view::npos) continue;
        if (!best || index > best->index) {
            best = DigitOccurrence{*word_to_numeral(word), index, DigitSource::Word};
        }
    }
    return best;
}

/**
 * @brief First digit of a line, numeral or word
 *
 * The numeral wins only when it starts strictly before the word;
 * on an equal index the word is taken.
 */
inline std::optional<DigitOccurrence> first_digit(std::string_view line) {
    auto numeral = find_first_numeral(line);
    auto word = find_first_word(line);

    if (numeral && word) {
        return numeral->index < word->index ? numeral : word;
    }
    return numeral ? numeral : word;
}

/**
 * @brief Last digit of a line, numeral or word
 *
 * The numeral wins only when it starts strictly after the word;
 * on an equal index the word is taken.
 */
inline std::optional<DigitOccurrence> last_digit(std::string_view line) {
    auto numeral = find_last_numeral(line);
    auto word = find_last_word(line);

    if (numeral && word) {
        return numeral->index > word->index ? numeral : word;
    }
    return numeral ? numeral : word;
}
