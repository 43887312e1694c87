#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

/**
 * @brief Spelled-out digits recognised in calibration lines
 *
 * Ordered so that the 1-based position of a word is its value.
 * "zero" is deliberately absent.
 */
inline constexpr std::array<std::string_view, 9> DIGIT_WORDS = {
    "one", "two", "three", "four", "five", "six", "seven", "eight", "nine"
};

/**
 * @brief Map a digit word to its numeral character
 * @param word Candidate word, matched exactly
 * @return '1'..'9', or std::nullopt if the word is not in DIGIT_WORDS
 */
inline std::optional<char> word_to_numeral(std::string_view word) {
    for (std::size_t i = 0; i < DIGIT_WORDS.size(); ++i) {
        if (DIGIT_WORDS[i] == word) {
            return static_cast<char>('1' + i);
        }
    }
    return std::nullopt;
}

/**
 * @brief Length of the word spelling a numeral ('1'..'9')
 * @return Word length, or 0 for anything else
 */
inline std::size_t numeral_word_length(char numeral) {
    if (numeral < '1' || numeral > '9') return 0;
    return DIGIT_WORDS[static_cast<std::size_t>(numeral - '1')].size();
}
