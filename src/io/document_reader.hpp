#pragma once
#include <filesystem>
#include <cstddef>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Check that a buffer is well-formed UTF-8
 *
 * Rejects stray continuation bytes, truncated sequences, overlong forms,
 * UTF-16 surrogates and code points above U+10FFFF.
 */
inline bool is_valid_utf8(std::string_view text) {
    std::size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        std::size_t length = 0;
        unsigned char min_second = 0x80;
        unsigned char max_second = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) min_second = 0xA0;  // overlong
            if (lead == 0xED) max_second = 0x9F;  // surrogates
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) min_second = 0x90;  // overlong
            if (lead == 0xF4) max_second = 0x8F;  // above U+10FFFF
        } else {
            return false;
        }

        if (text.size() - i < length) return false;

        auto second = static_cast<unsigned char>(text[i + 1]);
        if (second < min_second || second > max_second) return false;
        for (std::size_t k = 2; k < length; ++k) {
            auto next = static_cast<unsigned char>(text[i + k]);
            if (next < 0x80 || next > 0xBF) return false;
        }
        i += length;
    }
    return true;
}

/**
 * @brief Read a whole calibration document into memory
 * @param path File to read
 * @return File contents
 * @throws std::runtime_error if the path is missing, a directory, unreadable,
 *         or not valid UTF-8
 */
inline std::string read_document(const std::string& path) {
    if (std::filesystem::is_directory(path)) {
        throw std::runtime_error("Couldn't read input: " + path + " is a directory");
    }

    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Couldn't read input: cannot open " + path);
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("Couldn't read input: I/O error on " + path);
    }

    std::string content = buffer.str();
    if (!is_valid_utf8(content)) {
        throw std::runtime_error("Couldn't read input: " + path + " is not valid UTF-8");
    }
    return content;
}

/**
 * @brief Strip leading and trailing ASCII whitespace
 */
inline std::string_view trim(std::string_view line) {
    constexpr std::string_view whitespace = " \t\n\r\f\v";
    auto begin = line.find_first_not_of(whitespace);
    if (begin == std::string_view::npos) return {};
    auto end = line.find_last_not_of(whitespace);
    return line.substr(begin, end - begin + 1);
}

/**
 * @brief Split a document into trimmed lines
 *
 * Lines are separated by '\n'; a trailing '\r' is removed by trimming.
 * A terminating newline at the end of the document does not produce an
 * extra empty line, but empty lines in between are kept.
 */
inline std::vector<std::string> split_lines(std::string_view content) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < content.size()) {
        auto end = content.find('\n', start);
        if (end == std::string_view::npos) end = content.size();
        lines.emplace_back(trim(content.substr(start, end - start)));
        start = end + 1;
    }
    return lines;
}

/**
 * @brief Read a document and split it into trimmed lines
 * @throws std::runtime_error if the document cannot be read
 */
inline std::vector<std::string> read_lines(const std::string& path) {
    return split_lines(read_document(path));
}
