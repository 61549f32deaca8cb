/**
 * @file Utf8.hpp
 * @brief Code-point aware length and truncation for UTF-8 text.
 */

#pragma once
#include <cstddef>
#include <string>

namespace dualtap::infrastructure {

class Utf8 {
public:
    /** @brief Number of code points (continuation bytes are not counted). */
    static std::size_t Length(const std::string& text);

    /** @brief First maxChars code points of text, never splitting a sequence. */
    static std::string Truncate(const std::string& text, std::size_t maxChars);

    /**
     * @brief Removes leading and trailing whitespace, including Unicode spaces such as
     * U+00A0 and U+3000. Interior whitespace is kept.
     */
    static std::string Trim(const std::string& text);
};

} // namespace dualtap::infrastructure
