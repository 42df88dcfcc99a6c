#pragma once

#include <string>
#include <vector>

namespace tempo::pg {

/**
 * @brief Render a one-dimensional text array literal: {"a","b \"c\""}
 */
[[nodiscard]] std::string encode_text_array(const std::vector<std::string>& items);

/**
 * @brief Parse a one-dimensional array literal as returned in text format
 *
 * Handles quoted elements with backslash escapes; unquoted NULL elements
 * are skipped.
 */
[[nodiscard]] std::vector<std::string> decode_text_array(const std::string& literal);

} // namespace tempo::pg
