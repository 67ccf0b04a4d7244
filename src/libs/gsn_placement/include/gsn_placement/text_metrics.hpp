#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace gsn_placement {

// Removes HTML-like markup from element content: tags are dropped (line-breaking tags such
// as <br>, <p>, <div>, <li> become '\n'), common entities are decoded, runs of blanks are
// collapsed and every line is trimmed. Empty lines are dropped.
std::string strip_markup(std::string_view content);

// Estimated advance of one line of plain UTF-8 text. CJK and full-width glyphs are wider
// than ASCII ones.
double estimate_text_width(std::string_view line);

bool is_wide_code_point(char32_t cp);

// Splits on '\n'.
std::vector<std::string_view> split_lines(std::string_view text);

} // namespace gsn_placement
