#include <gsn_placement/text_metrics.hpp>
#include <gsn_placement/layout_constants.hpp>
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>

namespace gsn_placement {

namespace {

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

std::string lower_ascii(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_line_break_tag(const std::string& name) {
    static const char* const names[] = {
        "br", "p", "div", "li", "ul", "ol", "tr", "h1", "h2", "h3", "h4", "h5", "h6", "blockquote", "pre",
    };
    return std::find(std::begin(names), std::end(names), name) != std::end(names);
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x110000) {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Decodes the entity body between '&' and ';'. Returns false for unknown entities.
bool decode_entity(std::string_view body, std::string& out) {
    if (body == "amp") { out.push_back('&'); return true; }
    if (body == "lt") { out.push_back('<'); return true; }
    if (body == "gt") { out.push_back('>'); return true; }
    if (body == "quot") { out.push_back('"'); return true; }
    if (body == "apos") { out.push_back('\''); return true; }
    if (body == "nbsp") { out.push_back(' '); return true; }
    if (body.size() >= 2 && body[0] == '#') {
        const bool hex = body[1] == 'x' || body[1] == 'X';
        const std::string digits(body.substr(hex ? 2 : 1));
        if (digits.empty()) return false;
        char* end = nullptr;
        const unsigned long value = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
        if (end == nullptr || *end != '\0' || value == 0 || value > 0x10FFFF) return false;
        append_utf8(out, static_cast<char32_t>(value));
        return true;
    }
    return false;
}

// Collapses blanks, trims lines and drops empty ones.
std::string normalize_whitespace(const std::string& raw) {
    std::string out;
    std::string line;
    auto flush_line = [&]() {
        while (!line.empty() && line.back() == ' ') line.pop_back();
        if (!line.empty()) {
            if (!out.empty()) out.push_back('\n');
            out += line;
        }
        line.clear();
    };
    for (char c : raw) {
        if (c == '\n') {
            flush_line();
        } else if (is_blank(c)) {
            if (!line.empty() && line.back() != ' ') line.push_back(' ');
        } else {
            line.push_back(c);
        }
    }
    flush_line();
    return out;
}

// Decodes one UTF-8 sequence at s[i]; advances i. Malformed bytes decode as U+FFFD.
char32_t next_code_point(std::string_view s, std::size_t& i) {
    const unsigned char c = static_cast<unsigned char>(s[i]);
    std::size_t len = 1;
    char32_t cp = 0xFFFD;
    if (c < 0x80) {
        cp = c;
    } else if ((c & 0xE0) == 0xC0) {
        len = 2;
        cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
        len = 3;
        cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
        len = 4;
        cp = c & 0x07;
    } else {
        ++i;
        return 0xFFFD;
    }
    if (i + len > s.size()) {
        ++i;
        return 0xFFFD;
    }
    for (std::size_t k = 1; k < len; ++k) {
        const unsigned char cc = static_cast<unsigned char>(s[i + k]);
        if ((cc & 0xC0) != 0x80) {
            ++i;
            return 0xFFFD;
        }
        cp = (cp << 6) | (cc & 0x3F);
    }
    i += len;
    return cp;
}

} // namespace

std::string strip_markup(std::string_view content) {
    std::string raw;
    raw.reserve(content.size());

    std::size_t i = 0;
    while (i < content.size()) {
        const char c = content[i];
        if (c == '<') {
            const std::size_t close = content.find('>', i + 1);
            if (close == std::string_view::npos) {
                raw.push_back(c);
                ++i;
                continue;
            }
            std::string_view tag = content.substr(i + 1, close - i - 1);
            if (!tag.empty() && tag.front() == '/') tag.remove_prefix(1);
            std::size_t name_end = 0;
            while (name_end < tag.size() && std::isalnum(static_cast<unsigned char>(tag[name_end])))
                ++name_end;
            if (is_line_break_tag(lower_ascii(tag.substr(0, name_end))))
                raw.push_back('\n');
            i = close + 1;
        } else if (c == '&') {
            const std::size_t semi = content.find(';', i + 1);
            if (semi != std::string_view::npos && semi - i <= 10
                && decode_entity(content.substr(i + 1, semi - i - 1), raw)) {
                i = semi + 1;
            } else {
                raw.push_back(c);
                ++i;
            }
        } else {
            raw.push_back(c);
            ++i;
        }
    }
    return normalize_whitespace(raw);
}

bool is_wide_code_point(char32_t cp) {
    return (cp >= 0x1100 && cp <= 0x115F)     // Hangul Jamo
        || (cp >= 0x2E80 && cp <= 0x303E)     // CJK radicals, punctuation
        || (cp >= 0x3041 && cp <= 0x33FF)     // Kana, CJK compatibility
        || (cp >= 0x3400 && cp <= 0x4DBF)     // CJK extension A
        || (cp >= 0x4E00 && cp <= 0x9FFF)     // CJK unified ideographs
        || (cp >= 0xA000 && cp <= 0xA4CF)     // Yi
        || (cp >= 0xAC00 && cp <= 0xD7A3)     // Hangul syllables
        || (cp >= 0xF900 && cp <= 0xFAFF)     // CJK compatibility ideographs
        || (cp >= 0xFE30 && cp <= 0xFE4F)     // CJK compatibility forms
        || (cp >= 0xFF00 && cp <= 0xFF60)     // full-width forms
        || (cp >= 0xFFE0 && cp <= 0xFFE6)
        || (cp >= 0x20000 && cp <= 0x3FFFD);  // supplementary ideographic planes
}

double estimate_text_width(std::string_view line) {
    double width = 0.0;
    std::size_t i = 0;
    while (i < line.size()) {
        const char32_t cp = next_code_point(line, i);
        if (cp < 0x20) continue;
        if (cp < 0x80)
            width += layout::ascii_glyph_width;
        else if (is_wide_code_point(cp))
            width += layout::wide_glyph_width;
        else
            width += layout::other_glyph_width;
    }
    return width;
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start <= text.size()) {
        const std::size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

} // namespace gsn_placement
