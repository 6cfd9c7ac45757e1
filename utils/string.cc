// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <string>
#include <vector>

#include <utils/string.hh>

namespace textflow {

std::vector< std::string >
split(const std::string &s, const std::string &delims)
{
    std::vector< std::string > xs;

    for (size_t first = 0, second; first < s.size(); first = second + 1) {
        second = s.find_first_of(delims, first);

        if (first != second)
            xs.emplace_back(s.substr(first, second - first));

        if (second == std::string::npos)
            break;
    }

    return xs;
}

std::string trim(const std::string &s)
{
    static const char *ws = " \t\r\n\f\v";

    const auto first = s.find_first_not_of(ws);

    if (first == std::string::npos)
        return { };

    return s.substr(first, s.find_last_not_of(ws) - first + 1);
}

std::string
join(const std::vector< std::string > &xs, const std::string &sep)
{
    std::string s;

    for (size_t i = 0; i < xs.size(); ++i) {
        if (i)
            s += sep;

        s += xs[i];
    }

    return s;
}

std::optional< std::u32string > utf8_decode(const std::string &s)
{
    std::u32string result;
    result.reserve(s.size());

    for (size_t i = 0, n = s.size(); i < n;) {
        const unsigned char c = s[i];

        size_t len;
        char32_t cp;

        if (c < 0x80) {
            len = 1, cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2, cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3, cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4, cp = c & 0x07;
        } else {
            return { };
        }

        if (i + len > n)
            return { };

        for (size_t j = 1; j < len; ++j) {
            const unsigned char cc = s[i + j];

            if ((cc & 0xC0) != 0x80)
                return { };

            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong forms and surrogates are malformed:
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
            (len == 4 && (cp < 0x10000 || cp > 0x10FFFF)) ||
            (cp >= 0xD800 && cp <= 0xDFFF))
            return { };

        result += cp;
        i += len;
    }

    return result;
}

std::string utf8_encode(char32_t c)
{
    std::string s;

    if (c < 0x80) {
        s += char(c);
    } else if (c < 0x800) {
        s += char(0xC0 | (c >> 6));
        s += char(0x80 | (c & 0x3F));
    } else if (c < 0x10000) {
        s += char(0xE0 | (c >> 12));
        s += char(0x80 | ((c >> 6) & 0x3F));
        s += char(0x80 | (c & 0x3F));
    } else {
        s += char(0xF0 | (c >> 18));
        s += char(0x80 | ((c >> 12) & 0x3F));
        s += char(0x80 | ((c >> 6) & 0x3F));
        s += char(0x80 | (c & 0x3F));
    }

    return s;
}

std::string utf8_encode(const std::u32string &s)
{
    std::string result;

    for (auto c : s)
        result += utf8_encode(c);

    return result;
}

bool is_cjk(char32_t c)
{
    return
        (c >= 0x3040 && c <= 0x30FF) || // Hiragana, Katakana
        (c >= 0x3400 && c <= 0x4DBF) || // CJK Extension A
        (c >= 0x4E00 && c <= 0x9FFF) || // CJK Unified Ideographs
        (c >= 0xAC00 && c <= 0xD7AF) || // Hangul syllables
        (c >= 0xF900 && c <= 0xFAFF) || // CJK Compatibility Ideographs
        (c >= 0xFF66 && c <= 0xFF9F);   // half-width Katakana
}

bool is_punctuation(char32_t c)
{
    if (c < 0x80) {
        switch (c) {
        case '.': case ',': case ';': case ':': case '!': case '?':
        case ')': case ']': case '}': case '(': case '[': case '{':
            return true;
        default:
            return false;
        }
    }

    return
        (c >= 0x3000 && c <= 0x303F) || // CJK symbols and punctuation
        (c >= 0xFF01 && c <= 0xFF0F) || // full-width ASCII punctuation
        (c >= 0xFF1A && c <= 0xFF1F);
}

} // namespace textflow
