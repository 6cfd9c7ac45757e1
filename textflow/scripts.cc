// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <cmath>
#include <map>

#include <textflow/bands.hh>
#include <textflow/scripts.hh>

#include <utils/string.hh>

#include <range/v3/algorithm/max_element.hpp>
#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/view/transform.hpp>
using namespace ranges;

namespace textflow {
namespace {

const std::map< char32_t, char32_t >& superscripts () {
    static const std::map< char32_t, char32_t > xs{
        { U'0', U'⁰' }, { U'1', U'¹' }, { U'2', U'²' }, { U'3', U'³' },
        { U'4', U'⁴' }, { U'5', U'⁵' }, { U'6', U'⁶' }, { U'7', U'⁷' },
        { U'8', U'⁸' }, { U'9', U'⁹' }, { U'+', U'⁺' }, { U'-', U'⁻' },
        { U'=', U'⁼' }, { U'(', U'⁽' }, { U')', U'⁾' }, { U'n', U'ⁿ' },
        { U'i', U'ⁱ' }
    };

    return xs;
}

const std::map< char32_t, char32_t >& subscripts () {
    static const std::map< char32_t, char32_t > xs{
        { U'0', U'₀' }, { U'1', U'₁' }, { U'2', U'₂' }, { U'3', U'₃' },
        { U'4', U'₄' }, { U'5', U'₅' }, { U'6', U'₆' }, { U'7', U'₇' },
        { U'8', U'₈' }, { U'9', U'₉' }, { U'+', U'₊' }, { U'-', U'₋' },
        { U'=', U'₌' }, { U'(', U'₍' }, { U')', U'₎' }, { U'a', U'ₐ' },
        { U'e', U'ₑ' }, { U'o', U'ₒ' }, { U'x', U'ₓ' }
    };

    return xs;
}

word_t make_word (const token_t* p) {
    return word_t{ p->text, p->box, { p } };
}

} // anonymous

const char* to_string (script_kind_t x) {
    return x == script_kind_t::superscript ? "superscript" : "subscript";
}

std::optional< std::string >
to_script (const std::string& s, script_kind_t kind) {
    const auto& table = kind == script_kind_t::superscript
        ? superscripts () : subscripts ();

    const auto decoded = utf8_decode (s);

    if (!decoded || decoded->empty ()) {
        return { };
    }

    std::u32string result;

    for (auto c : *decoded) {
        auto iter = table.find (c);

        if (iter == table.end ()) {
            return { };
        }

        result += iter->second;
    }

    return utf8_encode (result);
}

line_t attach_scripts (
    const band_t& band, const params_t& params,
    script_attachments_t& attachments) {
    line_t line{ line_kind_t::text, { }, band.box, { } };

    if (band.tokens.empty ()) {
        return line;
    }

    const double mean = accumulate (
        band.tokens | views::transform (font_size_of), 0.) / band.tokens.size ();

    const auto largest = *max_element (band.tokens, std::less<>{ }, font_size_of);

    const auto is_script = [&](const token_t* p) {
        return band.tokens.size () > 1 &&
            p->font_size < params.script_size_ratio * mean &&
            std::fabs (p->baseline - largest->baseline) >
                params.script_offset_ratio * largest->font_size;
    };

    //
    // Words that start with a base token can take scripts; a script that
    // found no base stands on its own:
    //
    std::vector< bool > based;

    for (auto p : band.tokens) {
        if (!is_script (p)) {
            line.words.push_back (make_word (p));
            based.push_back (true);
            continue;
        }

        if (line.words.empty () || !based.back () ||
            p->box.arr [0] - line.words.back ().box.arr [2] >=
                params.script_proximity) {
            line.words.push_back (make_word (p));
            based.push_back (false);
            continue;
        }

        auto& word = line.words.back ();

        const auto kind = p->baseline < largest->baseline
            ? script_kind_t::superscript : script_kind_t::subscript;

        const auto canonical = to_script (p->text, kind);
        const auto& text = canonical ? *canonical : p->text;

        attachments.push_back ({
            kind, p, word.sources.front (), text, bool (canonical) });

        word.text += text;
        word.box += p->box;
        word.sources.push_back (p);
    }

    line.text = text_of (line.words, params);
    return line;
}

std::string text_of (const std::vector< word_t >& words, const params_t& params) {
    std::string s;

    for (size_t i = 0; i < words.size (); ++i) {
        if (i && needs_space (
                words [i - 1].text, words [i - 1].box,
                words [i].text, words [i].box, params)) {
            s += ' ';
        }

        s += words [i].text;
    }

    return s;
}

} // namespace textflow
