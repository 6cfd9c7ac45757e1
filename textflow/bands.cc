// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <textflow/bands.hh>

#include <utils/string.hh>

#include <range/v3/algorithm/sort.hpp>
#include <range/v3/algorithm/stable_sort.hpp>
using namespace ranges;

namespace textflow {
namespace {

bool is_opening (char32_t c) {
    return c == '(' || c == '[' || c == '{' || c == U'（' || c == U'「' ||
        c == U'『' || c == U'【';
}

bool is_closing_punctuation (char32_t c) {
    return is_punctuation (c) && !is_opening (c);
}

} // anonymous

bands_t make_bands (token_refs_t xs, const params_t& params) {
    sort (xs, [](auto lhs, auto rhs) {
        const auto& a = lhs->box.arr;
        const auto& b = rhs->box.arr;
        return a [1] < b [1] || (a [1] == b [1] && a [0] < b [0]);
    });

    bands_t bands;

    for (auto p : xs) {
        if (!bands.empty ()) {
            auto& band = bands.back ();

            if (vertical_overlap (band.box, p->box) > 0 &&
                p->box.arr [1] - band.box.arr [1] < params.line_height) {
                band.tokens.push_back (p);
                band.box += p->box;
                continue;
            }
        }

        bands.push_back (band_t{ { p }, p->box });
    }

    for (auto& band : bands) {
        stable_sort (band.tokens, [](auto lhs, auto rhs) {
            return lhs->box.arr [0] < rhs->box.arr [0];
        });
    }

    return bands;
}

void sort_column (column_t& column, const params_t& params) {
    column.bands = make_bands (column.tokens, params);
}

token_refs_t reading_order (const column_t& column) {
    token_refs_t xs;

    for (auto& band : column.bands) {
        xs.insert (xs.end (), band.tokens.begin (), band.tokens.end ());
    }

    return xs;
}

bool needs_space (
    const std::string& lhs, const bbox_t& lbox,
    const std::string& rhs, const bbox_t& rbox, const params_t& params) {
    if (lhs.empty () || rhs.empty ()) {
        return false;
    }

    const auto gap = rbox.arr [0] - lbox.arr [2];

    if (gap < params.word_gap) {
        return false;
    }

    const auto a = utf8_decode (lhs), b = utf8_decode (rhs);

    if (!a || !b || a->empty () || b->empty ()) {
        return true;
    }

    const auto last = a->back (), first = b->front ();

    if (is_cjk (last) && is_cjk (first)) {
        return gap > params.cjk_word_gap;
    }

    if (is_closing_punctuation (first) || is_opening (last)) {
        return false;
    }

    return true;
}

std::string text_of (const band_t& band, const params_t& params) {
    std::string s;

    const token_t* prev = nullptr;

    for (auto p : band.tokens) {
        if (prev && needs_space (prev->text, prev->box, p->text, p->box, params)) {
            s += ' ';
        }

        s += p->text;
        prev = p;
    }

    return s;
}

} // namespace textflow
