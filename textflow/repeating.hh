// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_REPEATING_HH
#define TEXTFLOW_TEXTFLOW_REPEATING_HH

#include <defs.hh>

#include <optional>
#include <set>
#include <string>
#include <tuple>

#include <textflow/params.hh>
#include <textflow/token.hh>

namespace textflow {

enum struct region_t { top, bottom };

//
// A running header or footer: the text and its position on the page, rounded
// to a grid so that small jitter between pages does not matter:
//
struct signature_t {
    std::string text;
    region_t region;
    int x, y;
};

inline bool operator< (const signature_t& lhs, const signature_t& rhs) {
    return std::tie (lhs.text, lhs.region, lhs.x, lhs.y) <
        std::tie (rhs.text, rhs.region, rhs.x, rhs.y);
}

using signatures_t = std::set< signature_t >;

//
// The signature of a token, if it lies in the header or footer band of its
// page:
//
std::optional< signature_t >
signature_of (const token_t&, const page_t&, const params_t&);

//
// Signatures present on more than `repeat_fraction' of the pages, and on two
// pages at least. Nothing is removed here:
//
signatures_t
find_repeating_elements (const document_t&, const params_t&);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_REPEATING_HH
