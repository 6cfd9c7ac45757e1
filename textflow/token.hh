// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_TOKEN_HH
#define TEXTFLOW_TEXTFLOW_TOKEN_HH

#include <defs.hh>

#include <string>
#include <vector>

#include <textflow/textflow.hh>

namespace textflow {

//
// A positioned word as produced by the upstream parser. Tokens are never
// modified after loading; every later stage refers to them by pointer:
//
struct token_t {
    std::string text;
    bbox_t box;
    double font_size;
    double baseline;
    int page;
};

using tokens_t = std::vector< token_t >;
using token_refs_t = std::vector< const token_t* >;

//
// A ruled line drawn on the page (table borders, separators):
//
struct rule_t {
    bbox_t box;
};

enum struct page_condition_t {
    empty_token_stream,
    encoding_anomaly,
    rotated_page,
    low_confidence,
    collaborator_failure,
    table_detection_ambiguous
};

const char* to_string (page_condition_t);

struct page_t {
    int number;
    double width, height;

    // Degrees; the pipeline works on upright pages only:
    int rotation;

    tokens_t tokens;
    std::vector< rule_t > rules;

    bbox_t box () const { return bbox_t{ 0, 0, width, height }; }
};

struct document_t {
    std::string name;
    std::vector< page_t > pages;
};

inline double font_size_of (const token_t* p) { return p->font_size; }

inline const bbox_t& bbox_from (const token_t& x) { return x.box; }
inline const bbox_t& bbox_from (const token_t* p) { return p->box; }

//
// Bounding box of a non-empty range of tokens or token pointers:
//
template< typename Range >
inline bbox_t bbox_of (const Range& xs) {
    ASSERT (!xs.empty ());

    auto box = bbox_from (*xs.begin ());

    for (auto& x : xs) {
        box += bbox_from (x);
    }

    return box;
}

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_TOKEN_HH
