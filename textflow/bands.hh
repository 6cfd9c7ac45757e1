// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_BANDS_HH
#define TEXTFLOW_TEXTFLOW_BANDS_HH

#include <defs.hh>

#include <string>

#include <textflow/columns.hh>
#include <textflow/params.hh>
#include <textflow/token.hh>

namespace textflow {

//
// Groups tokens into bands: in (top, left) order, a token joins the last band
// if it overlaps it vertically and its top is within `line_height' of the
// band's top. Bands come out top to bottom, their tokens left to right:
//
bands_t make_bands (token_refs_t, const params_t&);

void sort_column (column_t&, const params_t&);

//
// Column tokens in reading order, bands top to bottom:
//
token_refs_t reading_order (const column_t&);

//
// True if a space separates the two adjacent pieces of text in a line. Close
// pieces are glued, CJK text is glued unless far apart, and no space goes
// before closing or after opening punctuation:
//
bool needs_space (
    const std::string& lhs, const bbox_t& lbox,
    const std::string& rhs, const bbox_t& rbox, const params_t&);

std::string text_of (const band_t&, const params_t&);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_BANDS_HH
