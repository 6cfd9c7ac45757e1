// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_COLUMNS_HH
#define TEXTFLOW_TEXTFLOW_COLUMNS_HH

#include <defs.hh>

#include <vector>

#include <textflow/params.hh>
#include <textflow/token.hh>

namespace textflow {

//
// One visual line: tokens whose vertical extents overlap, left to right:
//
struct band_t {
    token_refs_t tokens;
    bbox_t box;
};

using bands_t = std::vector< band_t >;

struct column_t {
    token_refs_t tokens;
    bbox_t box;

    // Filled in by the reading order sorter:
    bands_t bands;
};

using columns_t = std::vector< column_t >;

//
// Splits the tokens of a page at vertical gutters wider than `column_gap'.
// Columns come out left to right; a candidate column with fewer than
// `min_column_tokens' tokens is folded into its nearest neighbour:
//
columns_t segment_columns (const token_refs_t&, const params_t&);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_COLUMNS_HH
