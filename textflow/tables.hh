// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_TABLES_HH
#define TEXTFLOW_TEXTFLOW_TABLES_HH

#include <defs.hh>

#include <string>
#include <utility>
#include <vector>

#include <textflow/params.hh>
#include <textflow/token.hh>

namespace textflow {

enum struct table_strategy_t { ruled, aligned };

const char* to_string (table_strategy_t);

//
// A table skeleton: row and column extents, top to bottom and left to right:
//
struct grid_t {
    std::vector< std::pair< double, double > > rows, cols;
};

struct cell_t {
    std::string text;
    bbox_t box;
    token_refs_t tokens;
};

struct table_t {
    bbox_t box;
    grid_t grid;
    size_t rows, cols;

    // Row-major, rows * cols cells:
    std::vector< cell_t > cells;

    table_strategy_t strategy;
    double confidence;

    // Both strategies fired over the region and disagreed:
    bool ambiguous;

    const cell_t& at (size_t row, size_t col) const {
        return cells [row * cols + col];
    }
};

using tables_t = std::vector< table_t >;

//
// Grids drawn with ruled lines, at least 2x2 cells, high confidence:
//
tables_t find_ruled_tables (const page_t&, const token_refs_t&, const params_t&);

//
// Grids of text aligned in at least `table_min_rows' rows and
// `table_min_cols' columns, medium confidence:
//
tables_t find_aligned_tables (const token_refs_t&, const params_t&);

//
// Both strategies, reconciled: an aligned table covering the same region with
// the same shape as a ruled one is dropped. If an aligned and a ruled table
// overlap but disagree (less than half their union in common, or a different
// shape) the ruled table is dropped and the aligned one is kept at a discount,
// marked ambiguous:
//
tables_t reconcile_tables (tables_t ruled, tables_t aligned);

tables_t detect_tables (const page_t&, const token_refs_t&, const params_t&);

//
// Every token whose center lies in the grid's extent goes to the nearest cell:
//
table_t
fill_table (const grid_t&, table_strategy_t, double confidence,
            const token_refs_t&, const params_t&);

//
// The tokens that do not belong to any of the tables:
//
token_refs_t exclude_table_tokens (const token_refs_t&, const tables_t&);

//
// One `a | b | c' line per table row:
//
std::vector< std::string > format_table (const table_t&);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_TABLES_HH
