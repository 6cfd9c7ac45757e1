// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <cmath>
#include <map>
#include <numeric>
#include <optional>
#include <set>

#include <textflow/bands.hh>
#include <textflow/tables.hh>

#include <utils/string.hh>

#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/algorithm/sort.hpp>
using namespace ranges;

// Confidence of a table drawn with ruled lines:
#define ruledTableConfidence 0.95

// Confidence of an aligned table is alignedTableBase plus alignedTableFill
// times the fraction of non-empty cells:
#define alignedTableBase 0.6
#define alignedTableFill 0.15

// Aligned tables that overlap a ruled table but disagree with it keep this
// fraction of their confidence:
#define ambiguousTableDiscount 0.8

// Minimum intersection over union for two detections to be the same table:
#define sameTableIoU 0.5

namespace textflow {
namespace {

using interval_t = std::pair< double, double >;

double distance_to (double x, const interval_t& i) {
    return x < i.first ? i.first - x : x > i.second ? x - i.second : 0;
}

size_t nearest (double x, const std::vector< interval_t >& xs) {
    size_t index = 0;

    for (size_t i = 1; i < xs.size (); ++i) {
        if (distance_to (x, xs [i]) < distance_to (x, xs [index])) {
            index = i;
        }
    }

    return index;
}

bbox_t box_of (const grid_t& grid) {
    return bbox_t{
        grid.cols.front ().first, grid.rows.front ().first,
        grid.cols.back ().second, grid.rows.back ().second
    };
}

bool inside (const point_t& pt, const bbox_t& box) {
    return
        box.arr [0] <= pt.x && pt.x <= box.arr [2] &&
        box.arr [1] <= pt.y && pt.y <= box.arr [3];
}

double fill_rate (const table_t& table) {
    const auto n = count_if (table.cells, [](auto& x) {
        return !x.tokens.empty ();
    });

    return ratio_of (n, table.cells.size ());
}

//
// Positions closer than the tolerance are one position, their mean:
//
std::vector< double > cluster (std::vector< double > xs, double tolerance) {
    sort (xs);

    std::vector< double > result;
    std::vector< double > group;

    for (auto x : xs) {
        if (!group.empty () && x - group.back () > tolerance) {
            result.push_back (
                std::accumulate (group.begin (), group.end (), 0.) / group.size ());
            group.clear ();
        }

        group.push_back (x);
    }

    if (!group.empty ()) {
        result.push_back (
            std::accumulate (group.begin (), group.end (), 0.) / group.size ());
    }

    return result;
}

bool horizontal (const rule_t& x, double thickness) {
    return height_of (x.box) <= thickness && width_of (x.box) > thickness;
}

bool vertical (const rule_t& x, double thickness) {
    return width_of (x.box) <= thickness && height_of (x.box) > thickness;
}

bool intersect (const rule_t& h, const rule_t& v, double tol) {
    const auto x = center_of (v.box).x, y = center_of (h.box).y;

    return
        h.box.arr [0] - tol <= x && x <= h.box.arr [2] + tol &&
        v.box.arr [1] - tol <= y && y <= v.box.arr [3] + tol;
}

struct disjoint_sets_t {
    std::vector< size_t > parent;

    explicit disjoint_sets_t (size_t n) : parent (n) {
        std::iota (parent.begin (), parent.end (), 0);
    }

    size_t find (size_t i) {
        while (parent [i] != i) {
            i = parent [i] = parent [parent [i]];
        }

        return i;
    }

    void unite (size_t a, size_t b) { parent [find (a)] = find (b); }
};

//
// A band broken at wide gaps; each piece is a cell candidate:
//
struct row_t {
    bbox_t box;
    std::vector< bbox_t > cells;
    size_t ntokens;
};

row_t split_row (const band_t& band, const params_t& params) {
    row_t row{ band.box, { }, band.tokens.size () };

    for (auto p : band.tokens) {
        if (row.cells.empty () ||
            p->box.arr [0] - row.cells.back ().arr [2] > params.table_cell_gap) {
            row.cells.push_back (p->box);
        }
        else {
            row.cells.back () += p->box;
        }
    }

    return row;
}

bool aligned (const row_t& lhs, const row_t& rhs, const params_t& params) {
    if (lhs.cells.size () != rhs.cells.size ()) {
        return false;
    }

    if (rhs.box.arr [1] - lhs.box.arr [3] > params.table_row_gap) {
        return false;
    }

    for (size_t i = 0; i < lhs.cells.size (); ++i) {
        const auto& a = lhs.cells [i];
        const auto& b = rhs.cells [i];

        if (horizontal_overlap (a, b) <= 0 &&
            std::fabs (a.arr [0] - b.arr [0]) > params.table_align_tolerance) {
            return false;
        }
    }

    return true;
}

std::optional< grid_t >
grid_from (const std::vector< row_t >& rows, const params_t& params) {
    const size_t ncols = rows.front ().cells.size ();

    size_t ntokens = 0;

    for (auto& row : rows) {
        ntokens += row.ntokens;
    }

    if (double (ntokens) / (rows.size () * ncols) > params.table_max_cell_tokens) {
        return { };
    }

    grid_t grid;

    for (auto& row : rows) {
        grid.rows.emplace_back (row.box.arr [1], row.box.arr [3]);
    }

    for (size_t i = 0; i < ncols; ++i) {
        auto box = rows.front ().cells [i];

        for (auto& row : rows) {
            box += row.cells [i];
        }

        grid.cols.emplace_back (box.arr [0], box.arr [2]);
    }

    return grid;
}

} // anonymous

const char* to_string (table_strategy_t x) {
    return x == table_strategy_t::ruled ? "ruled" : "aligned";
}

table_t
fill_table (const grid_t& grid, table_strategy_t strategy, double confidence,
            const token_refs_t& tokens, const params_t& params) {
    const auto box = box_of (grid);
    const auto nrows = grid.rows.size (), ncols = grid.cols.size ();

    table_t table{
        box, grid, nrows, ncols, { }, strategy, confidence, false
    };

    std::vector< token_refs_t > xs (nrows * ncols);

    for (auto p : tokens) {
        const auto c = center_of (p->box);

        if (!inside (c, box)) {
            continue;
        }

        xs [nearest (c.y, grid.rows) * ncols + nearest (c.x, grid.cols)]
            .push_back (p);
    }

    for (size_t i = 0; i < nrows; ++i) {
        for (size_t j = 0; j < ncols; ++j) {
            auto& cell_tokens = xs [i * ncols + j];

            std::vector< std::string > lines;

            for (auto& band : make_bands (cell_tokens, params)) {
                lines.push_back (text_of (band, params));
            }

            table.cells.push_back (cell_t{
                join (lines, " "),
                bbox_t{
                    grid.cols [j].first, grid.rows [i].first,
                    grid.cols [j].second, grid.rows [i].second
                },
                std::move (cell_tokens)
            });
        }
    }

    return table;
}

tables_t
find_ruled_tables (
    const page_t& page, const token_refs_t& tokens, const params_t& params) {
    std::vector< const rule_t* > hs, vs;

    for (auto& rule : page.rules) {
        if (horizontal (rule, params.rule_thickness)) {
            hs.push_back (&rule);
        }
        else if (vertical (rule, params.rule_thickness)) {
            vs.push_back (&rule);
        }
    }

    if (hs.size () < 3 || vs.size () < 3) {
        return { };
    }

    //
    // Horizontal rules are [0, hs.size ()), vertical ones follow:
    //
    disjoint_sets_t sets (hs.size () + vs.size ());

    for (size_t i = 0; i < hs.size (); ++i) {
        for (size_t j = 0; j < vs.size (); ++j) {
            if (intersect (*hs [i], *vs [j], params.rule_tolerance)) {
                sets.unite (i, hs.size () + j);
            }
        }
    }

    std::map< size_t, std::pair< std::vector< double >, std::vector< double > > >
        components;

    for (size_t i = 0; i < hs.size (); ++i) {
        components [sets.find (i)].first.push_back (center_of (hs [i]->box).y);
    }

    for (size_t j = 0; j < vs.size (); ++j) {
        components [sets.find (hs.size () + j)].second.push_back (
            center_of (vs [j]->box).x);
    }

    tables_t tables;

    for (auto& [ root, positions ] : components) {
        const auto ys = cluster (positions.first, params.rule_tolerance);
        const auto xs = cluster (positions.second, params.rule_tolerance);

        if (ys.size () < 3 || xs.size () < 3) {
            continue;
        }

        grid_t grid;

        for (size_t i = 1; i < ys.size (); ++i) {
            grid.rows.emplace_back (ys [i - 1], ys [i]);
        }

        for (size_t i = 1; i < xs.size (); ++i) {
            grid.cols.emplace_back (xs [i - 1], xs [i]);
        }

        tables.push_back (fill_table (
            grid, table_strategy_t::ruled, ruledTableConfidence, tokens,
            params));
    }

    return tables;
}

tables_t
find_aligned_tables (const token_refs_t& tokens, const params_t& params) {
    std::vector< row_t > rows;

    for (auto& band : make_bands (tokens, params)) {
        rows.push_back (split_row (band, params));
    }

    const auto min_rows = size_t (params.table_min_rows);
    const auto min_cols = size_t (params.table_min_cols);

    tables_t tables;

    for (size_t first = 0; first < rows.size ();) {
        if (rows [first].cells.size () < min_cols) {
            ++first;
            continue;
        }

        size_t last = first + 1;

        for (; last < rows.size () && aligned (rows [last - 1], rows [last], params);
             ++last) ;

        if (last - first >= min_rows) {
            const std::vector< row_t > run (
                rows.begin () + first, rows.begin () + last);

            if (auto grid = grid_from (run, params)) {
                auto table = fill_table (
                    *grid, table_strategy_t::aligned, 0, tokens, params);

                table.confidence =
                    alignedTableBase + alignedTableFill * fill_rate (table);

                tables.push_back (std::move (table));
            }
        }

        first = last;
    }

    return tables;
}

tables_t reconcile_tables (tables_t ruled, tables_t aligned) {
    const auto same_table = [](const table_t& a, const table_t& r) {
        return iou (a.box, r.box) >= sameTableIoU &&
            a.rows == r.rows && a.cols == r.cols;
    };

    std::vector< bool > confirmed (ruled.size ()), dropped (ruled.size ());
    std::vector< bool > superseded (aligned.size ());

    //
    // Detections that agree on region and shape: the ruled grid stands.
    //
    for (size_t i = 0; i < aligned.size (); ++i) {
        for (size_t j = 0; j < ruled.size (); ++j) {
            if (same_table (aligned [i], ruled [j])) {
                confirmed [j] = superseded [i] = true;
            }
        }
    }

    //
    // Remaining overlaps disagree: fall back to the aligned detection at a
    // discount, unless it overlaps a confirmed grid.
    //
    for (size_t i = 0; i < aligned.size (); ++i) {
        if (superseded [i]) {
            continue;
        }

        auto& a = aligned [i];

        for (size_t j = 0; j < ruled.size (); ++j) {
            if (confirmed [j] && overlapping (a.box, ruled [j].box)) {
                superseded [i] = true;
                break;
            }
        }

        if (superseded [i]) {
            continue;
        }

        for (size_t j = 0; j < ruled.size (); ++j) {
            if (!overlapping (a.box, ruled [j].box)) {
                continue;
            }

            dropped [j] = true;

            if (!a.ambiguous) {
                error (errLayout, -1,
                       "Ambiguous table detection at ({0:.1f}, {1:.1f}); "
                       "keeping the aligned grid", a.box.arr [0],
                       a.box.arr [1]);

                a.ambiguous = true;
                a.confidence *= ambiguousTableDiscount;
            }
        }
    }

    tables_t tables;

    for (size_t j = 0; j < ruled.size (); ++j) {
        if (!dropped [j]) {
            tables.push_back (std::move (ruled [j]));
        }
    }

    for (size_t i = 0; i < aligned.size (); ++i) {
        if (!superseded [i]) {
            tables.push_back (std::move (aligned [i]));
        }
    }

    sort (tables, [](auto& lhs, auto& rhs) {
        return lhs.box.arr [1] < rhs.box.arr [1];
    });

    return tables;
}

tables_t
detect_tables (
    const page_t& page, const token_refs_t& tokens, const params_t& params) {
    if (!params.detect_tables || tokens.empty ()) {
        return { };
    }

    auto tables = reconcile_tables (
        find_ruled_tables (page, tokens, params),
        find_aligned_tables (tokens, params));

    //
    // Refill in order so that a token lands in one table only:
    //
    auto rest = tokens;

    for (auto& table : tables) {
        auto tmp = fill_table (
            table.grid, table.strategy, table.confidence, rest, params);

        tmp.ambiguous = table.ambiguous;
        table = std::move (tmp);

        rest = exclude_table_tokens (rest, { table });
    }

    return tables;
}

token_refs_t
exclude_table_tokens (const token_refs_t& tokens, const tables_t& tables) {
    std::set< const token_t* > claimed;

    for (auto& table : tables) {
        for (auto& cell : table.cells) {
            claimed.insert (cell.tokens.begin (), cell.tokens.end ());
        }
    }

    token_refs_t xs;

    for (auto p : tokens) {
        if (!claimed.count (p)) {
            xs.push_back (p);
        }
    }

    return xs;
}

std::vector< std::string > format_table (const table_t& table) {
    std::vector< std::string > lines;

    for (size_t i = 0; i < table.rows; ++i) {
        std::vector< std::string > xs;

        for (size_t j = 0; j < table.cols; ++j) {
            xs.push_back (table.at (i, j).text);
        }

        lines.push_back (join (xs, " | "));
    }

    return lines;
}

} // namespace textflow
