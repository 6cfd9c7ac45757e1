// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>

#include <textflow/columns.hh>

#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/algorithm/sort.hpp>
using namespace ranges;

namespace textflow {
namespace {

column_t make_column (token_refs_t tokens) {
    auto box = bbox_of (tokens);
    return column_t{ std::move (tokens), box, { } };
}

void merge_into (column_t& dst, const column_t& src) {
    dst.tokens.insert (dst.tokens.end (), src.tokens.begin (), src.tokens.end ());
    dst.box = coalesce (dst.box, src.box);
}

//
// Folds undersized columns into their nearest neighbour until every column
// is large enough or a single column is left:
//
void merge_small_columns (columns_t& xs, size_t min_tokens) {
    for (;;) {
        if (xs.size () < 2) {
            break;
        }

        auto iter = find_if (xs, [&](auto& x) {
            return x.tokens.size () < min_tokens;
        });

        if (iter == xs.end ()) {
            break;
        }

        const size_t i = iter - xs.begin ();

        size_t j;

        if (i == 0) {
            j = 1;
        }
        else if (i + 1 == xs.size ()) {
            j = i - 1;
        }
        else {
            const auto l = horizontal_distance (xs [i - 1].box, xs [i].box);
            const auto r = horizontal_distance (xs [i].box, xs [i + 1].box);
            j = r < l ? i + 1 : i - 1;
        }

        merge_into (xs [j], xs [i]);
        xs.erase (xs.begin () + i);
    }
}

} // anonymous

columns_t segment_columns (const token_refs_t& tokens, const params_t& params) {
    if (tokens.empty ()) {
        return { };
    }

    auto xs = tokens;

    sort (xs, [](auto lhs, auto rhs) {
        const auto& a = lhs->box.arr;
        const auto& b = rhs->box.arr;
        return a [0] < b [0] || (a [0] == b [0] && a [1] < b [1]);
    });

    columns_t columns;
    token_refs_t current{ xs.front () };

    auto right = xs.front ()->box.arr [2];

    for (auto iter = xs.begin () + 1; iter != xs.end (); ++iter) {
        const auto& box = (*iter)->box;

        if (box.arr [0] - right > params.column_gap) {
            columns.push_back (make_column (std::move (current)));
            current.clear ();
        }

        current.push_back (*iter);
        right = (std::max) (right, box.arr [2]);
    }

    columns.push_back (make_column (std::move (current)));

    merge_small_columns (columns, size_t (params.min_column_tokens));

    return columns;
}

} // namespace textflow
