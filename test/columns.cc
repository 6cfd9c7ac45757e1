// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE textflow

#include <defs.hh>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <textflow/bands.hh>
#include <textflow/columns.hh>

#include "fixture.hh"

namespace {

//
// Two columns of three lines each, separated by a gutter of `gap' points:
//
textflow::tokens_t two_columns (double gap) {
    using namespace textflow::test;

    const double x = 250 + gap;

    return {
        make_token ("left-1",  50, 100, 250, 110),
        make_token ("right-1",  x, 100, x + 200, 110),
        make_token ("left-2",  50, 115, 250, 125),
        make_token ("right-2",  x, 115, x + 200, 125),
        make_token ("left-3",  50, 130, 250, 140),
        make_token ("right-3",  x, 130, x + 200, 140)
    };
}

} // anonymous

BOOST_AUTO_TEST_SUITE(columns)

BOOST_AUTO_TEST_CASE(two_columns_) {
    using namespace textflow;
    using namespace textflow::test;

    params_t params{ };
    params.column_gap = 50;

    const auto tokens = two_columns (60);
    auto columns = segment_columns (refs_of (tokens), params);

    BOOST_TEST_REQUIRE (columns.size () == 2U);

    for (auto& column : columns) {
        sort_column (column, params);
    }

    token_refs_t xs;

    for (auto& column : columns) {
        auto tmp = reading_order (column);
        xs.insert (xs.end (), tmp.begin (), tmp.end ());
    }

    const std::vector< std::string > result{
        "left-1", "left-2", "left-3", "right-1", "right-2", "right-3"
    };

    BOOST_TEST (texts_of (xs) == result);
}

static const std::vector< std::tuple< double, double, size_t > >
gap_dataset = {
    { 60, 50, 2 },
    { 51, 50, 2 },
    { 50, 50, 1 },
    { 40, 50, 1 },
    { 60, 70, 1 },
    { 60, 30, 2 }
};

BOOST_DATA_TEST_CASE(
    gutter, data::make (gap_dataset), gap, column_gap, result) {

    using namespace textflow;
    using namespace textflow::test;

    params_t params{ };
    params.column_gap = column_gap;

    const auto tokens = two_columns (gap);
    BOOST_TEST (segment_columns (refs_of (tokens), params).size () == result);
}

BOOST_AUTO_TEST_CASE(small_column) {
    using namespace textflow;
    using namespace textflow::test;

    params_t params{ };

    //
    // A lone token far to the right does not make a column of its own:
    //
    const tokens_t tokens{
        make_token ("a", 50, 100, 250, 110),
        make_token ("b", 50, 115, 250, 125),
        make_token ("c", 50, 130, 250, 140),
        make_token ("stray", 400, 115, 420, 125)
    };

    auto columns = segment_columns (refs_of (tokens), params);

    BOOST_TEST_REQUIRE (columns.size () == 1U);
    BOOST_TEST (columns [0].tokens.size () == 4U);
    BOOST_TEST (columns [0].box == (bbox_t{ 50, 100, 420, 140 }));
}

BOOST_AUTO_TEST_CASE(overlapping_lines) {
    using namespace textflow;
    using namespace textflow::test;

    params_t params{ };

    //
    // A wide heading spans the gutter of the lines below it, so there is
    // no gutter at all:
    //
    const tokens_t tokens{
        make_token ("heading", 50, 80, 500, 95),
        make_token ("a", 50, 100, 200, 110),
        make_token ("b", 300, 100, 500, 110),
        make_token ("c", 50, 115, 200, 125),
        make_token ("d", 300, 115, 500, 125)
    };

    BOOST_TEST (segment_columns (refs_of (tokens), params).size () == 1U);
}

BOOST_AUTO_TEST_CASE(empty) {
    using namespace textflow;

    const params_t params{ };
    BOOST_TEST (segment_columns ({ }, params).empty ());
}

BOOST_AUTO_TEST_SUITE_END()
