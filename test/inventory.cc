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

#include <textflow/inventory.hh>

#include "fixture.hh"

BOOST_TEST_DONT_PRINT_LOG_VALUE (textflow::size_class_t)
BOOST_TEST_DONT_PRINT_LOG_VALUE (textflow::position_band_t)
BOOST_TEST_DONT_PRINT_LOG_VALUE (textflow::coverage_status_t)

BOOST_AUTO_TEST_SUITE(inventory)

static const std::vector< std::tuple< double, textflow::size_class_t > >
size_class_dataset = {
    { 24.,  textflow::size_class_t::large    },
    { 18.,  textflow::size_class_t::standard },
    { 10.,  textflow::size_class_t::standard },
    {  9.9, textflow::size_class_t::small    },
    {  6.,  textflow::size_class_t::small    },
    {  5.,  textflow::size_class_t::tiny     }
};

BOOST_DATA_TEST_CASE(
    size_class_of_, data::make (size_class_dataset), font_size, result) {
    using namespace textflow;
    using namespace textflow::test;

    const auto token = make_token ("x", 0, 0, 10, 10, font_size);
    BOOST_TEST ((size_class_of (token) == result));
}

static const std::vector< std::tuple< double, textflow::position_band_t > >
position_band_dataset = {
    {  50., textflow::position_band_t::top    },
    { 113., textflow::position_band_t::top    },
    { 300., textflow::position_band_t::middle },
    { 668., textflow::position_band_t::middle },
    { 700., textflow::position_band_t::bottom }
};

BOOST_DATA_TEST_CASE(
    position_band_of_, data::make (position_band_dataset), y, result) {
    using namespace textflow;
    using namespace textflow::test;

    const params_t params{ };
    const auto page = make_page (1, { make_word ("x", 50, y) });

    BOOST_TEST ((position_band_of (page.tokens [0], page, params) == result));
}

static const std::vector< std::tuple< double, textflow::coverage_status_t > >
coverage_status_dataset = {
    { 1.,  textflow::coverage_status_t::good    },
    { .85, textflow::coverage_status_t::good    },
    { .8,  textflow::coverage_status_t::warning },
    { .7,  textflow::coverage_status_t::warning },
    { .69, textflow::coverage_status_t::poor    },
    { 0.,  textflow::coverage_status_t::poor    }
};

BOOST_DATA_TEST_CASE(
    coverage_status_, data::make (coverage_status_dataset), coverage, result) {
    using namespace textflow;
    BOOST_TEST ((coverage_status (coverage) == result));
}

BOOST_AUTO_TEST_CASE(counts) {
    using namespace textflow;
    using namespace textflow::test;

    const params_t params{ };

    document_t doc{ "doc", {
        make_page (1, {
            make_token ("Title", 50, 40, 150, 64, 24),
            make_word ("body", 50, 300),
            make_word ("text", 80, 300),
            make_token ("note", 50, 750, 70, 757, 7)
        }),
        make_page (2, {
            make_word ("more", 50, 300)
        })
    } };

    const inventory_t inventory (doc, params);

    BOOST_TEST (inventory.total () == 5U);
    BOOST_TEST_REQUIRE (inventory.pages ().size () == 2U);

    const auto& first = inventory.pages () [0];

    BOOST_TEST (first.page == 1);
    BOOST_TEST (first.total == 4U);

    BOOST_TEST (first.positions [size_t (position_band_t::top)]    == 1U);
    BOOST_TEST (first.positions [size_t (position_band_t::middle)] == 2U);
    BOOST_TEST (first.positions [size_t (position_band_t::bottom)] == 1U);

    BOOST_TEST (first.sizes [size_t (size_class_t::large)]    == 1U);
    BOOST_TEST (first.sizes [size_t (size_class_t::standard)] == 2U);
    BOOST_TEST (first.sizes [size_t (size_class_t::small)]    == 1U);
    BOOST_TEST (first.sizes [size_t (size_class_t::tiny)]     == 0U);

    const auto xs = inventory.position_distribution ();

    BOOST_TEST (xs [0] == .2, boost::test_tools::tolerance (1e-9));
    BOOST_TEST (xs [1] == .6, boost::test_tools::tolerance (1e-9));
    BOOST_TEST (xs [2] == .2, boost::test_tools::tolerance (1e-9));
}

BOOST_AUTO_TEST_CASE(coverage) {
    using namespace textflow;
    using namespace textflow::test;

    const params_t params{ };

    document_t doc{ "doc", {
        make_page (1, {
            make_word ("a", 50, 50),
            make_word ("b", 50, 300),
            make_word ("c", 50, 400),
            make_word ("d", 50, 750)
        })
    } };

    const inventory_t inventory (doc, params);
    const auto& tokens = doc.pages [0].tokens;

    BOOST_TEST (inventory.coverage ({ }) == 0.);

    BOOST_TEST (
        inventory.coverage ({ &tokens [1], &tokens [2] }) == .5,
        boost::test_tools::tolerance (1e-9));

    BOOST_TEST (
        inventory.coverage ({ &tokens [0], &tokens [1], &tokens [2], &tokens [3] })
        == 1.);

    //
    // Tokens that are not part of the document do not count:
    //
    const auto stranger = make_word ("e", 50, 300);
    BOOST_TEST (inventory.coverage ({ &stranger }) == 0.);

    const auto xs = inventory.position_distribution ({ &tokens [1], &tokens [3] });

    BOOST_TEST (xs [0] == 0.);
    BOOST_TEST (xs [1] == .5, boost::test_tools::tolerance (1e-9));
    BOOST_TEST (xs [2] == .5, boost::test_tools::tolerance (1e-9));
}

BOOST_AUTO_TEST_CASE(empty) {
    using namespace textflow;

    const params_t params{ };
    const document_t doc{ "empty", { } };

    const inventory_t inventory (doc, params);

    BOOST_TEST (inventory.total () == 0U);
    BOOST_TEST (inventory.coverage ({ }) == 0.);

    const auto xs = inventory.position_distribution ();
    BOOST_TEST (xs [0] + xs [1] + xs [2] == 0.);
}

BOOST_AUTO_TEST_SUITE_END()
