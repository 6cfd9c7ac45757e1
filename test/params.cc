// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE textflow

#include <defs.hh>

#include <sstream>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <textflow/params.hh>

#include "fixture.hh"

BOOST_AUTO_TEST_SUITE(params)

BOOST_AUTO_TEST_CASE(defaults) {
    using namespace textflow;

    const params_t params{ };

    BOOST_TEST (params.column_gap == 50);
    BOOST_TEST (params.line_height == 15);
    BOOST_TEST (params.margin_filtering);
    BOOST_TEST (params.quality_threshold == 70);
    BOOST_TEST (params.max_attempts == 2);
    BOOST_TEST (params.footnote_page_window == 3);
    BOOST_TEST ((params.ocr_backend == backend_t::none));
}

BOOST_AUTO_TEST_CASE(parse) {
    using namespace textflow;

    test::capture_errors_t errors;

    std::istringstream ss (
        "# layout\n"
        "columnGap 60\n"
        "lineHeight 12.5\n"
        "marginFilter no\n"
        "\n"
        "ocrBackend local\n"
        "ocrCommand \"my-ocr --json\"\n"
        "pageMarkers yes\n");

    params_t params;
    parse_config (params, ss, "test");

    BOOST_TEST (errors.messages.empty ());

    BOOST_TEST (params.column_gap == 60);
    BOOST_TEST (params.line_height == 12.5);
    BOOST_TEST (!params.margin_filtering);
    BOOST_TEST ((params.ocr_backend == backend_t::local));
    BOOST_TEST (params.ocr_command == "my-ocr --json");
    BOOST_TEST (params.page_markers);
}

static const std::vector< std::string >
bad_line_dataset = {
    "columnGap",
    "columnGap wide",
    "marginFilter maybe",
    "repeatFraction 1.5",
    "maxAttempts 0",
    "ocrBackend cloud",
    "frobnicate 3"
};

BOOST_DATA_TEST_CASE(
    bad_line, data::make (bad_line_dataset), line) {

    using namespace textflow;

    test::capture_errors_t errors;

    std::istringstream ss (line);

    const params_t defaults{ };
    params_t params;

    parse_config (params, ss, "test");

    BOOST_TEST (errors.messages.size () == 1U);
    BOOST_TEST (params.column_gap == defaults.column_gap);
    BOOST_TEST (params.margin_filtering == defaults.margin_filtering);
    BOOST_TEST (params.repeat_fraction == defaults.repeat_fraction);
    BOOST_TEST (params.max_attempts == defaults.max_attempts);
    BOOST_TEST ((params.ocr_backend == defaults.ocr_backend));
}

BOOST_AUTO_TEST_CASE(missing_file) {
    using namespace textflow;

    params_t params;
    BOOST_TEST (!parse_config_file (params, "/nonexistent/textflowrc"));
}

BOOST_AUTO_TEST_CASE(attempts) {
    using namespace textflow;

    params_t base;
    base.column_gap = 40;

    {
        auto params = params_for_attempt (base, 1);
        BOOST_TEST (params.margin_filtering);
        BOOST_TEST (params.column_gap == 40);
    }

    {
        auto params = params_for_attempt (base, 2);
        BOOST_TEST (!params.margin_filtering);
        BOOST_TEST (params.column_gap == 40);
    }

    {
        auto params = params_for_attempt (base, 3);
        BOOST_TEST (params.column_gap == 60);
    }
}

BOOST_AUTO_TEST_SUITE_END()
