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
#include <textflow/metadata.hh>
#include <textflow/repeating.hh>

#include "fixture.hh"

namespace {

//
// A page with a numbered section heading at the top, two lines of body text,
// and a page number in the bottom right corner:
//
textflow::page_t make_section_page (int n, const std::string& number = "5") {
    using namespace textflow::test;

    return make_page (n, {
        make_token ("1.2", 50, 20, 65, 30),
        make_token ("Overview", 70, 20, 110, 30),
        make_word ("Body", 50, 300),
        make_word ("text", 80, 300),
        make_word ("More", 50, 315),
        make_word ("text", 80, 315),
        make_token (number, 550, 770, 556, 780)
    });
}

textflow::columns_t
columns_of (const textflow::page_t& page, const textflow::params_t& params) {
    using namespace textflow;

    auto columns = segment_columns (test::refs_of (page.tokens), params);

    for (auto& column : columns) {
        sort_column (column, params);
    }

    return columns;
}

std::vector< std::string > texts_of (const textflow::columns_t& columns) {
    std::vector< std::string > xs;

    for (auto& column : columns) {
        auto tmp = textflow::test::texts_of (textflow::reading_order (column));
        xs.insert (xs.end (), tmp.begin (), tmp.end ());
    }

    return xs;
}

} // anonymous

BOOST_AUTO_TEST_SUITE(metadata)

BOOST_AUTO_TEST_CASE(section_survives_corner_number_goes) {
    using namespace textflow;

    const params_t params{ };

    document_t doc{ "sections", { } };

    for (int i = 1; i <= 3; ++i) {
        doc.pages.push_back (make_section_page (i));
    }

    const auto signatures = find_repeating_elements (doc, params);

    for (auto& page : doc.pages) {
        auto columns = columns_of (page, params);
        auto removals = filter_metadata (columns, page, signatures, params);

        const std::vector< std::string > xs{
            "1.2", "Overview", "Body", "text", "More", "text"
        };

        BOOST_TEST (texts_of (columns) == xs);

        BOOST_TEST_REQUIRE (removals.size () == 1U);
        BOOST_TEST (removals [0].token->text == "5");
        BOOST_TEST ((removals [0].reason ==
                     removal_reason_t::repeating_header_footer));
    }
}

BOOST_AUTO_TEST_CASE(margin_number) {
    using namespace textflow;

    const params_t params{ };

    //
    // On a single page there are no running elements; the isolated number
    // in the bottom margin is still a page number:
    //
    const auto page = make_section_page (1, "12");

    auto columns = columns_of (page, params);
    auto removals = filter_metadata (columns, page, { }, params);

    BOOST_TEST_REQUIRE (removals.size () == 1U);
    BOOST_TEST (removals [0].token->text == "12");
    BOOST_TEST ((removals [0].reason == removal_reason_t::margin_page_number));
}

BOOST_AUTO_TEST_CASE(margin_filtering_off) {
    using namespace textflow;

    params_t params{ };
    params.margin_filtering = false;

    document_t doc{ "sections", { } };

    for (int i = 1; i <= 3; ++i) {
        doc.pages.push_back (make_section_page (i));
    }

    const auto signatures = find_repeating_elements (doc, params);

    for (auto& page : doc.pages) {
        auto columns = columns_of (page, params);
        BOOST_TEST (filter_metadata (columns, page, signatures, params).empty ());
    }
}

BOOST_AUTO_TEST_CASE(strict_page_number) {
    using namespace textflow;
    using namespace textflow::test;

    const params_t params{ };

    const auto page = make_page (1, {
        make_word ("Body", 50, 300),
        make_word ("text", 80, 300),
        make_word ("Page", 280, 760),
        make_word ("3", 303, 760)
    });

    auto columns = columns_of (page, params);
    auto removals = filter_metadata (columns, page, { }, params);

    BOOST_TEST_REQUIRE (removals.size () == 2U);

    for (auto& x : removals) {
        BOOST_TEST ((x.reason == removal_reason_t::strict_page_number));
    }

    const std::vector< std::string > xs{ "Body", "text" };
    BOOST_TEST (texts_of (columns) == xs);
}

BOOST_AUTO_TEST_CASE(retention_policy) {
    using namespace textflow;

    const params_t params{ };

    const auto page = make_section_page (1, "12");

    auto columns = columns_of (page, params);

    auto removals = filter_metadata (
        columns, page, { }, params, [](auto&, auto) { return false; });

    BOOST_TEST (removals.empty ());
    BOOST_TEST (texts_of (columns).size () == page.tokens.size ());
}

static const std::vector< std::tuple< std::string, double, double, bool > >
classify_dataset = {
    //
    // Text, position, and whether it is removed:
    //
    { "3.14",   300, 770, false },
    { "*1",     300, 770, false },
    { "12",     300, 770, true  },
    { "12",     300, 400, false },
    { "1234",   300, 770, false },
    { "Page 4", 300, 400, true  },
    { "- 4 -",  300, 400, true  },
    { "word",   300, 770, false }
};

BOOST_DATA_TEST_CASE(
    classify_token_, data::make (classify_dataset), text, x, y, result) {

    using namespace textflow;
    using namespace textflow::test;

    const params_t params{ };

    const auto page = make_page (1, {
        make_token (text, x, y, x + 20, y + 10),
        make_word ("far", 50, 100)
    });

    const auto neighbours = refs_of (page.tokens);

    const token_context_t ctx{ page, text, false, neighbours };

    auto reason = classify_token (page.tokens [0], ctx, { }, params);
    BOOST_TEST (bool (reason) == result);
}

BOOST_AUTO_TEST_CASE(decimal_never_removed) {
    using namespace textflow;
    using namespace textflow::test;

    const params_t params{ };

    //
    // A decimal repeated in the corner of every page is still content:
    //
    document_t doc{ "decimals", { } };

    for (int i = 1; i <= 3; ++i) {
        doc.pages.push_back (make_page (i, {
            make_word ("Body", 50, 300),
            make_word ("text", 80, 300),
            make_word ("more", 50, 315),
            make_token ("2.5", 550, 770, 565, 780)
        }));
    }

    const auto signatures = find_repeating_elements (doc, params);
    BOOST_TEST (!signatures.empty ());

    for (auto& page : doc.pages) {
        auto columns = columns_of (page, params);

        for (auto& x : filter_metadata (columns, page, signatures, params)) {
            BOOST_TEST (x.token->text != "2.5");
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()
