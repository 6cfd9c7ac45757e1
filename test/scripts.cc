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

#include <textflow/scripts.hh>

#include "fixture.hh"

namespace {

textflow::token_t
make_glyph (const std::string& text, double x0, double y0, double x1,
            double y1, double font_size) {
    return textflow::test::make_token (text, x0, y0, x1, y1, font_size);
}

textflow::band_t band_of (const textflow::tokens_t& tokens) {
    return textflow::band_t{
        textflow::test::refs_of (tokens), textflow::bbox_of (tokens) };
}

} // anonymous

BOOST_AUTO_TEST_SUITE(scripts)

static const std::vector< std::tuple< std::string, bool, std::string > >
to_script_dataset = {
    { "2",   true,  "²"  },
    { "12",  true,  "¹²" },
    { "n",   true,  "ⁿ"  },
    { "+1",  true,  "⁺¹" },
    { "2",   false, "₂"  },
    { "x",   false, "ₓ"  },
    { "10",  false, "₁₀" }
};

BOOST_DATA_TEST_CASE(
    to_script_, data::make (to_script_dataset), text, super, result) {

    using namespace textflow;

    auto value = to_script (
        text, super ? script_kind_t::superscript : script_kind_t::subscript);

    BOOST_TEST_REQUIRE (bool (value));
    BOOST_TEST (*value == result);
}

BOOST_AUTO_TEST_CASE(to_script_none) {
    using namespace textflow;

    BOOST_TEST (!to_script ("x", script_kind_t::superscript));
    BOOST_TEST (!to_script ("ab", script_kind_t::subscript));
    BOOST_TEST (!to_script ("", script_kind_t::superscript));
}

BOOST_AUTO_TEST_CASE(superscript) {
    using namespace textflow;

    const params_t params{ };

    const tokens_t tokens{
        make_glyph ("x", 50, 100, 60, 112, 12),
        make_glyph ("2", 60.5, 96, 64, 103, 6)
    };

    script_attachments_t attachments;
    auto line = attach_scripts (band_of (tokens), params, attachments);

    BOOST_TEST (line.text == "x²");
    BOOST_TEST_REQUIRE (line.words.size () == 1U);
    BOOST_TEST (line.words [0].sources.size () == 2U);

    BOOST_TEST_REQUIRE (attachments.size () == 1U);
    BOOST_TEST ((attachments [0].kind == script_kind_t::superscript));
    BOOST_TEST (attachments [0].canonical);
    BOOST_TEST (attachments [0].base == &tokens [0]);
    BOOST_TEST (attachments [0].token == &tokens [1]);
}

BOOST_AUTO_TEST_CASE(subscript) {
    using namespace textflow;

    const params_t params{ };

    const tokens_t tokens{
        make_glyph ("H", 50, 100, 60, 112, 12),
        make_glyph ("2", 60.5, 108, 64, 115, 6),
        make_glyph ("O", 65, 100, 75, 112, 12)
    };

    script_attachments_t attachments;
    auto line = attach_scripts (band_of (tokens), params, attachments);

    BOOST_TEST (line.text == "H₂O");

    BOOST_TEST_REQUIRE (attachments.size () == 1U);
    BOOST_TEST ((attachments [0].kind == script_kind_t::subscript));
}

BOOST_AUTO_TEST_CASE(literal_script) {
    using namespace textflow;

    const params_t params{ };

    //
    // No superscript `a' in Unicode; the text is kept as is and tagged:
    //
    const tokens_t tokens{
        make_glyph ("x", 50, 100, 60, 112, 12),
        make_glyph ("a", 60.5, 96, 64, 103, 6)
    };

    script_attachments_t attachments;
    auto line = attach_scripts (band_of (tokens), params, attachments);

    BOOST_TEST (line.text == "xa");

    BOOST_TEST_REQUIRE (attachments.size () == 1U);
    BOOST_TEST (!attachments [0].canonical);
    BOOST_TEST (attachments [0].text == "a");
}

BOOST_AUTO_TEST_CASE(far_script) {
    using namespace textflow;

    const params_t params{ };

    //
    // Too far from the preceding word to be attached to it:
    //
    const tokens_t tokens{
        make_glyph ("x", 50, 100, 60, 112, 12),
        make_glyph ("2", 70, 96, 74, 103, 6)
    };

    script_attachments_t attachments;
    auto line = attach_scripts (band_of (tokens), params, attachments);

    BOOST_TEST (attachments.empty ());
    BOOST_TEST (line.words.size () == 2U);
    BOOST_TEST (line.text == "x 2");
}

BOOST_AUTO_TEST_CASE(same_size) {
    using namespace textflow;

    const params_t params{ };

    //
    // Raised but not smaller is not a script:
    //
    const tokens_t tokens{
        make_glyph ("x", 50, 100, 60, 112, 12),
        make_glyph ("y", 60.5, 96, 70, 108, 12)
    };

    script_attachments_t attachments;
    attach_scripts (band_of (tokens), params, attachments);

    BOOST_TEST (attachments.empty ());
}

BOOST_AUTO_TEST_CASE(single_token) {
    using namespace textflow;

    const params_t params{ };

    const tokens_t tokens{ make_glyph ("2", 60, 96, 64, 103, 6) };

    script_attachments_t attachments;
    auto line = attach_scripts (band_of (tokens), params, attachments);

    BOOST_TEST (attachments.empty ());
    BOOST_TEST (line.text == "2");
}

BOOST_AUTO_TEST_SUITE_END()
