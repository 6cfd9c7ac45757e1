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

#include <textflow/quality.hh>

BOOST_AUTO_TEST_SUITE(quality)

static const std::vector< std::tuple< double, char > >
grade_dataset = {
    { 100,  'A' },
    {  90,  'A' },
    { 89.9, 'B' },
    {  80,  'B' },
    {  75,  'C' },
    {  70,  'C' },
    {  65,  'D' },
    {  60,  'D' },
    { 59.9, 'F' },
    {   0,  'F' }
};

BOOST_DATA_TEST_CASE(grade_of_, data::make (grade_dataset), score, result) {
    using namespace textflow;
    BOOST_TEST (grade_of (score) == result);
}

static const std::vector<
    std::tuple< double, size_t, size_t, double, double, bool, double, size_t > >
score_dataset = {
    //
    // Coverage, flags, lines, footnote match rate, table confidence,
    // ordering, and the expected score and number of recommendations:
    //
    {  1.,  0, 10, 1., 1.,  true, 100.,  0 },
    { .5,   0, 10, 1., 1.,  true,  82.5, 1 },
    {  1.,  5, 10, 1., 1.,  true,  90.,  1 },
    {  1., 20, 10, 1., 1.,  true,  80.,  1 },
    {  1.,  3,  0, 1., 1.,  true, 100.,  0 },
    {  1.,  0, 10, 1., 1., false,  85.,  1 },
    {  1.,  0, 10, .6, .8,  true,  91.,  1 },
    {  0.,  1,  1, 0., 0., false,   0.,  5 }
};

BOOST_DATA_TEST_CASE(
    score_quality_, data::make (score_dataset),
    coverage, flags, lines, footnotes, tables, ordering, score, n) {
    using namespace textflow;

    const auto q = score_quality (
        quality_inputs_t{ coverage, flags, lines, footnotes, tables, ordering });

    BOOST_TEST (q.score == score, boost::test_tools::tolerance (1e-9));
    BOOST_TEST (q.grade == grade_of (q.score));
    BOOST_TEST (q.recommendations.size () == n);
}

BOOST_AUTO_TEST_CASE(components) {
    using namespace textflow;

    const auto q = score_quality (quality_inputs_t{ .5, 5, 10, 1., .6, true });

    BOOST_TEST (q.coverage == .5);
    BOOST_TEST (q.cleanliness == .5);
    BOOST_TEST (q.footnotes == 1.);
    BOOST_TEST (q.tables == .6);
    BOOST_TEST (q.ordering == 1.);

    BOOST_TEST (q.score == 66.5, boost::test_tools::tolerance (1e-9));
    BOOST_TEST (q.grade == 'D');

    BOOST_TEST_REQUIRE (q.recommendations.size () == 3U);
    BOOST_TEST (q.recommendations [0].find ("coverage") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(clamped) {
    using namespace textflow;

    const auto q = score_quality (quality_inputs_t{ 1.5, 0, 0, 2., -1., true });

    BOOST_TEST (q.coverage == 1.);
    BOOST_TEST (q.footnotes == 1.);
    BOOST_TEST (q.tables == 0.);
    BOOST_TEST (q.score == 85., boost::test_tools::tolerance (1e-9));
}

BOOST_AUTO_TEST_SUITE_END()
