// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE textflow

#include <defs.hh>

#include <fstream>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <textflow/batch.hh>

#include "fixture.hh"

namespace {

textflow::document_t make_document (const std::string& name, int nwords) {
    textflow::tokens_t xs;

    for (int i = 0; i < nwords; ++i) {
        xs.push_back (textflow::test::make_word (
            "word" + std::to_string (i), 50, 100 + 15 * i));
    }

    return textflow::document_t{ name, { textflow::test::make_page (1, xs) } };
}

const char* const json_document = R"({
    "name": "from-json",
    "pages": [ { "tokens": [
        { "text": "alpha", "bbox": [ 50, 100, 75, 110 ] },
        { "text": "beta",  "bbox": [ 80, 100, 100, 110 ] } ] } ]
})";

} // anonymous

BOOST_AUTO_TEST_SUITE(batch)

static const std::vector< std::tuple< size_t, size_t, size_t > >
worker_count_dataset = {
    { 1, 10, 1 },
    { 4, 10, 4 },
    { 8,  3, 3 },
    { 4,  0, 1 },
    { 1,  0, 1 }
};

BOOST_DATA_TEST_CASE(
    worker_count_, data::make (worker_count_dataset), jobs, ndocs, result) {
    using namespace textflow;
    BOOST_TEST (worker_count (jobs, ndocs) == result);
}

BOOST_AUTO_TEST_CASE(hardware_workers) {
    using namespace textflow;

    const auto n = worker_count (0, 1000);

    BOOST_TEST (n >= 1U);
    BOOST_TEST (n <= 1000U);
}

BOOST_AUTO_TEST_CASE(documents) {
    using namespace textflow;

    test::capture_errors_t errors;

    std::vector< document_t > docs;

    for (int i = 0; i < 6; ++i) {
        docs.push_back (i == 3
            ? document_t{ "broken", { } }
            : make_document ("doc" + std::to_string (i), i + 1));
    }

    const params_t params{ };
    const auto batch = process_batch (docs, params, { }, 3);

    BOOST_TEST_REQUIRE (batch.size () == docs.size ());

    for (size_t i = 0; i < batch.size (); ++i) {
        const auto& item = batch [i];

        BOOST_TEST (item.name == docs [i].name);

        if (i == 3) {
            BOOST_TEST (!item.extraction);
            BOOST_TEST (!item.failure.empty ());
        }
        else {
            BOOST_TEST_REQUIRE (item.extraction.has_value ());
            BOOST_TEST (item.failure.empty ());

            BOOST_TEST (item.extraction->name == docs [i].name);
            BOOST_TEST (item.extraction->result ().pages [0].lines.size () == i + 1);
        }
    }
}

BOOST_AUTO_TEST_CASE(files) {
    using namespace textflow;

    test::capture_errors_t errors;

    const auto dir = fs::temp_directory_path () / "textflow-batch-test";
    fs::create_directories (dir);

    const auto good = dir / "good.json";
    const auto bad = dir / "bad.json";
    const auto missing = dir / "missing.json";

    std::ofstream (good) << json_document;
    std::ofstream (bad) << "{ \"pages\": ";

    fs::remove (missing);

    const params_t params{ };
    const auto batch = process_batch (
        std::vector< fs::path >{ good, bad, missing }, params, { }, 2);

    BOOST_TEST_REQUIRE (batch.size () == 3U);

    BOOST_TEST (batch [0].name == "good");
    BOOST_TEST_REQUIRE (batch [0].extraction.has_value ());
    BOOST_TEST (batch [0].extraction->name == "from-json");
    BOOST_TEST (batch [0].extraction->result ().text == "alpha beta\n");

    BOOST_TEST (batch [1].name == "bad");
    BOOST_TEST (!batch [1].extraction);
    BOOST_TEST (!batch [1].failure.empty ());

    BOOST_TEST (batch [2].name == "missing");
    BOOST_TEST (!batch [2].extraction);
    BOOST_TEST (batch [2].failure.find ("cannot open") != std::string::npos);

    fs::remove_all (dir);
}

BOOST_AUTO_TEST_CASE(cancelled) {
    using namespace textflow;

    test::capture_errors_t errors;

    const std::vector< document_t > docs{
        make_document ("a", 2), make_document ("b", 3)
    };

    const std::atomic< bool > cancel (true);

    const params_t params{ };
    const auto batch = process_batch (docs, params, { }, 2, &cancel);

    BOOST_TEST_REQUIRE (batch.size () == 2U);

    for (auto& item : batch) {
        BOOST_TEST (!item.extraction);
        BOOST_TEST (item.failure == "cancelled");
    }
}

BOOST_AUTO_TEST_CASE(empty) {
    using namespace textflow;

    const params_t params{ };

    BOOST_TEST (process_batch (std::vector< document_t >{ }, params, { }).empty ());
}

BOOST_AUTO_TEST_SUITE_END()
