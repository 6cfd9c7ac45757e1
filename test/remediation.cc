// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE textflow

#include <defs.hh>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <atomic>
#include <string>
#include <vector>

#include <textflow/remediation.hh>

namespace {

struct fake_result_t {
    double score_, coverage_;
    int attempt;
    bool margin_filtering;

    double score () const { return score_; }
    double coverage () const { return coverage_; }
};

//
// A runner producing the given scores in turn, all with full coverage:
//
struct scripted_runner_t {
    explicit scripted_runner_t (std::vector< double > scores, double coverage = 1.)
        : scores (std::move (scores)), coverage (coverage)
        { }

    fake_result_t operator() (const textflow::params_t& params, int attempt) {
        ++calls;

        return fake_result_t{
            scores.at (size_t (attempt) - 1), coverage, attempt,
            params.margin_filtering };
    }

    std::vector< double > scores;
    double coverage;
    int calls = 0;
};

} // anonymous

BOOST_AUTO_TEST_SUITE(remediation)

BOOST_AUTO_TEST_CASE(accepted_on_rerun) {
    using namespace textflow;

    const params_t params{ };
    scripted_runner_t run ({ 55, 80 });

    const auto x = remediate (params, run);

    BOOST_TEST ((x.state () == remediation_state_t::accepted));
    BOOST_TEST (!x.cancelled ());
    BOOST_TEST (run.calls == 2);

    BOOST_TEST_REQUIRE (x.attempts ().size () == 2U);
    BOOST_TEST (x.attempts () [0].margin_filtering);
    BOOST_TEST (!x.attempts () [1].margin_filtering);

    BOOST_TEST (x.best_index () == 1U);
    BOOST_TEST (x.best ().attempt == 2);
    BOOST_TEST (x.best ().score () == 80.);
}

BOOST_AUTO_TEST_CASE(accepted_at_once) {
    using namespace textflow;

    const params_t params{ };
    scripted_runner_t run ({ 70, 99 });

    const auto x = remediate (params, run);

    BOOST_TEST ((x.state () == remediation_state_t::accepted));
    BOOST_TEST (run.calls == 1);
    BOOST_TEST (x.best ().attempt == 1);
}

BOOST_AUTO_TEST_CASE(exhausted) {
    using namespace textflow;

    params_t params{ };
    params.max_attempts = 3;

    scripted_runner_t run ({ 40, 60, 50 });

    const auto x = remediate (params, run);

    BOOST_TEST ((x.state () == remediation_state_t::exhausted));
    BOOST_TEST (x.attempts ().size () == 3U);
    BOOST_TEST (x.best_index () == 1U);
    BOOST_TEST (x.best ().score () == 60.);
}

BOOST_AUTO_TEST_CASE(earliest_among_equals) {
    using namespace textflow;

    const params_t params{ };
    scripted_runner_t run ({ 60, 60 });

    const auto x = remediate (params, run);

    BOOST_TEST ((x.state () == remediation_state_t::exhausted));
    BOOST_TEST (x.best_index () == 0U);
}

BOOST_AUTO_TEST_CASE(low_coverage) {
    using namespace textflow;

    const params_t params{ };

    //
    // A high score does not make up for missing content:
    //
    scripted_runner_t run ({ 90, 85 }, .5);

    const auto x = remediate (params, run);

    BOOST_TEST ((x.state () == remediation_state_t::exhausted));
    BOOST_TEST (run.calls == 2);
    BOOST_TEST (x.best_index () == 0U);
}

BOOST_AUTO_TEST_CASE(at_least_one_attempt) {
    using namespace textflow;

    params_t params{ };
    params.max_attempts = 0;

    scripted_runner_t run ({ 10 });

    const auto x = remediate (params, run);

    BOOST_TEST ((x.state () == remediation_state_t::exhausted));
    BOOST_TEST (run.calls == 1);
}

BOOST_AUTO_TEST_CASE(cancelled_before_start) {
    using namespace textflow;

    params_t params{ };
    params.max_attempts = 3;

    std::atomic< bool > cancel (true);
    scripted_runner_t run ({ 10, 20, 30 });

    const auto x = remediate (params, run, &cancel);

    //
    // The first attempt is always made:
    //
    BOOST_TEST (run.calls == 1);
    BOOST_TEST (x.cancelled ());
    BOOST_TEST ((x.state () == remediation_state_t::accepted));
    BOOST_TEST (x.best ().score () == 10.);
}

BOOST_AUTO_TEST_CASE(cancelled_while_running) {
    using namespace textflow;

    params_t params{ };
    params.max_attempts = 3;

    std::atomic< bool > cancel (false);
    int calls = 0;

    const auto x = remediate (
        params,
        [&](const params_t&, int attempt) {
            if (++calls == 2) {
                cancel = true;
            }

            return fake_result_t{ 10. * attempt, 1., attempt, true };
        },
        &cancel);

    BOOST_TEST (calls == 2);
    BOOST_TEST (x.cancelled ());
    BOOST_TEST (x.best ().attempt == 2);
}

BOOST_AUTO_TEST_CASE(controller) {
    using namespace textflow;

    params_t params{ };
    params.max_attempts = 3;

    remediation_controller_t< fake_result_t > x (params);

    BOOST_TEST (x.next_attempt () == 1);
    BOOST_TEST (x.next_params ().margin_filtering);

    //
    // Cancelling before any attempt changes nothing:
    //
    x.cancel ();
    BOOST_TEST ((x.state () == remediation_state_t::attempting));
    BOOST_TEST (!x.cancelled ());

    x.record (fake_result_t{ 10, 1, 1, true });
    x.record (fake_result_t{ 20, 1, 2, false });

    BOOST_TEST (x.next_attempt () == 3);
    BOOST_TEST (x.next_params ().column_gap == params.column_gap * params.gap_loosening);
    BOOST_TEST (x.best_index () == 1U);
}

BOOST_AUTO_TEST_CASE(to_string_) {
    using namespace textflow;

    BOOST_TEST (std::string (to_string (remediation_state_t::attempting)) == "attempting");
    BOOST_TEST (std::string (to_string (remediation_state_t::accepted)) == "accepted");
    BOOST_TEST (std::string (to_string (remediation_state_t::exhausted)) == "exhausted");
}

BOOST_AUTO_TEST_SUITE_END()
