// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_REMEDIATION_HH
#define TEXTFLOW_TEXTFLOW_REMEDIATION_HH

#include <defs.hh>

#include <algorithm>
#include <atomic>
#include <type_traits>
#include <vector>

#include <textflow/params.hh>

namespace textflow {

enum struct remediation_state_t { attempting, accepted, exhausted };

const char* to_string (remediation_state_t);

//
// Drives the reruns of the pipeline: attempt n is run with
// params_for_attempt (base, n); an attempt scoring at least
// `quality_threshold' with a coverage of at least `min_coverage' is accepted,
// otherwise the next one is made, up to `max_attempts'. When the attempts run
// out the best-scoring one stands, the earliest among equals. `Result' has
// score () and coverage () members:
//
template< typename Result >
class remediation_controller_t {
public:
    explicit remediation_controller_t (const params_t& base)
        : base_ (base), state_ (remediation_state_t::attempting), best_ (),
          cancelled_ ()
        { }

    remediation_state_t state () const { return state_; }

    int next_attempt () const { return int (attempts_.size ()) + 1; }

    params_t next_params () const {
        return params_for_attempt (base_, next_attempt ());
    }

    void record (Result x) {
        ASSERT (state_ == remediation_state_t::attempting);

        attempts_.push_back (std::move (x));

        const auto& last = attempts_.back ();
        const auto n = attempts_.size ();

        if (last.score () > attempts_ [best_].score ()) {
            best_ = n - 1;
        }

        if (last.score () >= base_.quality_threshold &&
            last.coverage () >= base_.min_coverage) {
            best_ = n - 1;
            state_ = remediation_state_t::accepted;
        }
        else if (int (n) >= (std::max) (1, base_.max_attempts)) {
            state_ = remediation_state_t::exhausted;
        }
    }

    //
    // Stops after the attempts made so far, keeping the best of them:
    //
    void cancel () {
        if (state_ == remediation_state_t::attempting && !attempts_.empty ()) {
            cancelled_ = true;
            state_ = remediation_state_t::accepted;
        }
    }

    bool cancelled () const { return cancelled_; }

    const std::vector< Result >& attempts () const { return attempts_; }

    size_t best_index () const { return best_; }
    const Result& best () const { return attempts_ [best_]; }

private:
    params_t base_;
    remediation_state_t state_;

    std::vector< Result > attempts_;
    size_t best_;

    bool cancelled_;
};

//
// Runs `run (params, attempt)' until the controller settles. The flag, when
// given, is checked before every attempt but the first:
//
template< typename Runner >
auto remediate (
    const params_t& base, Runner&& run,
    const std::atomic< bool >* cancel = nullptr) {
    using result_type = std::decay_t<
        std::invoke_result_t< Runner, const params_t&, int > >;

    remediation_controller_t< result_type > controller (base);

    while (controller.state () == remediation_state_t::attempting) {
        if (cancel && cancel->load ()) {
            controller.cancel ();

            if (controller.state () != remediation_state_t::attempting) {
                break;
            }
        }

        const auto params = controller.next_params ();
        controller.record (run (params, controller.next_attempt ()));
    }

    return controller;
}

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_REMEDIATION_HH
