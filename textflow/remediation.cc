// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <textflow/remediation.hh>

namespace textflow {

const char* to_string (remediation_state_t x) {
    switch (x) {
    case remediation_state_t::attempting: return "attempting";
    case remediation_state_t::accepted:   return "accepted";
    case remediation_state_t::exhausted:  return "exhausted";
    }

    return "unknown";
}

} // namespace textflow
