// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <textflow/token.hh>

namespace textflow {

const char* to_string (page_condition_t x) {
    switch (x) {
    case page_condition_t::empty_token_stream:
        return "empty_token_stream";
    case page_condition_t::encoding_anomaly:
        return "encoding_anomaly";
    case page_condition_t::rotated_page:
        return "rotated_page";
    case page_condition_t::low_confidence:
        return "low_confidence";
    case page_condition_t::collaborator_failure:
        return "collaborator_failure";
    case page_condition_t::table_detection_ambiguous:
        return "table_detection_ambiguous";
    }

    return "unknown";
}

} // namespace textflow
