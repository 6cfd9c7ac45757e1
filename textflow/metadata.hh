// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_METADATA_HH
#define TEXTFLOW_TEXTFLOW_METADATA_HH

#include <defs.hh>

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <textflow/columns.hh>
#include <textflow/params.hh>
#include <textflow/repeating.hh>
#include <textflow/token.hh>

namespace textflow {

enum struct removal_reason_t {
    repeating_header_footer,
    strict_page_number,
    margin_page_number
};

const char* to_string (removal_reason_t);

struct removal_t {
    const token_t* token;
    removal_reason_t reason;
};

using removals_t = std::vector< removal_t >;

//
// Consulted before every removal; returning false keeps the token. The
// default policy allows every removal:
//
using retention_policy_t = std::function<
    bool (const token_t&, removal_reason_t) >;

bool allow_removal (const token_t&, removal_reason_t);

//
// What the filter knows about the surroundings of a token:
//
struct token_context_t {
    const page_t& page;

    // Text of the band holding the token, and whether that band opens with
    // a section number:
    const std::string& band_text;
    bool section_band;

    // All the tokens on the page, for the isolation test:
    const token_refs_t& neighbours;
};

//
// Applies the rules in order, first match wins:
//   (a) a number with an internal decimal point is kept,
//   (b) a footnote marker is kept,
//       a running header or footer is removed, unless it shares the band
//       with a section number,
//   (c) a band that reads as a page number is removed,
//   (d) a bare short number in the outer margin, far from any other token,
//       is removed,
//   (e) anything else is kept.
// Running header and margin removals are skipped when `margin_filtering' is
// off:
//
std::optional< removal_reason_t >
classify_token (const token_t&, const token_context_t&, const signatures_t&,
                const params_t&);

//
// Removes metadata tokens from the bands of the columns; empty bands and
// columns are dropped. Returns the audit trail of removals:
//
removals_t filter_metadata (
    columns_t&, const page_t&, const signatures_t&, const params_t&,
    const retention_policy_t& = allow_removal);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_METADATA_HH
