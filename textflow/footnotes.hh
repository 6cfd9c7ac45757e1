// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_FOOTNOTES_HH
#define TEXTFLOW_TEXTFLOW_FOOTNOTES_HH

#include <defs.hh>

#include <string>
#include <vector>

#include <textflow/params.hh>
#include <textflow/scripts.hh>
#include <textflow/token.hh>

namespace textflow {

//
// A reference to a footnote in the body text. `text' is the marker as
// printed, `key' its canonical form used for matching:
//
struct footnote_marker_t {
    std::string text, key;
    bbox_t box;
    int page;
};

struct footnote_definition_t {
    std::string marker, key;
    std::string text;
    bbox_t box;
    int page;
};

using footnote_markers_t = std::vector< footnote_marker_t >;
using footnote_definitions_t = std::vector< footnote_definition_t >;

struct footnotes_t {
    footnote_markers_t markers;
    footnote_definitions_t definitions;
};

//
// Markers are words made of a marker pattern, or superscripts that are, in
// the body of the page (below the top margin, above the footnote region).
// Definitions are lines in the bottom `footnote_fraction' of the page that
// open with a marker and a separator; the lines that follow without a marker
// of their own continue the definition:
//
footnotes_t extract_footnotes (
    const page_t&, const lines_t&, const script_attachments_t&,
    const params_t&);

struct footnote_match_t {
    size_t marker, definition;
    double confidence;
};

struct footnote_matching_t {
    std::vector< footnote_match_t > matches;
    std::vector< size_t > unmatched_markers, unmatched_definitions;

    // Matched markers over all markers, 1 when there are none:
    double match_rate;
};

//
// Half for marker text agreement (1 for the same text, .5 for the same
// canonical form), half for page proximity, falling to 0 at
// `footnote_page_window' pages apart. Markers with different canonical forms
// do not match at all:
//
double match_confidence (
    const footnote_marker_t&, const footnote_definition_t&, const params_t&);

//
// Pairs every marker with its best definition of the same marker text,
// preferring the same page, then the nearest page, then the earliest
// definition. Matches at or below .5 confidence are rejected:
//
footnote_matching_t match_footnotes (
    const footnote_markers_t&, const footnote_definitions_t&, const params_t&);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_FOOTNOTES_HH
