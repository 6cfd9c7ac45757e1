// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_RULES_HH
#define TEXTFLOW_TEXTFLOW_RULES_HH

#include <defs.hh>

#include <optional>
#include <string>
#include <vector>

#include <boost/regex.hpp>

namespace textflow {

//
// Tagged pattern tables used by the metadata filter, the footnote extractor
// and the verifier. Patterns operate on UTF-8 bytes; every multibyte symbol
// is spelled as a literal alternative:
//
struct pattern_t {
    const char* tag;
    boost::regex re;
};

using patterns_t = std::vector< pattern_t >;

// `1.2', `(3)', `②', `4)', `第5章', at the start of a line
const patterns_t& section_patterns ();

// `*1', `※', `注2', `†', `‡', `[3]', `(*4)', `①', `¹²'
const patterns_t& footnote_marker_patterns ();

// `Page 5', `p. 5', `5 / 12', `- 5 -', `ページ 5'
const patterns_t& page_number_patterns ();

//
// Rule predicates. Markers and page numbers match the whole text; section
// numbers and decimals are searched for:
//
bool has_internal_decimal (const std::string&);

bool is_section_number (const std::string&);
bool is_footnote_marker (const std::string&);
bool is_strict_page_number (const std::string&);

// A bare number of one to three digits:
bool is_margin_number (const std::string&);

//
// Splits a footnote definition line into its marker and its text, e.g.,
// `*1: see above' into `*1' and `see above':
//
struct definition_head_t {
    std::string marker, text;
};

std::optional< definition_head_t >
split_footnote_definition (const std::string&);

//
// Canonical form used to compare markers: superscript digits become ASCII
// digits, e.g., `¹²' becomes `12':
//
std::string normalize_marker (const std::string&);

////////////////////////////////////////////////////////////////////////

enum struct hallucination_kind_t {
    formatting,
    explanatory_phrase,
    invented_header,
    dangling_footnote,
    page_marker
};

const char* to_string (hallucination_kind_t);

struct hallucination_rule_t {
    hallucination_kind_t kind;
    const char* tag;
    boost::regex re;
};

const std::vector< hallucination_rule_t >& hallucination_rules ();

// `--- PAGE 3 START ---' and `--- PAGE 3 END ---'
const boost::regex& page_marker_pattern ();

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_RULES_HH
