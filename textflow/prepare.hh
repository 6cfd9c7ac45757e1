// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_PREPARE_HH
#define TEXTFLOW_TEXTFLOW_PREPARE_HH

#include <defs.hh>

#include <map>
#include <set>
#include <string>
#include <vector>

#include <textflow/collaborators.hh>
#include <textflow/params.hh>
#include <textflow/token.hh>

namespace textflow {

using page_conditions_t = std::map< int, std::vector< page_condition_t > >;

//
// The document the pipeline runs on: upright pages, damaged text replaced,
// scanned pages recognized. Built once per document and read-only after:
//
struct prepared_document_t {
    document_t doc;
    page_conditions_t conditions;

    // Pages without any text, skipped by the pipeline:
    std::set< int > unextractable;
};

//
// True for text with replacement characters, NULs, malformed UTF-8 or
// leftover `\xNN' and `\uNNNN' escapes:
//
bool has_encoding_anomaly (const std::string&);

//
// Rotates the page and everything on it upright, if it was turned by a
// multiple of a quarter turn; returns false and leaves the page alone
// otherwise:
//
bool make_upright (page_t&);

prepared_document_t
prepare_document (const document_t&, const params_t&, const collaborators_t&);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_PREPARE_HH
