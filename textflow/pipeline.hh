// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_PIPELINE_HH
#define TEXTFLOW_TEXTFLOW_PIPELINE_HH

#include <defs.hh>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include <textflow/textflow.hh>
#include <textflow/collaborators.hh>
#include <textflow/columns.hh>
#include <textflow/footnotes.hh>
#include <textflow/inventory.hh>
#include <textflow/metadata.hh>
#include <textflow/params.hh>
#include <textflow/prepare.hh>
#include <textflow/quality.hh>
#include <textflow/remediation.hh>
#include <textflow/repeating.hh>
#include <textflow/scripts.hh>
#include <textflow/tables.hh>
#include <textflow/token.hh>
#include <textflow/verifier.hh>

namespace textflow {

struct page_result_t {
    int number;

    columns_t columns;
    tables_t tables;

    //
    // The page in reading order: the lines of the columns, left to right,
    // with the rows of every table spliced into the column it sits in:
    //
    lines_t lines;

    removals_t removals;
    script_attachments_t attachments;
    footnotes_t footnotes;

    std::vector< page_condition_t > conditions;

    // Band tops never go up within a column:
    bool ordering_consistent;
};

//
// Band tops are non-decreasing within every column:
//
bool ordering_consistent (const columns_t&);

//
// The rows of a table as output lines, one word per cell:
//
lines_t table_lines (const table_t&);

//
// Runs the page stages in order: table detection, column segmentation,
// band sorting, metadata filtering, script attachment, table reinsertion and
// footnote extraction. Tables are taken out before the columns are formed so
// that no table token shows up twice:
//
page_result_t process_page (
    const page_t&, const signatures_t&, const params_t&);

//
// The text of all the tokens of a page, in stream order; what the verifier
// checks output spans against:
//
std::string source_text_of (const page_t&);

std::string text_of (const page_result_t&);

enum struct document_condition_t { low_coverage, hallucination_detected };

const char* to_string (document_condition_t);

//
// One run of the pipeline over the whole document, with one parameter set:
//
struct document_result_t {
    int attempt;
    params_t params;

    std::vector< page_result_t > pages;

    // All markers and definitions of the document, in page order:
    footnote_markers_t markers;
    footnote_definitions_t definitions;
    footnote_matching_t matching;

    double table_confidence;

    verification_t verification;
    quality_t quality;

    std::vector< document_condition_t > conditions;

    // Pages separated by form feeds, with page markers if asked for:
    std::string text;

    double score () const { return quality.score; }
    double coverage () const { return verification.coverage; }
};

document_result_t run_attempt (
    const prepared_document_t&, const inventory_t&, const params_t&,
    int attempt, llm_engine_t* = nullptr);

//
// The outcome of a document: every attempt made, and the one that stands.
// Results refer to the tokens of the prepared document, which is shared:
//
struct extraction_t {
    std::string name;

    std::shared_ptr< const prepared_document_t > prepared;
    std::vector< page_inventory_t > inventory;

    std::vector< document_result_t > attempts;
    size_t best;

    remediation_state_t state;
    bool cancelled;

    const document_result_t& result () const { return attempts [best]; }
};

//
// Validates and prepares the document, takes its inventory, and runs
// attempts until one is accepted or the attempts run out. Throws
// malformed_input for an unusable document:
//
extraction_t process_document (
    const document_t&, const params_t&, const collaborators_t& = { },
    const std::atomic< bool >* cancel = nullptr);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_PIPELINE_HH
