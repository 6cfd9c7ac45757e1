// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_VERIFIER_HH
#define TEXTFLOW_TEXTFLOW_VERIFIER_HH

#include <defs.hh>

#include <array>
#include <set>
#include <string>
#include <vector>

#include <textflow/collaborators.hh>
#include <textflow/footnotes.hh>
#include <textflow/inventory.hh>
#include <textflow/params.hh>
#include <textflow/rules.hh>
#include <textflow/scripts.hh>

namespace textflow {

//
// A suspicious span of output. Spans without a basis in the source text of
// their page are hallucinations and are stripped (or corrected); spans with
// one are kept and reported:
//
struct flag_t {
    hallucination_kind_t kind;
    std::string rule;
    int page;
    std::string span;
    bool source_backed;
    bool stripped;
};

using flags_t = std::vector< flag_t >;

//
// A correction offered by the LLM collaborator, applied or not:
//
struct audit_entry_t {
    int page;
    std::string span, replacement;
    double confidence;
    bool applied;
};

struct verification_t {
    double coverage;
    coverage_status_t status;

    double element_ratio;
    double position_similarity;

    // Element ratio and position similarity are both above their minimums:
    bool passed;

    flags_t flags;
    std::vector< audit_entry_t > audit;

    size_t hallucinations () const;
};

//
// True if the span, or every word of it, occurs in the source text,
// whitespace aside:
//
bool has_source_basis (const std::string& span, const std::string& source);

//
// One minus the total variation distance of the two distributions:
//
double position_similarity (
    const std::array< double, 3 >&, const std::array< double, 3 >&);

//
// Checks that `--- PAGE N START ---' and `--- PAGE N END ---' lines come in
// pairs, in order, one pair per page:
//
flags_t check_page_markers (const std::string& text, size_t npages);

class verifier_t {
public:
    verifier_t (const inventory_t&, const params_t&, llm_engine_t* = nullptr);

    //
    // Scans the output lines of a page for hallucination patterns, cleaning
    // them in place:
    //
    void scan (int page, lines_t&, const std::string& source);

    //
    // Reports footnote markers that have no definition anywhere:
    //
    void check_footnotes (
        const footnote_markers_t&, const footnote_matching_t&);

    void check_page_markers (const std::string& text, size_t npages);

    verification_t finish (const std::set< const token_t* >& extracted);

private:
    std::string fix (int page, const flag_t&, const std::string& source);

private:
    const inventory_t& inventory_;
    params_t params_;
    llm_engine_t* llm_;

    flags_t flags_;
    std::vector< audit_entry_t > audit_;
};

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_VERIFIER_HH
