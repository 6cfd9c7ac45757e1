// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_QUALITY_HH
#define TEXTFLOW_TEXTFLOW_QUALITY_HH

#include <defs.hh>

#include <string>
#include <vector>

namespace textflow {

//
// The signals the score is made of:
//
struct quality_inputs_t {
    double coverage;

    // Hallucination flags; warnings backed by the source don't count:
    size_t hallucinations;
    size_t lines;
    double footnote_match_rate;
    double table_confidence;
    bool ordering_consistent;
};

struct quality_t {
    double score;
    char grade;

    // Weighted components, in [0,1] each:
    double coverage, cleanliness, footnotes, tables, ordering;

    std::vector< std::string > recommendations;
};

char grade_of (double score);

//
// 35% coverage, 20% freedom from hallucinations, 15% footnote matches, 15%
// table confidence, 15% ordering consistency, scaled to 100:
//
quality_t score_quality (const quality_inputs_t&);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_QUALITY_HH
