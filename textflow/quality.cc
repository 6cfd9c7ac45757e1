// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>

#include <textflow/quality.hh>
#include <textflow/textflow.hh>

// Component weights, summing to 1:
#define coverageWeight    0.35
#define cleanlinessWeight 0.20
#define footnoteWeight    0.15
#define tableWeight       0.15
#define orderingWeight    0.15

// Components below this value come with a recommendation:
#define weakComponent 0.7

namespace textflow {

char grade_of (double score) {
    return score >= 90
        ? 'A'
        : score >= 80 ? 'B' : score >= 70 ? 'C' : score >= 60 ? 'D' : 'F';
}

quality_t score_quality (const quality_inputs_t& x) {
    quality_t q{ };

    q.coverage = (std::clamp) (x.coverage, 0., 1.);

    const double density = (std::min) (1., ratio_of (x.hallucinations, x.lines, 0.));
    q.cleanliness = 1 - density;

    q.footnotes = (std::clamp) (x.footnote_match_rate, 0., 1.);
    q.tables = (std::clamp) (x.table_confidence, 0., 1.);
    q.ordering = x.ordering_consistent ? 1. : 0.;

    q.score = 100 * (
        coverageWeight * q.coverage +
        cleanlinessWeight * q.cleanliness +
        footnoteWeight * q.footnotes +
        tableWeight * q.tables +
        orderingWeight * q.ordering);

    q.grade = grade_of (q.score);

    if (q.coverage < weakComponent) {
        q.recommendations.emplace_back (
            "Low coverage: review filtering rules and column segmentation");
    }

    if (q.cleanliness < weakComponent) {
        q.recommendations.emplace_back (
            "Many hallucinated spans: review the output for injected text");
    }

    if (q.footnotes < weakComponent) {
        q.recommendations.emplace_back (
            "Unmatched footnotes: review the footnote region");
    }

    if (q.tables < weakComponent) {
        q.recommendations.emplace_back (
            "Uncertain tables: verify table detection");
    }

    if (!x.ordering_consistent) {
        q.recommendations.emplace_back (
            "Inconsistent reading order: review the line height");
    }

    return q;
}

} // namespace textflow
