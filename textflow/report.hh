// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_REPORT_HH
#define TEXTFLOW_TEXTFLOW_REPORT_HH

#include <defs.hh>

#include <iosfwd>

#include <json/value.h>

#include <textflow/pipeline.hh>

namespace textflow {

//
// The verification report and quality score of the attempt that stands,
// with a summary of every attempt made:
//
//   { "document", "state", "attempt", "cancelled",
//     "verification": { "coverage", "status", "element_ratio",
//                       "position_similarity", "passed", "flags": [...],
//                       "hallucinations", "audit": [...] },
//     "footnotes": { "markers", "definitions", "match_rate", "matches": [...],
//                    "unmatched_markers": [...],
//                    "unmatched_definitions": [...] },
//     "tables": { "count", "confidence", "ambiguous" },
//     "quality": { "score", "grade", "components": {...},
//                  "recommendations": [...] },
//     "inventory": [...], "pages": [...], "conditions": [...],
//     "attempts": [...] }
//
Json::Value make_report (const extraction_t&);

void write_report (std::ostream&, const extraction_t&);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_REPORT_HH
