// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_DOCUMENT_HH
#define TEXTFLOW_TEXTFLOW_DOCUMENT_HH

#include <defs.hh>

#include <iosfwd>
#include <string>

#include <json/forwards.h>

#include <textflow/token.hh>

#include <filesystem>
namespace fs = std::filesystem;

namespace textflow {

//
// Token documents are JSON:
//
//   { "name": "...",
//     "pages": [ { "number": 1, "width": 612, "height": 792, "rotation": 0,
//                  "tokens": [ { "text": "...", "bbox": [ x0, y0, x1, y1 ],
//                                "font_size": 10, "baseline": 80 }, ... ],
//                  "rules": [ [ x0, y0, x1, y1 ], ... ] }, ... ] }
//
// Only `pages', `tokens', `text' and `bbox' are required. All loaders throw
// malformed_input for bad JSON, a document without pages or tokens, or
// coordinates that are not finite:
//
document_t load_document (std::istream&, const std::string& name);
document_t load_document (const fs::path&);

//
// Throws malformed_input for a token without text or a four-number box:
//
token_t parse_token (const Json::Value&, int page);

void validate_document (const document_t&);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_DOCUMENT_HH
