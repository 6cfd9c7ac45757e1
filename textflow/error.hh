// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_ERROR_HH
#define TEXTFLOW_TEXTFLOW_ERROR_HH

#include <defs.hh>

#include <functional>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace textflow {

enum error_category_t {
    errSyntaxWarning, // malformed but recoverable input
    errSyntaxError,   // malformed input
    errConfig,        // bad configuration file command or value
    errCommandLine,   // bad command line argument
    errIO,            // file or process I/O
    errLayout,        // page layout anomaly (rotation, encoding, empty page)
    errVerification,  // verification and quality findings
    errCollaborator,  // OCR or LLM backend failure
    errInternal       // internal inconsistency
};

const char* to_string (error_category_t);

//
// Receives every diagnostic; `page' is the 1-based page number or -1 when the
// message is not about a page:
//
using error_callback_t = std::function<
    void (error_category_t, int, const std::string&) >;

//
// Replaces the diagnostics sink and returns the previous one. An empty
// callback silences all diagnostics:
//
error_callback_t set_error_callback (error_callback_t);

void error_message (error_category_t, int, const std::string&);

template< typename ... Args >
inline void
error (error_category_t category, int page, const char* fmt,
       const Args& ... args) {
    error_message (
        category, page, fmt::vformat (fmt, fmt::make_format_args (args...)));
}

//
// The only fatal condition: a document with no pages, no tokens at all, or
// with unusable coordinates:
//
struct malformed_input : std::runtime_error {
    using std::runtime_error::runtime_error;
};

//
// Thrown by collaborator backends; callers degrade the page and carry on:
//
struct collaborator_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_ERROR_HH
