// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_COLLABORATORS_HH
#define TEXTFLOW_TEXTFLOW_COLLABORATORS_HH

#include <defs.hh>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/noncopyable.hpp>

#include <textflow/params.hh>
#include <textflow/token.hh>

namespace textflow {

struct ocr_token_t {
    token_t token;
    double confidence;
};

using ocr_tokens_t = std::vector< ocr_token_t >;

//
// Recognizes the text of a page from its image; the page is identified by
// its number and size. Throws collaborator_error on failure:
//
struct ocr_engine_t : boost::noncopyable {
    virtual ~ocr_engine_t () = default;

    virtual ocr_tokens_t
    recognize (const std::string& document, const page_t&) = 0;
};

struct correction_t {
    std::string text;
    double confidence;
};

//
// Proposes a replacement for a suspicious span of output text, given the
// source text of its page, or nothing. Throws collaborator_error on failure:
//
struct llm_engine_t : boost::noncopyable {
    virtual ~llm_engine_t () = default;

    virtual std::optional< correction_t >
    correct (const std::string& span, const std::string& context) = 0;
};

using ocr_engine_ptr = std::shared_ptr< ocr_engine_t >;
using llm_engine_ptr = std::shared_ptr< llm_engine_t >;

struct collaborators_t {
    ocr_engine_ptr ocr;
    llm_engine_ptr llm;
};

//
// Backends selected by the parameters. `none' yields no engine; `local' runs
// the configured command, request JSON on its standard input and response
// JSON on its standard output, under a timeout and with retries. The remote
// kinds need a transport that is not built in; they are reported and
// treated as `none':
//
collaborators_t make_collaborators (const params_t&);

//
// Runs a shell command with the given standard input, killing it after
// `timeout' seconds, up to `retries' more times on failure. Returns its
// standard output or throws collaborator_error:
//
std::string run_command (
    const std::string& command, const std::string& input, int timeout,
    int retries);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_COLLABORATORS_HH
