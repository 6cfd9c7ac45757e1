// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <cstdio>
#include <fstream>
#include <optional>
#include <sstream>

#include <sys/wait.h>

#include <json/json.h>

#include <boost/scope_exit.hpp>

#include <textflow/collaborators.hh>
#include <textflow/document.hh>

#include <utils/path.hh>

namespace textflow {
namespace {

// Exit status of timeout(1) when the command ran out of time:
#define timedOutStatus 124

std::string to_json (const Json::Value& tree) {
    Json::StreamWriterBuilder builder;
    builder ["indentation"] = "";
    builder ["emitUTF8"] = true;

    return Json::writeString (builder, tree);
}

Json::Value from_json (const std::string& s) {
    std::istringstream ss (s);

    Json::CharReaderBuilder builder;

    Json::Value tree;
    std::string errs;

    if (!Json::parseFromStream (builder, ss, &tree, &errs) || !tree.isObject ()) {
        throw collaborator_error (format ("bad response: {}", errs));
    }

    return tree;
}

//
// Output of one run of the command, or nothing if it failed:
//
std::optional< std::string >
run_once (const std::string& command, const fs::path& input, int timeout) {
    const auto cmd = format (
        "timeout {} {} < '{}'", timeout, command, input.string ());

    FILE* f = popen (cmd.c_str (), "r");

    if (0 == f) {
        error (errCollaborator, -1, "Couldn't run '{0:s}'", command);
        return { };
    }

    std::string output;
    char buf [4096];

    for (size_t n; (n = fread (buf, 1, sizeof buf, f)) > 0;) {
        output.append (buf, n);
    }

    const int status = pclose (f);

    if (status == -1 || !WIFEXITED (status) || WEXITSTATUS (status) != 0) {
        if (WIFEXITED (status) && WEXITSTATUS (status) == timedOutStatus) {
            error (errCollaborator, -1, "'{0:s}' timed out after {1:d}s",
                   command, timeout);
        }
        else {
            error (errCollaborator, -1, "'{0:s}' failed", command);
        }

        return { };
    }

    return output;
}

class local_ocr_t : public ocr_engine_t {
public:
    explicit local_ocr_t (const params_t& params)
        : command_ (params.ocr_command),
          timeout_ (params.collaborator_timeout),
          retries_ (params.collaborator_retries)
        { }

    ocr_tokens_t
    recognize (const std::string& document, const page_t& page) override {
        Json::Value request;

        request ["document"] = document;
        request ["page"] = page.number;
        request ["width"] = page.width;
        request ["height"] = page.height;

        const auto response = from_json (
            run_command (command_, to_json (request), timeout_, retries_));

        const auto& tokens = response ["tokens"];

        if (!tokens.isNull () && !tokens.isArray ()) {
            throw collaborator_error ("bad OCR response: tokens is not a list");
        }

        ocr_tokens_t xs;

        try {
            for (auto& value : tokens) {
                const auto token = parse_token (value, page.number);
                const auto& confidence = value ["confidence"];

                if (!confidence.isNull () && !confidence.isNumeric ()) {
                    throw malformed_input ("confidence is not a number");
                }

                xs.push_back ({
                    token, confidence.isNull () ? 1. : confidence.asDouble () });
            }
        }
        catch (const malformed_input& e) {
            throw collaborator_error (format ("bad OCR token: {}", e.what ()));
        }

        return xs;
    }

private:
    std::string command_;
    int timeout_, retries_;
};

class local_llm_t : public llm_engine_t {
public:
    explicit local_llm_t (const params_t& params)
        : command_ (params.llm_command),
          timeout_ (params.collaborator_timeout),
          retries_ (params.collaborator_retries)
        { }

    std::optional< correction_t >
    correct (const std::string& span, const std::string& context) override {
        Json::Value request;

        request ["span"] = span;
        request ["context"] = context;

        const auto response = from_json (
            run_command (command_, to_json (request), timeout_, retries_));

        const auto& text = response ["text"];
        const auto& confidence = response ["confidence"];

        if (text.isNull ()) {
            return { };
        }

        if (!text.isString () ||
            !(confidence.isNull () || confidence.isNumeric ())) {
            throw collaborator_error ("bad correction");
        }

        return correction_t{
            text.asString (), confidence.isNull () ? 0. : confidence.asDouble () };
    }

private:
    std::string command_;
    int timeout_, retries_;
};

bool usable (backend_t backend, const std::string& command, const char* what) {
    switch (backend) {
    case backend_t::none:
        return false;

    case backend_t::local:
        if (command.empty ()) {
            error (errConfig, -1,
                   "The local {0:s} backend needs a command; using none", what);
            return false;
        }

        return true;

    default:
        error (errConfig, -1,
               "The {0:s} backend '{1:s}' is not available; using none", what,
               to_string (backend));
        return false;
    }
}

} // anonymous

std::string run_command (
    const std::string& command, const std::string& input, int timeout,
    int retries) {
    const auto path = make_temp_path ();

    {
        std::ofstream stream (path);

        if (!(stream << input)) {
            throw collaborator_error (
                format ("couldn't write request to {}", path.string ()));
        }
    }

    BOOST_SCOPE_EXIT(&path) {
        std::error_code ignore;
        fs::remove (path, ignore);
    } BOOST_SCOPE_EXIT_END

    for (int attempt = 0; attempt <= retries; ++attempt) {
        if (auto output = run_once (command, path, timeout)) {
            return *output;
        }
    }

    throw collaborator_error (
        format ("'{}' failed after {} attempt(s)", command, retries + 1));
}

collaborators_t make_collaborators (const params_t& params) {
    collaborators_t x;

    if (usable (params.ocr_backend, params.ocr_command, "OCR")) {
        x.ocr = std::make_shared< local_ocr_t > (params);
    }

    if (usable (params.llm_backend, params.llm_command, "LLM")) {
        x.llm = std::make_shared< local_llm_t > (params);
    }

    return x;
}

} // namespace textflow
