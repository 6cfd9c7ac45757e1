// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <cstdio>
#include <mutex>

#include <textflow/error.hh>

namespace textflow {
namespace {

void print_error (error_category_t category, int page, const std::string& s) {
    if (page >= 0) {
        fmt::print (stderr, "{0:s} (page {1:d}): {2:s}\n",
                    to_string (category), page, s);
    }
    else {
        fmt::print (stderr, "{0:s}: {1:s}\n", to_string (category), s);
    }

    fflush (stderr);
}

std::mutex error_mutex;
error_callback_t error_callback = print_error;

// Held while the sink runs; a sink may report errors of its own:
std::recursive_mutex sink_mutex;

} // anonymous

const char* to_string (error_category_t category) {
    static const char* names [] = {
        "Syntax Warning",
        "Syntax Error",
        "Config Error",
        "Command Line Error",
        "I/O Error",
        "Layout Warning",
        "Verification",
        "Collaborator Error",
        "Internal Error"
    };

    return names [category];
}

error_callback_t set_error_callback (error_callback_t callback) {
    std::lock_guard< std::mutex > lock (error_mutex);
    std::swap (error_callback, callback);
    return callback;
}

void error_message (error_category_t category, int page, const std::string& s) {
    error_callback_t callback;

    {
        std::lock_guard< std::mutex > lock (error_mutex);
        callback = error_callback;
    }

    if (callback) {
        //
        // Documents are processed on several threads; the sink sees one
        // message at a time:
        //
        std::lock_guard< std::recursive_mutex > lock (sink_mutex);
        callback (category, page, s);
    }
}

} // namespace textflow
