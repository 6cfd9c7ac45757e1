// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEST_FIXTURE_HH
#define TEXTFLOW_TEST_FIXTURE_HH

#include <defs.hh>

#include <string>
#include <vector>

#include <textflow/error.hh>
#include <textflow/token.hh>

namespace textflow {
namespace test {

//
// A token whose baseline sits at the bottom of its box:
//
inline token_t
make_token (const std::string& text, double x0, double y0, double x1,
            double y1, double font_size = 10, int page = 1) {
    return token_t{ text, bbox_t{ x0, y0, x1, y1 }, font_size, y1, page };
}

//
// A word of `n' characters, 5pt per character, on a 10pt line starting at
// `y':
//
inline token_t
make_word (const std::string& text, double x, double y, int page = 1) {
    return make_token (text, x, y, x + 5. * text.size (), y + 10, 10, page);
}

inline page_t make_page (int number, tokens_t tokens) {
    for (auto& x : tokens) {
        x.page = number;
    }

    return page_t{
        number, TEXTFLOW_PAPER_WIDTH, TEXTFLOW_PAPER_HEIGHT, 0,
        std::move (tokens), { }
    };
}

inline token_refs_t refs_of (const tokens_t& xs) {
    token_refs_t refs;

    for (auto& x : xs) {
        refs.push_back (&x);
    }

    return refs;
}

inline std::vector< std::string > texts_of (const token_refs_t& xs) {
    std::vector< std::string > result;

    for (auto p : xs) {
        result.push_back (p->text);
    }

    return result;
}

//
// Silences diagnostics for the lifetime of the object, collecting them:
//
struct capture_errors_t {
    capture_errors_t ()
        : prev (set_error_callback ([this](auto, auto, auto& s) {
              messages.push_back (s);
          }))
        { }

    ~capture_errors_t () {
        set_error_callback (prev);
    }

    std::vector< std::string > messages;
    error_callback_t prev;
};

} // namespace test
} // namespace textflow

#endif // TEXTFLOW_TEST_FIXTURE_HH
