// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <boost/regex.hpp>

#include <textflow/prepare.hh>

#include <utils/string.hh>

#include <range/v3/algorithm/count_if.hpp>
using namespace ranges;

namespace textflow {
namespace {

template< rotation_t R >
void unrotate_page (page_t& page) {
    const bool sideways =
        R == rotation_t::quarter_turn || R == rotation_t::three_quarters_turn;

    if (sideways) {
        std::swap (page.width, page.height);
    }

    const auto upright = page.box ();

    for (auto& token : page.tokens) {
        const auto offset = token.box.arr [3] - token.baseline;

        token.box = unrotate< R > (token.box, upright);

        //
        // The descent is kept for a half turn; sideways text has its baseline
        // estimated from the new bottom edge:
        //
        token.baseline = sideways ? token.box.arr [3] : token.box.arr [3] - offset;
    }

    for (auto& rule : page.rules) {
        rule.box = unrotate< R > (rule.box, upright);
    }

    page.rotation = 0;
}

void note (prepared_document_t& prep, const page_t& page, page_condition_t x) {
    prep.conditions [page.number].push_back (x);
}

//
// Replaces the tokens of the page with what the OCR engine recognizes with
// enough confidence. Returns false, and leaves the page alone, on failure:
//
bool recognize (
    page_t& page, const std::string& name, ocr_engine_t& ocr,
    const params_t& params) {
    try {
        tokens_t xs;

        for (auto& x : ocr.recognize (name, page)) {
            if (x.confidence >= params.ocr_min_confidence) {
                x.token.page = page.number;
                xs.push_back (std::move (x.token));
            }
        }

        page.tokens = std::move (xs);
        return true;
    }
    catch (const collaborator_error& e) {
        error (errCollaborator, page.number, "OCR failed: {0:s}", e.what ());
    }

    return false;
}

} // anonymous

bool has_encoding_anomaly (const std::string& s) {
    static const boost::regex escapes (
        "\\\\x[0-9A-Fa-f]{2}|\\\\u[0-9A-Fa-f]{4}");

    if (s.find ('\0') != std::string::npos) {
        return true;
    }

    // U+FFFD REPLACEMENT CHARACTER
    if (s.find ("\xEF\xBF\xBD") != std::string::npos) {
        return true;
    }

    if (!utf8_decode (s)) {
        return true;
    }

    return boost::regex_search (s, escapes);
}

bool make_upright (page_t& page) {
    const auto rotation = rotation_from (page.rotation);

    if (!rotation) {
        return false;
    }

    switch (*rotation) {
    case rotation_t::none:
        break;

    case rotation_t::quarter_turn:
        unrotate_page< rotation_t::quarter_turn > (page);
        break;

    case rotation_t::half_turn:
        unrotate_page< rotation_t::half_turn > (page);
        break;

    case rotation_t::three_quarters_turn:
        unrotate_page< rotation_t::three_quarters_turn > (page);
        break;
    }

    return true;
}

prepared_document_t
prepare_document (
    const document_t& doc, const params_t& params,
    const collaborators_t& collaborators) {
    prepared_document_t prep{ doc, { }, { } };

    for (auto& page : prep.doc.pages) {
        //
        // Rotation:
        //
        if (page.rotation % 360) {
            if (make_upright (page)) {
                note (prep, page, page_condition_t::rotated_page);
            }
            else {
                error (errLayout, page.number,
                       "Page rotated by {0:d} degrees; reading order is "
                       "unreliable", page.rotation);
                note (prep, page, page_condition_t::low_confidence);
            }
        }

        //
        // Damaged text:
        //
        const auto damaged = count_if (page.tokens, [](auto& x) {
            return has_encoding_anomaly (x.text);
        });

        bool recognized = false;

        if (damaged) {
            if (ratio_of (damaged, page.tokens.size ()) >
                params.encoding_anomaly_ratio) {
                error (errLayout, page.number,
                       "{0:d} of {1:d} tokens have damaged text",
                       damaged, page.tokens.size ());
                note (prep, page, page_condition_t::encoding_anomaly);

                if (collaborators.ocr) {
                    recognized = recognize (
                        page, doc.name, *collaborators.ocr, params);

                    if (!recognized) {
                        note (prep, page, page_condition_t::collaborator_failure);
                    }
                }
            }

            if (!recognized) {
                for (auto& token : page.tokens) {
                    if (has_encoding_anomaly (token.text)) {
                        token.text = TEXTFLOW_UNREADABLE;
                    }
                }
            }
        }

        //
        // Scanned pages carry few or no tokens:
        //
        if (collaborators.ocr && !recognized &&
            page.tokens.size () < size_t (params.ocr_word_threshold)) {
            if (!recognize (page, doc.name, *collaborators.ocr, params)) {
                note (prep, page, page_condition_t::collaborator_failure);
            }
        }

        if (page.tokens.empty ()) {
            error (errLayout, page.number, "Page has no text");
            note (prep, page, page_condition_t::empty_token_stream);
            prep.unextractable.insert (page.number);
        }
    }

    return prep;
}

} // namespace textflow
