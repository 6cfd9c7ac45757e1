// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <cstdlib>
#include <set>

#include <textflow/footnotes.hh>
#include <textflow/rules.hh>

#include <utils/string.hh>

// Matches must be better than this:
#define minFootnoteConfidence 0.5

namespace textflow {
namespace {

bool in_body (const bbox_t& box, const page_t& page, const params_t& params) {
    const auto y = center_of (box).y;

    return
        y >= params.margin_fraction * page.height &&
        y < (1 - params.footnote_fraction) * page.height;
}

bool in_footnote_region (
    const bbox_t& box, const page_t& page, const params_t& params) {
    return box.arr [1] >= (1 - params.footnote_fraction) * page.height;
}

} // anonymous

footnotes_t extract_footnotes (
    const page_t& page, const lines_t& lines,
    const script_attachments_t& attachments, const params_t& params) {
    footnotes_t result;

    for (auto& line : lines) {
        if (line.kind != line_kind_t::text || !in_body (line.box, page, params)) {
            continue;
        }

        for (auto& word : line.words) {
            if (is_footnote_marker (word.text)) {
                result.markers.push_back ({
                    word.text, normalize_marker (word.text), word.box,
                    page.number });
            }
        }
    }

    for (auto& x : attachments) {
        if (x.kind == script_kind_t::superscript && x.canonical &&
            is_footnote_marker (x.text) && in_body (x.token->box, page, params)) {
            result.markers.push_back ({
                x.text, normalize_marker (x.text), x.token->box, page.number });
        }
    }

    footnote_definition_t* open = nullptr;

    for (auto& line : lines) {
        if (line.kind != line_kind_t::text ||
            !in_footnote_region (line.box, page, params)) {
            continue;
        }

        if (auto head = split_footnote_definition (line.text)) {
            result.definitions.push_back ({
                head->marker, normalize_marker (head->marker),
                trim (head->text), line.box, page.number });

            open = &result.definitions.back ();
        }
        else if (open) {
            if (!open->text.empty ()) {
                open->text += ' ';
            }

            open->text += trim (line.text);
            open->box += line.box;
        }
    }

    return result;
}

double match_confidence (
    const footnote_marker_t& marker, const footnote_definition_t& definition,
    const params_t& params) {
    if (marker.key != definition.key) {
        return 0;
    }

    const double exact = marker.text == definition.marker ? 1. : .5;

    const double distance = std::abs (marker.page - definition.page);
    const double proximity = (std::max) (
        0., 1 - distance / params.footnote_page_window);

    return .5 * exact + .5 * proximity;
}

footnote_matching_t match_footnotes (
    const footnote_markers_t& markers,
    const footnote_definitions_t& definitions, const params_t& params) {
    footnote_matching_t result{ { }, { }, { }, 1. };

    std::set< size_t > used;

    for (size_t i = 0; i < markers.size (); ++i) {
        const auto& marker = markers [i];

        size_t best = definitions.size ();
        double best_confidence = 0;

        //
        // Ties go to the nearer page, then to the earlier definition:
        //
        for (size_t j = 0; j < definitions.size (); ++j) {
            if (marker.text != definitions [j].marker) {
                continue;
            }

            const auto c = match_confidence (marker, definitions [j], params);

            if (c <= minFootnoteConfidence) {
                continue;
            }

            if (best == definitions.size () || c > best_confidence ||
                (c == best_confidence &&
                 std::abs (definitions [j].page - marker.page) <
                 std::abs (definitions [best].page - marker.page))) {
                best = j;
                best_confidence = c;
            }
        }

        if (best == definitions.size ()) {
            result.unmatched_markers.push_back (i);
        }
        else {
            result.matches.push_back ({ i, best, best_confidence });
            used.insert (best);
        }
    }

    for (size_t j = 0; j < definitions.size (); ++j) {
        if (!used.count (j)) {
            result.unmatched_definitions.push_back (j);
        }
    }

    result.match_rate = ratio_of (result.matches.size (), markers.size ());
    return result;
}

} // namespace textflow
