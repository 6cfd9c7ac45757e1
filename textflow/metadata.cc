// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <cmath>
#include <set>

#include <textflow/bands.hh>
#include <textflow/metadata.hh>
#include <textflow/rules.hh>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/remove_if.hpp>
using namespace ranges;

namespace textflow {
namespace {

bool in_outer_margin (const token_t& token, const page_t& page, double fraction) {
    const auto y = center_of (token.box).y;
    const auto margin = fraction * page.height;
    return y < margin || y > page.height - margin;
}

bool isolated (const token_t& token, const token_refs_t& xs, double radius) {
    const auto c = center_of (token.box);

    return !any_of (xs, [&](auto p) {
        if (p == &token) {
            return false;
        }

        const auto d = center_of (p->box);
        return std::hypot (d.x - c.x, d.y - c.y) <= radius;
    });
}

} // anonymous

const char* to_string (removal_reason_t x) {
    switch (x) {
    case removal_reason_t::repeating_header_footer:
        return "repeating_header_footer";
    case removal_reason_t::strict_page_number:
        return "strict_page_number";
    case removal_reason_t::margin_page_number:
        return "margin_page_number";
    }

    return "unknown";
}

bool allow_removal (const token_t&, removal_reason_t) {
    return true;
}

std::optional< removal_reason_t >
classify_token (const token_t& token, const token_context_t& ctx,
                const signatures_t& signatures, const params_t& params) {
    const auto& text = token.text;

    // (a)
    if (has_internal_decimal (text)) {
        return { };
    }

    // (b)
    if (is_footnote_marker (text)) {
        return { };
    }

    if (params.margin_filtering && !ctx.section_band) {
        auto sig = signature_of (token, ctx.page, params);

        if (sig && signatures.count (*sig)) {
            return removal_reason_t::repeating_header_footer;
        }
    }

    // (c)
    if (is_strict_page_number (ctx.band_text)) {
        return removal_reason_t::strict_page_number;
    }

    // (d)
    if (params.margin_filtering && is_margin_number (text) &&
        in_outer_margin (token, ctx.page, params.margin_fraction) &&
        isolated (token, ctx.neighbours, params.isolation_radius)) {
        return removal_reason_t::margin_page_number;
    }

    // (e)
    return { };
}

removals_t filter_metadata (
    columns_t& columns, const page_t& page, const signatures_t& signatures,
    const params_t& params, const retention_policy_t& policy) {
    token_refs_t neighbours;

    for (auto& column : columns) {
        neighbours.insert (
            neighbours.end (), column.tokens.begin (), column.tokens.end ());
    }

    removals_t removals;
    std::set< const token_t* > removed;

    for (auto& column : columns) {
        for (auto& band : column.bands) {
            const auto band_text = text_of (band, params);

            const bool section_band =
                !band.tokens.empty () &&
                is_section_number (band.tokens.front ()->text);

            const token_context_t ctx{
                page, band_text, section_band, neighbours
            };

            for (auto p : band.tokens) {
                auto reason = classify_token (*p, ctx, signatures, params);

                if (reason && (!policy || policy (*p, *reason))) {
                    removals.push_back ({ p, *reason });
                    removed.insert (p);
                }
            }
        }
    }

    if (removed.empty ()) {
        return removals;
    }

    auto gone = [&](auto p) { return removed.count (p) > 0; };

    for (auto& column : columns) {
        column.tokens.erase (remove_if (column.tokens, gone), column.tokens.end ());

        for (auto& band : column.bands) {
            band.tokens.erase (remove_if (band.tokens, gone), band.tokens.end ());

            if (!band.tokens.empty ()) {
                band.box = bbox_of (band.tokens);
            }
        }

        column.bands.erase (
            remove_if (column.bands, [](auto& x) { return x.tokens.empty (); }),
            column.bands.end ());

        if (!column.tokens.empty ()) {
            column.box = bbox_of (column.tokens);
        }
    }

    columns.erase (
        remove_if (columns, [](auto& x) { return x.tokens.empty (); }),
        columns.end ());

    return removals;
}

} // namespace textflow
