// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <cmath>
#include <map>

#include <textflow/repeating.hh>

namespace textflow {

std::optional< signature_t >
signature_of (const token_t& token, const page_t& page, const params_t& params) {
    const auto& box = token.box;
    const auto band = params.repeat_band * page.height;

    region_t region;

    if (box.arr [3] <= band) {
        region = region_t::top;
    }
    else if (box.arr [1] >= page.height - band) {
        region = region_t::bottom;
    }
    else {
        return { };
    }

    const auto grid = params.repeat_grid;

    return signature_t{
        token.text, region,
        int (std::lround (box.arr [0] / grid)),
        int (std::lround (box.arr [1] / grid))
    };
}

signatures_t
find_repeating_elements (const document_t& doc, const params_t& params) {
    std::map< signature_t, std::set< int > > pages_of;

    for (auto& page : doc.pages) {
        for (auto& token : page.tokens) {
            if (auto sig = signature_of (token, page, params)) {
                pages_of [*sig].insert (page.number);
            }
        }
    }

    const double threshold = params.repeat_fraction * doc.pages.size ();

    signatures_t xs;

    for (auto& [ sig, pages ] : pages_of) {
        if (pages.size () >= 2 && pages.size () > threshold) {
            xs.insert (sig);
        }
    }

    return xs;
}

} // namespace textflow
