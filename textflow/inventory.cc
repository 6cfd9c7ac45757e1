// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <textflow/inventory.hh>

// Coverage status thresholds:
#define goodCoverage 0.85
#define fairCoverage 0.70

namespace textflow {
namespace {

std::array< double, 3 > normalized (const std::array< size_t, 3 >& xs) {
    const auto n = xs [0] + xs [1] + xs [2];

    return {
        ratio_of (xs [0], n, 0.), ratio_of (xs [1], n, 0.), ratio_of (xs [2], n, 0.)
    };
}

} // anonymous

const char* to_string (position_band_t x) {
    switch (x) {
    case position_band_t::top:    return "top";
    case position_band_t::middle: return "middle";
    case position_band_t::bottom: return "bottom";
    }

    return "unknown";
}

const char* to_string (size_class_t x) {
    switch (x) {
    case size_class_t::large:    return "large";
    case size_class_t::standard: return "standard";
    case size_class_t::small:    return "small";
    case size_class_t::tiny:     return "tiny";
    }

    return "unknown";
}

const char* to_string (coverage_status_t x) {
    switch (x) {
    case coverage_status_t::good:    return "GOOD";
    case coverage_status_t::warning: return "WARNING";
    case coverage_status_t::poor:    return "POOR";
    }

    return "unknown";
}

position_band_t
position_band_of (const token_t& token, const page_t& page, const params_t& params) {
    const auto y = center_of (token.box).y;
    const auto band = params.inventory_band * page.height;

    return y < band
        ? position_band_t::top
        : y > page.height - band ? position_band_t::bottom : position_band_t::middle;
}

size_class_t size_class_of (const token_t& token) {
    const auto x = token.font_size;

    return x > 18
        ? size_class_t::large
        : x >= 10
            ? size_class_t::standard
            : x >= 6 ? size_class_t::small : size_class_t::tiny;
}

coverage_status_t coverage_status (double coverage) {
    return coverage >= goodCoverage
        ? coverage_status_t::good
        : coverage >= fairCoverage ? coverage_status_t::warning : coverage_status_t::poor;
}

inventory_t::inventory_t (const document_t& doc, const params_t& params)
    : doc_ (doc), params_ (params), total_ () {
    for (auto& page : doc.pages) {
        page_inventory_t x{ page.number, page.tokens.size (), { }, { } };

        for (auto& token : page.tokens) {
            ++x.positions [size_t (position_band_of (token, page, params))];
            ++x.sizes [size_t (size_class_of (token))];
        }

        total_ += x.total;
        pages_.push_back (x);
    }
}

std::array< double, 3 > inventory_t::position_distribution () const {
    std::array< size_t, 3 > xs{ };

    for (auto& page : pages_) {
        for (size_t i = 0; i < xs.size (); ++i) {
            xs [i] += page.positions [i];
        }
    }

    return normalized (xs);
}

std::array< double, 3 >
inventory_t::position_distribution (const std::set< const token_t* >& tokens) const {
    std::array< size_t, 3 > xs{ };

    for (auto& page : doc_.pages) {
        for (auto& token : page.tokens) {
            if (tokens.count (&token)) {
                ++xs [size_t (position_band_of (token, page, params_))];
            }
        }
    }

    return normalized (xs);
}

double inventory_t::coverage (const std::set< const token_t* >& tokens) const {
    size_t n = 0;

    for (auto& page : doc_.pages) {
        for (auto& token : page.tokens) {
            n += tokens.count (&token);
        }
    }

    return ratio_of (n, total_, 0.);
}

} // namespace textflow
