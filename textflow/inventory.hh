// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_INVENTORY_HH
#define TEXTFLOW_TEXTFLOW_INVENTORY_HH

#include <defs.hh>

#include <array>
#include <set>
#include <vector>

#include <textflow/params.hh>
#include <textflow/token.hh>

namespace textflow {

enum struct position_band_t { top, middle, bottom };
enum struct size_class_t { large, standard, small, tiny };

const char* to_string (position_band_t);
const char* to_string (size_class_t);

position_band_t position_band_of (const token_t&, const page_t&, const params_t&);
size_class_t size_class_of (const token_t&);

struct page_inventory_t {
    int page;
    size_t total;

    // Indexed by position_band_t and size_class_t, respectively:
    std::array< size_t, 3 > positions;
    std::array< size_t, 4 > sizes;
};

enum struct coverage_status_t { good, warning, poor };

const char* to_string (coverage_status_t);

coverage_status_t coverage_status (double coverage);

//
// Token counts of a document taken before anything is filtered. The counts
// are fixed at construction:
//
class inventory_t {
public:
    inventory_t (const document_t&, const params_t&);

    const std::vector< page_inventory_t >& pages () const { return pages_; }

    size_t total () const { return total_; }

    //
    // Distribution of the tokens over the top, middle and bottom bands:
    //
    std::array< double, 3 > position_distribution () const;

    //
    // Distribution of the given tokens, which must come from the same
    // document, over the same bands:
    //
    std::array< double, 3 >
    position_distribution (const std::set< const token_t* >&) const;

    //
    // Fraction of the inventory found among the given tokens:
    //
    double coverage (const std::set< const token_t* >&) const;

private:
    const document_t& doc_;
    params_t params_;

    std::vector< page_inventory_t > pages_;
    size_t total_;
};

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_INVENTORY_HH
