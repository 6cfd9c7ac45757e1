// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef TEXTFLOW_TEXTFLOW_TEXTFLOW_HH
#define TEXTFLOW_TEXTFLOW_TEXTFLOW_HH

#include <defs.hh>

#include <cstddef>

#include <textflow/bbox.hh>
#include <textflow/error.hh>

#include <fmt/format.h>
using fmt::format;

namespace textflow {

//
// Fraction in [0,1], with an empty denominator counting as complete:
//
inline double ratio_of (size_t num, size_t den, double otherwise = 1.) {
    return den ? double (num) / den : otherwise;
}

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_TEXTFLOW_HH
