// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef TEXTFLOW_DEFS_HH
#define TEXTFLOW_DEFS_HH

#include <config.hh>

#include <boost/assert.hpp>

#define TEXTFLOW_ASSERT BOOST_ASSERT
#define ASSERT TEXTFLOW_ASSERT

#endif // TEXTFLOW_DEFS_HH
