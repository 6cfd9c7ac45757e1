// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef TEXTFLOW_CONFIG_HH
#define TEXTFLOW_CONFIG_HH

// Autoconf-like macros
#define PACKAGE "textflow"
#define PACKAGE_NAME "textflow"
#define PACKAGE_STRING "textflow 1.0.0"
#define PACKAGE_TARNAME "textflow"
#define PACKAGE_URL ""
#define PACKAGE_VERSION "1.0.0"
#define VERSION "1.0.0"

#define TEXTFLOW_COPYRIGHT "Copyright 2019-2020 Thinkoid, LLC"

// Name of the per-user configuration file, looked up in $HOME:
#define TEXTFLOW_RC ".textflowrc"

//------------------------------------------------------------------------
// page geometry
//------------------------------------------------------------------------

// default page size (in points) for token documents that omit it
#ifdef A4_PAPER
#define TEXTFLOW_PAPER_WIDTH 595 // ISO A4 (210x297 mm)
#define TEXTFLOW_PAPER_HEIGHT 842
#else
#define TEXTFLOW_PAPER_WIDTH 612 // American letter (8.5x11")
#define TEXTFLOW_PAPER_HEIGHT 792
#endif

//------------------------------------------------------------------------
// output
//------------------------------------------------------------------------

// Text substituted for tokens whose encoding is damaged beyond repair and
// for which no OCR engine is available:
#define TEXTFLOW_UNREADABLE "[unreadable]"

#endif // TEXTFLOW_CONFIG_HH
