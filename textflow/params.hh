// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_PARAMS_HH
#define TEXTFLOW_TEXTFLOW_PARAMS_HH

#include <defs.hh>

#include <iosfwd>
#include <string>

#include <filesystem>
namespace fs = std::filesystem;

namespace textflow {

enum struct backend_t { none, local, remote_a, remote_b };

const char* to_string (backend_t);

////////////////////////////////////////////////////////////////////////

//
// All tunables of the pipeline. Distances are in points, fractions are of the
// page height unless noted. A params_t is built once (defaults, then the
// configuration file, then the command line) and is read-only afterwards:
//
struct params_t {
    //
    // Columns and bands:
    //
    double column_gap = 50;
    int    min_column_tokens = 3;
    double line_height = 15;

    // Words closer than this are glued together; CJK glyphs use the
    // wider threshold:
    double word_gap = 2;
    double cjk_word_gap = 10;

    //
    // Running headers and footers:
    //
    double repeat_band = .10;
    double repeat_fraction = .5;
    double repeat_grid = 10;

    //
    // Page numbers and margins:
    //
    bool   margin_filtering = true;
    double margin_fraction = .05;
    double isolation_radius = 50;

    //
    // Superscripts and subscripts:
    //
    double script_size_ratio = .7;
    double script_offset_ratio = .15;
    double script_proximity = 5;

    //
    // Tables:
    //
    bool   detect_tables = true;
    double table_cell_gap = 15;
    double table_row_gap = 20;
    int    table_min_rows = 3;
    int    table_min_cols = 3;
    double table_max_cell_tokens = 4;
    double table_align_tolerance = 5;
    double rule_thickness = 2;
    double rule_tolerance = 3;

    //
    // Footnotes:
    //
    double footnote_fraction = .20;
    int    footnote_page_window = 3;

    //
    // Verification and quality:
    //
    double inventory_band = .15;
    double min_element_ratio = .70;
    double min_position_similarity = .80;
    double min_coverage = .70;
    double quality_threshold = 70;
    int    max_attempts = 2;
    double gap_loosening = 1.5;

    //
    // Damaged and scanned pages:
    //
    double encoding_anomaly_ratio = .10;
    int    ocr_word_threshold = 10;
    double ocr_min_confidence = .5;

    //
    // Collaborators:
    //
    backend_t   ocr_backend = backend_t::none;
    std::string ocr_command;
    backend_t   llm_backend = backend_t::none;
    std::string llm_command;
    double      llm_min_confidence = .8;
    int         collaborator_timeout = 30;
    int         collaborator_retries = 2;

    //
    // Output:
    //
    bool page_markers = false;
};

//
// Reads `keyword value' lines from a configuration file into `params'. Bad
// lines are reported as errConfig and skipped. Returns false if the file
// cannot be opened:
//
bool parse_config_file (params_t& params, const fs::path& path);

void parse_config (params_t&, std::istream&, const std::string& name);

//
// Defaults overridden by the given configuration file or, when the path is
// empty, by ~/.textflowrc if there is one:
//
params_t load_params (const fs::path& path = { });

//
// The parameter variant used by the n-th remediation attempt (1-based):
//
params_t params_for_attempt (const params_t& base, int attempt);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_PARAMS_HH
