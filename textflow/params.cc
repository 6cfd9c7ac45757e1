// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <textflow/error.hh>
#include <textflow/params.hh>

#include <utils/path.hh>

namespace textflow {
namespace {

using tokens_t = std::vector< std::string >;

//
// Breaks the line into whitespace-separated tokens; single or double quotes
// group a token that contains spaces:
//
tokens_t tokenize (const std::string& buf) {
    tokens_t tokens;

    auto p1 = buf.begin (), last = buf.end ();

    while (p1 != last) {
        for (; p1 != last && isspace (*p1); ++p1) ;
        if (p1 == last) { break; }

        auto p2 = p1;

        if (*p1 == '"' || *p1 == '\'') {
            for (p2 = p1 + 1; p2 != last && *p2 != *p1; ++p2) ;
            ++p1;
        }
        else {
            for (p2 = p1 + 1; p2 != last && !isspace (*p2); ++p2) ;
        }

        tokens.emplace_back (p1, p2);
        p1 = p2 != last ? p2 + 1 : p2;
    }

    return tokens;
}

void bad_command (const char* cmdName, const std::string& fileName, int line) {
    error (
        errConfig, -1, "Bad '{0:s}' config file command ({1:s}:{2:d})",
        cmdName, fileName, line);
}

bool parse_yes_no2 (const std::string& token, bool& flag) {
    if (token == "yes") { flag = true; }
    else if (token == "no") {
        flag = false;
    }
    else {
        return false;
    }
    return true;
}

void parse_yes_no (
    const char* cmdName, bool& flag, const tokens_t& tokens,
    const std::string& fileName, int line) {
    if (tokens.size () != 2 || !parse_yes_no2 (tokens [1], flag)) {
        bad_command (cmdName, fileName, line);
    }
}

void parse_integer (
    const char* cmdName, int& val, const tokens_t& tokens,
    const std::string& fileName, int line, int minval = 0) {
    if (tokens.size () != 2 || tokens [1].empty ()) {
        return bad_command (cmdName, fileName, line);
    }

    const auto& tok = tokens [1];

    for (size_t i = tok [0] == '-' ? 1 : 0; i < tok.size (); ++i) {
        if (tok [i] < '0' || tok [i] > '9') {
            return bad_command (cmdName, fileName, line);
        }
    }

    const int tmp = atoi (tok.c_str ());

    if (tmp < minval) {
        return bad_command (cmdName, fileName, line);
    }

    val = tmp;
}

void parse_float (
    const char* cmdName, double& val, const tokens_t& tokens,
    const std::string& fileName, int line, double minval = 0,
    double maxval = 1e9) {
    if (tokens.size () != 2 || tokens [1].empty ()) {
        return bad_command (cmdName, fileName, line);
    }

    const auto& tok = tokens [1];

    for (size_t i = tok [0] == '-' ? 1 : 0; i < tok.size (); ++i) {
        if (!((tok [i] >= '0' && tok [i] <= '9') || tok [i] == '.')) {
            return bad_command (cmdName, fileName, line);
        }
    }

    const double tmp = atof (tok.c_str ());

    if (tmp < minval || tmp > maxval) {
        return bad_command (cmdName, fileName, line);
    }

    val = tmp;
}

void parse_fraction (
    const char* cmdName, double& val, const tokens_t& tokens,
    const std::string& fileName, int line) {
    parse_float (cmdName, val, tokens, fileName, line, 0., 1.);
}

void parse_string (
    const char* cmdName, std::string& val, const tokens_t& tokens,
    const std::string& fileName, int line) {
    if (tokens.size () != 2) {
        return bad_command (cmdName, fileName, line);
    }

    val = tokens [1];
}

void parse_backend (
    const char* cmdName, backend_t& val, const tokens_t& tokens,
    const std::string& fileName, int line) {
    if (tokens.size () != 2) {
        return bad_command (cmdName, fileName, line);
    }

    const auto& tok = tokens [1];

    if (tok == "none") { val = backend_t::none; }
    else if (tok == "local") {
        val = backend_t::local;
    }
    else if (tok == "remoteA") {
        val = backend_t::remote_a;
    }
    else if (tok == "remoteB") {
        val = backend_t::remote_b;
    }
    else {
        bad_command (cmdName, fileName, line);
    }
}

void parse_line (
    params_t& params, const std::string& buf, const std::string& fileName,
    int line) {
    auto tokens = tokenize (buf);

    if (tokens.empty () || tokens [0][0] == '#') {
        return;
    }

    const auto& cmd = tokens [0];
    auto& p = params;

    if (cmd == "include") {
        if (tokens.size () == 2) {
            const auto path = expand_path (tokens [1]);

            if (!parse_config_file (p, path)) {
                error (
                    errConfig, -1,
                    "Couldn't find included config file: '{0:s}' "
                    "({1:s}:{2:d})",
                    tokens [1], fileName, line);
            }
        }
        else {
            error (
                errConfig, -1,
                "Bad 'include' config file command ({0:s}:{1:d})", fileName,
                line);
        }
    }
    else if (cmd == "columnGap") {
        parse_float ("columnGap", p.column_gap, tokens, fileName, line);
    }
    else if (cmd == "minColumnTokens") {
        parse_integer (
            "minColumnTokens", p.min_column_tokens, tokens, fileName, line, 1);
    }
    else if (cmd == "lineHeight") {
        parse_float ("lineHeight", p.line_height, tokens, fileName, line);
    }
    else if (cmd == "wordGap") {
        parse_float ("wordGap", p.word_gap, tokens, fileName, line);
    }
    else if (cmd == "cjkWordGap") {
        parse_float ("cjkWordGap", p.cjk_word_gap, tokens, fileName, line);
    }
    else if (cmd == "repeatBand") {
        parse_fraction ("repeatBand", p.repeat_band, tokens, fileName, line);
    }
    else if (cmd == "repeatFraction") {
        parse_fraction (
            "repeatFraction", p.repeat_fraction, tokens, fileName, line);
    }
    else if (cmd == "repeatGrid") {
        parse_float ("repeatGrid", p.repeat_grid, tokens, fileName, line, 1.);
    }
    else if (cmd == "marginFilter") {
        parse_yes_no (
            "marginFilter", p.margin_filtering, tokens, fileName, line);
    }
    else if (cmd == "marginFraction") {
        parse_fraction (
            "marginFraction", p.margin_fraction, tokens, fileName, line);
    }
    else if (cmd == "isolationRadius") {
        parse_float (
            "isolationRadius", p.isolation_radius, tokens, fileName, line);
    }
    else if (cmd == "scriptSizeRatio") {
        parse_fraction (
            "scriptSizeRatio", p.script_size_ratio, tokens, fileName, line);
    }
    else if (cmd == "scriptOffsetRatio") {
        parse_fraction (
            "scriptOffsetRatio", p.script_offset_ratio, tokens, fileName,
            line);
    }
    else if (cmd == "scriptProximity") {
        parse_float (
            "scriptProximity", p.script_proximity, tokens, fileName, line);
    }
    else if (cmd == "detectTables") {
        parse_yes_no ("detectTables", p.detect_tables, tokens, fileName, line);
    }
    else if (cmd == "tableCellGap") {
        parse_float ("tableCellGap", p.table_cell_gap, tokens, fileName, line);
    }
    else if (cmd == "tableRowGap") {
        parse_float ("tableRowGap", p.table_row_gap, tokens, fileName, line);
    }
    else if (cmd == "tableMinRows") {
        parse_integer (
            "tableMinRows", p.table_min_rows, tokens, fileName, line, 2);
    }
    else if (cmd == "tableMinCols") {
        parse_integer (
            "tableMinCols", p.table_min_cols, tokens, fileName, line, 2);
    }
    else if (cmd == "tableMaxCellTokens") {
        parse_float (
            "tableMaxCellTokens", p.table_max_cell_tokens, tokens, fileName,
            line, 1.);
    }
    else if (cmd == "tableAlignTolerance") {
        parse_float (
            "tableAlignTolerance", p.table_align_tolerance, tokens, fileName,
            line);
    }
    else if (cmd == "ruleThickness") {
        parse_float ("ruleThickness", p.rule_thickness, tokens, fileName, line);
    }
    else if (cmd == "ruleTolerance") {
        parse_float ("ruleTolerance", p.rule_tolerance, tokens, fileName, line);
    }
    else if (cmd == "footnoteFraction") {
        parse_fraction (
            "footnoteFraction", p.footnote_fraction, tokens, fileName, line);
    }
    else if (cmd == "footnotePageWindow") {
        parse_integer (
            "footnotePageWindow", p.footnote_page_window, tokens, fileName,
            line, 1);
    }
    else if (cmd == "inventoryBand") {
        parse_fraction (
            "inventoryBand", p.inventory_band, tokens, fileName, line);
    }
    else if (cmd == "minElementRatio") {
        parse_fraction (
            "minElementRatio", p.min_element_ratio, tokens, fileName, line);
    }
    else if (cmd == "minPositionSimilarity") {
        parse_fraction (
            "minPositionSimilarity", p.min_position_similarity, tokens,
            fileName, line);
    }
    else if (cmd == "minCoverage") {
        parse_fraction ("minCoverage", p.min_coverage, tokens, fileName, line);
    }
    else if (cmd == "qualityThreshold") {
        parse_float (
            "qualityThreshold", p.quality_threshold, tokens, fileName, line,
            0., 100.);
    }
    else if (cmd == "maxAttempts") {
        parse_integer ("maxAttempts", p.max_attempts, tokens, fileName, line, 1);
    }
    else if (cmd == "gapLoosening") {
        parse_float (
            "gapLoosening", p.gap_loosening, tokens, fileName, line, 1.);
    }
    else if (cmd == "encodingAnomalyRatio") {
        parse_fraction (
            "encodingAnomalyRatio", p.encoding_anomaly_ratio, tokens, fileName,
            line);
    }
    else if (cmd == "ocrWordThreshold") {
        parse_integer (
            "ocrWordThreshold", p.ocr_word_threshold, tokens, fileName, line);
    }
    else if (cmd == "ocrMinConfidence") {
        parse_fraction (
            "ocrMinConfidence", p.ocr_min_confidence, tokens, fileName, line);
    }
    else if (cmd == "ocrBackend") {
        parse_backend ("ocrBackend", p.ocr_backend, tokens, fileName, line);
    }
    else if (cmd == "ocrCommand") {
        parse_string ("ocrCommand", p.ocr_command, tokens, fileName, line);
    }
    else if (cmd == "llmBackend") {
        parse_backend ("llmBackend", p.llm_backend, tokens, fileName, line);
    }
    else if (cmd == "llmCommand") {
        parse_string ("llmCommand", p.llm_command, tokens, fileName, line);
    }
    else if (cmd == "llmMinConfidence") {
        parse_fraction (
            "llmMinConfidence", p.llm_min_confidence, tokens, fileName, line);
    }
    else if (cmd == "collaboratorTimeout") {
        parse_integer (
            "collaboratorTimeout", p.collaborator_timeout, tokens, fileName,
            line, 1);
    }
    else if (cmd == "collaboratorRetries") {
        parse_integer (
            "collaboratorRetries", p.collaborator_retries, tokens, fileName,
            line);
    }
    else if (cmd == "pageMarkers") {
        parse_yes_no ("pageMarkers", p.page_markers, tokens, fileName, line);
    }
    else {
        error (
            errConfig, -1,
            "Unknown config file command '{0:s}' ({1:s}:{2:d})", cmd,
            fileName, line);
    }
}

} // anonymous

const char* to_string (backend_t x) {
    switch (x) {
    case backend_t::none:     return "none";
    case backend_t::local:    return "local";
    case backend_t::remote_a: return "remoteA";
    case backend_t::remote_b: return "remoteB";
    }

    return "unknown";
}

void parse_config (
    params_t& params, std::istream& stream, const std::string& name) {
    std::string buf;

    for (int line = 1; std::getline (stream, buf); ++line) {
        if (!buf.empty () && buf.back () == '\r') {
            buf.pop_back ();
        }

        parse_line (params, buf, name, line);
    }
}

bool parse_config_file (params_t& params, const fs::path& path) {
    std::ifstream stream (path);

    if (!stream) {
        return false;
    }

    parse_config (params, stream, path.string ());
    return true;
}

params_t load_params (const fs::path& path) {
    params_t params;

    if (path.empty ()) {
        const auto rc = home_path () / TEXTFLOW_RC;

        if (fs::exists (rc)) {
            parse_config_file (params, rc);
        }
    }
    else if (!parse_config_file (params, expand_path (path))) {
        error (
            errIO, -1, "Couldn't open config file '{0:s}'", path.string ());
    }

    return params;
}

params_t params_for_attempt (const params_t& base, int attempt) {
    auto params = base;

    switch (attempt) {
    case 1:
        break;

    case 2:
        // Running headers or margin numbers may have taken real content:
        params.margin_filtering = false;
        break;

    default:
        // Columns may have been split at a gutter that is not one:
        params.column_gap = base.column_gap * base.gap_loosening;
        break;
    }

    return params;
}

} // namespace textflow
