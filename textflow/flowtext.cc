// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

#include <textflow/batch.hh>
#include <textflow/params.hh>
#include <textflow/report.hh>

#include <utils/parseargs.hh>

#include <filesystem>
namespace fs = std::filesystem;

using namespace textflow;

static char cfgFileName [256] = "";
static char outputDir [256] = "";
static int jobs = 0;
static bool toStdout = false;
static double columnGap = 0;
static double lineHeight = 0;
static int maxAttempts = 0;
static double qualityThreshold = -1;
static bool noMarginFilter = false;
static bool noTables = false;
static bool pageMarkers = false;
static bool quiet = false;
static bool printVersion = false;
static bool printHelp = false;

static ArgDesc argDesc [] = {
    { "-cfg", argString, cfgFileName, sizeof (cfgFileName),
      "configuration file to use in place of .textflowrc" },
    { "-o", argString, outputDir, sizeof (outputDir),
      "directory for the text and report files" },
    { "-j", argInt, &jobs, 0, "number of documents processed at once" },
    { "-stdout", argFlag, &toStdout, 0,
      "write the text of a single document to stdout" },
    { "-gap", argFP, &columnGap, 0, "minimum gutter between columns" },
    { "-line", argFP, &lineHeight, 0, "line height tolerance" },
    { "-attempts", argInt, &maxAttempts, 0,
      "maximum number of remediation attempts" },
    { "-threshold", argFP, &qualityThreshold, 0,
      "quality score accepted without remediation" },
    { "-nomargin", argFlag, &noMarginFilter, 0,
      "keep running headers, footers and margin numbers" },
    { "-notables", argFlag, &noTables, 0, "don't detect tables" },
    { "-markers", argFlag, &pageMarkers, 0,
      "enclose every page in start and end markers" },
    { "-q", argFlag, &quiet, 0, "don't print any messages or errors" },
    { "-v", argFlag, &printVersion, 0, "print copyright and version info" },
    { "-h", argFlag, &printHelp, 0, "print usage information" },
    { "-help", argFlag, &printHelp, 0, "print usage information" },
    { "--help", argFlag, &printHelp, 0, "print usage information" },
    { "-?", argFlag, &printHelp, 0, "print usage information" },
    { }
};

static std::atomic< bool > interrupted{ false };

static void onInterrupt (int) {
    interrupted = true;
}

static params_t makeParams () {
    auto params = load_params (cfgFileName);

    if (columnGap > 0)         { params.column_gap = columnGap; }
    if (lineHeight > 0)        { params.line_height = lineHeight; }
    if (maxAttempts > 0)       { params.max_attempts = maxAttempts; }
    if (qualityThreshold >= 0) { params.quality_threshold = qualityThreshold; }
    if (noMarginFilter)        { params.margin_filtering = false; }
    if (noTables)              { params.detect_tables = false; }
    if (pageMarkers)           { params.page_markers = true; }

    return params;
}

static bool writeFile (const fs::path& path, const std::string& s) {
    std::ofstream stream (path, std::ios::binary);

    if (!stream || !(stream << s)) {
        error (errIO, -1, "Couldn't write file '{0:s}'", path.string ());
        return false;
    }

    return true;
}

static bool writeOutput (const fs::path& input, const extraction_t& x) {
    const auto dir = outputDir [0]
        ? fs::path (outputDir) : input.parent_path ();

    const auto stem = input.stem ().string ();

    std::ostringstream report;
    write_report (report, x);

    if (toStdout) {
        std::cout << x.result ().text;
        return writeFile (dir / (stem + ".report.json"), report.str ());
    }

    return
        writeFile (dir / (stem + ".txt"), x.result ().text) &&
        writeFile (dir / (stem + ".report.json"), report.str ());
}

int main (int argc, char* argv []) {
    int exitCode = 99;

    // parse args
    bool ok = parseArgs (argDesc, &argc, argv);

    if (!ok || argc < 2 || printVersion || printHelp ||
        (toStdout && argc != 2)) {
        fprintf (stderr, "flowtext version %s\n", PACKAGE_VERSION);
        fprintf (stderr, "%s\n", TEXTFLOW_COPYRIGHT);

        if (!printVersion) {
            printUsage ("flowtext", "<token-file> ...", argDesc);
        }

        return exitCode;
    }

    if (quiet) {
        set_error_callback ({ });
    }

    if (outputDir [0]) {
        std::error_code ec;
        fs::create_directories (outputDir, ec);

        if (ec) {
            error (errIO, -1, "Couldn't create directory '{0:s}': {1:s}",
                   outputDir, ec.message ());
            return 2;
        }
    }

    // read config file
    const auto params = makeParams ();
    const auto collaborators = make_collaborators (params);

    std::vector< fs::path > inputs (argv + 1, argv + argc);

    std::signal (SIGINT, onInterrupt);

    const auto batch = process_batch (
        inputs, params, collaborators, size_t ((std::max) (jobs, 0)),
        &interrupted);

    exitCode = 0;

    for (size_t i = 0; i < batch.size (); ++i) {
        const auto& item = batch [i];

        if (!item.extraction) {
            exitCode = (std::max) (exitCode, 1);
            continue;
        }

        if (!writeOutput (inputs [i], *item.extraction)) {
            exitCode = 2;
        }
    }

    return exitCode;
}
