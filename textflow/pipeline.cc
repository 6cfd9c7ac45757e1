// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <set>

#include <textflow/bands.hh>
#include <textflow/document.hh>
#include <textflow/pipeline.hh>

#include <utils/string.hh>

#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/algorithm/max_element.hpp>
#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/view/transform.hpp>
using namespace ranges;

namespace textflow {
namespace {

token_refs_t token_refs_of (const page_t& page) {
    token_refs_t xs;

    for (auto& x : page.tokens) {
        xs.push_back (&x);
    }

    return xs;
}

//
// The column a table is spliced into: the one it overlaps most, horizontally:
//
size_t host_column (const table_t& table, const columns_t& columns) {
    size_t best = 0;
    double best_overlap = -1;

    for (size_t i = 0; i < columns.size (); ++i) {
        const double x = horizontal_overlap (table.box, columns [i].box);

        if (x > best_overlap) {
            best = i;
            best_overlap = x;
        }
    }

    return best;
}

void add_condition (page_result_t& page, page_condition_t x) {
    if (find_if (page.conditions, [&](auto y) { return x == y; }) ==
        page.conditions.end ()) {
        page.conditions.push_back (x);
    }
}

std::set< const token_t* > extracted_tokens (const document_result_t& result) {
    std::set< const token_t* > xs;

    for (auto& page : result.pages) {
        for (auto& line : page.lines) {
            for (auto& word : line.words) {
                xs.insert (word.sources.begin (), word.sources.end ());
            }
        }
    }

    return xs;
}

double mean_table_confidence (const std::vector< page_result_t >& pages) {
    double sum = 0;
    size_t n = 0;

    for (auto& page : pages) {
        for (auto& table : page.tables) {
            sum += table.confidence;
            ++n;
        }
    }

    return n ? sum / n : 1.;
}

std::string
compose_text (const document_result_t& result, const prepared_document_t& prep) {
    std::string text;

    for (size_t i = 0; i < prep.doc.pages.size (); ++i) {
        const auto& page = prep.doc.pages [i];

        if (i) {
            text += '\f';
        }

        auto iter = find_if (result.pages, [&](auto& x) {
            return x.number == page.number;
        });

        const auto body = iter == result.pages.end ()
            ? std::string{ } : text_of (*iter);

        if (result.params.page_markers) {
            text += format ("--- PAGE {} START ---\n", page.number);

            if (!body.empty ()) {
                text += body;
                text += '\n';
            }

            text += format ("--- PAGE {} END ---\n", page.number);
        }
        else if (!body.empty ()) {
            text += body;
            text += '\n';
        }
    }

    return text;
}

} // anonymous

bool ordering_consistent (const columns_t& columns) {
    return all_of (columns, [](auto& column) {
        for (size_t i = 1; i < column.bands.size (); ++i) {
            if (column.bands [i].box.arr [1] < column.bands [i - 1].box.arr [1]) {
                return false;
            }
        }

        return true;
    });
}

lines_t table_lines (const table_t& table) {
    lines_t lines;

    const auto rows = format_table (table);

    for (size_t i = 0; i < table.rows; ++i) {
        line_t line{
            line_kind_t::table_row, { },
            bbox_t{
                table.box.arr [0], table.grid.rows [i].first,
                table.box.arr [2], table.grid.rows [i].second },
            rows [i]
        };

        for (size_t j = 0; j < table.cols; ++j) {
            const auto& cell = table.at (i, j);
            line.words.push_back (word_t{ cell.text, cell.box, cell.tokens });
        }

        lines.push_back (std::move (line));
    }

    return lines;
}

page_result_t process_page (
    const page_t& page, const signatures_t& signatures, const params_t& params) {
    page_result_t result{ page.number, { }, { }, { }, { }, { }, { }, { }, true };

    const auto tokens = token_refs_of (page);

    result.tables = detect_tables (page, tokens, params);

    result.columns = segment_columns (
        exclude_table_tokens (tokens, result.tables), params);

    for (auto& column : result.columns) {
        sort_column (column, params);
    }

    result.removals = filter_metadata (result.columns, page, signatures, params);
    result.ordering_consistent = ordering_consistent (result.columns);

    std::vector< lines_t > xs;

    for (auto& column : result.columns) {
        xs.emplace_back ();

        for (auto& band : column.bands) {
            xs.back ().push_back (
                attach_scripts (band, params, result.attachments));
        }
    }

    //
    // Each table goes before the first line of its column that starts below
    // the table's top:
    //
    for (auto& table : result.tables) {
        if (xs.empty ()) {
            xs.emplace_back ();
        }

        auto& lines = xs [host_column (table, result.columns)];

        auto iter = find_if (lines, [&](auto& line) {
            return line.box.arr [1] > table.box.arr [1];
        });

        const auto rows = table_lines (table);
        lines.insert (iter, rows.begin (), rows.end ());

        if (table.ambiguous) {
            add_condition (result, page_condition_t::table_detection_ambiguous);
        }
    }

    for (auto& lines : xs) {
        result.lines.insert (result.lines.end (), lines.begin (), lines.end ());
    }

    result.footnotes = extract_footnotes (
        page, result.lines, result.attachments, params);

    return result;
}

std::string source_text_of (const page_t& page) {
    std::vector< std::string > xs;

    for (auto& token : page.tokens) {
        xs.push_back (token.text);
    }

    return join (xs, " ");
}

std::string text_of (const page_result_t& page) {
    std::vector< std::string > xs;

    for (auto& line : page.lines) {
        xs.push_back (line.text);
    }

    return join (xs, "\n");
}

const char* to_string (document_condition_t x) {
    switch (x) {
    case document_condition_t::low_coverage:
        return "low_coverage";
    case document_condition_t::hallucination_detected:
        return "hallucination_detected";
    }

    return "unknown";
}

document_result_t run_attempt (
    const prepared_document_t& prep, const inventory_t& inventory,
    const params_t& params, int attempt, llm_engine_t* llm) {
    document_result_t result{ };

    result.attempt = attempt;
    result.params = params;

    const auto signatures = find_repeating_elements (prep.doc, params);

    for (auto& page : prep.doc.pages) {
        if (prep.unextractable.count (page.number)) {
            continue;
        }

        auto x = process_page (page, signatures, params);

        auto iter = prep.conditions.find (page.number);

        if (iter != prep.conditions.end ()) {
            for (auto c : iter->second) {
                add_condition (x, c);
            }
        }

        auto& fn = x.footnotes;

        result.markers.insert (
            result.markers.end (), fn.markers.begin (), fn.markers.end ());

        result.definitions.insert (
            result.definitions.end (),
            fn.definitions.begin (), fn.definitions.end ());

        result.pages.push_back (std::move (x));
    }

    result.matching = match_footnotes (result.markers, result.definitions, params);

    //
    // Verification:
    //
    verifier_t verifier (inventory, params, llm);

    for (auto& page : result.pages) {
        auto iter = find_if (prep.doc.pages, [&](auto& x) {
            return x.number == page.number;
        });

        ASSERT (iter != prep.doc.pages.end ());
        verifier.scan (page.number, page.lines, source_text_of (*iter));
    }

    verifier.check_footnotes (result.markers, result.matching);

    result.text = compose_text (result, prep);

    if (params.page_markers) {
        verifier.check_page_markers (result.text, prep.doc.pages.size ());
    }

    result.verification = verifier.finish (extracted_tokens (result));

    //
    // Quality:
    //
    result.table_confidence = mean_table_confidence (result.pages);

    const size_t nlines = accumulate (
        result.pages | views::transform ([](auto& x) { return x.lines.size (); }),
        size_t (0));

    const bool ordered = all_of (result.pages, [](auto& x) {
        return x.ordering_consistent;
    });

    result.quality = score_quality ({
        result.verification.coverage, result.verification.hallucinations (),
        nlines,
        result.matching.match_rate, result.table_confidence, ordered });

    if (result.verification.coverage < params.min_coverage) {
        result.conditions.push_back (document_condition_t::low_coverage);
    }

    if (result.verification.hallucinations ()) {
        result.conditions.push_back (
            document_condition_t::hallucination_detected);
    }

    return result;
}

extraction_t process_document (
    const document_t& doc, const params_t& params,
    const collaborators_t& collaborators, const std::atomic< bool >* cancel) {
    validate_document (doc);

    auto prep = std::make_shared< const prepared_document_t > (
        prepare_document (doc, params, collaborators));

    const inventory_t inventory (prep->doc, params);

    auto controller = remediate (
        params, [&](const params_t& p, int attempt) {
            auto result = run_attempt (
                *prep, inventory, p, attempt, collaborators.llm.get ());

            error (errVerification, -1,
                   "{0:s}: attempt {1:d} scored {2:.1f} ({3:c}), "
                   "coverage {4:.2f}",
                   doc.name, attempt, result.score (), result.quality.grade,
                   result.coverage ());

            return result;
        },
        cancel);

    if (controller.state () == remediation_state_t::exhausted) {
        error (errVerification, -1,
               "{0:s}: no attempt reached {1:.0f}; keeping attempt {2:d}",
               doc.name, params.quality_threshold,
               controller.best ().attempt);
    }

    return extraction_t{
        doc.name, prep, inventory.pages (), controller.attempts (),
        controller.best_index (), controller.state (), controller.cancelled ()
    };
}

} // namespace textflow
