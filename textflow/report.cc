// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <map>
#include <memory>
#include <ostream>

#include <json/json.h>

#include <textflow/report.hh>

namespace textflow {
namespace {

Json::Value verification_of (const verification_t& x) {
    Json::Value tree (Json::objectValue);

    tree ["coverage"] = x.coverage;
    tree ["status"] = to_string (x.status);
    tree ["element_ratio"] = x.element_ratio;
    tree ["position_similarity"] = x.position_similarity;
    tree ["passed"] = x.passed;
    tree ["hallucinations"] = Json::UInt64 (x.hallucinations ());

    auto& flags = tree ["flags"] = Json::Value (Json::arrayValue);

    for (auto& flag : x.flags) {
        Json::Value node;

        node ["kind"] = to_string (flag.kind);
        node ["rule"] = flag.rule;
        node ["page"] = flag.page;
        node ["span"] = flag.span;
        node ["source_backed"] = flag.source_backed;
        node ["stripped"] = flag.stripped;

        flags.append (node);
    }

    auto& audit = tree ["audit"] = Json::Value (Json::arrayValue);

    for (auto& entry : x.audit) {
        Json::Value node;

        node ["page"] = entry.page;
        node ["span"] = entry.span;
        node ["replacement"] = entry.replacement;
        node ["confidence"] = entry.confidence;
        node ["applied"] = entry.applied;

        audit.append (node);
    }

    return tree;
}

Json::Value footnotes_of (const document_result_t& result) {
    Json::Value tree (Json::objectValue);

    tree ["markers"] = Json::UInt64 (result.markers.size ());
    tree ["definitions"] = Json::UInt64 (result.definitions.size ());
    tree ["match_rate"] = result.matching.match_rate;

    auto& matches = tree ["matches"] = Json::Value (Json::arrayValue);

    for (auto& m : result.matching.matches) {
        const auto& marker = result.markers [m.marker];
        const auto& definition = result.definitions [m.definition];

        Json::Value node;

        node ["marker"] = marker.text;
        node ["marker_page"] = marker.page;
        node ["definition"] = definition.text;
        node ["definition_page"] = definition.page;
        node ["confidence"] = m.confidence;

        matches.append (node);
    }

    auto& unmatched_markers =
        tree ["unmatched_markers"] = Json::Value (Json::arrayValue);

    for (auto i : result.matching.unmatched_markers) {
        Json::Value node;

        node ["marker"] = result.markers [i].text;
        node ["page"] = result.markers [i].page;

        unmatched_markers.append (node);
    }

    auto& unmatched_definitions =
        tree ["unmatched_definitions"] = Json::Value (Json::arrayValue);

    for (auto i : result.matching.unmatched_definitions) {
        Json::Value node;

        node ["marker"] = result.definitions [i].marker;
        node ["page"] = result.definitions [i].page;
        node ["text"] = result.definitions [i].text;

        unmatched_definitions.append (node);
    }

    return tree;
}

Json::Value tables_of (const document_result_t& result) {
    size_t count = 0, ambiguous = 0;

    for (auto& page : result.pages) {
        for (auto& table : page.tables) {
            ++count;
            ambiguous += table.ambiguous;
        }
    }

    Json::Value tree (Json::objectValue);

    tree ["count"] = Json::UInt64 (count);
    tree ["confidence"] = result.table_confidence;
    tree ["ambiguous"] = Json::UInt64 (ambiguous);

    return tree;
}

Json::Value quality_of (const quality_t& x) {
    Json::Value tree (Json::objectValue);

    tree ["score"] = x.score;
    tree ["grade"] = std::string (1, x.grade);

    auto& components = tree ["components"];

    components ["coverage"] = x.coverage;
    components ["cleanliness"] = x.cleanliness;
    components ["footnotes"] = x.footnotes;
    components ["tables"] = x.tables;
    components ["ordering"] = x.ordering;

    auto& recommendations =
        tree ["recommendations"] = Json::Value (Json::arrayValue);

    for (auto& s : x.recommendations) {
        recommendations.append (s);
    }

    return tree;
}

Json::Value pages_of (const document_result_t& result) {
    Json::Value tree (Json::arrayValue);

    for (auto& page : result.pages) {
        Json::Value node;

        node ["number"] = page.number;
        node ["columns"] = Json::UInt64 (page.columns.size ());
        node ["lines"] = Json::UInt64 (page.lines.size ());
        node ["tables"] = Json::UInt64 (page.tables.size ());
        node ["scripts"] = Json::UInt64 (page.attachments.size ());
        node ["ordering_consistent"] = page.ordering_consistent;

        std::map< std::string, size_t > removals;

        for (auto& x : page.removals) {
            ++removals [to_string (x.reason)];
        }

        auto& counts = node ["removals"] = Json::Value (Json::objectValue);

        for (auto& [ reason, n ] : removals) {
            counts [reason] = Json::UInt64 (n);
        }

        auto& conditions = node ["conditions"] = Json::Value (Json::arrayValue);

        for (auto c : page.conditions) {
            conditions.append (to_string (c));
        }

        tree.append (node);
    }

    return tree;
}

Json::Value inventory_of (const std::vector< page_inventory_t >& pages) {
    Json::Value tree (Json::arrayValue);

    for (auto& page : pages) {
        Json::Value node;

        node ["page"] = page.page;
        node ["total"] = Json::UInt64 (page.total);

        node ["positions"]["top"]    = Json::UInt64 (page.positions [0]);
        node ["positions"]["middle"] = Json::UInt64 (page.positions [1]);
        node ["positions"]["bottom"] = Json::UInt64 (page.positions [2]);

        node ["sizes"]["large"]    = Json::UInt64 (page.sizes [0]);
        node ["sizes"]["standard"] = Json::UInt64 (page.sizes [1]);
        node ["sizes"]["small"]    = Json::UInt64 (page.sizes [2]);
        node ["sizes"]["tiny"]     = Json::UInt64 (page.sizes [3]);

        tree.append (node);
    }

    return tree;
}

} // anonymous

Json::Value make_report (const extraction_t& extraction) {
    const auto& result = extraction.result ();

    Json::Value tree (Json::objectValue);

    tree ["document"] = extraction.name;
    tree ["state"] = to_string (extraction.state);
    tree ["attempt"] = result.attempt;
    tree ["cancelled"] = extraction.cancelled;

    tree ["verification"] = verification_of (result.verification);
    tree ["footnotes"] = footnotes_of (result);
    tree ["tables"] = tables_of (result);
    tree ["quality"] = quality_of (result.quality);
    tree ["inventory"] = inventory_of (extraction.inventory);
    tree ["pages"] = pages_of (result);

    auto& conditions = tree ["conditions"] = Json::Value (Json::arrayValue);

    for (auto c : result.conditions) {
        conditions.append (to_string (c));
    }

    auto& unextractable =
        tree ["unextractable"] = Json::Value (Json::arrayValue);

    for (auto n : extraction.prepared->unextractable) {
        unextractable.append (n);
    }

    auto& attempts = tree ["attempts"] = Json::Value (Json::arrayValue);

    for (auto& x : extraction.attempts) {
        Json::Value node;

        node ["attempt"] = x.attempt;
        node ["score"] = x.score ();
        node ["grade"] = std::string (1, x.quality.grade);
        node ["coverage"] = x.coverage ();
        node ["margin_filtering"] = x.params.margin_filtering;
        node ["column_gap"] = x.params.column_gap;

        attempts.append (node);
    }

    return tree;
}

void write_report (std::ostream& stream, const extraction_t& extraction) {
    Json::StreamWriterBuilder builder;
    builder ["indentation"] = "  ";
    builder ["emitUTF8"] = true;

    std::unique_ptr< Json::StreamWriter > writer (builder.newStreamWriter ());
    writer->write (make_report (extraction), &stream);

    stream << '\n';
}

} // namespace textflow
