// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <string>
#include <vector>

#include <textflow/rules.hh>

#include <range/v3/algorithm/any_of.hpp>
using namespace ranges;

namespace textflow {
namespace {

#define TEXTFLOW_CIRCLED \
    "(?:①|②|③|④|⑤|⑥|⑦|⑧|⑨|⑩|⑪|⑫|⑬|⑭|⑮|⑯|⑰|⑱|⑲|⑳)"

#define TEXTFLOW_SUPERSCRIPTS "(?:¹|²|³|⁰|⁴|⁵|⁶|⁷|⁸|⁹)+"

#define TEXTFLOW_MARKER                                                 \
    "(?:\\*\\d+|※\\d*|注\\d*|†|‡|\\[\\d+\\]|\\(\\*\\d+\\)|"             \
    TEXTFLOW_CIRCLED "|" TEXTFLOW_SUPERSCRIPTS ")"

const auto icase = boost::regex::perl | boost::regex::icase;

bool match_any (const patterns_t& xs, const std::string& s) {
    return any_of (xs, [&](auto& x) { return boost::regex_match (s, x.re); });
}

bool search_any (const patterns_t& xs, const std::string& s) {
    return any_of (xs, [&](auto& x) { return boost::regex_search (s, x.re); });
}

} // anonymous

const patterns_t& section_patterns () {
    static const patterns_t xs{
        { "decimal",   boost::regex ("^\\d+\\.\\d+") },
        { "paren",     boost::regex ("^\\(\\d+\\)") },
        { "circled",   boost::regex ("^" TEXTFLOW_CIRCLED) },
        { "bracket",   boost::regex ("^\\d+(?:\\)|）)") },
        { "chapter",   boost::regex ("^第?\\d+(?:章|条|項|節|款|目)") }
    };

    return xs;
}

const patterns_t& footnote_marker_patterns () {
    static const patterns_t xs{
        { "asterisk",    boost::regex ("\\*\\d+") },
        { "kome",        boost::regex ("※\\d*") },
        { "chu",         boost::regex ("注\\d*") },
        { "dagger",      boost::regex ("†") },
        { "ddagger",     boost::regex ("‡") },
        { "bracket",     boost::regex ("\\[\\d+\\]") },
        { "paren",       boost::regex ("\\(\\*\\d+\\)") },
        { "circled",     boost::regex (TEXTFLOW_CIRCLED) },
        { "superscript", boost::regex (TEXTFLOW_SUPERSCRIPTS) }
    };

    return xs;
}

const patterns_t& page_number_patterns () {
    static const patterns_t xs{
        { "page",   boost::regex ("Page\\s+\\d+", icase) },
        { "peji",   boost::regex ("ページ\\s*\\d+") },
        { "dashed", boost::regex ("-\\s*\\d+\\s*-") },
        { "ratio",  boost::regex ("\\d+\\s*/\\s*\\d+") },
        { "p",      boost::regex ("p\\.\\s*\\d+", icase) }
    };

    return xs;
}

bool has_internal_decimal (const std::string& s) {
    static const boost::regex re ("\\d+\\.\\d+");
    return boost::regex_search (s, re);
}

bool is_section_number (const std::string& s) {
    return search_any (section_patterns (), s);
}

bool is_footnote_marker (const std::string& s) {
    return match_any (footnote_marker_patterns (), s);
}

bool is_strict_page_number (const std::string& s) {
    return match_any (page_number_patterns (), s);
}

bool is_margin_number (const std::string& s) {
    static const boost::regex re ("\\d{1,3}");
    return boost::regex_match (s, re);
}

std::optional< definition_head_t >
split_footnote_definition (const std::string& s) {
    static const boost::regex re (
        "^\\s*(" TEXTFLOW_MARKER ")(?:\\s*(?::|：)\\s*|\\s+|$)(.*)$");

    boost::smatch what;

    if (!boost::regex_match (s, what, re)) {
        return { };
    }

    return definition_head_t{ what [1].str (), what [2].str () };
}

std::string normalize_marker (const std::string& s) {
    static const std::pair< const char*, char > arr [] = {
        { "⁰", '0' }, { "¹", '1' }, { "²", '2' }, { "³", '3' }, { "⁴", '4' },
        { "⁵", '5' }, { "⁶", '6' }, { "⁷", '7' }, { "⁸", '8' }, { "⁹", '9' }
    };

    std::string result;

    for (size_t i = 0; i < s.size ();) {
        bool replaced = false;

        for (auto& [ from, to ] : arr) {
            const std::string tmp (from);

            if (0 == s.compare (i, tmp.size (), tmp)) {
                result += to;
                i += tmp.size ();
                replaced = true;
                break;
            }
        }

        if (!replaced) {
            result += s [i++];
        }
    }

    return result;
}

////////////////////////////////////////////////////////////////////////

const char* to_string (hallucination_kind_t x) {
    switch (x) {
    case hallucination_kind_t::formatting:         return "formatting";
    case hallucination_kind_t::explanatory_phrase: return "explanatory_phrase";
    case hallucination_kind_t::invented_header:    return "invented_header";
    case hallucination_kind_t::dangling_footnote:  return "dangling_footnote";
    case hallucination_kind_t::page_marker:        return "page_marker";
    }

    return "unknown";
}

const std::vector< hallucination_rule_t >& hallucination_rules () {
    using kind = hallucination_kind_t;

    static const std::vector< hallucination_rule_t > xs{
        { kind::formatting, "bold",
          boost::regex ("\\*\\*[^*]+\\*\\*") },
        { kind::formatting, "bold",
          boost::regex ("__[^_]+__") },
        { kind::formatting, "italic",
          boost::regex ("(?<!\\*)\\*[^*\\s\\d][^*]*\\*(?![\\d*])") },
        { kind::formatting, "italic",
          boost::regex ("(?<![_\\w])_[^_\\s][^_]*_(?![_\\w])") },
        { kind::formatting, "markup",
          boost::regex ("</?[a-z]+[^>]*>", icase) },
        { kind::explanatory_phrase, "describes",
          boost::regex (
              "This (?:section|document|page) (?:describes|contains|shows)",
              icase) },
        { kind::explanatory_phrase, "aside",
          boost::regex ("As shown|As seen|Note that|Please note", icase) },
        { kind::explanatory_phrase, "pointer",
          boost::regex ("The following|Below is|Above is", icase) },
        { kind::invented_header, "markdown",
          boost::regex ("^#{1,6}\\s+.+$") },
        { kind::invented_header, "boilerplate",
          boost::regex (
              "^(?:Table of Contents|Summary|Introduction|Conclusion)$") }
    };

    return xs;
}

const boost::regex& page_marker_pattern () {
    static const boost::regex re ("^--- PAGE (\\d+) (START|END) ---$");
    return re;
}

} // namespace textflow
