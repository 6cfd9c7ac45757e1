// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <cctype>
#include <cmath>
#include <sstream>

#include <textflow/verifier.hh>

#include <utils/string.hh>

#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/algorithm/remove_if.hpp>
#include <range/v3/algorithm/sort.hpp>
using namespace ranges;

namespace textflow {
namespace {

std::string without_whitespace (const std::string& s) {
    std::string result;

    for (auto c : s) {
        if (!isspace ((unsigned char)c)) {
            result += c;
        }
    }

    return result;
}

std::string collapse_whitespace (const std::string& s) {
    return join (split (s), " ");
}

struct match_t {
    size_t pos, len;
    const hallucination_rule_t* rule;
};

std::vector< match_t > find_matches (const std::string& text) {
    std::vector< match_t > xs;

    for (auto& rule : hallucination_rules ()) {
        boost::sregex_iterator iter (text.begin (), text.end (), rule.re), last;

        for (; iter != last; ++iter) {
            const auto& what = *iter;

            if (what.length (0) > 0) {
                xs.push_back ({
                    size_t (what.position (0)), size_t (what.length (0)), &rule });
            }
        }
    }

    sort (xs, [](auto& lhs, auto& rhs) {
        return lhs.pos < rhs.pos || (lhs.pos == rhs.pos && lhs.len > rhs.len);
    });

    //
    // The first of overlapping matches stands for all of them:
    //
    std::vector< match_t > result;

    for (auto& x : xs) {
        if (result.empty () || x.pos >= result.back ().pos + result.back ().len) {
            result.push_back (x);
        }
    }

    return result;
}

flag_t marker_flag (const char* rule, const std::string& span) {
    return flag_t{
        hallucination_kind_t::page_marker, rule, -1, span, false, false };
}

//
// Offsets of the words in the text of their line, npos for a word that is not
// where it is expected:
//
std::vector< size_t > word_offsets (const line_t& line) {
    std::vector< size_t > xs;

    size_t pos = 0;

    for (auto& word : line.words) {
        const auto n = word.text.empty ()
            ? std::string::npos : line.text.find (word.text, pos);

        xs.push_back (n);

        if (n != std::string::npos) {
            pos = n + word.text.size ();
        }
    }

    return xs;
}

} // anonymous

size_t verification_t::hallucinations () const {
    return count_if (flags, [](auto& x) { return !x.source_backed; });
}

bool has_source_basis (const std::string& span, const std::string& source) {
    const auto needle = without_whitespace (span);

    if (needle.empty ()) {
        return true;
    }

    const auto haystack = without_whitespace (source);

    if (haystack.find (needle) != std::string::npos) {
        return true;
    }

    //
    // Source tokens need not be in reading order; every word of the span
    // found in the source is a basis too:
    //
    for (auto& word : split (span)) {
        if (haystack.find (word) == std::string::npos) {
            return false;
        }
    }

    return true;
}

double position_similarity (
    const std::array< double, 3 >& lhs, const std::array< double, 3 >& rhs) {
    double sum = 0;

    for (size_t i = 0; i < lhs.size (); ++i) {
        sum += std::fabs (lhs [i] - rhs [i]);
    }

    return 1 - sum / 2;
}

flags_t check_page_markers (const std::string& text, size_t npages) {
    flags_t flags;

    std::istringstream ss (text);
    std::string line;

    int open = -1, last = 0;
    size_t pairs = 0, seen = 0;

    while (std::getline (ss, line)) {
        line = trim (line);

        boost::smatch what;

        if (!boost::regex_match (line, what, page_marker_pattern ())) {
            continue;
        }

        ++seen;

        const int n = std::stoi (what [1].str ());

        if (what [2] == "START") {
            if (open >= 0) {
                flags.push_back (marker_flag ("unclosed_page", line));
            }

            if (n <= last) {
                flags.push_back (marker_flag ("out_of_order", line));
            }

            open = n;
        }
        else {
            if (open != n) {
                flags.push_back (marker_flag ("unopened_page", line));
            }
            else {
                ++pairs;
                last = n;
            }

            open = -1;
        }
    }

    if (open >= 0) {
        flags.push_back (
            marker_flag ("unclosed_page", format ("--- PAGE {} START ---", open)));
    }

    if (seen && pairs != npages) {
        flags.push_back (marker_flag (
            "page_count", format ("{} of {} pages marked", pairs, npages)));
    }

    return flags;
}

////////////////////////////////////////////////////////////////////////

verifier_t::verifier_t (
    const inventory_t& inventory, const params_t& params, llm_engine_t* llm)
    : inventory_ (inventory), params_ (params), llm_ (llm)
{ }

std::string
verifier_t::fix (int page, const flag_t& flag, const std::string& source) {
    if (0 == llm_) {
        return { };
    }

    try {
        if (auto x = llm_->correct (flag.span, source)) {
            const bool applied =
                x->confidence >= params_.llm_min_confidence &&
                has_source_basis (x->text, source);

            audit_.push_back ({ page, flag.span, x->text, x->confidence, applied });

            error (errVerification, page,
                   "Correction of '{0:s}' to '{1:s}' ({2:.2f}) {3:s}",
                   flag.span, x->text, x->confidence,
                   applied ? "applied" : "rejected");

            if (applied) {
                return x->text;
            }
        }
    }
    catch (const collaborator_error& e) {
        error (errCollaborator, page, "Correction failed: {0:s}", e.what ());
    }

    return { };
}

void verifier_t::scan (int page, lines_t& lines, const std::string& source) {
    for (auto& line : lines) {
        const auto matches = find_matches (line.text);

        if (matches.empty ()) {
            continue;
        }

        flags_t flags;

        for (auto& m : matches) {
            const auto span = line.text.substr (m.pos, m.len);

            flags.push_back (flag_t{
                m.rule->kind, m.rule->tag, page, span,
                has_source_basis (span, source), false });
        }

        const auto offsets = word_offsets (line);
        std::vector< bool > stripped (line.words.size ());

        //
        // Back to front, so that earlier positions stay valid:
        //
        for (size_t i = matches.size (); i--;) {
            auto& flag = flags [i];

            if (flag.source_backed) {
                continue;
            }

            //
            // Words of the span no longer count as extracted:
            //
            const auto first = matches [i].pos, last = first + matches [i].len;

            for (size_t k = 0; k < line.words.size (); ++k) {
                const auto n = offsets [k];

                if (n != std::string::npos &&
                    n < last && first < n + line.words [k].text.size ()) {
                    stripped [k] = true;
                }
            }

            error (errVerification, page, "Unsupported {0:s} '{1:s}' removed",
                   to_string (flag.kind), flag.span);

            line.text.replace (
                matches [i].pos, matches [i].len, fix (page, flag, source));

            flag.stripped = true;
        }

        for (size_t k = line.words.size (); k--;) {
            if (stripped [k]) {
                line.words.erase (line.words.begin () + k);
            }
        }

        line.text = collapse_whitespace (line.text);
        flags_.insert (flags_.end (), flags.begin (), flags.end ());
    }

    lines.erase (
        remove_if (lines, [](auto& x) { return x.text.empty (); }), lines.end ());
}

void verifier_t::check_footnotes (
    const footnote_markers_t& markers, const footnote_matching_t& matching) {
    for (auto i : matching.unmatched_markers) {
        const auto& marker = markers [i];

        flags_.push_back (flag_t{
            hallucination_kind_t::dangling_footnote, "unmatched_marker",
            marker.page, marker.text, true, false });
    }
}

void verifier_t::check_page_markers (const std::string& text, size_t npages) {
    auto xs = textflow::check_page_markers (text, npages);
    flags_.insert (flags_.end (), xs.begin (), xs.end ());
}

verification_t
verifier_t::finish (const std::set< const token_t* >& extracted) {
    verification_t x{ };

    x.coverage = inventory_.coverage (extracted);
    x.status = coverage_status (x.coverage);

    x.element_ratio = x.coverage;
    x.position_similarity = textflow::position_similarity (
        inventory_.position_distribution (),
        inventory_.position_distribution (extracted));

    x.passed =
        x.element_ratio >= params_.min_element_ratio &&
        x.position_similarity >= params_.min_position_similarity;

    x.flags = flags_;
    x.audit = audit_;

    return x;
}

} // namespace textflow
