// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_SCRIPTS_HH
#define TEXTFLOW_TEXTFLOW_SCRIPTS_HH

#include <defs.hh>

#include <optional>
#include <string>
#include <vector>

#include <textflow/columns.hh>
#include <textflow/params.hh>
#include <textflow/token.hh>

namespace textflow {

enum struct script_kind_t { superscript, subscript };

const char* to_string (script_kind_t);

//
// A superscript or subscript glued onto the word before it. When the script
// has no canonical Unicode form the literal text is kept and `canonical' is
// false, so consumers can tell it from body text:
//
struct script_attachment_t {
    script_kind_t kind;
    const token_t* token;
    const token_t* base;
    std::string text;
    bool canonical;
};

using script_attachments_t = std::vector< script_attachment_t >;

struct word_t {
    std::string text;
    bbox_t box;
    token_refs_t sources;
};

enum struct line_kind_t { text, table_row };

struct line_t {
    line_kind_t kind;
    std::vector< word_t > words;
    bbox_t box;
    std::string text;
};

using lines_t = std::vector< line_t >;

//
// The canonical superscript or subscript spelling of the text, if every
// character has one:
//
std::optional< std::string > to_script (const std::string&, script_kind_t);

//
// Turns a band into a line of words, merging script tokens onto the nearest
// preceding base token. A token is a script if it is smaller than
// `script_size_ratio' of the band's mean font size and its baseline is off
// the band's baseline by more than `script_offset_ratio' of the band's font
// size; up is superscript, down is subscript:
//
line_t attach_scripts (const band_t&, const params_t&, script_attachments_t&);

std::string text_of (const std::vector< word_t >&, const params_t&);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_SCRIPTS_HH
