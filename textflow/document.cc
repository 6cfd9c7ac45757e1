// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <cmath>
#include <fstream>

#include <json/json.h>

#include <textflow/document.hh>

namespace textflow {
namespace {

const Json::Value&
member_of (const Json::Value& value, const char* key, Json::ValueType type) {
    const auto& x = value [key];

    if (!x.isNull () && (x.type () != type && !(
            type == Json::realValue && x.isNumeric ()))) {
        throw malformed_input (format ("`{}' has the wrong type", key));
    }

    return x;
}

double number_of (const Json::Value& value, const char* key, double other) {
    const auto& x = member_of (value, key, Json::realValue);
    return x.isNull () ? other : x.asDouble ();
}

int integer_of (const Json::Value& value, const char* key, int other) {
    const auto& x = member_of (value, key, Json::realValue);

    if (x.isNull ()) {
        return other;
    }

    if (!x.isInt ()) {
        throw malformed_input (format ("`{}' is not an integer", key));
    }

    return x.asInt ();
}

bbox_t parse_box (const Json::Value& value) {
    if (!value.isArray () || value.size () != 4) {
        throw malformed_input (
            format ("bounding box with {} coordinates",
                    value.isArray () ? value.size () : 0U));
    }

    double xs [4];

    for (Json::ArrayIndex i = 0; i < 4; ++i) {
        if (!value [i].isNumeric ()) {
            throw malformed_input ("bounding box with a non-numeric coordinate");
        }

        xs [i] = value [i].asDouble ();
    }

    return normalize (bbox_t{ xs [0], xs [1], xs [2], xs [3] });
}

bool finite (const bbox_t& box) {
    return std::isfinite (box.arr [0]) && std::isfinite (box.arr [1]) &&
        std::isfinite (box.arr [2]) && std::isfinite (box.arr [3]);
}

page_t parse_page (const Json::Value& value, int index) {
    if (!value.isObject ()) {
        throw malformed_input (format ("page {} is not an object", index));
    }

    page_t page{
        integer_of (value, "number", index),
        number_of (value, "width", TEXTFLOW_PAPER_WIDTH),
        number_of (value, "height", TEXTFLOW_PAPER_HEIGHT),
        integer_of (value, "rotation", 0),
        { }, { }
    };

    for (auto& x : member_of (value, "tokens", Json::arrayValue)) {
        page.tokens.push_back (parse_token (x, page.number));
    }

    for (auto& x : member_of (value, "rules", Json::arrayValue)) {
        page.rules.push_back (rule_t{ parse_box (x) });
    }

    return page;
}

} // anonymous

token_t parse_token (const Json::Value& value, int page) {
    if (!value.isObject ()) {
        throw malformed_input ("token is not an object");
    }

    const auto& text = member_of (value, "text", Json::stringValue);

    if (text.isNull ()) {
        throw malformed_input ("token without text");
    }

    const auto box = parse_box (value ["bbox"]);

    return token_t{
        text.asString (),
        box,
        number_of (value, "font_size", height_of (box)),
        number_of (value, "baseline", box.arr [3]),
        page
    };
}

void validate_document (const document_t& doc) {
    if (doc.pages.empty ()) {
        throw malformed_input (format ("{}: document has no pages", doc.name));
    }

    size_t ntokens = 0;

    for (auto& page : doc.pages) {
        if (!std::isfinite (page.width) || !std::isfinite (page.height) ||
            page.width <= 0 || page.height <= 0) {
            throw malformed_input (
                format ("{}: page {} has no usable size", doc.name, page.number));
        }

        for (auto& token : page.tokens) {
            if (!finite (token.box) || !std::isfinite (token.font_size) ||
                !std::isfinite (token.baseline)) {
                throw malformed_input (
                    format ("{}: page {} has a token with bad coordinates",
                            doc.name, page.number));
            }
        }

        for (auto& rule : page.rules) {
            if (!finite (rule.box)) {
                throw malformed_input (
                    format ("{}: page {} has a rule with bad coordinates",
                            doc.name, page.number));
            }
        }

        ntokens += page.tokens.size ();
    }

    if (0 == ntokens) {
        throw malformed_input (format ("{}: document has no tokens", doc.name));
    }
}

document_t load_document (std::istream& stream, const std::string& name) {
    Json::CharReaderBuilder builder;

    Json::Value root;
    std::string errs;

    if (!Json::parseFromStream (builder, stream, &root, &errs)) {
        throw malformed_input (format ("{}: {}", name, errs));
    }

    if (!root.isObject ()) {
        throw malformed_input (format ("{}: not a token document", name));
    }

    document_t doc{ name, { } };

    try {
        const auto& x = member_of (root, "name", Json::stringValue);

        if (!x.isNull ()) {
            doc.name = x.asString ();
        }

        const auto& pages = member_of (root, "pages", Json::arrayValue);

        if (pages.isNull ()) {
            throw malformed_input ("document without pages");
        }

        int index = 0;

        for (auto& page : pages) {
            doc.pages.push_back (parse_page (page, ++index));
        }
    }
    catch (const malformed_input& e) {
        throw malformed_input (format ("{}: {}", name, e.what ()));
    }

    validate_document (doc);
    return doc;
}

document_t load_document (const fs::path& path) {
    std::ifstream stream (path);

    if (!stream) {
        throw std::runtime_error (
            format ("{}: cannot open token document", path.string ()));
    }

    return load_document (stream, path.stem ().string ());
}

} // namespace textflow
