// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef TEXTFLOW_UTILS_STRING_HH
#define TEXTFLOW_UTILS_STRING_HH

#include <defs.hh>

#include <optional>
#include <string>
#include <vector>

namespace textflow {

std::vector< std::string >
split(const std::string &s, const std::string &delims = " \t\r\n");

std::string trim(const std::string &s);

std::string
join(const std::vector< std::string > &xs, const std::string &sep = " ");

//
// UTF-8 helpers. Decoding stops at the first malformed sequence and returns
// nothing in that case:
//
std::optional< std::u32string > utf8_decode(const std::string &s);

std::string utf8_encode(char32_t c);
std::string utf8_encode(const std::u32string &s);

bool is_cjk(char32_t c);
bool is_punctuation(char32_t c);

} // namespace textflow

#endif // TEXTFLOW_UTILS_STRING_HH
