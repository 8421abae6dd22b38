// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef GLYPHTEXT_UTILS_STRING_HH
#define GLYPHTEXT_UTILS_STRING_HH

#include <defs.hh>

#include <string>
#include <vector>

namespace glyphtext {

//
// Split on whitespace; a token starting with a single or a double quote
// extends up to the matching quote (quotes are not part of the token):
//
std::vector< std::string > tokenize(const std::string &s);

//
// Number of code points in an UTF-8 string (continuation bytes are not
// counted):
//
size_t utf8_length(const std::string &s);

//
// Replace the escapes \n, \t, \r and \\ with the characters they stand for:
//
std::string unescape(const std::string &s);

} // namespace glyphtext

#endif // GLYPHTEXT_UTILS_STRING_HH
