// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC

#ifndef GLYPHTEXT_UTILS_PATH_HH
#define GLYPHTEXT_UTILS_PATH_HH

#include <defs.hh>

#include <filesystem>
namespace fs = std::filesystem;

namespace glyphtext {

//
// Home directory of the current user, from $HOME or the password database:
//
fs::path home_path();

//
// Shell-like expansion of `~' and environment variables; the path is returned
// unchanged if it does not expand to exactly one word:
//
fs::path expand_path(const fs::path &);

fs::path make_temp_path();

} // namespace glyphtext

#endif // GLYPHTEXT_UTILS_PATH_HH
