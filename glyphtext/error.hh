// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef GLYPHTEXT_GLYPHTEXT_ERROR_HH
#define GLYPHTEXT_GLYPHTEXT_ERROR_HH

#include <defs.hh>

#include <functional>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace glyphtext {

enum struct error_category_t {
    warning,   // recoverable condition, processing continues
    config,    // error in a configuration file
    io,        // cannot read or write a file
    source,    // the run source failed to produce a page
    cancelled, // cooperative cancellation was observed
    internal   // internal error, malfunction within the library
};

const char *to_string(error_category_t);

//
// The callback receives the category, the page number (-1 when the message
// is not about a particular page) and the formatted message. Calls are
// serialized; a callback must not report errors itself:
//
using error_callback_t =
    std::function< void(error_category_t, int, const std::string &) >;

//
// An empty callback silences all diagnostics:
//
void set_error_callback(error_callback_t);
error_callback_t error_callback();

void report_error(error_category_t, int, const std::string &);

template< typename... Args >
inline void error(error_category_t category, int page,
                  fmt::format_string< Args... > str, Args &&... args)
{
    report_error(category, page,
                 fmt::format(str, std::forward< Args >(args)...));
}

} // namespace glyphtext

#endif // GLYPHTEXT_GLYPHTEXT_ERROR_HH
