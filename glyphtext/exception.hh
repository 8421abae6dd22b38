// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef GLYPHTEXT_GLYPHTEXT_EXCEPTION_HH
#define GLYPHTEXT_GLYPHTEXT_EXCEPTION_HH

#include <defs.hh>

#include <stdexcept>
#include <string>

namespace glyphtext {

enum struct errc_t {
    source_unavailable, // the run source could not produce the page
    cancelled,          // cooperative cancellation observed
    exhausted,          // streaming call made after the terminal state
    resolution,         // font or object resolution failed
    invalid_argument
};

const char *to_string(errc_t);

//
// Every error leaving the extraction core is an extraction_error, tagged with
// the page it is about (-1 when not page-specific):
//
struct extraction_error : std::runtime_error
{
    extraction_error(errc_t, int, const std::string &);

    errc_t kind() const noexcept { return kind_; }
    int page() const noexcept { return page_; }

    const std::string &detail() const noexcept { return detail_; }

private:
    errc_t kind_;
    int page_;
    std::string detail_;
};

//
// Re-tag an extraction_error with a page number, unless it already has one:
//
extraction_error with_page(const extraction_error &, int);

} // namespace glyphtext

#endif // GLYPHTEXT_GLYPHTEXT_EXCEPTION_HH
