// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <glyphtext/exception.hh>

#include <fmt/format.h>

namespace glyphtext {
namespace {

std::string what_of(errc_t kind, int page, const std::string &detail)
{
    if (page < 0) {
        return detail.empty()
            ? std::string(to_string(kind))
            : fmt::format("{}: {}", to_string(kind), detail);
    }

    return detail.empty()
        ? fmt::format("{} on page {}", to_string(kind), page)
        : fmt::format("{} on page {}: {}", to_string(kind), page, detail);
}

} // anonymous namespace

const char *to_string(errc_t kind)
{
    switch (kind) {
    case errc_t::source_unavailable: return "source unavailable";
    case errc_t::cancelled:          return "cancelled";
    case errc_t::exhausted:          return "exhausted";
    case errc_t::resolution:         return "resolution failed";
    case errc_t::invalid_argument:   return "invalid argument";
    }

    return "unknown error";
}

extraction_error::extraction_error(errc_t kind, int page,
                                   const std::string &detail)
    : std::runtime_error(what_of(kind, page, detail))
    , kind_(kind)
    , page_(page)
    , detail_(detail)
{
}

extraction_error with_page(const extraction_error &e, int page)
{
    return e.page() < 0 ? extraction_error(e.kind(), page, e.detail()) : e;
}

} // namespace glyphtext
