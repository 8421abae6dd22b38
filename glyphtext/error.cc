// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cstdio>

#include <mutex>

#include <glyphtext/error.hh>

namespace glyphtext {
namespace {

void default_error_callback(error_category_t category, int page,
                            const std::string &msg)
{
    if (page < 0) {
        fmt::print(stderr, "{}: {}\n", to_string(category), msg);
    } else {
        fmt::print(stderr, "{} (page {}): {}\n", to_string(category), page,
                   msg);
    }

    fflush(stderr);
}

std::mutex &error_mutex()
{
    static std::mutex m;
    return m;
}

error_callback_t &error_callback_ref()
{
    static error_callback_t fn = default_error_callback;
    return fn;
}

} // anonymous namespace

const char *to_string(error_category_t category)
{
    switch (category) {
    case error_category_t::warning:   return "Warning";
    case error_category_t::config:    return "Config Error";
    case error_category_t::io:        return "I/O Error";
    case error_category_t::source:    return "Source Error";
    case error_category_t::cancelled: return "Cancelled";
    case error_category_t::internal:  return "Internal Error";
    }

    return "Error";
}

void set_error_callback(error_callback_t fn)
{
    std::lock_guard< std::mutex > lock(error_mutex());
    error_callback_ref() = std::move(fn);
}

error_callback_t error_callback()
{
    std::lock_guard< std::mutex > lock(error_mutex());
    return error_callback_ref();
}

void report_error(error_category_t category, int page, const std::string &msg)
{
    std::lock_guard< std::mutex > lock(error_mutex());

    if (auto &fn = error_callback_ref())
        fn(category, page, msg);
}

} // namespace glyphtext
