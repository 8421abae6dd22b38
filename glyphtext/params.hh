// -*- mode: c++; -*-
// Copyright 2001-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef GLYPHTEXT_GLYPHTEXT_PARAMS_HH
#define GLYPHTEXT_GLYPHTEXT_PARAMS_HH

#include <defs.hh>

#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <utils/path.hh>

#include <glyphtext/batch_extractor.hh>
#include <glyphtext/buffer_pool.hh>
#include <glyphtext/cancellation.hh>
#include <glyphtext/page_extractor.hh>
#include <glyphtext/reading_order.hh>
#include <glyphtext/streaming_extractor.hh>

namespace glyphtext {

//
// Tunables, with their configuration file keywords:
//
struct params_t
{
    int workers = 0;                                        // workers
    ordering_t ordering = ordering_t::smart;                // ordering

    long cache_capacity = 0;                                // cacheCapacity
    long font_cache_capacity = GLYPHTEXT_FONT_CACHE_CAPACITY; // fontCacheCapacity
    long page_cache_capacity = GLYPHTEXT_RESIDENT_PAGES;    // pageCacheCapacity

    long buffer_pool_size = 32;                             // bufferPoolSize
    long buffer_size = 2048;                                // bufferSize

    std::string row_separator = "\n";                       // rowSeparator
    std::string page_separator = "\n";                      // pageSeparator

    double min_row_tolerance = 1.;                          // minRowTolerance
    double column_gap_fraction = .05;                       // columnGapFraction

    bool insert_spaces = false;                             // insertSpaces

    error_policy_t error_policy = error_policy_t::strict;   // errorPolicy
    bool verbose = false;                                   // verbose

    //
    // Parse a configuration file; false if it cannot be opened:
    //
    bool parse_file(const fs::path &);

    void parse_stream(std::istream &, const fs::path &);
    void parse_line(const std::string &, const fs::path &, int);

    layout_params_t layout() const;

    extract_options_t extract_options() const;
    batch_options_t batch_options(cancellation_token_t = { }) const;

    buffer_pool_ptr make_buffer_pool() const;

    std::unique_ptr< streaming_extractor_t > make_streaming_extractor(
        run_source_ptr, std::vector< int > = { },
        cancellation_token_t = { }) const;

    //
    // Extract the pages under the configured error policy:
    //
    page_results_t extract(
        batch_extractor_t &, const std::vector< int > &,
        cancellation_token_t = { }) const;

private:
    bool do_parse_file(const fs::path &, int);
    void do_parse_stream(std::istream &, const fs::path &, int);
    void do_parse_line(const std::string &, const fs::path &, int, int);

    void parse_include(
        const std::vector< std::string > &, const fs::path &, int, int);
};

//
// The configuration file in use: the given file name, $GLYPHTEXTRC,
// ~/.glyphtextrc or the system-wide file, the first that exists:
//
std::optional< fs::path > find_config_file(const std::string & = { });

//
// Defaults, overridden by the configuration file in use, if any:
//
params_t load_params(const std::string & = { });

} // namespace glyphtext

#endif // GLYPHTEXT_GLYPHTEXT_PARAMS_HH
