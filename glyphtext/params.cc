// -*- mode: c++; -*-
// Copyright 2001-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

#include <utils/path.hh>
#include <utils/string.hh>

#include <glyphtext/error.hh>
#include <glyphtext/params.hh>

namespace glyphtext {
namespace {

//
// Nesting limit for included configuration files:
//
constexpr int max_include_depth = 16;

using tokens_t = std::vector< std::string >;

inline void
bad_command(const char *cmd, const fs::path &filename, int line)
{
    error(error_category_t::config, -1,
          "Bad '{}' config file command ({}:{})", cmd, filename.string(),
          line);
}

void parse_yes_no(
    const char *cmd, bool &flag, const tokens_t &tokens,
    const fs::path &filename, int line)
{
    if (tokens.size() != 2) {
        return bad_command(cmd, filename, line);
    }

    const auto &tok = tokens[1];

    if (tok == "yes") {
        flag = true;
    } else if (tok == "no") {
        flag = false;
    } else {
        bad_command(cmd, filename, line);
    }
}

template< typename T >
void parse_integer(
    const char *cmd, T &val, const tokens_t &tokens, const fs::path &filename,
    int line)
{
    if (tokens.size() != 2 || tokens[1].empty()) {
        return bad_command(cmd, filename, line);
    }

    const auto &tok = tokens[1];

    try {
        size_t n = 0;
        const auto x = std::stol(tok, &n);

        if (n != tok.size() || x < 0 ||
            x > long((std::numeric_limits< T >::max)())) {
            return bad_command(cmd, filename, line);
        }

        val = T(x);
    } catch (const std::logic_error &) {
        bad_command(cmd, filename, line);
    }
}

void parse_float(
    const char *cmd, double &val, const tokens_t &tokens,
    const fs::path &filename, int line)
{
    if (tokens.size() != 2 || tokens[1].empty()) {
        return bad_command(cmd, filename, line);
    }

    const auto &tok = tokens[1];

    try {
        size_t n = 0;
        const auto x = std::stod(tok, &n);

        if (n != tok.size() || x < 0) {
            return bad_command(cmd, filename, line);
        }

        val = x;
    } catch (const std::logic_error &) {
        bad_command(cmd, filename, line);
    }
}

void parse_string(
    const char *cmd, std::string &val, const tokens_t &tokens,
    const fs::path &filename, int line)
{
    if (tokens.size() != 2) {
        return bad_command(cmd, filename, line);
    }

    val = unescape(tokens[1]);
}

void parse_ordering(
    ordering_t &val, const tokens_t &tokens, const fs::path &filename,
    int line)
{
    if (tokens.size() == 2) {
        if (tokens[1] == "simple") {
            val = ordering_t::simple;
            return;
        } else if (tokens[1] == "smart") {
            val = ordering_t::smart;
            return;
        }
    }

    bad_command("ordering", filename, line);
}

void parse_error_policy(
    error_policy_t &val, const tokens_t &tokens, const fs::path &filename,
    int line)
{
    if (tokens.size() == 2) {
        if (tokens[1] == "strict") {
            val = error_policy_t::strict;
            return;
        } else if (tokens[1] == "partial") {
            val = error_policy_t::partial;
            return;
        }
    }

    bad_command("errorPolicy", filename, line);
}

} // anonymous

bool params_t::parse_file(const fs::path &filename)
{
    return do_parse_file(filename, 0);
}

void params_t::parse_stream(std::istream &stream, const fs::path &filename)
{
    do_parse_stream(stream, filename, 0);
}

void params_t::parse_line(
    const std::string &buf, const fs::path &filename, int line)
{
    do_parse_line(buf, filename, line, 0);
}

bool params_t::do_parse_file(const fs::path &filename, int depth)
{
    std::ifstream stream(filename);

    if (!stream) {
        return false;
    }

    do_parse_stream(stream, filename, depth);
    return true;
}

void params_t::do_parse_stream(
    std::istream &stream, const fs::path &filename, int depth)
{
    std::string buf;

    for (int line = 1; std::getline(stream, buf); ++line) {
        do_parse_line(buf, filename, line, depth);
    }
}

void params_t::parse_include(
    const tokens_t &tokens, const fs::path &filename, int line, int depth)
{
    if (tokens.size() != 2) {
        return bad_command("include", filename, line);
    }

    if (depth >= max_include_depth) {
        error(error_category_t::config, -1,
              "Config files nested too deeply: '{}' ({}:{})", tokens[1],
              filename.string(), line);
        return;
    }

    const auto path = expand_path(tokens[1]);

    if (!do_parse_file(path, depth + 1)) {
        error(error_category_t::config, -1,
              "Couldn't find included config file: '{}' ({}:{})",
              path.string(), filename.string(), line);
    }
}

void params_t::do_parse_line(
    const std::string &buf, const fs::path &filename, int line, int depth)
{
    const auto tokens = tokenize(buf);

    if (tokens.empty() || tokens[0][0] == '#') {
        return;
    }

    const auto &cmd = tokens[0];

    if (cmd == "include") {
        parse_include(tokens, filename, line, depth);
    } else if (cmd == "workers") {
        parse_integer("workers", workers, tokens, filename, line);
    } else if (cmd == "ordering") {
        parse_ordering(ordering, tokens, filename, line);
    } else if (cmd == "cacheCapacity") {
        parse_integer("cacheCapacity", cache_capacity, tokens, filename, line);
    } else if (cmd == "fontCacheCapacity") {
        parse_integer(
            "fontCacheCapacity", font_cache_capacity, tokens, filename, line);
    } else if (cmd == "pageCacheCapacity") {
        parse_integer(
            "pageCacheCapacity", page_cache_capacity, tokens, filename, line);
    } else if (cmd == "bufferPoolSize") {
        parse_integer(
            "bufferPoolSize", buffer_pool_size, tokens, filename, line);
    } else if (cmd == "bufferSize") {
        parse_integer("bufferSize", buffer_size, tokens, filename, line);
    } else if (cmd == "rowSeparator") {
        parse_string("rowSeparator", row_separator, tokens, filename, line);
    } else if (cmd == "pageSeparator") {
        parse_string("pageSeparator", page_separator, tokens, filename, line);
    } else if (cmd == "minRowTolerance") {
        parse_float(
            "minRowTolerance", min_row_tolerance, tokens, filename, line);
    } else if (cmd == "columnGapFraction") {
        parse_float(
            "columnGapFraction", column_gap_fraction, tokens, filename, line);
    } else if (cmd == "insertSpaces") {
        parse_yes_no("insertSpaces", insert_spaces, tokens, filename, line);
    } else if (cmd == "errorPolicy") {
        parse_error_policy(error_policy, tokens, filename, line);
    } else if (cmd == "verbose") {
        parse_yes_no("verbose", verbose, tokens, filename, line);
    } else {
        error(error_category_t::config, -1,
              "Unknown config file command '{}' ({}:{})", cmd,
              filename.string(), line);
    }
}

layout_params_t params_t::layout() const
{
    layout_params_t params;

    params.min_row_tolerance = min_row_tolerance;
    params.column_gap_fraction = column_gap_fraction;

    return params;
}

extract_options_t params_t::extract_options() const
{
    extract_options_t opts;

    opts.ordering = ordering;
    opts.row_separator = row_separator;
    opts.insert_spaces = insert_spaces;
    opts.layout = layout();

    return opts;
}

batch_options_t params_t::batch_options(cancellation_token_t token) const
{
    batch_options_t opts;

    opts.workers = workers;
    opts.ordering = ordering;
    opts.cancellation = std::move(token);
    opts.cache_capacity = cache_capacity;
    opts.font_cache_capacity = font_cache_capacity;
    opts.row_separator = row_separator;
    opts.insert_spaces = insert_spaces;
    opts.layout = layout();

    return opts;
}

buffer_pool_ptr params_t::make_buffer_pool() const
{
    return std::make_shared< buffer_pool_t >(
        size_t(buffer_pool_size), size_t(buffer_size));
}

std::unique_ptr< streaming_extractor_t > params_t::make_streaming_extractor(
    run_source_ptr source, std::vector< int > pages,
    cancellation_token_t token) const
{
    auto p = std::make_unique< streaming_extractor_t >(
        std::move(source), std::move(pages), extract_options(),
        page_cache_capacity, std::move(token), make_buffer_pool());

    p->pages().verbose(verbose);

    return p;
}

page_results_t params_t::extract(
    batch_extractor_t &extractor, const std::vector< int > &pages,
    cancellation_token_t token) const
{
    const auto opts = batch_options(std::move(token));

    switch (error_policy) {
    case error_policy_t::partial:
        return extractor.extract_partial(pages, opts);

    case error_policy_t::strict:
    default:
        return extractor.extract(pages, opts);
    }
}

////////////////////////////////////////////////////////////////////////

std::optional< fs::path > find_config_file(const std::string &filename)
{
    std::vector< fs::path > candidates;

    if (!filename.empty()) {
        candidates.push_back(expand_path(filename));
    }

    if (const char *s = std::getenv(GLYPHTEXT_RC_ENV)) {
        if (s[0]) {
            candidates.push_back(expand_path(s));
        }
    }

    candidates.push_back(home_path() / GLYPHTEXT_RC);
    candidates.push_back(GLYPHTEXT_SYSTEM_RC);

    for (const auto &path : candidates) {
        std::error_code ec;

        if (fs::is_regular_file(path, ec)) {
            return path;
        }
    }

    return { };
}

params_t load_params(const std::string &filename)
{
    params_t params;

    if (!filename.empty()) {
        std::error_code ec;

        if (!fs::is_regular_file(expand_path(filename), ec)) {
            error(error_category_t::io, -1,
                  "Couldn't find config file '{}'", filename);
        }
    }

    if (auto path = find_config_file(filename)) {
        if (!params.parse_file(*path)) {
            error(error_category_t::io, -1,
                  "Couldn't open config file '{}'", path->string());
        }
    }

    return params;
}

} // namespace glyphtext
