// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef GLYPHTEXT_GLYPHTEXT_PAGE_EXTRACTOR_HH
#define GLYPHTEXT_GLYPHTEXT_PAGE_EXTRACTOR_HH

#include <defs.hh>

#include <memory>
#include <string>
#include <vector>

#include <glyphtext/buffer_pool.hh>
#include <glyphtext/cancellation.hh>
#include <glyphtext/reading_order.hh>
#include <glyphtext/run_source.hh>
#include <glyphtext/text_run.hh>

namespace glyphtext {

struct extract_options_t
{
    ordering_t ordering = ordering_t::smart;

    std::string row_separator = "\n";

    //
    // Insert a space between runs of a row separated by a visible gap, when
    // the advance of the left run is known:
    //
    bool insert_spaces = false;

    layout_params_t layout;
};

using styled_segments_t = std::vector< styled_segment_t >;

//
// Row grouping keyed by the rounded baseline of the row:
//
struct positioned_row_t
{
    long position_key;
    styled_segments_t segments;
};

using positioned_rows_t = std::vector< positioned_row_t >;

//
// Append the text of the rows to the string, rows separated by the row
// separator:
//
void append_text(std::string &, const rows_t &, const extract_options_t & = { });

std::string to_text(const rows_t &, const extract_options_t & = { });
styled_segments_t to_styled(const rows_t &);
positioned_rows_t to_positioned_rows(const rows_t &);

//
// Extracts the text of single pages. Stateless besides the source (and its
// caches) and the buffer pool, safe for concurrent use on distinct pages.
// Every error is thrown as an extraction_error tagged with the page:
//
struct page_extractor_t
{
    explicit page_extractor_t(run_source_ptr, buffer_pool_ptr = { });

    //
    // The non-empty runs of the page with their fonts resolved, in content
    // order:
    //
    text_runs_t runs(int page, const cancellation_token_t & = { }) const;

    std::string text(
        int page, const extract_options_t & = { },
        const cancellation_token_t & = { }) const;

    styled_segments_t styled(
        int page, const extract_options_t & = { },
        const cancellation_token_t & = { }) const;

    positioned_rows_t rows(
        int page, const extract_options_t & = { },
        const cancellation_token_t & = { }) const;

    columns_t columns(
        int page, const extract_options_t & = { },
        const cancellation_token_t & = { }) const;

    //
    // Text of already resolved runs, built in a pooled buffer:
    //
    std::string text(const text_runs_t &, const extract_options_t & = { }) const;

    const run_source_ptr &source() const { return source_; }
    const buffer_pool_ptr &buffers() const { return buffers_; }

private:
    run_source_ptr source_;
    buffer_pool_ptr buffers_;
};

} // namespace glyphtext

#endif // GLYPHTEXT_GLYPHTEXT_PAGE_EXTRACTOR_HH
