// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef GLYPHTEXT_GLYPHTEXT_BATCH_EXTRACTOR_HH
#define GLYPHTEXT_GLYPHTEXT_BATCH_EXTRACTOR_HH

#include <defs.hh>

#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <glyphtext/buffer_pool.hh>
#include <glyphtext/caches.hh>
#include <glyphtext/cancellation.hh>
#include <glyphtext/page_extractor.hh>
#include <glyphtext/reading_order.hh>

namespace glyphtext {

enum struct error_policy_t {
    strict, // the first error fails the whole batch
    partial // failures are reported per page
};

const char *to_string(error_policy_t);

struct batch_options_t
{
    //
    // Zero selects default_worker_count():
    //
    int workers = 0;

    ordering_t ordering = ordering_t::smart;
    cancellation_token_t cancellation;

    //
    // Object cache capacity; zero leaves the capacity as configured, or sizes
    // an unbounded cache after the number of requested pages:
    //
    long cache_capacity = 0;

    //
    // Font cache capacity; zero leaves it as configured:
    //
    long font_cache_capacity = 0;

    std::string row_separator = "\n";
    bool insert_spaces = false;

    layout_params_t layout;

    extract_options_t extract_options() const;
};

struct page_result_t
{
    int page;
    std::string text;
    std::exception_ptr error;

    bool ok() const { return !error; }
};

using page_results_t = std::vector< page_result_t >;

struct styled_page_result_t
{
    int page;
    styled_segments_t segments;
    std::exception_ptr error;

    bool ok() const { return !error; }
};

using styled_page_results_t = std::vector< styled_page_result_t >;

struct rows_page_result_t
{
    int page;
    positioned_rows_t rows;
    std::exception_ptr error;

    bool ok() const { return !error; }
};

using rows_page_results_t = std::vector< rows_page_result_t >;

using page_callback_t = std::function< void(const page_result_t &) >;

//
// Available hardware parallelism, between 1 and a small fixed bound:
//
int default_worker_count();

//
// Page numbers 1 to page_count() of the source:
//
std::vector< int > all_pages(const run_source_t &);

//
// Extracts sets of pages on a pool of worker threads. Results come back in
// the order of the requested pages. Cancellation stops dispatch; in-flight
// pages complete, then the call throws a cancellation error.
//
struct batch_extractor_t
{
    explicit batch_extractor_t(caching_source_ptr, buffer_pool_ptr = { });

    //
    // All or nothing: the first page error stops dispatch and is rethrown
    // once all workers have stopped:
    //
    page_results_t
    extract(const std::vector< int > &, const batch_options_t & = { });

    //
    // One result per requested page, either text or an error:
    //
    page_results_t
    extract_partial(const std::vector< int > &, const batch_options_t & = { });

    //
    // Styled segments and row groupings of the pages, in request order, under
    // either error policy:
    //
    styled_page_results_t extract_styled(
        const std::vector< int > &, const batch_options_t & = { },
        error_policy_t = error_policy_t::strict);

    rows_page_results_t extract_rows(
        const std::vector< int > &, const batch_options_t & = { },
        error_policy_t = error_policy_t::strict);

    //
    // Hands the per-page results to the callback in request order; an
    // exception thrown by the callback ends the delivery and propagates:
    //
    void extract_each(
        const std::vector< int > &, const page_callback_t &,
        const batch_options_t & = { });

    //
    // Page texts in request order, joined by the separator:
    //
    std::string extract_to_string(
        const std::vector< int > &, const batch_options_t & = { },
        const std::string &separator = "\n");

    //
    // Every page of the source, joined by the separator:
    //
    std::string extract_document(
        const batch_options_t & = { }, const std::string &separator = "\n");

    const caching_source_ptr &source() const { return source_; }
    const buffer_pool_ptr &buffers() const { return buffers_; }

private:
    //
    // Runs the product over the pages on the worker pool, storing each value
    // in the given field of its result slot:
    //
    template< typename Result, typename Value, typename Product >
    std::vector< Result > run(
        const std::vector< int > &, const batch_options_t &, error_policy_t,
        Value Result::*, Product);

    void size_caches(size_t, const batch_options_t &);

private:
    caching_source_ptr source_;
    buffer_pool_ptr buffers_;
};

} // namespace glyphtext

#endif // GLYPHTEXT_GLYPHTEXT_BATCH_EXTRACTOR_HH
