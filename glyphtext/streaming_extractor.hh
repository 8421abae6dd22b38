// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef GLYPHTEXT_GLYPHTEXT_STREAMING_EXTRACTOR_HH
#define GLYPHTEXT_GLYPHTEXT_STREAMING_EXTRACTOR_HH

#include <defs.hh>

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include <boost/noncopyable.hpp>

#include <glyphtext/cancellation.hh>
#include <glyphtext/lazy_page_manager.hh>
#include <glyphtext/page_extractor.hh>

namespace glyphtext {

enum struct stream_state_t { idle, emitting, done };

const char *to_string(stream_state_t);

struct stream_item_t
{
    int page;
    std::string text;

    //
    // False on the item of the last page:
    //
    bool has_more;
};

//
// Emits the text of a sequence of pages, one page per call to next. The
// pages go through a lazy page manager, so that at most its capacity of
// decoded pages stays resident.
//
// A page that fails to extract makes next throw the page's error; the stream
// moves past that page and the following call continues with the next one.
// Cancellation is terminal. Once done, next throws an exhausted error:
//
struct streaming_extractor_t : private boost::noncopyable
{
    //
    // An empty page list streams every page of the source:
    //
    explicit streaming_extractor_t(
        run_source_ptr, std::vector< int > pages = { },
        extract_options_t = { }, long resident_pages = GLYPHTEXT_RESIDENT_PAGES,
        cancellation_token_t = { }, buffer_pool_ptr = { });

    stream_item_t next();

    //
    // Up to n items. A page failing after some items were collected ends the
    // batch early, with the stream still on that page; its error is thrown by
    // the following call:
    //
    std::vector< stream_item_t > next_batch(size_t n);

    //
    // Fraction of the pages consumed, 1 for an empty stream. Does not
    // decrease until reset:
    //
    float progress() const;

    page_manager_stats_t stats() const { return manager_.stats(); }

    stream_state_t state() const { return state_; }

    //
    // Rewind to the first page and drop resident pages; a cancelled token
    // stays cancelled:
    //
    void reset();

    void close();

    lazy_page_manager_t &pages() { return manager_; }

    size_t size() const { return pages_.size(); }

private:
    std::string load(int page);
    stream_item_t emit();
    void advance();

private:
    lazy_page_manager_t manager_;

    std::vector< int > pages_;
    extract_options_t opts_;
    cancellation_token_t token_;

    std::mutex mutex_;

    std::atomic< size_t > current_{ 0 };
    std::atomic< stream_state_t > state_{ stream_state_t::idle };
};

} // namespace glyphtext

#endif // GLYPHTEXT_GLYPHTEXT_STREAMING_EXTRACTOR_HH
