// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef GLYPHTEXT_GLYPHTEXT_LAZY_PAGE_MANAGER_HH
#define GLYPHTEXT_GLYPHTEXT_LAZY_PAGE_MANAGER_HH

#include <defs.hh>

#include <atomic>
#include <memory>

#include <boost/noncopyable.hpp>

#include <glyphtext/cancellation.hh>
#include <glyphtext/lru_cache.hh>
#include <glyphtext/page_extractor.hh>
#include <glyphtext/run_source.hh>

namespace glyphtext {

//
// Decoded content of a page, immutable once loaded and shared by all users
// of the page:
//
struct page_content_t
{
    int page;
    text_runs_t runs;
};

using page_content_ptr = std::shared_ptr< const page_content_t >;

struct page_manager_stats_t
{
    long total_pages, resident_pages;
};

//
// Keeps a bounded number of decoded pages resident, loading them on demand
// and evicting the least recently used one when the bound is exceeded:
//
struct lazy_page_manager_t : private boost::noncopyable
{
    //
    // A capacity of zero or less selects the default:
    //
    explicit lazy_page_manager_t(
        run_source_ptr, long capacity = GLYPHTEXT_RESIDENT_PAGES,
        buffer_pool_ptr = { });

    page_content_ptr get(int page, const cancellation_token_t & = { });

    bool is_resident(int page) const { return pages_.contains(page); }

    bool release(int page) { return pages_.erase(page); }
    void clear() { pages_.clear(); }

    long capacity() const { return pages_.capacity(); }

    //
    // Number of pages decoded so far:
    //
    long loads() const { return loads_; }

    page_manager_stats_t stats() const;

    const page_extractor_t &extractor() const { return extractor_; }

    //
    // Report evictions of resident pages as warnings:
    //
    void verbose(bool b) { verbose_ = b; }

private:
    page_extractor_t extractor_;
    lru_cache_t< int, page_content_ptr > pages_;

    std::atomic< long > loads_{ 0 };
    bool verbose_ = false;
};

using lazy_page_manager_ptr = std::shared_ptr< lazy_page_manager_t >;

} // namespace glyphtext

#endif // GLYPHTEXT_GLYPHTEXT_LAZY_PAGE_MANAGER_HH
