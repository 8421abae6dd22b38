// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <glyphtext/error.hh>
#include <glyphtext/lazy_page_manager.hh>

namespace glyphtext {

lazy_page_manager_t::lazy_page_manager_t(
    run_source_ptr source, long capacity, buffer_pool_ptr buffers)
    : extractor_(std::move(source), std::move(buffers)),
      pages_(capacity > 0 ? capacity : GLYPHTEXT_RESIDENT_PAGES)
{ }

page_content_ptr
lazy_page_manager_t::get(int page, const cancellation_token_t &token)
{
    const auto evictions = pages_.stats().evictions;

    auto content = pages_.get_or_compute(page, [&] {
        auto xs = extractor_.runs(page, token);
        ++loads_;

        return std::make_shared< const page_content_t >(
            page_content_t{ page, std::move(xs) });
    });

    if (verbose_) {
        const auto n = pages_.stats().evictions - evictions;

        if (n > 0) {
            error(error_category_t::warning, page,
                  "{} resident page(s) evicted, capacity {}", n,
                  pages_.capacity());
        }
    }

    return content;
}

page_manager_stats_t lazy_page_manager_t::stats() const
{
    return page_manager_stats_t{
        extractor_.source()->page_count(), pages_.size() };
}

} // namespace glyphtext
