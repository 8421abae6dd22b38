// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <algorithm>

#include <glyphtext/caches.hh>
#include <glyphtext/exception.hh>

namespace glyphtext {

long object_cache_capacity_for(long npages)
{
    return (std::min)(
        long(GLYPHTEXT_OBJECT_CACHE_CEILING),
        long(GLYPHTEXT_OBJECT_CACHE_PER_PAGE) * (std::max)(npages, 1L));
}

caching_source_t::caching_source_t(
    run_source_ptr source, object_cache_ptr objects, font_cache_ptr fonts)
    : source_(std::move(source)), objects_(std::move(objects)),
      fonts_(std::move(fonts))
{
    if (!source_)
        throw extraction_error(errc_t::invalid_argument, -1, "null run source");

    if (!objects_)
        objects_ = std::make_shared< object_cache_t >();

    if (!fonts_)
        fonts_ = std::make_shared< font_cache_t >(
            GLYPHTEXT_FONT_CACHE_CAPACITY);
}

int caching_source_t::page_count() const
{
    return source_->page_count();
}

raw_runs_t caching_source_t::runs(int page, resolver_t &resolver)
{
    //
    // Lookups made by the source while decoding the page come back through
    // the given resolver (normally this object):
    //
    return source_->runs(page, resolver);
}

font_ptr caching_source_t::resolve_font(const ref_t &ref)
{
    return fonts_->get_or_compute(
        ref, [&] { return source_->resolve_font(ref); });
}

object_ptr caching_source_t::resolve_object(const ref_t &ref)
{
    return objects_->get_or_compute(
        ref, [&] { return source_->resolve_object(ref); });
}

} // namespace glyphtext
