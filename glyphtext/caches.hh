// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef GLYPHTEXT_GLYPHTEXT_CACHES_HH
#define GLYPHTEXT_GLYPHTEXT_CACHES_HH

#include <defs.hh>

#include <memory>

#include <glyphtext/lru_cache.hh>
#include <glyphtext/run_source.hh>

namespace glyphtext {

using object_cache_t = lru_cache_t< ref_t, object_ptr >;
using font_cache_t = lru_cache_t< ref_t, font_ptr >;

using object_cache_ptr = std::shared_ptr< object_cache_t >;
using font_cache_ptr = std::shared_ptr< font_cache_t >;

//
// Object cache capacity for a request of the given number of pages, when no
// capacity was configured:
//
long object_cache_capacity_for(long npages);

//
// Run source decorator that memoizes object and font lookups in shared,
// bounded caches. The caches may be shared with other caching sources over
// the same document:
//
struct caching_source_t : run_source_t
{
    explicit caching_source_t(run_source_ptr source,
                              object_cache_ptr objects = { },
                              font_cache_ptr fonts = { });

    int page_count() const override;

    using run_source_t::runs;
    raw_runs_t runs(int, resolver_t &) override;

    font_ptr resolve_font(const ref_t &) override;
    object_ptr resolve_object(const ref_t &) override;

    object_cache_t &objects() { return *objects_; }
    const object_cache_t &objects() const { return *objects_; }

    font_cache_t &fonts() { return *fonts_; }
    const font_cache_t &fonts() const { return *fonts_; }

    const run_source_ptr &source() const { return source_; }

private:
    run_source_ptr source_;

    object_cache_ptr objects_;
    font_cache_ptr fonts_;
};

using caching_source_ptr = std::shared_ptr< caching_source_t >;

} // namespace glyphtext

#endif // GLYPHTEXT_GLYPHTEXT_CACHES_HH
