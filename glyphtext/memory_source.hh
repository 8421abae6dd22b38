// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef GLYPHTEXT_GLYPHTEXT_MEMORY_SOURCE_HH
#define GLYPHTEXT_GLYPHTEXT_MEMORY_SOURCE_HH

#include <defs.hh>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <glyphtext/run_source.hh>

namespace glyphtext {

//
// Run source over pages, fonts and objects held in memory. Pages may depend
// on objects, which are then resolved through the resolver passed to runs,
// the way a document-backed source resolves content streams and resources.
// Pages can be made to fail or to take time, and all calls are counted:
//
struct memory_source_t : run_source_t
{
    memory_source_t() = default;

    //
    // Setup; not synchronized with extraction:
    //
    void add_page(int page, raw_runs_t runs, std::vector< ref_t > deps = { });
    void add_font(const ref_t &, font_t);
    void add_object(const ref_t &, std::string);

    void fail_page(int page, std::string reason = "damaged page");
    void delay_page(int page, std::chrono::milliseconds);

    int page_count() const override;

    using run_source_t::runs;
    raw_runs_t runs(int, resolver_t &) override;

    font_ptr resolve_font(const ref_t &) override;
    object_ptr resolve_object(const ref_t &) override;

    long page_calls() const { return page_calls_; }
    long font_calls() const { return font_calls_; }
    long object_calls() const { return object_calls_; }

    //
    // Pages produced so far, in the order the calls were made:
    //
    std::vector< int > produced() const;

private:
    struct page_t
    {
        raw_runs_t runs;
        std::vector< ref_t > deps;

        std::string failure;
        std::chrono::milliseconds delay{ };
    };

    std::map< int, page_t > pages_;

    std::map< ref_t, font_ptr > fonts_;
    std::map< ref_t, object_ptr > objects_;

    std::atomic< long > page_calls_{ 0 }, font_calls_{ 0 }, object_calls_{ 0 };

    mutable std::mutex mutex_;
    std::vector< int > produced_;
};

} // namespace glyphtext

#endif // GLYPHTEXT_GLYPHTEXT_MEMORY_SOURCE_HH
