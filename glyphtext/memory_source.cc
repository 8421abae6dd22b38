// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <thread>

#include <fmt/format.h>

#include <glyphtext/exception.hh>
#include <glyphtext/memory_source.hh>

namespace glyphtext {

void memory_source_t::add_page(
    int page, raw_runs_t runs, std::vector< ref_t > deps)
{
    if (page < 1)
        throw extraction_error(
            errc_t::invalid_argument, page, "page numbers start at 1");

    auto &p = pages_[page];

    p.runs = std::move(runs);
    p.deps = std::move(deps);
}

void memory_source_t::add_font(const ref_t &ref, font_t font)
{
    fonts_[ref] = std::make_shared< const font_t >(std::move(font));
}

void memory_source_t::add_object(const ref_t &ref, std::string data)
{
    objects_[ref] = std::make_shared< const object_t >(
        object_t{ ref, std::move(data) });
}

void memory_source_t::fail_page(int page, std::string reason)
{
    pages_[page].failure = std::move(reason);
}

void memory_source_t::delay_page(int page, std::chrono::milliseconds delay)
{
    pages_[page].delay = delay;
}

int memory_source_t::page_count() const
{
    return pages_.empty() ? 0 : pages_.rbegin()->first;
}

raw_runs_t memory_source_t::runs(int page, resolver_t &resolver)
{
    ++page_calls_;

    auto iter = pages_.find(page);

    if (iter == pages_.end())
        throw extraction_error(
            errc_t::source_unavailable, page, "no such page");

    const auto &p = iter->second;

    if (p.delay.count())
        std::this_thread::sleep_for(p.delay);

    if (!p.failure.empty())
        throw extraction_error(errc_t::source_unavailable, page, p.failure);

    for (const auto &ref : p.deps)
        resolver.resolve_object(ref);

    {
        std::lock_guard< std::mutex > guard(mutex_);
        produced_.push_back(page);
    }

    return p.runs;
}

font_ptr memory_source_t::resolve_font(const ref_t &ref)
{
    ++font_calls_;

    auto iter = fonts_.find(ref);

    if (iter == fonts_.end())
        throw extraction_error(
            errc_t::resolution, -1,
            fmt::format("unknown font {} {} R", ref.num, ref.gen));

    return iter->second;
}

object_ptr memory_source_t::resolve_object(const ref_t &ref)
{
    ++object_calls_;

    auto iter = objects_.find(ref);

    if (iter == objects_.end())
        throw extraction_error(
            errc_t::resolution, -1,
            fmt::format("unknown object {} {} R", ref.num, ref.gen));

    return iter->second;
}

std::vector< int > memory_source_t::produced() const
{
    std::lock_guard< std::mutex > guard(mutex_);
    return produced_;
}

} // namespace glyphtext
