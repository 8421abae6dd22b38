// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <numeric>

#include <glyphtext/exception.hh>
#include <glyphtext/streaming_extractor.hh>

namespace glyphtext {

const char *to_string(stream_state_t state)
{
    switch (state) {
    case stream_state_t::idle:
        return "idle";
    case stream_state_t::emitting:
        return "emitting";
    case stream_state_t::done:
        return "done";
    default:
        ASSERT(0);
        return "unknown";
    }
}

streaming_extractor_t::streaming_extractor_t(
    run_source_ptr source, std::vector< int > pages, extract_options_t opts,
    long resident_pages, cancellation_token_t token, buffer_pool_ptr buffers)
    : manager_(std::move(source), resident_pages, std::move(buffers)),
      pages_(std::move(pages)),
      opts_(std::move(opts)), token_(std::move(token))
{
    if (pages_.empty()) {
        pages_.resize(manager_.extractor().source()->page_count());
        std::iota(pages_.begin(), pages_.end(), 1);
    }
}

void streaming_extractor_t::advance()
{
    if (++current_ >= pages_.size()) {
        state_ = stream_state_t::done;
    }
}

std::string streaming_extractor_t::load(int page)
{
    auto content = manager_.get(page, token_);
    return manager_.extractor().text(content->runs, opts_);
}

stream_item_t streaming_extractor_t::emit()
{
    if (state_ == stream_state_t::done || current_ >= pages_.size()) {
        state_ = stream_state_t::done;
        throw extraction_error(errc_t::exhausted, -1, "no more pages");
    }

    const int page = pages_[current_];

    if (token_.cancelled()) {
        state_ = stream_state_t::done;
        token_.throw_if_cancelled(page);
    }

    state_ = stream_state_t::emitting;

    try {
        auto text = load(page);
        advance();

        return stream_item_t{
            page, std::move(text), state_ != stream_state_t::done };
    } catch (const extraction_error &e) {
        if (e.kind() == errc_t::cancelled) {
            state_ = stream_state_t::done;
        } else {
            advance();
        }

        throw;
    }
}

stream_item_t streaming_extractor_t::next()
{
    std::lock_guard< std::mutex > guard(mutex_);
    return emit();
}

std::vector< stream_item_t > streaming_extractor_t::next_batch(size_t n)
{
    std::lock_guard< std::mutex > guard(mutex_);

    if (state_ == stream_state_t::done) {
        throw extraction_error(errc_t::exhausted, -1, "no more pages");
    }

    std::vector< stream_item_t > items;
    items.reserve((std::min)(n, pages_.size() - current_));

    while (items.size() < n && state_ != stream_state_t::done) {
        if (items.empty() || token_.cancelled()) {
            items.push_back(emit());
            continue;
        }

        const int page = pages_[current_];

        try {
            auto text = load(page);
            advance();

            items.push_back(stream_item_t{
                page, std::move(text), state_ != stream_state_t::done });
        } catch (const extraction_error &e) {
            if (e.kind() == errc_t::cancelled) {
                state_ = stream_state_t::done;
                throw;
            }

            //
            // The stream stays on the failing page, the next call reports it:
            //
            break;
        }
    }

    return items;
}

float streaming_extractor_t::progress() const
{
    if (pages_.empty()) {
        return 1.f;
    }

    return float(current_) / pages_.size();
}

void streaming_extractor_t::reset()
{
    std::lock_guard< std::mutex > guard(mutex_);

    current_ = 0;
    state_ = stream_state_t::idle;

    manager_.clear();
}

void streaming_extractor_t::close()
{
    std::lock_guard< std::mutex > guard(mutex_);

    state_ = stream_state_t::done;
    manager_.clear();
}

} // namespace glyphtext
