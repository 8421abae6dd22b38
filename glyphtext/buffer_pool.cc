// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <glyphtext/buffer_pool.hh>

namespace glyphtext {

scoped_buffer_t::scoped_buffer_t(buffer_pool_t &pool, buffer_ptr buf)
    : pool_(&pool), buf_(std::move(buf))
{ }

scoped_buffer_t &scoped_buffer_t::operator=(scoped_buffer_t &&other) noexcept
{
    if (this != &other) {
        release();

        pool_ = other.pool_;
        buf_ = std::move(other.buf_);
    }

    return *this;
}

void scoped_buffer_t::release() noexcept
{
    if (buf_) {
        pool_->release(std::move(buf_));
    }
}

scoped_buffer_t buffer_pool_t::acquire()
{
    buffer_ptr buf;

    {
        std::lock_guard< std::mutex > guard(mutex_);

        if (!idle_.empty()) {
            buf = std::move(idle_.back());
            idle_.pop_back();

            ++reused_;
        } else {
            ++created_;
        }
    }

    if (!buf) {
        buf = std::make_unique< std::string >();
        buf->reserve(initial_capacity_);
    }

    return scoped_buffer_t(*this, std::move(buf));
}

void buffer_pool_t::release(buffer_ptr buf) noexcept
{
    if (!buf) {
        return;
    }

    buf->clear();

    std::lock_guard< std::mutex > guard(mutex_);

    if (idle_.size() < max_idle_) {
        //
        // Storage for max_idle_ buffers is reserved up front, the push does
        // not allocate:
        //
        idle_.push_back(std::move(buf));
    }
}

buffer_pool_stats_t buffer_pool_t::stats() const
{
    std::lock_guard< std::mutex > guard(mutex_);
    return buffer_pool_stats_t{ long(idle_.size()), created_, reused_ };
}

} // namespace glyphtext
