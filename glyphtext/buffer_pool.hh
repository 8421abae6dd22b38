// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef GLYPHTEXT_GLYPHTEXT_BUFFER_POOL_HH
#define GLYPHTEXT_GLYPHTEXT_BUFFER_POOL_HH

#include <defs.hh>

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/noncopyable.hpp>

namespace glyphtext {

using buffer_ptr = std::unique_ptr< std::string >;

struct buffer_pool_t;

//
// A buffer checked out of a pool; returns it to the pool when destroyed.
// Movable, not copyable:
//
struct scoped_buffer_t
{
    scoped_buffer_t(buffer_pool_t &, buffer_ptr);

    scoped_buffer_t(scoped_buffer_t &&other) noexcept
        : pool_(other.pool_), buf_(std::move(other.buf_))
    { }

    scoped_buffer_t &operator=(scoped_buffer_t &&) noexcept;

    ~scoped_buffer_t() { release(); }

    //
    // Returns the buffer to the pool ahead of destruction:
    //
    void release() noexcept;

    explicit operator bool() const { return bool(buf_); }

    std::string &operator*() { return *buf_; }
    std::string *operator->() { return buf_.get(); }

    std::string &str() { return *buf_; }

private:
    buffer_pool_t *pool_;
    buffer_ptr buf_;
};

struct buffer_pool_stats_t
{
    long idle, created, reused;
};

//
// Pool of reusable string buffers. Buffers come back emptied, with their
// capacity retained; idle buffers beyond the configured bound are dropped
// instead of pooled:
//
struct buffer_pool_t : private boost::noncopyable
{
    explicit buffer_pool_t(size_t max_idle = 32, size_t initial_capacity = 2048)
        : max_idle_(max_idle), initial_capacity_(initial_capacity)
    {
        idle_.reserve(max_idle_);
    }

    scoped_buffer_t acquire();
    void release(buffer_ptr) noexcept;

    buffer_pool_stats_t stats() const;

private:
    size_t max_idle_, initial_capacity_;

    mutable std::mutex mutex_;
    std::vector< buffer_ptr > idle_;

    long created_ = 0, reused_ = 0;
};

using buffer_pool_ptr = std::shared_ptr< buffer_pool_t >;

} // namespace glyphtext

#endif // GLYPHTEXT_GLYPHTEXT_BUFFER_POOL_HH
