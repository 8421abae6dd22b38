// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef GLYPHTEXT_GLYPHTEXT_CANCELLATION_HH
#define GLYPHTEXT_GLYPHTEXT_CANCELLATION_HH

#include <defs.hh>

#include <atomic>
#include <memory>

#include <glyphtext/exception.hh>

namespace glyphtext {

//
// Shared, write-once cancellation flag. Copies observe the same flag; once
// cancelled a token stays cancelled:
//
struct cancellation_token_t
{
    cancellation_token_t()
        : flag_(std::make_shared< std::atomic< bool > >(false))
    { }

    void cancel() noexcept { flag_->store(true, std::memory_order_release); }

    bool cancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

    void throw_if_cancelled(int page = -1) const {
        if (cancelled())
            throw extraction_error(errc_t::cancelled, page, "cancelled");
    }

private:
    std::shared_ptr< std::atomic< bool > > flag_;
};

} // namespace glyphtext

#endif // GLYPHTEXT_GLYPHTEXT_CANCELLATION_HH
