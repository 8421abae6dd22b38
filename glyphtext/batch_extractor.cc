// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <numeric>
#include <optional>
#include <thread>

#include <boost/scope_exit.hpp>

#include <glyphtext/batch_extractor.hh>
#include <glyphtext/error.hh>
#include <glyphtext/exception.hh>

namespace glyphtext {
namespace {

struct extraction_job_t
{
    int page;
    size_t slot;
};

//
// Bounded job queue shared by the dispatcher and the workers. Closing it
// lets the workers drain the pending jobs; aborting it drops them and wakes
// everybody up:
//
struct job_queue_t
{
    explicit job_queue_t(size_t capacity) : capacity_(capacity) { }

    bool push(extraction_job_t job) {
        std::unique_lock< std::mutex > lock(mutex_);

        cond_.wait(lock, [this] {
            return aborted_ || jobs_.size() < capacity_;
        });

        if (aborted_ || closed_) {
            return false;
        }

        jobs_.push_back(job);
        cond_.notify_all();

        return true;
    }

    std::optional< extraction_job_t > pop() {
        std::unique_lock< std::mutex > lock(mutex_);

        cond_.wait(lock, [this] {
            return aborted_ || closed_ || !jobs_.empty();
        });

        if (aborted_ || jobs_.empty()) {
            return { };
        }

        auto job = jobs_.front();
        jobs_.pop_front();

        cond_.notify_all();

        return job;
    }

    void close() {
        std::lock_guard< std::mutex > guard(mutex_);
        closed_ = true;
        cond_.notify_all();
    }

    void abort() {
        std::lock_guard< std::mutex > guard(mutex_);
        aborted_ = true;
        jobs_.clear();
        cond_.notify_all();
    }

private:
    size_t capacity_;

    std::mutex mutex_;
    std::condition_variable cond_;

    std::deque< extraction_job_t > jobs_;
    bool closed_ = false, aborted_ = false;
};

std::string text_of(
    const page_extractor_t &extractor, int page, const extract_options_t &opts,
    const cancellation_token_t &token)
{
    return extractor.text(page, opts, token);
}

} // anonymous

const char *to_string(error_policy_t policy)
{
    switch (policy) {
    case error_policy_t::strict:
        return "strict";
    case error_policy_t::partial:
        return "partial";
    default:
        ASSERT(0);
        return "unknown";
    }
}

extract_options_t batch_options_t::extract_options() const
{
    extract_options_t opts;

    opts.ordering = ordering;
    opts.row_separator = row_separator;
    opts.insert_spaces = insert_spaces;
    opts.layout = layout;

    return opts;
}

int default_worker_count()
{
    const int n = int(std::thread::hardware_concurrency());
    return std::clamp(n, 1, GLYPHTEXT_MAX_DEFAULT_WORKERS);
}

std::vector< int > all_pages(const run_source_t &source)
{
    std::vector< int > pages((std::max)(source.page_count(), 0));
    std::iota(pages.begin(), pages.end(), 1);
    return pages;
}

////////////////////////////////////////////////////////////////////////

batch_extractor_t::batch_extractor_t(
    caching_source_ptr source, buffer_pool_ptr buffers)
    : source_(std::move(source)), buffers_(std::move(buffers))
{
    if (!source_) {
        throw extraction_error(errc_t::invalid_argument, -1, "null run source");
    }

    if (!buffers_) {
        buffers_ = std::make_shared< buffer_pool_t >();
    }
}

void batch_extractor_t::size_caches(size_t npages, const batch_options_t &opts)
{
    auto &objects = source_->objects();

    if (opts.cache_capacity > 0) {
        objects.capacity(opts.cache_capacity);
    } else if (objects.capacity() <= 0) {
        //
        // Unbounded and not configured, bound it by the size of the request:
        //
        objects.capacity(object_cache_capacity_for(long(npages)));
    }

    if (opts.font_cache_capacity > 0) {
        source_->fonts().capacity(opts.font_cache_capacity);
    }
}

template< typename Result, typename Value, typename Product >
std::vector< Result > batch_extractor_t::run(
    const std::vector< int > &pages, const batch_options_t &opts,
    error_policy_t policy, Value Result::*field, Product product)
{
    if (pages.empty()) {
        return { };
    }

    const auto &token = opts.cancellation;

    if (token.cancelled()) {
        error(error_category_t::cancelled, -1,
              "batch of {} page(s) cancelled before start", pages.size());
        throw extraction_error(errc_t::cancelled, -1, "cancelled before start");
    }

    size_caches(pages.size(), opts);

    const auto nworkers = (std::min)(
        size_t(opts.workers > 0 ? opts.workers : default_worker_count()),
        pages.size());

    //
    // Result slots, in request order:
    //
    std::vector< Result > results(pages.size());

    for (size_t i = 0; i < pages.size(); ++i) {
        results[i].page = pages[i];
    }

    const page_extractor_t extractor(source_, buffers_);
    const auto eopts = opts.extract_options();

    job_queue_t queue(2 * nworkers);

    std::atomic< bool > abort{ false };

    std::mutex error_mutex;
    std::exception_ptr first_error;

    const auto fail = [&](int page, const char *what) {
        {
            std::lock_guard< std::mutex > guard(error_mutex);

            if (first_error) {
                return;
            }

            first_error = std::current_exception();
        }

        abort = true;
        queue.abort();

        error(error_category_t::source, page, "batch aborted: {}", what);
    };

    const auto work = [&] {
        while (auto job = queue.pop()) {
            if (token.cancelled() || abort) {
                queue.abort();
                break;
            }

            auto &slot = results[job->slot];

            try {
                slot.*field = product(extractor, job->page, eopts, token);
            } catch (const extraction_error &e) {
                if (e.kind() == errc_t::cancelled) {
                    queue.abort();
                    break;
                }

                if (policy == error_policy_t::strict) {
                    fail(job->page, e.what());
                    break;
                }

                slot.error = std::current_exception();
                error(error_category_t::source, job->page, "{}", e.what());
            } catch (const std::exception &e) {
                if (policy == error_policy_t::strict) {
                    fail(job->page, e.what());
                    break;
                }

                slot.error = std::current_exception();
                error(error_category_t::internal, job->page, "{}", e.what());
            }
        }
    };

    {
        std::vector< std::thread > threads;
        threads.reserve(nworkers);

        BOOST_SCOPE_EXIT_ALL(&) {
            queue.close();

            for (auto &thread : threads) {
                if (thread.joinable()) {
                    thread.join();
                }
            }
        };

        for (size_t i = 0; i < nworkers; ++i) {
            threads.emplace_back(work);
        }

        for (size_t i = 0; i < pages.size(); ++i) {
            if (token.cancelled() || abort) {
                break;
            }

            if (!queue.push(extraction_job_t{ pages[i], i })) {
                break;
            }
        }
    }

    //
    // All workers have stopped:
    //
    if (token.cancelled()) {
        error(error_category_t::cancelled, -1,
              "batch of {} page(s) cancelled", pages.size());
        throw extraction_error(errc_t::cancelled, -1, "batch cancelled");
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }

    return results;
}

page_results_t batch_extractor_t::extract(
    const std::vector< int > &pages, const batch_options_t &opts)
{
    return run(
        pages, opts, error_policy_t::strict, &page_result_t::text, text_of);
}

page_results_t batch_extractor_t::extract_partial(
    const std::vector< int > &pages, const batch_options_t &opts)
{
    return run(
        pages, opts, error_policy_t::partial, &page_result_t::text, text_of);
}

styled_page_results_t batch_extractor_t::extract_styled(
    const std::vector< int > &pages, const batch_options_t &opts,
    error_policy_t policy)
{
    return run(
        pages, opts, policy, &styled_page_result_t::segments,
        [](const page_extractor_t &extractor, int page,
           const extract_options_t &eopts, const cancellation_token_t &token) {
            return extractor.styled(page, eopts, token);
        });
}

rows_page_results_t batch_extractor_t::extract_rows(
    const std::vector< int > &pages, const batch_options_t &opts,
    error_policy_t policy)
{
    return run(
        pages, opts, policy, &rows_page_result_t::rows,
        [](const page_extractor_t &extractor, int page,
           const extract_options_t &eopts, const cancellation_token_t &token) {
            return extractor.rows(page, eopts, token);
        });
}

void batch_extractor_t::extract_each(
    const std::vector< int > &pages, const page_callback_t &callback,
    const batch_options_t &opts)
{
    for (const auto &result : extract_partial(pages, opts)) {
        callback(result);
    }
}

std::string batch_extractor_t::extract_to_string(
    const std::vector< int > &pages, const batch_options_t &opts,
    const std::string &separator)
{
    const auto results = extract(pages, opts);

    auto buf = buffers_->acquire();

    for (size_t i = 0; i < results.size(); ++i) {
        if (i) {
            *buf += separator;
        }

        *buf += results[i].text;
    }

    return *buf;
}

std::string batch_extractor_t::extract_document(
    const batch_options_t &opts, const std::string &separator)
{
    return extract_to_string(all_pages(*source_), opts, separator);
}

} // namespace glyphtext
