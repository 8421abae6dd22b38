// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <cctype>
#include <cmath>

#include <utils/string.hh>

#include <glyphtext/exception.hh>
#include <glyphtext/page_extractor.hh>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/join.hpp>
#include <range/v3/view/transform.hpp>
using namespace ranges;

namespace glyphtext {
namespace {

//
// Minimum horizontal gap between two runs, for a space to be inserted:
//
constexpr double space_gap_mul = .2;
constexpr double min_space_gap = .5;

inline bool is_space(char c)
{
    return std::isspace(static_cast< unsigned char >(c));
}

bool needs_space(const text_run_t &prev, const text_run_t &run)
{
    if (!(prev.width > 0)) {
        return false;
    }

    if (is_space(prev.text.back()) || is_space(run.text.front())) {
        return false;
    }

    const double gap = run.x - (prev.x + prev.width);
    return gap > (std::max)(space_gap_mul * run.font_size, min_space_gap);
}

inline styled_segment_t styled_segment_of(const text_run_t &run)
{
    return styled_segment_t{ run.font_name, run.font_size, run.text };
}

} // anonymous

void append_text(
    std::string &str, const rows_t &rows, const extract_options_t &opts)
{
    for (size_t i = 0; i < rows.size(); ++i) {
        if (i) {
            str += opts.row_separator;
        }

        const text_run_t *prev = 0;

        for (const auto &run : rows[i].runs) {
            if (opts.insert_spaces && prev && needs_space(*prev, run)) {
                str += ' ';
            }

            str += run.text;
            prev = &run;
        }
    }
}

std::string to_text(const rows_t &rows, const extract_options_t &opts)
{
    std::string str;
    append_text(str, rows, opts);
    return str;
}

styled_segments_t to_styled(const rows_t &rows)
{
    return rows |
        views::transform([](const row_t &row) -> const text_runs_t & {
            return row.runs;
        }) |
        views::join | views::transform(styled_segment_of) |
        ranges::to< std::vector >();
}

positioned_rows_t to_positioned_rows(const rows_t &rows)
{
    positioned_rows_t xs;
    xs.reserve(rows.size());

    for (const auto &row : rows) {
        xs.push_back(positioned_row_t{
            std::lround(row.y),
            row.runs | views::transform(styled_segment_of) |
                ranges::to< std::vector >() });
    }

    return xs;
}

////////////////////////////////////////////////////////////////////////

page_extractor_t::page_extractor_t(run_source_ptr source, buffer_pool_ptr buffers)
    : source_(std::move(source)), buffers_(std::move(buffers))
{
    if (!source_) {
        throw extraction_error(errc_t::invalid_argument, -1, "null run source");
    }

    if (!buffers_) {
        buffers_ = std::make_shared< buffer_pool_t >();
    }
}

text_runs_t
page_extractor_t::runs(int page, const cancellation_token_t &token) const
{
    token.throw_if_cancelled(page);

    text_runs_t xs;

    try {
        auto raw = source_->runs(page);
        xs.reserve(raw.size());

        for (auto &run : raw) {
            //
            // Empty runs carry no text and do not take part in the layout:
            //
            if (run.text.empty()) {
                continue;
            }

            auto font = source_->resolve_font(run.font);

            double width = run.width;

            if (!(width > 0) && font && font->avg_width > 0) {
                width = font->avg_width * run.font_size * utf8_length(run.text);
            }

            xs.push_back(text_run_t{
                run.x, run.y, run.font_size, font ? font->name : std::string(),
                std::move(run.text), width });
        }
    } catch (const extraction_error &e) {
        throw with_page(e, page);
    } catch (const std::exception &e) {
        throw extraction_error(errc_t::resolution, page, e.what());
    }

    //
    // The page is complete; a cancellation observed now still discards it:
    //
    token.throw_if_cancelled(page);

    return xs;
}

std::string
page_extractor_t::text(const text_runs_t &xs, const extract_options_t &opts) const
{
    auto buf = buffers_->acquire();
    append_text(*buf, order_rows(xs, opts.ordering, opts.layout), opts);
    return *buf;
}

std::string page_extractor_t::text(
    int page, const extract_options_t &opts,
    const cancellation_token_t &token) const
{
    return text(runs(page, token), opts);
}

styled_segments_t page_extractor_t::styled(
    int page, const extract_options_t &opts,
    const cancellation_token_t &token) const
{
    return to_styled(order_rows(runs(page, token), opts.ordering, opts.layout));
}

positioned_rows_t page_extractor_t::rows(
    int page, const extract_options_t &opts,
    const cancellation_token_t &token) const
{
    return to_positioned_rows(
        order_rows(runs(page, token), opts.ordering, opts.layout));
}

columns_t page_extractor_t::columns(
    int page, const extract_options_t &opts,
    const cancellation_token_t &token) const
{
    return make_columns(runs(page, token), opts.layout);
}

} // namespace glyphtext
