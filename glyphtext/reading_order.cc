// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <cmath>
#include <functional>
#include <iterator>
#include <limits>
#include <map>

#include <glyphtext/reading_order.hh>

#include <range/v3/algorithm/max.hpp>
#include <range/v3/algorithm/max_element.hpp>
#include <range/v3/algorithm/sort.hpp>
#include <range/v3/algorithm/stable_sort.hpp>
#include <range/v3/algorithm/upper_bound.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/iota.hpp>
#include <range/v3/view/join.hpp>
#include <range/v3/view/transform.hpp>
using namespace ranges;

namespace glyphtext {
namespace {

//
// Profile precision is 5% of the minimum font size, with a lower bound:
//
constexpr double split_precision_mul = .05;
constexpr double min_split_precision = .01;

//
// Profile bins covered by no more than this fraction of the peak coverage
// count as empty:
//
constexpr double gap_noise_fraction = .1;

constexpr long max_profile_bins = 1L << 16;

//
// Minimum number of rows on either side of a column gap:
//
constexpr size_t min_column_rows = 2;

std::vector< size_t > indices_of(const text_runs_t &runs)
{
    return views::iota(size_t(0), runs.size()) | ranges::to< std::vector >();
}

//
// Index of the partition, delimited by the given boundaries, that holds the
// larger portion of the run; the leftmost one on ties:
//
size_t partition_of(const text_run_t &run, const std::vector< double > &bounds)
{
    const auto box = bbox_of(run);
    const double x0 = box.arr[0], x1 = box.arr[2];

    if (!(x1 > x0)) {
        return size_t(ranges::upper_bound(bounds, x0) - bounds.begin());
    }

    const double inf = std::numeric_limits< double >::infinity();

    size_t best = 0;
    double best_overlap = 0;

    for (size_t i = 0; i <= bounds.size(); ++i) {
        const bbox_t part{
            i ? bounds[i - 1] : -inf, box.arr[1],
            i < bounds.size() ? bounds[i] : inf, box.arr[3] };

        const double overlap = horizontal_overlap(box, part);

        if (overlap > best_overlap) {
            best = i;
            best_overlap = overlap;
        }
    }

    return best;
}

} // anonymous

const char *to_string(ordering_t ordering)
{
    switch (ordering) {
    case ordering_t::simple:
        return "simple";
    case ordering_t::smart:
        return "smart";
    default:
        ASSERT(0);
        return "unknown";
    }
}

double row_tolerance(const text_runs_t &runs, const layout_params_t &params)
{
    //
    // Font sizes are bucketed to a tenth of a unit; the smallest of equally
    // frequent sizes wins:
    //
    std::map< long, size_t > sizes;

    for (const auto &run : runs) {
        if (run.font_size > 0) {
            ++sizes[std::lround(run.font_size * 10)];
        }
    }

    if (sizes.empty()) {
        return params.min_row_tolerance;
    }

    const auto iter = ranges::max_element(
        sizes, std::less<>{ }, [](const auto &x) { return x.second; });

    return (std::max)(params.min_row_tolerance, .5 * iter->first / 10.);
}

rows_t make_rows(const text_runs_t &runs, double tolerance)
{
    auto indices = indices_of(runs);

    ranges::stable_sort(indices, std::greater<>{ }, [&](size_t i) {
        return runs[i].y;
    });

    //
    // Sweep top to bottom; a row is anchored on its highest run:
    //
    std::vector< double > anchors;
    std::vector< std::vector< size_t > > members;

    for (auto i : indices) {
        if (anchors.empty() || anchors.back() - runs[i].y > tolerance) {
            anchors.push_back(runs[i].y);
            members.emplace_back();
        }

        members.back().push_back(i);
    }

    rows_t rows;
    rows.reserve(anchors.size());

    for (size_t n = 0; n < anchors.size(); ++n) {
        auto &xs = members[n];

        ranges::sort(xs, [&](size_t a, size_t b) {
            return runs[a].x < runs[b].x || (runs[a].x == runs[b].x && a < b);
        });

        rows.push_back(row_t{
            anchors[n], xs | views::transform([&](size_t i) {
                            return runs[i];
                        }) | ranges::to< std::vector >() });
    }

    return rows;
}

gaps_t find_gaps(const text_runs_t &runs, const layout_params_t &params)
{
    if (runs.size() < 2) {
        return { };
    }

    //
    // Compute the bounding box of the run set and the minimum font size:
    //
    auto box = bbox_of(runs.front());
    double min_font_size = 0;

    for (const auto &run : runs) {
        box = coalesce(box, bbox_of(run));

        if (run.font_size > 0 &&
            (min_font_size == 0 || run.font_size < min_font_size)) {
            min_font_size = run.font_size;
        }
    }

    const double xmin = box.arr[0], xmax = box.arr[2];
    const double width = xmax - xmin;

    if (!(width > 0)) {
        return { };
    }

    double precision = (std::max)(
        split_precision_mul * min_font_size, min_split_precision);

    if (width / precision > max_profile_bins) {
        precision = width / max_profile_bins;
    }

    const auto bin_of = [&](double x) {
        return long(std::floor((x - xmin) / precision));
    };

    const long nbins = bin_of(xmax) + 1;

    //
    // The vertical profile counts, for each stripe of the page, the runs
    // intersecting it:
    //
    std::vector< long > vprofile(nbins);

    for (const auto &run : runs) {
        const auto b = bbox_of(run);

        const long first = std::clamp(bin_of(b.arr[0]), 0L, nbins - 1);
        long last = bin_of(b.arr[2]);

        //
        // A run ending exactly on a stripe boundary does not cover the next
        // stripe:
        //
        if (last > first && xmin + last * precision >= b.arr[2]) {
            --last;
        }

        last = std::clamp(last, first, nbins - 1);

        for (long i = first; i <= last; ++i) {
            ++vprofile[i];
        }
    }

    const long noise = long(gap_noise_fraction * ranges::max(vprofile));
    const double min_gap = params.column_gap_fraction * width;

    gaps_t gaps;

    for (long i = 0; i < nbins;) {
        if (vprofile[i] > noise) {
            ++i;
            continue;
        }

        long j = i;

        for (; j < nbins && vprofile[j] <= noise; ++j)
            ;

        //
        // Only interior stripes separate columns:
        //
        if (i > 0 && j < nbins) {
            const gap_t gap{ xmin + i * precision, xmin + j * precision };

            if (gap.xmax - gap.xmin > min_gap) {
                gaps.push_back(gap);
            }
        }

        i = j;
    }

    if (gaps.empty()) {
        return gaps;
    }

    //
    // A lone row with wide word spacing is no column layout:
    //
    const double tolerance = row_tolerance(runs, params);

    std::erase_if(gaps, [&](const gap_t &gap) {
        const double middle = (gap.xmin + gap.xmax) / 2;

        text_runs_t lhs, rhs;

        for (const auto &run : runs) {
            const auto b = bbox_of(run);
            (b.arr[0] + b.arr[2] < 2 * middle ? lhs : rhs).push_back(run);
        }

        return make_rows(lhs, tolerance).size() < min_column_rows ||
            make_rows(rhs, tolerance).size() < min_column_rows;
    });

    return gaps;
}

columns_t make_columns(const text_runs_t &runs, const layout_params_t &params)
{
    //
    // One tolerance for the whole page, so that rows are grouped alike in
    // every column:
    //
    const double tolerance = row_tolerance(runs, params);

    const auto bounds = find_gaps(runs, params) |
        views::transform([](const gap_t &gap) {
            return (gap.xmin + gap.xmax) / 2;
        }) |
        ranges::to< std::vector >();

    std::vector< text_runs_t > parts(bounds.size() + 1);

    for (const auto &run : runs) {
        parts[partition_of(run, bounds)].push_back(run);
    }

    columns_t columns;

    for (const auto &part : parts) {
        if (part.empty()) {
            continue;
        }

        auto box = bbox_of(part.front());

        for (const auto &run : part) {
            box = coalesce(box, bbox_of(run));
        }

        columns.push_back(
            column_t{ box.arr[0], box.arr[2], make_rows(part, tolerance) });
    }

    return columns;
}

rows_t order_rows(
    const text_runs_t &runs, ordering_t ordering, const layout_params_t &params)
{
    switch (ordering) {
    case ordering_t::smart: {
        rows_t rows;

        for (auto &column : make_columns(runs, params)) {
            std::move(
                column.rows.begin(), column.rows.end(),
                std::back_inserter(rows));
        }

        return rows;
    }

    case ordering_t::simple:
    default:
        return make_rows(runs, row_tolerance(runs, params));
    }
}

text_runs_t
order(const text_runs_t &runs, ordering_t ordering, const layout_params_t &params)
{
    auto rows = order_rows(runs, ordering, params);

    return rows |
        views::transform([](const row_t &row) -> const text_runs_t & {
            return row.runs;
        }) |
        views::join | ranges::to< std::vector >();
}

} // namespace glyphtext
