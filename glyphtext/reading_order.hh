// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef GLYPHTEXT_GLYPHTEXT_READING_ORDER_HH
#define GLYPHTEXT_GLYPHTEXT_READING_ORDER_HH

#include <defs.hh>

#include <vector>

#include <glyphtext/text_run.hh>

namespace glyphtext {

enum struct ordering_t { simple, smart };

const char *to_string(ordering_t);

struct layout_params_t
{
    //
    // Lower bound for the row tolerance, in page units:
    //
    double min_row_tolerance = 1.;

    //
    // Minimum width of a column gap, as a fraction of the width of the run
    // set:
    //
    double column_gap_fraction = .05;
};

//
// Runs sharing a baseline, left to right. The row baseline is the one of the
// highest run in the row:
//
struct row_t
{
    double y;
    text_runs_t runs;
};

using rows_t = std::vector< row_t >;

struct column_t
{
    double xmin, xmax;
    rows_t rows;
};

using columns_t = std::vector< column_t >;

struct gap_t
{
    double xmin, xmax;
};

using gaps_t = std::vector< gap_t >;

//
// Half the modal font size of the runs, but no less than the configured
// minimum:
//
double row_tolerance(const text_runs_t &, const layout_params_t & = { });

//
// Simple ordering: rows by descending baseline, runs by ascending x. Ties
// are broken by the index of the run in the input:
//
rows_t make_rows(const text_runs_t &, double tolerance);

//
// Interior x-ranges with no or negligible run coverage, wider than the
// configured fraction of the run set width and with at least two rows of text
// on either side, left to right:
//
gaps_t find_gaps(const text_runs_t &, const layout_params_t & = { });

//
// Partition the runs at the gaps and order each partition into rows. Without
// gaps the result is a single column holding the simple ordering:
//
columns_t make_columns(const text_runs_t &, const layout_params_t & = { });

//
// Rows in reading order; in smart mode, columns left to right:
//
rows_t order_rows(const text_runs_t &, ordering_t, const layout_params_t & = { });

//
// The runs, in reading order:
//
text_runs_t order(const text_runs_t &, ordering_t, const layout_params_t & = { });

} // namespace glyphtext

#endif // GLYPHTEXT_GLYPHTEXT_READING_ORDER_HH
