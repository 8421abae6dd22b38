// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef GLYPHTEXT_GLYPHTEXT_TEXT_RUN_HH
#define GLYPHTEXT_GLYPHTEXT_TEXT_RUN_HH

#include <defs.hh>

#include <string>
#include <vector>

#include <utils/string.hh>
#include <glyphtext/bbox.hh>

namespace glyphtext {

//
// Average glyph advance, as a fraction of the font size, assumed for runs
// whose width is not known:
//
constexpr double default_glyph_advance = .5;

//
// A contiguous piece of positioned text, the atomic unit of layout. The
// origin (x, y) is the start of the baseline in page space; y grows upward:
//
struct text_run_t
{
    double x, y;
    double font_size;

    std::string font_name;
    std::string text;

    //
    // Horizontal advance of the whole run, 0 when unknown:
    //
    double width = 0;
};

using text_runs_t = std::vector< text_run_t >;

//
// Horizontal extent of a run, estimated from the font size and the number of
// code points when the run does not carry its width:
//
inline double extent_of(const text_run_t &run)
{
    if (run.width > 0)
        return run.width;

    const double size = run.font_size > 0 ? run.font_size : 0;
    return default_glyph_advance * size * utf8_length(run.text);
}

inline bbox_t bbox_of(const text_run_t &run)
{
    return normalize(bbox_t{
        run.x, run.y, run.x + extent_of(run), run.y + run.font_size });
}

//
// Run text with its style, one per ordered run:
//
struct styled_segment_t
{
    std::string font_name;
    double font_size;
    std::string text;
};

inline bool operator==(const styled_segment_t &lhs, const styled_segment_t &rhs)
{
    return lhs.font_name == rhs.font_name && lhs.font_size == rhs.font_size &&
        lhs.text == rhs.text;
}

} // namespace glyphtext

#endif // GLYPHTEXT_GLYPHTEXT_TEXT_RUN_HH
