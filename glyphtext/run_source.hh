// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef GLYPHTEXT_GLYPHTEXT_RUN_SOURCE_HH
#define GLYPHTEXT_GLYPHTEXT_RUN_SOURCE_HH

#include <defs.hh>

#include <cstddef>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace glyphtext {

//
// Indirect reference to a document object, `num gen R':
//
struct ref_t
{
    int num, gen;
};

inline bool operator==(const ref_t &lhs, const ref_t &rhs)
{
    return lhs.num == rhs.num && lhs.gen == rhs.gen;
}

inline bool operator!=(const ref_t &lhs, const ref_t &rhs)
{
    return !(lhs == rhs);
}

inline bool operator<(const ref_t &lhs, const ref_t &rhs)
{
    return lhs.num < rhs.num || (lhs.num == rhs.num && lhs.gen < rhs.gen);
}

inline std::ostream &operator<<(std::ostream &ss, const ref_t &ref)
{
    return ss << ref.num << " " << ref.gen << " R";
}

//
// Resolved font; the core needs only its name for styled output:
//
struct font_t
{
    std::string name;

    //
    // Average glyph advance per unit of font size, 0 if unknown:
    //
    double avg_width = 0;
};

using font_ptr = std::shared_ptr< const font_t >;

//
// A decoded document object (e.g., a decompressed content stream):
//
struct object_t
{
    ref_t ref;
    std::string data;
};

using object_ptr = std::shared_ptr< const object_t >;

//
// A run as produced by the source, before its font is resolved:
//
struct raw_run_t
{
    double x, y;
    double font_size;

    ref_t font;
    std::string text;

    double width = 0;
};

using raw_runs_t = std::vector< raw_run_t >;

////////////////////////////////////////////////////////////////////////

struct resolver_t
{
    virtual ~resolver_t() = default;

    //
    // Both throw extraction_error (resolution) if the reference cannot be
    // resolved:
    //
    virtual font_ptr resolve_font(const ref_t &) = 0;
    virtual object_ptr resolve_object(const ref_t &) = 0;
};

//
// The external collaborator that parses the document. It yields, per page,
// the positioned runs in content stream order; any object or font it needs
// while decoding the page is looked up through the given resolver, which lets
// a caching layer observe (and memoize) those lookups. Implementations must
// be safe for concurrent calls on distinct pages.
//
struct run_source_t : resolver_t
{
    //
    // Pages are numbered from 1 to page_count():
    //
    virtual int page_count() const = 0;

    //
    // Throws extraction_error (source_unavailable) when the page cannot be
    // produced:
    //
    virtual raw_runs_t runs(int page, resolver_t &) = 0;

    raw_runs_t runs(int page) { return runs(page, *this); }
};

using run_source_ptr = std::shared_ptr< run_source_t >;

} // namespace glyphtext

template< >
struct std::hash< glyphtext::ref_t >
{
    size_t operator()(const glyphtext::ref_t &ref) const noexcept
    {
        return std::hash< long long >()(
            ((long long)ref.num << 16) ^ (long long)ref.gen);
    }
};

#endif // GLYPHTEXT_GLYPHTEXT_RUN_SOURCE_HH
