// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef GLYPHTEXT_GLYPHTEXT_BBOX_HH
#define GLYPHTEXT_GLYPHTEXT_BBOX_HH

#include <defs.hh>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace glyphtext {
namespace detail {

//
// Bounding box, described by the 4 coordinates of its `bottom-left' and
// `top-right' corners in page space, where y grows upward:
//
template< typename T >
struct bbox_t {
    using value_type = T;
    value_type arr [4];
};

template< typename T >
inline bool
operator== (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    return std::equal (
        lhs.arr, lhs.arr + sizeof lhs.arr / sizeof *lhs.arr, rhs.arr);
}

template< typename T >
inline bool
operator!= (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    return !(lhs == rhs);
}

template< typename T >
inline std::ostream&
operator<< (std::ostream& ss, const bbox_t< T >& box) {
    return ss
        << box.arr [0] << ","
        << box.arr [1] << ","
        << box.arr [2] << ","
        << box.arr [3];
}

////////////////////////////////////////////////////////////////////////

template< typename T >
inline bbox_t< T >
normalize (bbox_t< T > x) {
    if (x.arr [0] > x.arr [2]) { std::swap (x.arr [0], x.arr [2]); }
    if (x.arr [1] > x.arr [3]) { std::swap (x.arr [1], x.arr [3]); }
    return x;
}

template< typename T >
inline T
horizontal_overlap (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    const auto dist =
        (std::min) (lhs.arr [2], rhs.arr [2]) -
        (std::max) (lhs.arr [0], rhs.arr [0]);
    return dist > 0 ? dist : 0;
}

template< typename T >
inline bbox_t< T >
coalesce (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    return bbox_t< T >{
        (std::min) (lhs.arr [0], rhs.arr [0]),
        (std::min) (lhs.arr [1], rhs.arr [1]),
        (std::max) (lhs.arr [2], rhs.arr [2]),
        (std::max) (lhs.arr [3], rhs.arr [3])
    };
}

} // namespace detail

////////////////////////////////////////////////////////////////////////

//
// The default bounding box type is the floating point specialization for
// double:
//
using bbox_t  = detail::bbox_t< double >;

using detail::normalize;
using detail::horizontal_overlap;
using detail::coalesce;

} // namespace glyphtext

#endif // GLYPHTEXT_GLYPHTEXT_BBOX_HH
