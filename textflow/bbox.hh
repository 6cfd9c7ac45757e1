// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef TEXTFLOW_TEXTFLOW_BBOX_HH
#define TEXTFLOW_TEXTFLOW_BBOX_HH

#include <defs.hh>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <optional>
#include <vector>

namespace textflow {

enum struct rotation_t {
    none, quarter_turn, half_turn, three_quarters_turn
};

namespace detail {

template< typename T >
struct point_t {
    using value_t = T;
    value_t x, y;
};

//
// Bounding box, described by 4 coordinates of two points, a `top-left' and a
// `bottom-right'. Token coordinates have (0,0) at the top-left of the page and
// the y axis growing downward:
//
template< typename T >
struct bbox_t {
    using value_type = T;
    using point_type = point_t< T >;

    union {
        value_type arr [4];
        point_type point [2];
    };
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
inline bbox_t< T >&
operator+= (bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    return (
        lhs = {
            (std::min) (lhs.arr [0], rhs.arr [0]),
            (std::min) (lhs.arr [1], rhs.arr [1]),
            (std::max) (lhs.arr [2], rhs.arr [2]),
            (std::max) (lhs.arr [3], rhs.arr [3])
        });
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
inline T width_of (const bbox_t< T >& x) { return x.arr [2] - x.arr [0]; }

template< typename T >
inline T height_of (const bbox_t< T >& x) { return x.arr [3] - x.arr [1]; }

template< typename T >
inline T area_of (const bbox_t< T >& x) { return width_of (x) * height_of (x); }

template< typename T >
inline point_t< T >
center_of (const bbox_t< T >& x) {
    return { (x.arr [0] + x.arr [2]) / 2, (x.arr [1] + x.arr [3]) / 2 };
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
inline T
vertical_overlap (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    const auto dist =
        (std::min) (lhs.arr [3], rhs.arr [3]) -
        (std::max) (lhs.arr [1], rhs.arr [1]);
    return dist > 0 ? dist : 0;
}

template< typename T >
inline bool
overlapping (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    return horizontal_overlap (lhs, rhs) && vertical_overlap (lhs, rhs);
}

template< typename T >
inline T
horizontal_distance (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    return lhs.arr [2] < rhs.arr [0]
        ? rhs.arr [0] - lhs.arr [2]
        : rhs.arr [2] < lhs.arr [0] ? lhs.arr [0] - rhs.arr [2] : 0;
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

//
// Intersection over union, the usual measure of how much two detections of
// the same region agree:
//
template< typename T >
inline double
iou (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    const double common =
        double (horizontal_overlap (lhs, rhs)) * vertical_overlap (lhs, rhs);

    const double total = double (area_of (lhs)) + area_of (rhs) - common;
    return total > 0 ? common / total : 0;
}

//
// In the definition of the specialization `x' stands for the rotated box, and
// `X' stands for the `superbox', i.e., the upright page that will host the
// box. E.g., a box on a page turned by 90° has its new x_min at the width of
// the upright page less the former y_max, and its new y_min at the former
// x_min:
//
template< textflow::rotation_t, typename >
struct unrotate_t;

template< typename T >
struct unrotate_t< textflow::rotation_t::none, T > {
    using box_type = bbox_t< T >;
    box_type operator() (const box_type& x, const box_type&) const {
        return x;
    }
};

#define TEXTFLOW_UNROTATE_DEF(type, a, b, c, d)                         \
template< typename T >                                                  \
struct unrotate_t< textflow::rotation_t::type, T > {                    \
    using box_type = bbox_t< T >;                                       \
    box_type operator() (const box_type& x, const box_type& X) const {  \
        const auto& [ x0, y0, x1, y1 ] = x.arr;                         \
        const auto& [ X0, Y0, X1, Y1 ] = X.arr;                         \
        return { a, b, c, d };                                          \
    }                                                                   \
}

TEXTFLOW_UNROTATE_DEF (       quarter_turn, X1 - y1,      x0, X1 - y0,      x1);
TEXTFLOW_UNROTATE_DEF (          half_turn, X1 - x1, Y1 - y1, X1 - x0, Y1 - y0);
TEXTFLOW_UNROTATE_DEF (three_quarters_turn,      y0, Y1 - x1,      y1, Y1 - x0);

#undef TEXTFLOW_UNROTATE_DEF

} // namespace detail

////////////////////////////////////////////////////////////////////////

//
// The default bounding box type is the floating point specialization for
// double:
//
using bbox_t  = detail::bbox_t< double >;
using point_t = detail::point_t< double >;

////////////////////////////////////////////////////////////////////////

template< rotation_t rotation, typename T >
inline detail::bbox_t< T >
unrotate (const detail::bbox_t< T >& box, const detail::bbox_t< T >& superbox) {
    //
    // Rotation around origin followed by a translation, brings the box
    // `upright'; the superbox is the upright page:
    //
    return detail::unrotate_t< rotation, T > ()(box, superbox);
}

//
// Maps a page /Rotate-style angle in degrees to a rotation, if the angle is a
// multiple of a quarter turn:
//
inline std::optional< rotation_t >
rotation_from (int degrees) {
    switch (((degrees % 360) + 360) % 360) {
    case   0: return rotation_t::none;
    case  90: return rotation_t::quarter_turn;
    case 180: return rotation_t::half_turn;
    case 270: return rotation_t::three_quarters_turn;
    default:
        return { };
    }
}

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_BBOX_HH
