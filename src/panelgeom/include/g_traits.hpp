/**
 * Distributed under the terms of the BSD 3-Clause License.
 *
 * The full license is in the file LICENSE, distributed with this software.
 *
 * Author: Jun Zhu <jun.zhu@xfel.eu>
 * Copyright (C) European X-Ray Free-Electron Laser Facility GmbH.
 * All rights reserved.
 */

#ifndef PANELGEOM_TRAITS_H
#define PANELGEOM_TRAITS_H

#include <cmath>
#include <limits>
#include <type_traits>

#include "xtensor/xtensor.hpp"
#include "xtensor/xarray.hpp"


namespace pgeom
{

/**
 * Dense N-dimensional containers accepted as detector data, i.e. with a
 * run-time shape and row-major storage.
 */
template<typename T>
struct IsDenseArray : std::false_type {};

template<typename T, xt::layout_type L>
struct IsDenseArray<xt::xarray<T, L>> : std::true_type {};

template<typename T, std::size_t N, xt::layout_type L>
struct IsDenseArray<xt::xtensor<T, N, L>> : std::true_type {};

template<typename E, template<typename> class C>
using EnableIf = std::enable_if_t<C<E>::value, bool>;

/**
 * Value written to the pixels of an assembled image which are not covered
 * by any tile: NaN for floating point data and zero otherwise.
 */
template<typename T, typename = void>
struct NoData
{
  static constexpr T value() { return T{}; }
};

template<typename T>
struct NoData<T, std::enable_if_t<std::is_floating_point<T>::value>>
{
  static constexpr T value() { return std::numeric_limits<T>::quiet_NaN(); }
};

namespace detail
{

template<typename T>
inline bool isNaN(T v, std::true_type) { return std::isnan(v); }

template<typename T>
inline bool isNaN(T, std::false_type) { return false; }

} // detail

/**
 * Whether v is NaN. Always false for integral types.
 */
template<typename T>
inline bool isNaN(T v) { return detail::isNaN(v, std::is_floating_point<T>{}); }

} // pgeom

#endif //PANELGEOM_TRAITS_H
