/**
 * Distributed under the terms of the BSD 3-Clause License.
 *
 * The full license is in the file LICENSE, distributed with this software.
 *
 * Author: Jun Zhu <jun.zhu@xfel.eu>
 * Copyright (C) European X-Ray Free-Electron Laser Facility GmbH.
 * All rights reserved.
 */

#ifndef PANELGEOM_UTILITIES_H
#define PANELGEOM_UTILITIES_H

#include <array>
#include <string>
#include <sstream>
#include <vector>
#include <algorithm>
#include <functional>

#if defined(PGEOM_USE_TBB)
#include "tbb/parallel_for.h"
#include "tbb/blocked_range2d.h"
#endif

#include "g_errors.hpp"


namespace pgeom
{
namespace utils
{

/**
 * Check the trailing dimensions of a shape.
 *
 * @param shape: shape of the data, with any number of leading dimensions.
 * @param expected: expected trailing dimensions.
 * @param header: header for the error message if the shapes are different.
 */
template<typename S1, typename S2>
inline void checkTrailingShape(const S1& shape, const S2& expected, const std::string& header)
{
  bool ok = shape.size() >= expected.size();
  if (ok)
  {
    ok = std::equal(expected.begin(), expected.end(), shape.end() - expected.size(),
                    [] (auto a, auto b) { return static_cast<size_t>(a) == static_cast<size_t>(b); });
  }

  if (not ok)
  {
    std::ostringstream ss;
    ss << header << ": expected (..., ";
    for (size_t i = 0; i < expected.size(); ++i)
    {
      ss << expected[i] << (i + 1 < expected.size() ? ", " : ")");
    }
    ss << ", actual (";
    for (size_t i = 0; i < shape.size(); ++i)
    {
      ss << shape[i] << (i + 1 < shape.size() ? ", " : "");
    }
    ss << ")";
    throw ShapeMismatch(ss.str());
  }
}

/**
 * Return the leading (batch) dimensions of a shape with n_trailing trailing
 * dimensions removed.
 */
template<typename S>
inline std::vector<size_t> leadingShape(const S& shape, size_t n_trailing)
{
  std::vector<size_t> leading;
  for (size_t i = 0; i + n_trailing < shape.size(); ++i) leading.push_back(static_cast<size_t>(shape[i]));
  return leading;
}

/**
 * Number of frames described by the leading dimensions.
 */
inline size_t nFrames(const std::vector<size_t>& leading)
{
  size_t n = 1;
  for (auto v : leading) n *= v;
  return n;
}

template<typename shape_t>
inline void applyFunctor2d(const std::array<shape_t, 2>& shape, std::function<void(size_t, size_t)> functor)
{
#if defined(PGEOM_USE_TBB)
  tbb::parallel_for(tbb::blocked_range2d<size_t>(0, shape[0], 0, shape[1]),
    [&functor] (const tbb::blocked_range2d<size_t> &block) {
      for (size_t i = block.rows().begin(); i != block.rows().end(); ++i) {
        for (size_t j = block.cols().begin(); j != block.cols().end(); ++j) {
#else
      for (size_t i = 0; i < shape[0]; ++i) {
        for (size_t j = 0; j < shape[1]; ++j) {
#endif
          functor(i, j);
        }
      }
#if defined(PGEOM_USE_TBB)
    });
#endif
}

} //utils
} //pgeom

#endif //PANELGEOM_UTILITIES_H
