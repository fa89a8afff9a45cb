/**
 * Distributed under the terms of the BSD 3-Clause License.
 *
 * The full license is in the file LICENSE, distributed with this software.
 *
 * Author: Jun Zhu <jun.zhu@xfel.eu>
 * Copyright (C) European X-Ray Free-Electron Laser Facility GmbH.
 * All rights reserved.
 */
#include <cmath>
#include <cstdlib>
#include <sstream>

#include "xtensor/xview.hpp"

#include "g_fragment.hpp"
#include "g_crystfel.hpp"
#include "g_errors.hpp"

namespace pgeom
{

namespace
{

// std::nearbyint rounds half to even in the default rounding mode, which is
// the same as numpy.around.
int roundToInt(double v)
{
  return static_cast<int>(std::nearbyint(v));
}

} // namespace

GeometryFragment::GeometryFragment(const vectorType& corner_pos,
                                   const vectorType& ss_vec,
                                   const vectorType& fs_vec,
                                   int ss_pixels,
                                   int fs_pixels)
  : corner_pos_(corner_pos), ss_vec_(ss_vec), fs_vec_(fs_vec), ss_pixels_(ss_pixels), fs_pixels_(fs_pixels)
{
  if (ss_pixels <= 0 || fs_pixels <= 0)
  {
    std::stringstream fmt;
    fmt << "Tile must have a positive number of pixels! Actual: (" << ss_pixels << ", " << fs_pixels << ")";
    throw InvalidConfiguration(fmt.str());
  }
}

GeometryFragment GeometryFragment::fromPanel(const CrystfelPanel& panel)
{
  vectorType corner_pos {panel.corner_x, panel.corner_y, panel.coffset};
  vectorType ss_vec {panel.ss[0], panel.ss[1], panel.ss[2]};
  vectorType fs_vec {panel.fs[0], panel.fs[1], panel.fs[2]};
  return GeometryFragment(corner_pos, ss_vec, fs_vec,
                          panel.max_ss - panel.min_ss + 1,
                          panel.max_fs - panel.min_fs + 1);
}

GeometryFragment::cornersType GeometryFragment::corners() const
{
  vectorType ss_span = ss_vec_ * static_cast<double>(ss_pixels_);
  vectorType fs_span = fs_vec_ * static_cast<double>(fs_pixels_);

  cornersType c;
  xt::view(c, 0, xt::all()) = corner_pos_;
  xt::view(c, 1, xt::all()) = corner_pos_ + fs_span;
  xt::view(c, 2, xt::all()) = corner_pos_ + ss_span + fs_span;
  xt::view(c, 3, xt::all()) = corner_pos_ + ss_span;
  return c;
}

GeometryFragment::vectorType GeometryFragment::centre() const
{
  return corner_pos_ + 0.5 * ss_vec_ * static_cast<double>(ss_pixels_)
                     + 0.5 * fs_vec_ * static_cast<double>(fs_pixels_);
}

GridGeometryFragment GeometryFragment::snap(double tolerance) const
{
  for (int i = 0; i < 2; ++i)
  {
    if (std::abs(ss_vec_(i) - std::nearbyint(ss_vec_(i))) >= tolerance ||
        std::abs(fs_vec_(i) - std::nearbyint(fs_vec_(i))) >= tolerance)
    {
      std::stringstream fmt;
      fmt << "Tile orientation is not aligned with the pixel grid within " << tolerance
          << ": ss_vec = (" << ss_vec_(0) << ", " << ss_vec_(1) << "), "
          << "fs_vec = (" << fs_vec_(0) << ", " << fs_vec_(1) << ")";
      throw NonAxisAlignedGeometry(fmt.str());
    }
  }

  // (x, y) -> (y, x) for indexing arrays
  return GridGeometryFragment({roundToInt(corner_pos_(1)), roundToInt(corner_pos_(0))},
                              {roundToInt(ss_vec_(1)), roundToInt(ss_vec_(0))},
                              {roundToInt(fs_vec_(1)), roundToInt(fs_vec_(0))},
                              ss_pixels_,
                              fs_pixels_);
}

GridGeometryFragment::GridGeometryFragment(const indexType& corner_pos,
                                           const indexType& ss_vec,
                                           const indexType& fs_vec,
                                           int ss_pixels,
                                           int fs_pixels)
  : ss_pixels_(ss_pixels), fs_pixels_(fs_pixels)
{
  auto is_unit = [] (const indexType& v, int axis)
  {
    return std::abs(v[axis]) == 1 && v[1 - axis] == 0;
  };

  if (not ((is_unit(ss_vec, 0) && is_unit(fs_vec, 1)) || (is_unit(ss_vec, 1) && is_unit(fs_vec, 0))))
  {
    std::stringstream fmt;
    fmt << "Rounded tile orientation is not a permutation of the axes: "
        << "ss_vec = (" << ss_vec[0] << ", " << ss_vec[1] << "), "
        << "fs_vec = (" << fs_vec[0] << ", " << fs_vec[1] << ")";
    throw NonAxisAlignedGeometry(fmt.str());
  }

  indexType corner_shift;
  if (fs_vec[0] == 0)
  {
    // flip without transposing
    transform_.transpose = false;
    transform_.flip_rows = ss_vec[0] < 0;
    transform_.flip_cols = fs_vec[1] < 0;
    pixel_dims_ = {ss_pixels, fs_pixels};
  } else
  {
    // transpose and then flip
    transform_.transpose = true;
    transform_.flip_rows = fs_vec[0] < 0;
    transform_.flip_cols = ss_vec[1] < 0;
    pixel_dims_ = {fs_pixels, ss_pixels};
  }
  corner_shift[0] = transform_.flip_rows ? -pixel_dims_[0] : 0;
  corner_shift[1] = transform_.flip_cols ? -pixel_dims_[1] : 0;

  corner_idx_ = {corner_pos[0] + corner_shift[0], corner_pos[1] + corner_shift[1]};
  opp_corner_idx_ = {corner_idx_[0] + pixel_dims_[0], corner_idx_[1] + pixel_dims_[1]};
}

} // pgeom
