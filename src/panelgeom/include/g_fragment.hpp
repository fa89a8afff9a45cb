/**
 * Distributed under the terms of the BSD 3-Clause License.
 *
 * The full license is in the file LICENSE, distributed with this software.
 *
 * Author: Jun Zhu <jun.zhu@xfel.eu>
 * Copyright (C) European X-Ray Free-Electron Laser Facility GmbH.
 * All rights reserved.
 */
#ifndef PANELGEOM_FRAGMENT_H
#define PANELGEOM_FRAGMENT_H

#include <array>
#include <utility>

#include "xtensor/xfixed.hpp"

namespace pgeom
{

struct CrystfelPanel;
class GridGeometryFragment;

/**
 * Default tolerance used when snapping the orientation of a tile to the
 * pixel grid. Each in-plane component of the slow-scan and fast-scan vectors
 * must be closer than this to its rounded value.
 */
constexpr double kSnapTolerance = 0.1;

/**
 * Geometry of a single rigid tile.
 *
 * The coordinates are (x, y, z) in the lab frame and in units of the pixel
 * size. The corner position is the position of the first pixel read out,
 * ss_vec and fs_vec are the unit vectors along the slow-scan and fast-scan
 * directions of the tile.
 */
class GeometryFragment
{
public:

  using vectorType = xt::xtensor_fixed<double, xt::xshape<3>>;
  using cornersType = xt::xtensor_fixed<double, xt::xshape<4, 3>>;

  GeometryFragment(const vectorType& corner_pos,
                   const vectorType& ss_vec,
                   const vectorType& fs_vec,
                   int ss_pixels,
                   int fs_pixels);

  ~GeometryFragment() = default;

  /**
   * Construct a fragment from a panel in a CrystFEL geometry file.
   */
  static GeometryFragment fromPanel(const CrystfelPanel& panel);

  const vectorType& cornerPos() const { return corner_pos_; }

  const vectorType& ssVec() const { return ss_vec_; }

  const vectorType& fsVec() const { return fs_vec_; }

  int ssPixels() const { return ss_pixels_; }

  int fsPixels() const { return fs_pixels_; }

  /**
   * Return the four corners of the tile. shape=(4, 3)
   *
   * The order is: first pixel corner, end of the first row along fs, the
   * diagonal corner, end of the first column along ss.
   */
  cornersType corners() const;

  /**
   * Return the centre of the tile.
   */
  vectorType centre() const;

  /**
   * Approximate the tile to the 2D pixel grid.
   *
   * @param tolerance: maximum deviation of any in-plane component of ss_vec
   *   and fs_vec from its rounded value.
   *
   * @throws NonAxisAlignedGeometry if the tile is not aligned with the axes.
   */
  GridGeometryFragment snap(double tolerance = kSnapTolerance) const;

private:

  vectorType corner_pos_;
  vectorType ss_vec_;
  vectorType fs_vec_;
  int ss_pixels_;
  int fs_pixels_;
};

/**
 * Data operator which reproduces the orientation of a tile on the pixel grid:
 * an optional transpose followed by independent flips of the rows and columns.
 */
struct GridTransform
{
  bool transpose = false;
  bool flip_rows = false;
  bool flip_cols = false;

  /**
   * Map the index (i, j) of a pixel in the placed block with shape dims to
   * its (ss, fs) index in the raw tile data.
   */
  std::array<int, 2> rawIndex(int i, int j, const std::array<int, 2>& dims) const
  {
    int si = flip_rows ? dims[0] - 1 - i : i;
    int sj = flip_cols ? dims[1] - 1 - j : j;
    if (transpose) return {sj, si};
    return {si, sj};
  }
};

inline bool operator==(const GridTransform& lhs, const GridTransform& rhs)
{
  return lhs.transpose == rhs.transpose && lhs.flip_rows == rhs.flip_rows && lhs.flip_cols == rhs.flip_cols;
}

/**
 * Geometry of a single tile snapped to the pixel grid.
 *
 * The coordinates are (y, x), i.e. (row, column), suitable for indexing an
 * array. They are not yet shifted by the centre of the assembled image.
 */
class GridGeometryFragment
{
public:

  using indexType = std::array<int, 2>;

  /**
   * @param corner_pos: rounded (y, x) corner position.
   * @param ss_vec: rounded (y, x) slow-scan vector.
   * @param fs_vec: rounded (y, x) fast-scan vector.
   *
   * @throws NonAxisAlignedGeometry if ss_vec and fs_vec are not a permutation
   *   of the unit vectors (with signs).
   */
  GridGeometryFragment(const indexType& corner_pos,
                       const indexType& ss_vec,
                       const indexType& fs_vec,
                       int ss_pixels,
                       int fs_pixels);

  ~GridGeometryFragment() = default;

  /**
   * Index of the corner of the placed block closest to the origin.
   */
  const indexType& cornerIdx() const { return corner_idx_; }

  /**
   * Exclusive index of the opposite corner of the placed block.
   */
  const indexType& oppCornerIdx() const { return opp_corner_idx_; }

  /**
   * Shape (y, x) of the placed block.
   */
  const indexType& pixelDims() const { return pixel_dims_; }

  const GridTransform& transform() const { return transform_; }

  int ssPixels() const { return ss_pixels_; }

  int fsPixels() const { return fs_pixels_; }

  /**
   * Position the tile data at the assembled image.
   *
   * @param src: data of the whole module. shape=(ss, fs)
   * @param dst: assembled image. shape=(y, x)
   * @param origin: (ss, fs) index of the first pixel of the tile in src.
   * @param centre: (y, x) offset of the assembled image.
   * @param ignore_tile_edge: true for leaving the pixels at the edges of the
   *   tile untouched.
   */
  template<typename M, typename N>
  void position(M&& src, N& dst, const indexType& origin, const indexType& centre,
                bool ignore_tile_edge=false) const;

  /**
   * Copy the tile data from the assembled image back to the module data.
   *
   * @param src: assembled image. shape=(y, x)
   * @param dst: data of the whole module. shape=(ss, fs)
   * @param origin: (ss, fs) index of the first pixel of the tile in dst.
   * @param centre: (y, x) offset of the assembled image.
   */
  template<typename M, typename N>
  void dismantle(M&& src, N& dst, const indexType& origin, const indexType& centre) const;

private:

  indexType corner_idx_;
  indexType opp_corner_idx_;
  indexType pixel_dims_;
  GridTransform transform_;
  int ss_pixels_;
  int fs_pixels_;
};

template<typename M, typename N>
void GridGeometryFragment::position(M&& src, N& dst, const indexType& origin, const indexType& centre,
                                    bool ignore_tile_edge) const
{
  int edge = ignore_tile_edge ? 1 : 0;

  int iy0_dst = corner_idx_[0] + centre[0];
  int ix0_dst = corner_idx_[1] + centre[1];
  for (int iy = edge; iy < pixel_dims_[0] - edge; ++iy)
  {
    for (int ix = edge; ix < pixel_dims_[1] - edge; ++ix)
    {
      auto raw = transform_.rawIndex(iy, ix, pixel_dims_);
      dst(iy0_dst + iy, ix0_dst + ix) = src(origin[0] + raw[0], origin[1] + raw[1]);
    }
  }
}

template<typename M, typename N>
void GridGeometryFragment::dismantle(M&& src, N& dst, const indexType& origin, const indexType& centre) const
{
  int iy0 = corner_idx_[0] + centre[0];
  int ix0 = corner_idx_[1] + centre[1];
  for (int iy = 0; iy < pixel_dims_[0]; ++iy)
  {
    for (int ix = 0; ix < pixel_dims_[1]; ++ix)
    {
      auto raw = transform_.rawIndex(iy, ix, pixel_dims_);
      dst(origin[0] + raw[0], origin[1] + raw[1]) = src(iy0 + iy, ix0 + ix);
    }
  }
}

} // pgeom

#endif //PANELGEOM_FRAGMENT_H
