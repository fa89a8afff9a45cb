/**
 * Distributed under the terms of the BSD 3-Clause License.
 *
 * The full license is in the file LICENSE, distributed with this software.
 *
 * Author: Jun Zhu <jun.zhu@xfel.eu>
 * Copyright (C) European X-Ray Free-Electron Laser Facility GmbH.
 * All rights reserved.
 */
#ifndef PANELGEOM_GEOMETRY_H
#define PANELGEOM_GEOMETRY_H

#include <cmath>
#include <array>
#include <vector>
#include <string>
#include <memory>
#include <mutex>
#include <sstream>
#include <utility>
#include <algorithm>
#include <type_traits>

#include "xtensor/xarray.hpp"
#include "xtensor/xtensor.hpp"
#include "xtensor/xview.hpp"
#include "xtensor/xfixed.hpp"
#include "xtensor/xmath.hpp"
#include "xtensor/xbuilder.hpp"
#include "xtensor/xstrided_view.hpp"
#include "xtensor-blas/xlinalg.hpp"

#include "g_crystfel.hpp"
#include "g_errors.hpp"
#include "g_fragment.hpp"
#include "g_helpers.hpp"
#include "g_logging.hpp"
#include "g_traits.hpp"
#include "g_utilities.hpp"

namespace pgeom
{

template<typename G>
class DetectorGeometryBase;

/**
 * Assembled image(s) and the (y, x) pixel position of the detector centre
 * in the assembled image(s).
 */
template<typename T>
struct AssembledData
{
  xt::xarray<T> data;
  std::array<int, 2> centre;
};

/**
 * Interpolation used when assembling data with the accurate geometry.
 */
enum class Interpolation
{
  Nearest = 0,
  Linear = 1,
};

/**
 * Parse the name of an interpolation: 'nearest' or 'linear'.
 *
 * @throws InvalidConfiguration for any other name.
 */
inline Interpolation parseInterpolation(const std::string& name)
{
  if (name == "nearest") return Interpolation::Nearest;
  if (name == "linear") return Interpolation::Linear;

  std::stringstream fmt;
  fmt << "Interpolation must be 'nearest' or 'linear', not '" << name << "'";
  throw InvalidConfiguration(fmt.str());
}

/**
 * Detector geometry approximated to align all tiles to a 2D pixel grid.
 *
 * The coordinates used in this class are (y, x), suitable for indexing an
 * array. The constant properties of the detector (number of modules, data
 * shape, the rule for splitting module data into tiles) are read from G.
 */
template<typename G>
class SnappedGeometry
{
public:

  using indexType = std::array<int, 2>;
  using tilesType = std::vector<std::vector<GridGeometryFragment>>;

  /**
   * Snap all the tiles of the given geometry.
   *
   * @throws NonAxisAlignedGeometry if any tile cannot be snapped.
   */
  explicit SnappedGeometry(const DetectorGeometryBase<G>& geom);

  ~SnappedGeometry() = default;

  /**
   * Position all the modules at the correct area of the assembled image(s).
   *
   * @param src: data in modules. shape=(..., modules, ss, fs)
   * @param ignore_tile_edge: true for leaving the pixels at the edges of
   *   tiles at the no-data value.
   *
   * @return: assembled data with shape=(..., y, x) and the centre.
   */
  template<typename E, EnableIf<std::decay_t<E>, IsDenseArray> = false>
  AssembledData<typename std::decay_t<E>::value_type>
  position(E&& src, bool ignore_tile_edge=false) const;

  /**
   * Dismantle assembled image(s) into modules.
   *
   * @param src: assembled data. shape=(..., y, x)
   *
   * @return: data in modules. shape=(..., modules, ss, fs)
   */
  template<typename E, EnableIf<std::decay_t<E>, IsDenseArray> = false>
  xt::xarray<typename std::decay_t<E>::value_type> dismantle(E&& src) const;

  /**
   * Return the shape (y, x) of the assembled image.
   */
  const indexType& assembledShape() const { return a_shape_; }

  /**
   * Return the (y, x) position of the detector centre in the assembled image.
   */
  const indexType& assembledCenter() const { return a_center_; }

  const tilesType& tiles() const { return tiles_; }

private:

  tilesType tiles_;
  indexType a_shape_;
  indexType a_center_;

  void computeAssembledDim();

  void checkOverlaps() const;
};

/**
 * Base class for the geometry of detectors which consist of a fixed number of
 * modules, with each module consisting of a fixed number of tiles.
 *
 * The coordinates used in this class are 3D (x, y, z), and represent
 * multiples of the pixel size.
 *
 * G must provide:
 *   n_quads, n_modules, n_tiles_per_module: static constexpr int
 *   module_ss, module_fs: shape of the data of a module
 *   tile_ss, tile_fs: shape of the data of a tile
 *   static double pixelSize(): pixel size in metres
 *   static std::array<int, 2> tileOrigin(int tile): (ss, fs) index of the
 *     first pixel of the tile in the module data
 *   static const char* detectorName()
 */
template<typename G>
class DetectorGeometryBase
{
public:

  using vectorType = GeometryFragment::vectorType;
  using moduleType = std::vector<GeometryFragment>;
  using modulesType = std::vector<moduleType>;
  using shapeType = std::array<int, 2>;

  DetectorGeometryBase(const DetectorGeometryBase& other);

  DetectorGeometryBase& operator=(const DetectorGeometryBase&) = delete;

  ~DetectorGeometryBase() = default;

  /**
   * Load the geometry from a CrystFEL geometry file.
   *
   * Panels must be named p{module}a{tile}.
   *
   * @throws GeometryFileError
   */
  static G fromCrystfelGeom(const std::string& filename);

  /**
   * Write the geometry to a CrystFEL geometry file.
   *
   * @throws GeometryFileError
   */
  void writeCrystfelGeom(const std::string& filename);

  const modulesType& modules() const { return modules_; }

  const GeometryFragment& tile(int module, int tile) const { return modules_[module][tile]; }

  /**
   * Return the name of the file this geometry was loaded from or written to.
   */
  const std::string& filename() const { return filename_; }

  /**
   * Return the geometry snapped to the pixel grid.
   *
   * It is computed on the first call and cached.
   *
   * @throws NonAxisAlignedGeometry if any tile cannot be snapped. The cache
   *   stays empty in this case.
   */
  const SnappedGeometry<G>& snapped() const;

  /**
   * Assemble data from this detector according to where the pixels are.
   *
   * This approximates the geometry to align all pixels to a 2D grid. It is
   * less accurate than positionModulesInterpolate, but much faster.
   *
   * @param src: data in modules. shape=(..., modules, ss, fs)
   * @param ignore_tile_edge: true for ignoring the pixels at the edges of tiles.
   */
  template<typename E, EnableIf<std::decay_t<E>, IsDenseArray> = false>
  AssembledData<typename std::decay_t<E>::value_type>
  positionModulesFast(E&& src, bool ignore_tile_edge=false) const
  {
    return snapped().position(std::forward<E>(src), ignore_tile_edge);
  }

  /**
   * Deprecated alias for positionModulesFast.
   */
  template<typename E, EnableIf<std::decay_t<E>, IsDenseArray> = false>
  AssembledData<typename std::decay_t<E>::value_type>
  positionAllModules(E&& src, bool ignore_tile_edge=false) const
  {
    return positionModulesFast(std::forward<E>(src), ignore_tile_edge);
  }

  /**
   * Dismantle data assembled by positionModulesFast into modules.
   *
   * @param src: assembled data. shape=(..., y, x)
   */
  template<typename E, EnableIf<std::decay_t<E>, IsDenseArray> = false>
  xt::xarray<typename std::decay_t<E>::value_type> dismantleAllModules(E&& src) const
  {
    return snapped().dismantle(std::forward<E>(src));
  }

  /**
   * Assemble data from this detector according to where the pixels are.
   *
   * Each tile is resampled through the inverse of its affine transformation,
   * which is slow but does not require the tiles to be aligned with the axes.
   * Where tiles overlap, the larger value is taken.
   *
   * @param src: data in modules. shape=(..., modules, ss, fs)
   * @param interp: interpolation between neighbouring pixels of a tile.
   */
  template<typename E, EnableIf<std::decay_t<E>, IsDenseArray> = false>
  AssembledData<typename std::decay_t<E>::value_type>
  positionModulesInterpolate(E&& src, Interpolation interp=Interpolation::Linear) const;

  /**
   * Return the shape (y, x) and the centre (y, x) of the image assembled by
   * positionModulesInterpolate.
   */
  std::pair<shapeType, shapeType> interpolatedDimensions() const;

  /**
   * Return the distortion array for this detector, suitable for pyFAI.
   *
   * shape=(modules * module_ss, module_fs, 4, 3), where 4 is the number of
   * corners of a pixel and the last dimension is the (z, y, x) position of
   * each corner in metres.
   */
  xt::xtensor<float, 4> toDistortionArray() const;

protected:

  modulesType modules_;
  std::string filename_;

  explicit DetectorGeometryBase(modulesType modules, std::string filename="No file");

private:

  mutable std::once_flag snap_flag_;
  mutable std::unique_ptr<SnappedGeometry<G>> snapped_;

  template<typename M, typename N>
  void interpolateTile(M&& src, N& dst, xt::xtensor<bool, 2>& covered, int& n_overlaps,
                       const GeometryFragment& tile, const shapeType& origin,
                       const shapeType& centre, Interpolation interp) const;
};

/* ------------------------------------------------------------------------
 * SnappedGeometry
 * ------------------------------------------------------------------------ */

template<typename G>
SnappedGeometry<G>::SnappedGeometry(const DetectorGeometryBase<G>& geom)
{
  for (const auto& module : geom.modules())
  {
    std::vector<GridGeometryFragment> snapped_tiles;
    for (const auto& tile : module) snapped_tiles.push_back(tile.snap());
    tiles_.push_back(std::move(snapped_tiles));
  }

  computeAssembledDim();
  checkOverlaps();
}

template<typename G>
void SnappedGeometry<G>::computeAssembledDim()
{
  indexType min_yx = tiles_[0][0].cornerIdx();
  indexType max_yx = tiles_[0][0].oppCornerIdx();
  for (const auto& module : tiles_)
  {
    for (const auto& tile : module)
    {
      for (int i = 0; i < 2; ++i)
      {
        min_yx[i] = std::min(min_yx[i], tile.cornerIdx()[i]);
        max_yx[i] = std::max(max_yx[i], tile.oppCornerIdx()[i]);
      }
    }
  }

  a_shape_ = {max_yx[0] - min_yx[0], max_yx[1] - min_yx[1]};
  a_center_ = {-min_yx[0], -min_yx[1]};
}

template<typename G>
void SnappedGeometry<G>::checkOverlaps() const
{
  std::vector<std::array<int, 4>> rects;
  for (const auto& module : tiles_)
  {
    for (const auto& tile : module)
    {
      rects.push_back({tile.cornerIdx()[0], tile.cornerIdx()[1], tile.pixelDims()[0], tile.pixelDims()[1]});
    }
  }

  int n_overlaps = 0;
  for (size_t i = 0; i < rects.size(); ++i)
  {
    for (size_t j = i + 1; j < rects.size(); ++j)
    {
      if (overlap(rects[i], rects[j])) ++n_overlaps;
    }
  }

  if (n_overlaps > 0)
  {
    logger()->warn("{} pairs of tiles overlap in the snapped {} geometry", n_overlaps, G::detectorName());
  }
}

template<typename G>
template<typename E, EnableIf<std::decay_t<E>, IsDenseArray>>
AssembledData<typename std::decay_t<E>::value_type>
SnappedGeometry<G>::position(E&& src, bool ignore_tile_edge) const
{
  using value_type = typename std::decay_t<E>::value_type;

  auto ss = src.shape();
  utils::checkTrailingShape(ss,
    std::array<size_t, 3>({static_cast<size_t>(G::n_modules),
                           static_cast<size_t>(G::module_ss),
                           static_cast<size_t>(G::module_fs)}),
    "Modules data has an unexpected shape");

  auto leading = utils::leadingShape(ss, 3);
  size_t n_pulses = utils::nFrames(leading);
  size_t n_modules = G::n_modules;
  size_t n_tiles = G::n_tiles_per_module;

  std::vector<size_t> out_shape(leading);
  out_shape.push_back(static_cast<size_t>(a_shape_[0]));
  out_shape.push_back(static_cast<size_t>(a_shape_[1]));
  auto out = xt::xarray<value_type>::from_shape(out_shape);
  out.fill(NoData<value_type>::value());

  auto src_frames = xt::reshape_view(src, std::vector<size_t>(
    {n_pulses, n_modules, static_cast<size_t>(G::module_ss), static_cast<size_t>(G::module_fs)}));
  auto dst_frames = xt::reshape_view(out, std::vector<size_t>(
    {n_pulses, static_cast<size_t>(a_shape_[0]), static_cast<size_t>(a_shape_[1])}));

  logger()->debug("Assembling {} frame(s) of {} into ({}, {})",
                  n_pulses, G::detectorName(), a_shape_[0], a_shape_[1]);

  utils::applyFunctor2d(std::array<size_t, 2>({n_modules, n_pulses}),
    [&src_frames, &dst_frames, n_tiles, ignore_tile_edge, this] (size_t im, size_t ip)
    {
      auto&& src_view = xt::view(src_frames, ip, im, xt::all(), xt::all());
      auto&& dst_view = xt::view(dst_frames, ip, xt::all(), xt::all());
      for (size_t it = 0; it < n_tiles; ++it)
      {
        tiles_[im][it].position(src_view, dst_view, G::tileOrigin(static_cast<int>(it)), a_center_,
                                ignore_tile_edge);
      }
    }
  );

  return {std::move(out), a_center_};
}

template<typename G>
template<typename E, EnableIf<std::decay_t<E>, IsDenseArray>>
xt::xarray<typename std::decay_t<E>::value_type> SnappedGeometry<G>::dismantle(E&& src) const
{
  using value_type = typename std::decay_t<E>::value_type;

  auto ss = src.shape();
  utils::checkTrailingShape(ss,
    std::array<size_t, 2>({static_cast<size_t>(a_shape_[0]), static_cast<size_t>(a_shape_[1])}),
    "Assembled data has an unexpected shape");

  auto leading = utils::leadingShape(ss, 2);
  size_t n_pulses = utils::nFrames(leading);
  size_t n_modules = G::n_modules;
  size_t n_tiles = G::n_tiles_per_module;

  std::vector<size_t> out_shape(leading);
  out_shape.push_back(n_modules);
  out_shape.push_back(static_cast<size_t>(G::module_ss));
  out_shape.push_back(static_cast<size_t>(G::module_fs));
  auto out = xt::xarray<value_type>::from_shape(out_shape);
  out.fill(NoData<value_type>::value());

  auto src_frames = xt::reshape_view(src, std::vector<size_t>(
    {n_pulses, static_cast<size_t>(a_shape_[0]), static_cast<size_t>(a_shape_[1])}));
  auto dst_frames = xt::reshape_view(out, std::vector<size_t>(
    {n_pulses, n_modules, static_cast<size_t>(G::module_ss), static_cast<size_t>(G::module_fs)}));

  utils::applyFunctor2d(std::array<size_t, 2>({n_modules, n_pulses}),
    [&src_frames, &dst_frames, n_tiles, this] (size_t im, size_t ip)
    {
      auto&& src_view = xt::view(src_frames, ip, xt::all(), xt::all());
      auto&& dst_view = xt::view(dst_frames, ip, im, xt::all(), xt::all());
      for (size_t it = 0; it < n_tiles; ++it)
      {
        tiles_[im][it].dismantle(src_view, dst_view, G::tileOrigin(static_cast<int>(it)), a_center_);
      }
    }
  );

  return out;
}

/* ------------------------------------------------------------------------
 * DetectorGeometryBase
 * ------------------------------------------------------------------------ */

template<typename G>
DetectorGeometryBase<G>::DetectorGeometryBase(modulesType modules, std::string filename)
  : modules_(std::move(modules)), filename_(std::move(filename))
{
  bool valid = static_cast<int>(modules_.size()) == G::n_modules;
  for (const auto& module : modules_)
  {
    if (static_cast<int>(module.size()) != G::n_tiles_per_module) valid = false;
  }

  if (not valid)
  {
    std::stringstream fmt;
    fmt << G::detectorName() << " geometry requires " << G::n_modules << " modules with "
        << G::n_tiles_per_module << " tiles each!";
    throw InvalidConfiguration(fmt.str());
  }
}

template<typename G>
DetectorGeometryBase<G>::DetectorGeometryBase(const DetectorGeometryBase& other)
  : modules_(other.modules_), filename_(other.filename_)
{
}

template<typename G>
const SnappedGeometry<G>& DetectorGeometryBase<G>::snapped() const
{
  std::call_once(snap_flag_, [this] ()
  {
    snapped_ = std::make_unique<SnappedGeometry<G>>(*this);
    auto& s = snapped_->assembledShape();
    logger()->debug("Snapped {} geometry: assembled shape ({}, {})", G::detectorName(), s[0], s[1]);
  });
  return *snapped_;
}

template<typename G>
G DetectorGeometryBase<G>::fromCrystfelGeom(const std::string& filename)
{
  auto geom_dict = loadCrystfelGeometry(filename);

  modulesType modules;
  for (int p = 0; p < G::n_modules; ++p)
  {
    moduleType tiles;
    for (int a = 0; a < G::n_tiles_per_module; ++a)
    {
      std::stringstream name;
      name << "p" << p << "a" << a;
      auto it = geom_dict.panels.find(name.str());
      if (it == geom_dict.panels.end())
      {
        std::stringstream fmt;
        fmt << filename << ": panel '" << name.str() << "' not found";
        throw GeometryFileError(fmt.str());
      }

      auto fragment = GeometryFragment::fromPanel(it->second);
      if (fragment.ssPixels() != G::tile_ss || fragment.fsPixels() != G::tile_fs)
      {
        std::stringstream fmt;
        fmt << filename << ": panel '" << name.str() << "' has (" << fragment.ssPixels() << ", "
            << fragment.fsPixels() << ") pixels, expected (" << G::tile_ss << ", " << G::tile_fs << ")";
        throw GeometryFileError(fmt.str());
      }
      tiles.push_back(fragment);
    }
    modules.push_back(std::move(tiles));
  }

  return G(std::move(modules), filename);
}

template<typename G>
void DetectorGeometryBase<G>::writeCrystfelGeom(const std::string& filename)
{
  std::vector<CrystfelPanel> panels;
  for (int p = 0; p < G::n_modules; ++p)
  {
    for (int a = 0; a < G::n_tiles_per_module; ++a)
    {
      const auto& fragment = modules_[p][a];
      auto origin = G::tileOrigin(a);

      CrystfelPanel panel;
      std::stringstream name;
      name << "p" << p << "a" << a;
      panel.name = name.str();
      panel.module = p;
      panel.corner_x = fragment.cornerPos()(0);
      panel.corner_y = fragment.cornerPos()(1);
      panel.coffset = fragment.cornerPos()(2);
      panel.ss = {fragment.ssVec()(0), fragment.ssVec()(1), fragment.ssVec()(2)};
      panel.fs = {fragment.fsVec()(0), fragment.fsVec()(1), fragment.fsVec()(2)};
      panel.min_ss = origin[0];
      panel.max_ss = origin[0] + fragment.ssPixels() - 1;
      panel.min_fs = origin[1];
      panel.max_fs = origin[1] + fragment.fsPixels() - 1;
      panels.push_back(panel);
    }
  }

  CrystfelHeader header {G::detectorName(), G::pixelSize(), G::n_quads, G::n_modules, G::n_tiles_per_module};
  writeCrystfelGeometry(filename, header, panels);

  if (filename_ == "No file") filename_ = filename;
}

template<typename G>
std::pair<typename DetectorGeometryBase<G>::shapeType, typename DetectorGeometryBase<G>::shapeType>
DetectorGeometryBase<G>::interpolatedDimensions() const
{
  double min_x = modules_[0][0].cornerPos()(0);
  double min_y = modules_[0][0].cornerPos()(1);
  double max_x = min_x;
  double max_y = min_y;
  for (const auto& module : modules_)
  {
    for (const auto& tile : module)
    {
      auto corners = tile.corners();
      for (int i = 0; i < 4; ++i)
      {
        min_x = std::min(min_x, corners(i, 0));
        min_y = std::min(min_y, corners(i, 1));
        max_x = std::max(max_x, corners(i, 0));
        max_y = std::max(max_y, corners(i, 1));
      }
    }
  }

  // Truncate towards zero and add a margin of one pixel for rounding errors.
  int min_ix = static_cast<int>(min_x) - 1;
  int min_iy = static_cast<int>(min_y) - 1;
  int max_ix = static_cast<int>(max_x) + 1;
  int max_iy = static_cast<int>(max_y) + 1;

  return {{max_iy - min_iy, max_ix - min_ix}, {-min_iy, -min_ix}};
}

template<typename G>
template<typename E, EnableIf<std::decay_t<E>, IsDenseArray>>
AssembledData<typename std::decay_t<E>::value_type>
DetectorGeometryBase<G>::positionModulesInterpolate(E&& src, Interpolation interp) const
{
  using value_type = typename std::decay_t<E>::value_type;

  auto ss = src.shape();
  utils::checkTrailingShape(ss,
    std::array<size_t, 3>({static_cast<size_t>(G::n_modules),
                           static_cast<size_t>(G::module_ss),
                           static_cast<size_t>(G::module_fs)}),
    "Modules data has an unexpected shape");

  auto dims = interpolatedDimensions();
  const auto& a_shape = dims.first;
  const auto& a_center = dims.second;

  auto leading = utils::leadingShape(ss, 3);
  size_t n_pulses = utils::nFrames(leading);

  std::vector<size_t> out_shape(leading);
  out_shape.push_back(static_cast<size_t>(a_shape[0]));
  out_shape.push_back(static_cast<size_t>(a_shape[1]));
  auto out = xt::xarray<value_type>::from_shape(out_shape);
  out.fill(NoData<value_type>::value());

  auto src_frames = xt::reshape_view(src, std::vector<size_t>(
    {n_pulses, static_cast<size_t>(G::n_modules),
     static_cast<size_t>(G::module_ss), static_cast<size_t>(G::module_fs)}));
  auto dst_frames = xt::reshape_view(out, std::vector<size_t>(
    {n_pulses, static_cast<size_t>(a_shape[0]), static_cast<size_t>(a_shape[1])}));

  // Overlapping tiles are reported from the coverage of the first frame.
  std::vector<int> n_overlaps(n_pulses, 0);

  utils::applyFunctor2d(std::array<size_t, 2>({n_pulses, 1}),
    [&, this] (size_t ip, size_t)
    {
      auto&& dst_view = xt::view(dst_frames, ip, xt::all(), xt::all());
      xt::xtensor<bool, 2> covered = xt::zeros<bool>(
        {static_cast<size_t>(a_shape[0]), static_cast<size_t>(a_shape[1])});
      for (int im = 0; im < G::n_modules; ++im)
      {
        auto&& src_view = xt::view(src_frames, ip, im, xt::all(), xt::all());
        for (int it = 0; it < G::n_tiles_per_module; ++it)
        {
          interpolateTile(src_view, dst_view, covered, n_overlaps[ip],
                          modules_[im][it], G::tileOrigin(it), a_center, interp);
        }
      }
    }
  );

  if (n_pulses > 0 && n_overlaps[0] > 0)
  {
    logger()->warn("{} pixels are covered by more than one tile in the {} geometry; the larger value is taken",
                   n_overlaps[0], G::detectorName());
  }

  return {std::move(out), a_center};
}

template<typename G>
template<typename M, typename N>
void DetectorGeometryBase<G>::interpolateTile(M&& src, N& dst, xt::xtensor<bool, 2>& covered, int& n_overlaps,
                                              const GeometryFragment& tile, const shapeType& origin,
                                              const shapeType& centre, Interpolation interp) const
{
  using value_type = std::decay_t<decltype(dst(0, 0))>;

  // Rotation matrix from the tile (ss, fs) to the assembled image (y, x).
  xt::xtensor<double, 2> rotn {{tile.ssVec()(1), tile.fsVec()(1)},
                               {tile.ssVec()(0), tile.fsVec()(0)}};
  double det = rotn(0, 0) * rotn(1, 1) - rotn(0, 1) * rotn(1, 0);
  if (std::abs(det) < 1e-9)
  {
    std::stringstream fmt;
    fmt << "Tile has parallel ss and fs vectors: ss_vec = (" << tile.ssVec()(0) << ", " << tile.ssVec()(1)
        << "), fs_vec = (" << tile.fsVec()(0) << ", " << tile.fsVec()(1) << ")";
    throw InvalidConfiguration(fmt.str());
  }

  // The affine transformation maps the output (y, x) to the input (ss, fs).
  // Pixel centres are at half-integer positions in both frames:
  //   in + 0.5 = inv(rotn) * (out + 0.5 - corner)
  xt::xtensor<double, 2> transform = xt::linalg::inv(rotn);
  xt::xtensor<double, 1> corner {tile.cornerPos()(1) + centre[0],
                                 tile.cornerPos()(0) + centre[1]};
  xt::xtensor<double, 1> shifted = 0.5 - corner;
  xt::xtensor<double, 1> offset = xt::linalg::dot(transform, shifted) - 0.5;

  auto corners = tile.corners();
  double min_y = xt::amin(xt::view(corners, xt::all(), 1))() + centre[0];
  double max_y = xt::amax(xt::view(corners, xt::all(), 1))() + centre[0];
  double min_x = xt::amin(xt::view(corners, xt::all(), 0))() + centre[1];
  double max_x = xt::amax(xt::view(corners, xt::all(), 0))() + centre[1];

  int iy0 = std::max(0, static_cast<int>(std::floor(min_y)) - 1);
  int iy1 = std::min(static_cast<int>(covered.shape()[0]), static_cast<int>(std::ceil(max_y)) + 1);
  int ix0 = std::max(0, static_cast<int>(std::floor(min_x)) - 1);
  int ix1 = std::min(static_cast<int>(covered.shape()[1]), static_cast<int>(std::ceil(max_x)) + 1);

  int n_ss = tile.ssPixels();
  int n_fs = tile.fsPixels();
  auto at = [&src, &origin] (int i, int j) { return static_cast<double>(src(origin[0] + i, origin[1] + j)); };

  for (int iy = iy0; iy < iy1; ++iy)
  {
    for (int ix = ix0; ix < ix1; ++ix)
    {
      double u = transform(0, 0) * iy + transform(0, 1) * ix + offset(0);
      double v = transform(1, 0) * iy + transform(1, 1) * ix + offset(1);
      if (u < -0.5 || u >= n_ss - 0.5 || v < -0.5 || v >= n_fs - 0.5) continue;

      double sample;
      if (interp == Interpolation::Nearest)
      {
        // pixel k covers [k - 0.5, k + 0.5), so halves are rounded up
        int i = std::min(std::max(static_cast<int>(std::floor(u + 0.5)), 0), n_ss - 1);
        int j = std::min(std::max(static_cast<int>(std::floor(v + 0.5)), 0), n_fs - 1);
        sample = at(i, j);
      } else
      {
        int i0 = static_cast<int>(std::floor(u));
        int j0 = static_cast<int>(std::floor(v));
        double fu = u - i0;
        double fv = v - j0;
        int i1 = std::min(i0 + 1, n_ss - 1);
        int j1 = std::min(j0 + 1, n_fs - 1);
        i0 = std::max(i0, 0);
        j0 = std::max(j0, 0);
        // neighbours with zero weight are skipped so that a NaN next to an
        // exactly hit pixel does not propagate
        sample = 0.;
        for (int di = 0; di < 2; ++di)
        {
          for (int dj = 0; dj < 2; ++dj)
          {
            double w = (di ? fu : 1 - fu) * (dj ? fv : 1 - fv);
            if (w > 0.) sample += w * at(di ? i1 : i0, dj ? j1 : j0);
          }
        }
      }

      // NaN pixels do not cover the output, as with numpy.nanmax
      if (isNaN(sample)) continue;

      value_type value = std::is_floating_point<value_type>::value
                         ? static_cast<value_type>(sample)
                         : static_cast<value_type>(std::round(sample));

      if (covered(iy, ix))
      {
        ++n_overlaps;
        if (value > dst(iy, ix)) dst(iy, ix) = value;
      } else
      {
        dst(iy, ix) = value;
        covered(iy, ix) = true;
      }
    }
  }
}

template<typename G>
xt::xtensor<float, 4> DetectorGeometryBase<G>::toDistortionArray() const
{
  // Only geometries which can be aligned with the pixel grid are supported.
  snapped();

  double px = G::pixelSize();
  xt::xtensor<float, 4> distortion = xt::zeros<float>(
    {static_cast<size_t>(G::n_modules * G::module_ss), static_cast<size_t>(G::module_fs),
     static_cast<size_t>(4), static_cast<size_t>(3)});

  xt::xtensor<double, 1> corner_ss_offsets {-.5, .5, .5, -.5};
  xt::xtensor<double, 1> corner_fs_offsets {-.5, -.5, .5, .5};

  for (int m = 0; m < G::n_modules; ++m)
  {
    for (int t = 0; t < G::n_tiles_per_module; ++t)
    {
      const auto& tile = modules_[m][t];
      auto origin = G::tileOrigin(t);
      int n_ss = tile.ssPixels();
      int n_fs = tile.fsPixels();

      // shape (ss, fs, corners) by broadcasting
      auto ss_index = xt::view(xt::arange<double>(n_ss), xt::all(), xt::newaxis(), xt::newaxis())
                      + xt::view(corner_ss_offsets, xt::newaxis(), xt::newaxis(), xt::all());
      auto fs_index = xt::view(xt::arange<double>(n_fs), xt::newaxis(), xt::all(), xt::newaxis())
                      + xt::view(corner_fs_offsets, xt::newaxis(), xt::newaxis(), xt::all());

      int row0 = m * G::module_ss + origin[0];
      auto rows = xt::range(row0, row0 + n_ss);
      auto cols = xt::range(origin[1], origin[1] + n_fs);
      for (int k = 0; k < 3; ++k)
      {
        double c = tile.cornerPos()(k) * px;
        double ss_unit = tile.ssVec()(k) * px;
        double fs_unit = tile.fsVec()(k) * px;
        // last dimension is (z, y, x)
        xt::view(distortion, rows, cols, xt::all(), 2 - k) = xt::cast<float>(c + ss_index * ss_unit + fs_index * fs_unit);
      }
    }
  }

  // Shift the x & y origin from the centre to the corner
  for (int k = 1; k < 3; ++k)
  {
    auto&& coord = xt::view(distortion, xt::all(), xt::all(), xt::all(), k);
    float min_v = xt::amin(coord)();
    coord -= min_v;
  }

  return distortion;
}

} // pgeom

#endif //PANELGEOM_GEOMETRY_H
