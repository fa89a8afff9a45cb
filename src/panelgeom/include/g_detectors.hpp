/**
 * Distributed under the terms of the BSD 3-Clause License.
 *
 * The full license is in the file LICENSE, distributed with this software.
 *
 * Author: Jun Zhu <jun.zhu@xfel.eu>
 * Copyright (C) European X-Ray Free-Electron Laser Facility GmbH.
 * All rights reserved.
 */
#ifndef PANELGEOM_DETECTORS_H
#define PANELGEOM_DETECTORS_H

#include <array>
#include <string>

#include "g_geometry.hpp"

namespace pgeom
{

/**
 * Positions of the four quadrants in pixel units. (x, y)
 */
using quadPositionType = std::array<std::array<double, 2>, 4>;

/**
 * AGIPD-1M geometry.
 *
 * 16 modules, each consisting of 8 tiles of 64 x 128 pixels. The tiles are
 * read out in order along the slow-scan direction of the module data.
 */
class AGIPD_1MGeometry : public DetectorGeometryBase<AGIPD_1MGeometry>
{
public:

  static constexpr int n_quads = 4;
  static constexpr int n_modules = 16;
  static constexpr int n_tiles_per_module = 8; // number of tiles per module
  static constexpr int module_ss = 512;
  static constexpr int module_fs = 128;
  static constexpr int tile_ss = 64;
  static constexpr int tile_fs = 128;

  static double pixelSize() { return 2e-4; }

  static const char* detectorName() { return "AGIPD-1M"; }

  static shapeType tileOrigin(int tile) { return {tile * tile_ss, 0}; }

  explicit AGIPD_1MGeometry(modulesType modules, std::string filename="No file");

  AGIPD_1MGeometry(const AGIPD_1MGeometry& other) = default;

  ~AGIPD_1MGeometry() = default;

  /**
   * Generate an AGIPD-1M geometry from quadrant positions.
   *
   * This produces an idealised geometry, assuming all modules are perfectly
   * flat, aligned and equally spaced within their quadrant.
   *
   * @param quad_pos: positions of the first pixel of the first module in each
   *   quadrant, i.e. modules 0, 4, 8 and 12, in pixel units.
   * @param asic_gap: gap between adjacent tiles in pixel units.
   * @param panel_gap: gap between adjacent modules in pixel units.
   */
  static AGIPD_1MGeometry fromQuadPositions(const quadPositionType& quad_pos,
                                            double asic_gap=2, double panel_gap=29);
};

/**
 * LPD-1M geometry.
 *
 * 16 modules, each consisting of 16 tiles of 32 x 128 pixels. The left half
 * of the module data holds tiles 0 - 7 in reversed order along the slow-scan
 * direction and the right half holds tiles 8 - 15 in order.
 */
class LPD_1MGeometry : public DetectorGeometryBase<LPD_1MGeometry>
{
public:

  static constexpr int n_quads = 4;
  static constexpr int n_modules = 16;
  static constexpr int n_tiles_per_module = 16; // number of tiles per module
  static constexpr int module_ss = 256;
  static constexpr int module_fs = 256;
  static constexpr int tile_ss = 32;
  static constexpr int tile_fs = 128;

  static double pixelSize() { return 5e-4; }

  static const char* detectorName() { return "LPD-1M"; }

  static shapeType tileOrigin(int tile)
  {
    if (tile < 8) return {(7 - tile) * tile_ss, 0};
    return {(tile - 8) * tile_ss, tile_fs};
  }

  explicit LPD_1MGeometry(modulesType modules, std::string filename="No file");

  LPD_1MGeometry(const LPD_1MGeometry& other) = default;

  ~LPD_1MGeometry() = default;

  /**
   * Generate an LPD-1M geometry from quadrant positions.
   *
   * This produces an idealised geometry, assuming all modules are perfectly
   * flat, aligned and equally spaced within their quadrant.
   *
   * @param quad_pos: positions of the corner of each quadrant where module 1,
   *   tile 1 is positioned, in pixel units. This is the top-left corner of
   *   the quadrant looking into the beam, not the first pixel read out.
   * @param asic_gap: gap between adjacent tiles in pixel units.
   * @param panel_gap: gap between adjacent modules in pixel units.
   */
  static LPD_1MGeometry fromQuadPositions(const quadPositionType& quad_pos,
                                          double asic_gap=4, double panel_gap=4);
};

} // pgeom

#endif //PANELGEOM_DETECTORS_H
