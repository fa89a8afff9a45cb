/**
 * Distributed under the terms of the BSD 3-Clause License.
 *
 * The full license is in the file LICENSE, distributed with this software.
 *
 * Author: Jun Zhu <jun.zhu@xfel.eu>
 * Copyright (C) European X-Ray Free-Electron Laser Facility GmbH.
 * All rights reserved.
 */
#include "g_detectors.hpp"

namespace pgeom
{

constexpr int AGIPD_1MGeometry::n_quads;
constexpr int AGIPD_1MGeometry::n_modules;
constexpr int AGIPD_1MGeometry::n_tiles_per_module;
constexpr int AGIPD_1MGeometry::module_ss;
constexpr int AGIPD_1MGeometry::module_fs;
constexpr int AGIPD_1MGeometry::tile_ss;
constexpr int AGIPD_1MGeometry::tile_fs;

AGIPD_1MGeometry::AGIPD_1MGeometry(modulesType modules, std::string filename)
  : DetectorGeometryBase<AGIPD_1MGeometry>(std::move(modules), std::move(filename))
{
}

AGIPD_1MGeometry AGIPD_1MGeometry::fromQuadPositions(const quadPositionType& quad_pos,
                                                     double asic_gap, double panel_gap)
{
  static const std::array<int, 4> quad_x_orientations {1, 1, -1, -1};
  static const std::array<int, 4> quad_y_orientations {-1, -1, 1, 1};

  modulesType modules;
  for (int p = 0; p < n_modules; ++p)
  {
    int quad = p / 4;
    double x_orient = quad_x_orientations[quad];
    double y_orient = quad_y_orientations[quad];
    double corner_y = quad_pos[quad][1] - (p % 4) * (tile_fs + panel_gap);

    moduleType tiles;
    for (int a = 0; a < n_tiles_per_module; ++a)
    {
      double corner_x = quad_pos[quad][0] + x_orient * (tile_ss + asic_gap) * a;
      vectorType corner_pos {corner_x, corner_y, 0.};
      vectorType ss_vec {x_orient, 0., 0.};
      vectorType fs_vec {0., y_orient, 0.};
      tiles.push_back(GeometryFragment(corner_pos, ss_vec, fs_vec, tile_ss, tile_fs));
    }
    modules.push_back(std::move(tiles));
  }

  return AGIPD_1MGeometry(std::move(modules));
}

constexpr int LPD_1MGeometry::n_quads;
constexpr int LPD_1MGeometry::n_modules;
constexpr int LPD_1MGeometry::n_tiles_per_module;
constexpr int LPD_1MGeometry::module_ss;
constexpr int LPD_1MGeometry::module_fs;
constexpr int LPD_1MGeometry::tile_ss;
constexpr int LPD_1MGeometry::tile_fs;

LPD_1MGeometry::LPD_1MGeometry(modulesType modules, std::string filename)
  : DetectorGeometryBase<LPD_1MGeometry>(std::move(modules), std::move(filename))
{
}

LPD_1MGeometry LPD_1MGeometry::fromQuadPositions(const quadPositionType& quad_pos,
                                                 double asic_gap, double panel_gap)
{
  static const std::array<int, 4> panels_across {0, 0, 1, 1};
  static const std::array<int, 4> panels_up {0, -1, -1, 0};

  modulesType modules;
  for (int p = 0; p < n_modules; ++p)
  {
    int quad = p / 4;
    int p_in_quad = p % 4;
    double panel_corner_x = quad_pos[quad][0] + panels_across[p_in_quad] * (256 + asic_gap + panel_gap);
    double panel_corner_y = quad_pos[quad][1] + panels_up[p_in_quad] * (256 + 7 * asic_gap + panel_gap);

    moduleType tiles;
    for (int a = 0; a < n_tiles_per_module; ++a)
    {
      int up = a < 8 ? -a : -(15 - a);
      int across = a < 8 ? 0 : 1;

      double corner_x = panel_corner_x + (tile_fs + asic_gap) * across;
      // The first pixel read out is at the bottom left of the tile, whereas
      // the quadrant and panel corners are at the top left.
      double corner_y = panel_corner_y - tile_ss + (tile_ss + asic_gap) * up;

      vectorType corner_pos {corner_x, corner_y, 0.};
      vectorType ss_vec {0., 1., 0.};
      vectorType fs_vec {1., 0., 0.};
      tiles.push_back(GeometryFragment(corner_pos, ss_vec, fs_vec, tile_ss, tile_fs));
    }
    modules.push_back(std::move(tiles));
  }

  return LPD_1MGeometry(std::move(modules));
}

} // pgeom
