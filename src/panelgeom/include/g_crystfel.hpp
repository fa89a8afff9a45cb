/**
 * Distributed under the terms of the BSD 3-Clause License.
 *
 * The full license is in the file LICENSE, distributed with this software.
 *
 * Author: Jun Zhu <jun.zhu@xfel.eu>
 * Copyright (C) European X-Ray Free-Electron Laser Facility GmbH.
 * All rights reserved.
 */
#ifndef PANELGEOM_CRYSTFEL_H
#define PANELGEOM_CRYSTFEL_H

#include <array>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace pgeom
{

/**
 * A panel in a CrystFEL geometry file.
 *
 * The position and the vectors are in the lab frame (x, y, z) and in units
 * of the pixel size. The min/max indices locate the panel in the data block
 * of module 'module' (the value of dim1).
 */
struct CrystfelPanel
{
  std::string name;
  int module = 0;
  double corner_x = 0.;
  double corner_y = 0.;
  double coffset = 0.;
  std::array<double, 3> ss {0., 0., 0.};
  std::array<double, 3> fs {0., 0., 0.};
  int min_ss = 0;
  int max_ss = 0;
  int min_fs = 0;
  int max_fs = 0;
};

/**
 * Content of a CrystFEL geometry file which is relevant to the detector
 * layout.
 */
struct CrystfelGeometry
{
  // top-level 'key = value' entries which are not panel defaults
  std::map<std::string, std::string> globals;
  // rigid groups and rigid group collections, by name
  std::map<std::string, std::vector<std::string>> rigid_groups;
  std::map<std::string, std::vector<std::string>> rigid_group_collections;
  std::map<std::string, CrystfelPanel> panels;
};

/**
 * Header information for writing a CrystFEL geometry file.
 */
struct CrystfelHeader
{
  std::string detector_name;
  double pixel_size; // in metres
  int n_quads;
  int n_modules;
  int n_tiles_per_module;
};

/**
 * Parse a CrystFEL vector string like "+1x -0.002y +0.5z".
 *
 * @throws GeometryFileError if the string is malformed.
 */
std::array<double, 3> parseCrystfelVector(const std::string& s);

/**
 * Format a vector in the CrystFEL notation. The z component is written only
 * if it is not zero.
 */
std::string formatCrystfelVector(const std::array<double, 3>& v);

/**
 * Parse CrystFEL geometry from a stream.
 *
 * @param source: name of the source used in error messages.
 *
 * @throws GeometryFileError
 */
CrystfelGeometry parseCrystfelGeometry(std::istream& in, const std::string& source);

/**
 * Load a CrystFEL geometry file.
 *
 * @throws GeometryFileError
 */
CrystfelGeometry loadCrystfelGeometry(const std::string& filename);

/**
 * Write the header and all the panels in the CrystFEL format.
 */
void writeCrystfelGeometry(std::ostream& out, const CrystfelHeader& header,
                           const std::vector<CrystfelPanel>& panels);

/**
 * Write the header and all the panels to a CrystFEL geometry file.
 *
 * @throws GeometryFileError if the file cannot be written.
 */
void writeCrystfelGeometry(const std::string& filename, const CrystfelHeader& header,
                           const std::vector<CrystfelPanel>& panels);

} // pgeom

#endif //PANELGEOM_CRYSTFEL_H
