/**
 * Distributed under the terms of the BSD 3-Clause License.
 *
 * The full license is in the file LICENSE, distributed with this software.
 *
 * Author: Jun Zhu <jun.zhu@xfel.eu>
 * Copyright (C) European X-Ray Free-Electron Laser Facility GmbH.
 * All rights reserved.
 */
#ifndef PANELGEOM_ERRORS_H
#define PANELGEOM_ERRORS_H

#include <stdexcept>
#include <string>

namespace pgeom
{

/**
 * Input data does not have the shape required by the detector geometry.
 */
class ShapeMismatch : public std::invalid_argument
{
public:
  explicit ShapeMismatch(const std::string& msg) : std::invalid_argument(msg) {}
};

/**
 * A tile cannot be snapped to the pixel grid because its rounded orientation
 * is not a permutation of the canonical axes.
 */
class NonAxisAlignedGeometry : public std::invalid_argument
{
public:
  explicit NonAxisAlignedGeometry(const std::string& msg) : std::invalid_argument(msg) {}
};

/**
 * Unrecognized option value or invalid construction argument.
 */
class InvalidConfiguration : public std::invalid_argument
{
public:
  explicit InvalidConfiguration(const std::string& msg) : std::invalid_argument(msg) {}
};

/**
 * CrystFEL geometry file cannot be read, parsed or written.
 */
class GeometryFileError : public std::runtime_error
{
public:
  explicit GeometryFileError(const std::string& msg) : std::runtime_error(msg) {}
};

} // pgeom

#endif //PANELGEOM_ERRORS_H
