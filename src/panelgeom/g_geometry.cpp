/**
 * Distributed under the terms of the BSD 3-Clause License.
 *
 * The full license is in the file LICENSE, distributed with this software.
 *
 * Author: Jun Zhu <jun.zhu@xfel.eu>
 * Copyright (C) European X-Ray Free-Electron Laser Facility GmbH.
 * All rights reserved.
 */
#include "pybind11/pybind11.h"
#include "pybind11/stl.h"

#include "g_pyconfig.hpp"
#include "g_detectors.hpp"

namespace py = pybind11;


template<typename T>
py::tuple toPython(pgeom::AssembledData<T>&& assembled)
{
  xt::pyarray<T> data = std::move(assembled.data);
  return py::make_tuple(data, assembled.centre);
}

template<typename Geometry>
void declareGeometry(py::module &m, const std::string& detector)
{
  using GeometryBase = pgeom::DetectorGeometryBase<Geometry>;
  const std::string py_class_name = detector + std::string("Geometry");

  py::class_<Geometry> cls(m, py_class_name.c_str());

#define PGEOM_POSITION_MODULES(VALUE_TYPE)                                                              \
  cls.def("position_modules_fast",                                                                      \
    [] (const Geometry& self, const xt::pyarray<VALUE_TYPE>& src, bool ignore_tile_edge)                \
    {                                                                                                   \
      return toPython(self.positionModulesFast(src, ignore_tile_edge));                                 \
    }, py::arg("data").noconvert(), py::arg("ignore_tile_edge") = false);                               \
  cls.def("position_all_modules",                                                                       \
    [] (const Geometry& self, const xt::pyarray<VALUE_TYPE>& src, bool ignore_tile_edge)                \
    {                                                                                                   \
      return toPython(self.positionAllModules(src, ignore_tile_edge));                                  \
    }, py::arg("data").noconvert(), py::arg("ignore_tile_edge") = false);                               \
  cls.def("position_modules_interpolate",                                                               \
    [] (const Geometry& self, const xt::pyarray<VALUE_TYPE>& src, const std::string& order)             \
    {                                                                                                   \
      return toPython(self.positionModulesInterpolate(src, pgeom::parseInterpolation(order)));          \
    }, py::arg("data").noconvert(), py::arg("order") = "linear");                                      \
  cls.def("dismantle_all_modules",                                                                      \
    [] (const Geometry& self, const xt::pyarray<VALUE_TYPE>& src)                                       \
    {                                                                                                   \
      xt::pyarray<VALUE_TYPE> modules = self.dismantleAllModules(src);                                  \
      return modules;                                                                                   \
    }, py::arg("data").noconvert());

  PGEOM_POSITION_MODULES(float)
  PGEOM_POSITION_MODULES(double)
  PGEOM_POSITION_MODULES(uint16_t)
  PGEOM_POSITION_MODULES(bool)

  cls.def_static("from_quad_positions",
                 [] (const pgeom::quadPositionType& quad_pos) { return Geometry::fromQuadPositions(quad_pos); },
                 py::arg("quad_pos"))
    .def_static("from_quad_positions", &Geometry::fromQuadPositions, py::arg("quad_pos"),
                py::arg("asic_gap"), py::arg("panel_gap"))
    .def_static("from_crystfel_geom", &GeometryBase::fromCrystfelGeom, py::arg("filename"))
    .def("write_crystfel_geom", &GeometryBase::writeCrystfelGeom, py::arg("filename"))
    .def("to_distortion_array", [] (const Geometry& self)
    {
      xt::pyarray<float> distortion = self.toDistortionArray();
      return distortion;
    })
    .def("assembled_shape", [] (const Geometry& self) { return self.snapped().assembledShape(); })
    .def_property_readonly("filename", &GeometryBase::filename)
    .def_property_readonly_static("pixel_size", [] (py::object) { return Geometry::pixelSize(); })
    .def_property_readonly_static("n_modules", [] (py::object) { return Geometry::n_modules; })
    .def_property_readonly_static("n_tiles_per_module", [] (py::object) { return Geometry::n_tiles_per_module; })
    .def_property_readonly_static("expected_data_shape", [] (py::object)
    {
      return std::array<int, 3>({Geometry::n_modules, Geometry::module_ss, Geometry::module_fs});
    });
}

PYBIND11_MODULE(panelgeom, m)
{
  xt::import_numpy();

  pgeom::configureLogging();

  m.doc() = "Geometry of multi-module X-ray area detectors.";

  py::register_exception<pgeom::ShapeMismatch>(m, "ShapeMismatch", PyExc_ValueError);
  py::register_exception<pgeom::NonAxisAlignedGeometry>(m, "NonAxisAlignedGeometry", PyExc_ValueError);
  py::register_exception<pgeom::InvalidConfiguration>(m, "InvalidConfiguration", PyExc_ValueError);
  py::register_exception<pgeom::GeometryFileError>(m, "GeometryFileError", PyExc_IOError);

  declareGeometry<pgeom::AGIPD_1MGeometry>(m, "AGIPD_1M");

  declareGeometry<pgeom::LPD_1MGeometry>(m, "LPD_1M");
}
