/**
 * Distributed under the terms of the BSD 3-Clause License.
 *
 * The full license is in the file LICENSE, distributed with this software.
 *
 * Author: Jun Zhu <jun.zhu@xfel.eu>
 * Copyright (C) European X-Ray Free-Electron Laser Facility GmbH.
 * All rights reserved.
 */
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>

#include "fmt/format.h"
#include "fmt/ranges.h"

#include "g_crystfel.hpp"
#include "g_errors.hpp"
#include "g_logging.hpp"

#ifndef PGEOM_VERSION
#define PGEOM_VERSION "dev"
#endif

namespace pgeom
{

namespace
{

// Panel fields which can be given at the top level as defaults for the
// panels declared afterwards.
const std::set<std::string> panel_fields {
  "corner_x", "corner_y", "coffset", "ss", "fs",
  "min_ss", "max_ss", "min_fs", "max_fs", "dim0", "dim1", "dim2", "dim3"
};

using fieldMap = std::map<std::string, std::string>;

std::string strip(const std::string& s)
{
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

std::vector<std::string> splitList(const std::string& s)
{
  std::vector<std::string> items;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ','))
  {
    item = strip(item);
    if (not item.empty()) items.push_back(item);
  }
  return items;
}

double toDouble(const std::string& s, const std::string& what)
{
  size_t pos = 0;
  double v;
  try
  {
    v = std::stod(s, &pos);
  } catch (const std::logic_error&)
  {
    throw GeometryFileError(fmt::format("{}: cannot convert '{}' to a number", what, s));
  }
  if (pos != s.size())
    throw GeometryFileError(fmt::format("{}: cannot convert '{}' to a number", what, s));
  return v;
}

int toInt(const std::string& s, const std::string& what)
{
  size_t pos = 0;
  int v;
  try
  {
    v = std::stoi(s, &pos);
  } catch (const std::logic_error&)
  {
    throw GeometryFileError(fmt::format("{}: cannot convert '{}' to an integer", what, s));
  }
  if (pos != s.size())
    throw GeometryFileError(fmt::format("{}: cannot convert '{}' to an integer", what, s));
  return v;
}

const std::string& requireField(const fieldMap& fields, const std::string& panel,
                                const std::string& key, const std::string& source)
{
  auto it = fields.find(key);
  if (it == fields.end())
    throw GeometryFileError(fmt::format("{}: panel '{}' has no '{}'", source, panel, key));
  return it->second;
}

CrystfelPanel makePanel(const std::string& name, const fieldMap& fields, const std::string& source)
{
  auto what = [&source, &name] (const std::string& key) { return source + ": " + name + "/" + key; };

  CrystfelPanel panel;
  panel.name = name;
  panel.corner_x = toDouble(requireField(fields, name, "corner_x", source), what("corner_x"));
  panel.corner_y = toDouble(requireField(fields, name, "corner_y", source), what("corner_y"));
  auto it = fields.find("coffset");
  if (it != fields.end()) panel.coffset = toDouble(it->second, what("coffset"));

  try
  {
    panel.ss = parseCrystfelVector(requireField(fields, name, "ss", source));
    panel.fs = parseCrystfelVector(requireField(fields, name, "fs", source));
  } catch (const GeometryFileError& e)
  {
    throw GeometryFileError(fmt::format("{}: panel '{}': {}", source, name, e.what()));
  }

  panel.min_ss = toInt(requireField(fields, name, "min_ss", source), what("min_ss"));
  panel.max_ss = toInt(requireField(fields, name, "max_ss", source), what("max_ss"));
  panel.min_fs = toInt(requireField(fields, name, "min_fs", source), what("min_fs"));
  panel.max_fs = toInt(requireField(fields, name, "max_fs", source), what("max_fs"));
  if (panel.max_ss < panel.min_ss || panel.max_fs < panel.min_fs)
    throw GeometryFileError(fmt::format("{}: panel '{}' has an empty pixel range", source, name));

  // dim1 is the module index in the data array, '%' or 'ss'/'fs' otherwise
  it = fields.find("dim1");
  if (it != fields.end() && not it->second.empty() && std::isdigit(static_cast<unsigned char>(it->second[0])))
    panel.module = toInt(it->second, what("dim1"));

  return panel;
}

} // namespace

std::array<double, 3> parseCrystfelVector(const std::string& s)
{
  std::array<double, 3> v {0., 0., 0.};
  std::string coeff;
  bool any = false;
  for (char c : s)
  {
    if (std::isspace(static_cast<unsigned char>(c))) continue;

    if (c == 'x' || c == 'y' || c == 'z')
    {
      double value;
      if (coeff.empty() || coeff == "+") value = 1.;
      else if (coeff == "-") value = -1.;
      else value = toDouble(coeff, "vector '" + s + "'");
      v[c - 'x'] += value;
      coeff.clear();
      any = true;
    } else
    {
      coeff += c;
    }
  }

  if (not coeff.empty() || not any)
    throw GeometryFileError(fmt::format("invalid vector '{}'", s));

  return v;
}

std::string formatCrystfelVector(const std::array<double, 3>& v)
{
  std::string s = fmt::format("{:+}x {:+}y", v[0], v[1]);
  if (v[2] != 0.) s += fmt::format(" {:+}z", v[2]);
  return s;
}

CrystfelGeometry parseCrystfelGeometry(std::istream& in, const std::string& source)
{
  CrystfelGeometry geom;
  fieldMap defaults;
  std::map<std::string, fieldMap> panel_fields_map;
  std::vector<std::string> panel_order;

  std::string line;
  int lineno = 0;
  while (std::getline(in, line))
  {
    ++lineno;
    auto comment = line.find(';');
    if (comment != std::string::npos) line.erase(comment);
    line = strip(line);
    if (line.empty()) continue;

    auto eq = line.find('=');
    if (eq == std::string::npos)
      throw GeometryFileError(fmt::format("{}:{}: expected 'key = value', got '{}'", source, lineno, line));

    std::string key = strip(line.substr(0, eq));
    std::string value = strip(line.substr(eq + 1));
    if (key.empty())
      throw GeometryFileError(fmt::format("{}:{}: empty key", source, lineno));

    auto slash = key.find('/');
    if (slash == std::string::npos)
    {
      if (key.compare(0, 23, "rigid_group_collection_") == 0 && key.size() > 23)
      {
        geom.rigid_group_collections[key.substr(23)] = splitList(value);
      } else if (key.compare(0, 12, "rigid_group_") == 0 && key.size() > 12)
      {
        geom.rigid_groups[key.substr(12)] = splitList(value);
      } else if (panel_fields.count(key))
      {
        defaults[key] = value;
      } else
      {
        geom.globals[key] = value;
      }
      continue;
    }

    std::string name = key.substr(0, slash);
    std::string field = key.substr(slash + 1);
    if (name.empty() || field.empty())
      throw GeometryFileError(fmt::format("{}:{}: invalid key '{}'", source, lineno, key));

    // bad regions are not part of the layout
    if (name.compare(0, 4, "bad_") == 0) continue;

    auto it = panel_fields_map.find(name);
    if (it == panel_fields_map.end())
    {
      it = panel_fields_map.emplace(name, defaults).first;
      panel_order.push_back(name);
    }
    it->second[field] = value;
  }

  if (in.bad())
    throw GeometryFileError(fmt::format("{}: read error", source));

  for (const auto& name : panel_order)
  {
    geom.panels.emplace(name, makePanel(name, panel_fields_map.at(name), source));
  }

  return geom;
}

CrystfelGeometry loadCrystfelGeometry(const std::string& filename)
{
  std::ifstream in(filename);
  if (not in)
    throw GeometryFileError(fmt::format("cannot open geometry file '{}'", filename));

  auto geom = parseCrystfelGeometry(in, filename);
  logger()->info("Loaded {} panels from CrystFEL geometry file '{}'", geom.panels.size(), filename);
  return geom;
}

void writeCrystfelGeometry(std::ostream& out, const CrystfelHeader& header,
                           const std::vector<CrystfelPanel>& panels)
{
  int n_modules_per_quad = header.n_modules / header.n_quads;

  auto tile_names = [&header] (int p)
  {
    std::vector<std::string> names;
    for (int a = 0; a < header.n_tiles_per_module; ++a) names.push_back(fmt::format("p{}a{}", p, a));
    return fmt::format("{}", fmt::join(names, ","));
  };

  out << fmt::format("; {} geometry file written by panelgeom {}\n", header.detector_name, PGEOM_VERSION)
      << "; You may need to edit this file to add:\n"
      << "; - data and mask locations in the file\n"
      << "; - mask_good & mask_bad values to interpret the mask\n"
      << "; - adu_per_eV & photon_energy\n"
      << "; - clen (detector distance)\n"
      << ";\n"
      << "; See: http://www.desy.de/~twhite/crystfel/manual-crystfel_geometry.html\n"
      << "\n"
      << "dim0 = %\n"
      << fmt::format("res = {:g} ; {:g} um pixels\n", 1. / header.pixel_size, header.pixel_size * 1e6)
      << "\n";

  for (int q = 0; q < header.n_quads; ++q)
  {
    std::vector<std::string> modules;
    for (int p = q * n_modules_per_quad; p < (q + 1) * n_modules_per_quad; ++p) modules.push_back(tile_names(p));
    out << fmt::format("rigid_group_q{} = {}\n", q, fmt::join(modules, ","));
  }
  out << "\n";

  for (int p = 0; p < header.n_modules; ++p)
  {
    out << fmt::format("rigid_group_p{} = {}\n", p, tile_names(p));
  }
  out << "\n";

  std::vector<std::string> quads, modules;
  for (int q = 0; q < header.n_quads; ++q) quads.push_back(fmt::format("q{}", q));
  for (int p = 0; p < header.n_modules; ++p) modules.push_back(fmt::format("p{}", p));
  out << fmt::format("rigid_group_collection_quadrants = {}\n", fmt::join(quads, ","))
      << fmt::format("rigid_group_collection_asics = {}\n", fmt::join(modules, ","))
      << "\n";

  for (const auto& panel : panels)
  {
    const auto& n = panel.name;
    out << "\n"
        << fmt::format("{}/dim1 = {}\n", n, panel.module)
        << fmt::format("{}/dim2 = ss\n", n)
        << fmt::format("{}/dim3 = fs\n", n)
        << fmt::format("{}/min_fs = {}\n", n, panel.min_fs)
        << fmt::format("{}/min_ss = {}\n", n, panel.min_ss)
        << fmt::format("{}/max_fs = {}\n", n, panel.max_fs)
        << fmt::format("{}/max_ss = {}\n", n, panel.max_ss)
        << fmt::format("{}/fs = {}\n", n, formatCrystfelVector(panel.fs))
        << fmt::format("{}/ss = {}\n", n, formatCrystfelVector(panel.ss))
        << fmt::format("{}/corner_x = {}\n", n, panel.corner_x)
        << fmt::format("{}/corner_y = {}\n", n, panel.corner_y)
        << fmt::format("{}/coffset = {}\n", n, panel.coffset);
  }
}

void writeCrystfelGeometry(const std::string& filename, const CrystfelHeader& header,
                           const std::vector<CrystfelPanel>& panels)
{
  std::ofstream out(filename);
  if (not out)
    throw GeometryFileError(fmt::format("cannot open '{}' for writing", filename));

  writeCrystfelGeometry(out, header, panels);
  out.flush();
  if (not out)
    throw GeometryFileError(fmt::format("failed to write geometry file '{}'", filename));

  logger()->info("Wrote {} panels to CrystFEL geometry file '{}'", panels.size(), filename);
}

} // pgeom
