/**
 * Distributed under the terms of the BSD 3-Clause License.
 *
 * The full license is in the file LICENSE, distributed with this software.
 *
 * Author: Jun Zhu <jun.zhu@xfel.eu>
 * Copyright (C) European X-Ray Free-Electron Laser Facility GmbH.
 * All rights reserved.
 */
#ifndef PANELGEOM_LOGGING_H
#define PANELGEOM_LOGGING_H

#include <memory>

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/cfg/env.h"

namespace pgeom
{

/**
 * Return the library logger "panelgeom".
 *
 * The logger writes to stderr and is created on the first call. Its default
 * level is 'warn'; call configureLogging() to honour SPDLOG_LEVEL.
 */
inline std::shared_ptr<spdlog::logger> logger()
{
  static std::shared_ptr<spdlog::logger> instance = [] ()
  {
    auto lg = spdlog::get("panelgeom");
    if (lg == nullptr)
    {
      lg = spdlog::stderr_color_mt("panelgeom");
      lg->set_level(spdlog::level::warn);
    }
    return lg;
  }();
  return instance;
}

/**
 * Apply the logging levels given in the environment variable SPDLOG_LEVEL,
 * e.g. SPDLOG_LEVEL=panelgeom=debug.
 */
inline void configureLogging()
{
  logger(); // the logger must be registered before the levels are loaded
  spdlog::cfg::load_env_levels();
}

} // pgeom

#endif //PANELGEOM_LOGGING_H
