/**
 * Distributed under the terms of the BSD 3-Clause License.
 *
 * The full license is in the file LICENSE, distributed with this software.
 *
 * Author: Jun Zhu <jun.zhu@xfel.eu>
 * Copyright (C) European X-Ray Free-Electron Laser Facility GmbH.
 * All rights reserved.
 */
#ifndef PANELGEOM_PYCONFIG_H
#define PANELGEOM_PYCONFIG_H

#define FORCE_IMPORT_ARRAY
#include "xtensor-python/pyarray.hpp"

#include "g_traits.hpp"

namespace pgeom
{

template<typename T, xt::layout_type L>
struct IsDenseArray<xt::pyarray<T, L>> : std::true_type {};

} // pgeom

#endif //PANELGEOM_PYCONFIG_H
