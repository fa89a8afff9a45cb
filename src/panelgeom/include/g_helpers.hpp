/**
 * Distributed under the terms of the BSD 3-Clause License.
 *
 * The full license is in the file LICENSE, distributed with this software.
 *
 * Author: Jun Zhu <jun.zhu@xfel.eu>
 * Copyright (C) European X-Ray Free-Electron Laser Facility GmbH.
 * All rights reserved.
 */

#ifndef PANELGEOM_HELPERS_H
#define PANELGEOM_HELPERS_H

#include <array>
#include <algorithm>

namespace pgeom {

/**
 * Calculate the intersection area of two rectangles.

 * @param rect1: (y1, x1, h1, w1) of rectangle 1.
 * @param rect2: (y2, x2, h2, w2) of rectangle 2.
 *
 * Note: (y, x) is the index of the corner closest to the origin.
 *
 * @returns: (y, x, h, w) of the intersection area. h or w is not positive if
 *   the two rectangles do not intersect.
 */
inline std::array<int, 4>
intersection(const std::array<int, 4> &rect1, const std::array<int, 4> &rect2) {
  int y = std::max(rect1[0], rect2[0]);
  int yy = std::min(rect1[0] + rect1[2], rect2[0] + rect2[2]);
  int x = std::max(rect1[1], rect2[1]);
  int xx = std::min(rect1[1] + rect1[3], rect2[1] + rect2[3]);

  int h = yy - y;
  int w = xx - x;

  return {y, x, h, w};
}

/**
 * Whether two rectangles (y, x, h, w) share at least one pixel.
 */
inline bool overlap(const std::array<int, 4> &rect1, const std::array<int, 4> &rect2) {
  auto inter = intersection(rect1, rect2);
  return inter[2] > 0 && inter[3] > 0;
}

}

#endif //PANELGEOM_HELPERS_H
