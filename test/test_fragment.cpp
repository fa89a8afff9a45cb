/**
 * Distributed under the terms of the BSD 3-Clause License.
 *
 * The full license is in the file LICENSE, distributed with this software.
 *
 * Author: Jun Zhu <jun.zhu@xfel.eu>
 * Copyright (C) European X-Ray Free-Electron Laser Facility GmbH.
 * All rights reserved.
 */
#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include <cmath>
#include <limits>
#include <vector>

#include "xtensor/xio.hpp"
#include "xtensor/xtensor.hpp"
#include "xtensor/xbuilder.hpp"
#include "xtensor/xmath.hpp"
#include "xtensor/xview.hpp"

#include "g_errors.hpp"
#include "g_fragment.hpp"

namespace pgeom
{
namespace test
{

using ::testing::ElementsAre;
using vectorType = GeometryFragment::vectorType;

TEST(TestGeometryFragment, testCornersAndCentre)
{
  GeometryFragment frag(vectorType {10., 20., 1.}, vectorType {0., 1., 0.}, vectorType {1., 0., 0.}, 4, 3);

  auto corners = frag.corners();
  EXPECT_THAT(xt::view(corners, 0, xt::all()), ElementsAre(10., 20., 1.));
  EXPECT_THAT(xt::view(corners, 1, xt::all()), ElementsAre(13., 20., 1.));
  EXPECT_THAT(xt::view(corners, 2, xt::all()), ElementsAre(13., 24., 1.));
  EXPECT_THAT(xt::view(corners, 3, xt::all()), ElementsAre(10., 24., 1.));

  EXPECT_THAT(frag.centre(), ElementsAre(11.5, 22., 1.));
}

TEST(TestGeometryFragment, testInvalidPixels)
{
  EXPECT_THROW(GeometryFragment(vectorType {0., 0., 0.}, vectorType {1., 0., 0.}, vectorType {0., 1., 0.}, 0, 3),
               InvalidConfiguration);
  EXPECT_THROW(GeometryFragment(vectorType {0., 0., 0.}, vectorType {1., 0., 0.}, vectorType {0., 1., 0.}, 4, -1),
               InvalidConfiguration);
}

TEST(TestGeometryFragment, testSnapWithoutTranspose)
{
  // ss along y and fs along x
  GeometryFragment frag(vectorType {10.2, 20.4, 0.}, vectorType {0., 1., 0.}, vectorType {1., 0., 0.}, 4, 3);
  auto grid = frag.snap();

  EXPECT_THAT(grid.cornerIdx(), ElementsAre(20, 10));
  EXPECT_THAT(grid.oppCornerIdx(), ElementsAre(24, 13));
  EXPECT_THAT(grid.pixelDims(), ElementsAre(4, 3));
  EXPECT_EQ(grid.transform(), (GridTransform {false, false, false}));
  EXPECT_EQ(4, grid.ssPixels());
  EXPECT_EQ(3, grid.fsPixels());
}

TEST(TestGeometryFragment, testSnapWithTranspose)
{
  // ss along x and fs along -y
  GeometryFragment frag(vectorType {10., 20., 0.}, vectorType {1., 0., 0.}, vectorType {0., -1., 0.}, 4, 3);
  auto grid = frag.snap();

  EXPECT_EQ(grid.transform(), (GridTransform {true, true, false}));
  EXPECT_THAT(grid.pixelDims(), ElementsAre(3, 4));
  // shifted by the extent along the flipped axis
  EXPECT_THAT(grid.cornerIdx(), ElementsAre(17, 10));
  EXPECT_THAT(grid.oppCornerIdx(), ElementsAre(20, 14));
}

TEST(TestGeometryFragment, testSnapRoundsHalfToEven)
{
  GeometryFragment frag(vectorType {0.5, 1.5, 0.}, vectorType {0., 1., 0.}, vectorType {1., 0., 0.}, 4, 3);
  EXPECT_THAT(frag.snap().cornerIdx(), ElementsAre(2, 0));

  GeometryFragment frag2(vectorType {-2.5, 542.5, 0.}, vectorType {0., 1., 0.}, vectorType {1., 0., 0.}, 4, 3);
  EXPECT_THAT(frag2.snap().cornerIdx(), ElementsAre(542, -2));
}

TEST(TestGeometryFragment, testSnapTiltedTile)
{
  // rounds to (1, 0) but it is tilted by more than the tolerance
  GeometryFragment frag(vectorType {0., 0., 0.}, vectorType {0.9, 0.2, 0.}, vectorType {-0.2, 0.9, 0.}, 4, 3);
  EXPECT_THROW(frag.snap(), NonAxisAlignedGeometry);

  // a small tilt is accepted
  GeometryFragment frag2(vectorType {0., 0., 0.}, vectorType {0.999, 0.02, 0.}, vectorType {-0.02, 0.999, 0.}, 4, 3);
  EXPECT_NO_THROW(frag2.snap());
  EXPECT_THROW(frag2.snap(0.01), NonAxisAlignedGeometry);

  // 45 degrees
  double c = std::sqrt(0.5);
  GeometryFragment frag3(vectorType {0., 0., 0.}, vectorType {c, c, 0.}, vectorType {-c, c, 0.}, 4, 3);
  EXPECT_THROW(frag3.snap(), NonAxisAlignedGeometry);
}

TEST(TestGeometryFragment, testSnapParallelVectors)
{
  GeometryFragment frag(vectorType {0., 0., 0.}, vectorType {1., 0., 0.}, vectorType {1., 0., 0.}, 4, 3);
  EXPECT_THROW(frag.snap(), NonAxisAlignedGeometry);

  // out-of-plane fast-scan direction
  GeometryFragment frag2(vectorType {0., 0., 0.}, vectorType {1., 0., 0.}, vectorType {0., 0., 1.}, 4, 3);
  EXPECT_THROW(frag2.snap(), NonAxisAlignedGeometry);
}

TEST(TestGeometryFragment, testSnappedBoundingRectangle)
{
  std::vector<GeometryFragment> fragments {
    GeometryFragment(vectorType {10.3, -20.6, 0.}, vectorType {0., 1., 0.}, vectorType {1., 0., 0.}, 64, 128),
    GeometryFragment(vectorType {-525.4, 625.2, 0.}, vectorType {1., 0., 0.}, vectorType {0., -1., 0.}, 64, 128),
    GeometryFragment(vectorType {520.5, -160.5, 0.}, vectorType {-1., 0., 0.}, vectorType {0., 1., 0.}, 64, 128),
    GeometryFragment(vectorType {0.49, 0.51, 0.}, vectorType {0., -1., 0.}, vectorType {-1., 0., 0.}, 32, 128),
    GeometryFragment(vectorType {3., 4., 0.}, vectorType {0.998, 0.05, 0.}, vectorType {-0.05, 0.998, 0.}, 16, 8),
  };

  for (const auto& frag : fragments)
  {
    auto grid = frag.snap();
    auto corners = frag.corners();
    double min_y = xt::amin(xt::view(corners, xt::all(), 1))();
    double max_y = xt::amax(xt::view(corners, xt::all(), 1))();
    double min_x = xt::amin(xt::view(corners, xt::all(), 0))();
    double max_x = xt::amax(xt::view(corners, xt::all(), 0))();

    EXPECT_LE(std::abs(grid.cornerIdx()[0] - min_y), 1.);
    EXPECT_LE(std::abs(grid.cornerIdx()[1] - min_x), 1.);
    EXPECT_LE(std::abs(grid.oppCornerIdx()[0] - max_y), 1.);
    EXPECT_LE(std::abs(grid.oppCornerIdx()[1] - max_x), 1.);
  }
}

/**
 * For every axis permutation and flip, pixel (i, j) of the tile must land on
 * the grid cell covered by corner + i * ss_vec + j * fs_vec.
 */
TEST(TestGeometryFragment, testPositionAllOrientations)
{
  int n_ss = 2;
  int n_fs = 3;
  xt::xtensor<int, 2> src {{0, 1, 2}, {3, 4, 5}};

  std::vector<std::array<double, 2>> units {{1., 0.}, {-1., 0.}, {0., 1.}, {0., -1.}};

  int n_orientations = 0;
  for (const auto& ss : units)
  {
    for (const auto& fs : units)
    {
      if (ss[0] * fs[0] + ss[1] * fs[1] != 0.) continue;
      ++n_orientations;

      GeometryFragment frag(vectorType {5., 7., 0.}, vectorType {ss[0], ss[1], 0.}, vectorType {fs[0], fs[1], 0.},
                            n_ss, n_fs);
      auto grid = frag.snap();
      EXPECT_EQ(n_ss * n_fs, grid.pixelDims()[0] * grid.pixelDims()[1]);

      xt::xtensor<int, 2> dst = xt::zeros<int>({grid.pixelDims()[0], grid.pixelDims()[1]}) - 1;
      std::array<int, 2> centre {-grid.cornerIdx()[0], -grid.cornerIdx()[1]};
      grid.position(src, dst, {0, 0}, centre);

      // index of the cell covering [p, p + s) along an axis
      auto cell = [] (double p, double s, int k) { return s > 0 ? static_cast<int>(p) + k : static_cast<int>(p) - k - 1; };
      for (int i = 0; i < n_ss; ++i)
      {
        for (int j = 0; j < n_fs; ++j)
        {
          int x = ss[0] != 0. ? cell(5., ss[0], i) : cell(5., fs[0], j);
          int y = ss[1] != 0. ? cell(7., ss[1], i) : cell(7., fs[1], j);
          EXPECT_EQ(src(i, j), dst(y + centre[0], x + centre[1]));
        }
      }

      // and back
      xt::xtensor<int, 2> raw = xt::zeros<int>({n_ss, n_fs});
      grid.dismantle(dst, raw, {0, 0}, centre);
      EXPECT_EQ(src, raw);
    }
  }
  EXPECT_EQ(8, n_orientations);
}

TEST(TestGeometryFragment, testPositionIgnoreTileEdge)
{
  GeometryFragment frag(vectorType {0., 0., 0.}, vectorType {0., 1., 0.}, vectorType {1., 0., 0.}, 4, 3);
  auto grid = frag.snap();

  xt::xtensor<float, 2> src = xt::ones<float>({4, 3});
  float nan = std::numeric_limits<float>::quiet_NaN();
  xt::xtensor<float, 2> dst = xt::zeros<float>({4, 3}) + nan;
  grid.position(src, dst, {0, 0}, {0, 0}, true);

  for (int i = 0; i < 4; ++i)
  {
    for (int j = 0; j < 3; ++j)
    {
      if (i == 0 || i == 3 || j == 0 || j == 2) EXPECT_TRUE(std::isnan(dst(i, j)));
      else EXPECT_EQ(1.f, dst(i, j));
    }
  }
}

TEST(TestGeometryFragment, testRawIndex)
{
  std::array<int, 2> dims {2, 3};
  EXPECT_THAT((GridTransform {false, false, false}).rawIndex(1, 2, dims), ElementsAre(1, 2));
  EXPECT_THAT((GridTransform {false, true, false}).rawIndex(1, 2, dims), ElementsAre(0, 2));
  EXPECT_THAT((GridTransform {false, false, true}).rawIndex(1, 2, dims), ElementsAre(1, 0));
  EXPECT_THAT((GridTransform {true, false, false}).rawIndex(1, 2, dims), ElementsAre(2, 1));
  EXPECT_THAT((GridTransform {true, true, true}).rawIndex(1, 2, dims), ElementsAre(0, 0));
}

} // test
} // pgeom
