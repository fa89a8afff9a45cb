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

#include <array>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <vector>

#include "g_errors.hpp"
#include "g_helpers.hpp"
#include "g_logging.hpp"
#include "g_traits.hpp"
#include "g_utilities.hpp"

namespace pgeom
{
namespace test
{

using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(TestUtilities, testCheckTrailingShape)
{
  std::vector<size_t> shape {10, 16, 512, 128};
  std::array<int, 3> expected {16, 512, 128};
  EXPECT_NO_THROW(utils::checkTrailingShape(shape, expected, "Data"));
  EXPECT_NO_THROW(utils::checkTrailingShape(std::vector<size_t>{16, 512, 128}, expected, "Data"));

  EXPECT_THROW(utils::checkTrailingShape(std::vector<size_t>{16, 512, 127}, expected, "Data"), ShapeMismatch);
  EXPECT_THROW(utils::checkTrailingShape(std::vector<size_t>{512, 128}, expected, "Data"), ShapeMismatch);

  try
  {
    utils::checkTrailingShape(std::vector<size_t>{2, 15, 512, 128}, expected, "Modules data");
    FAIL() << "ShapeMismatch is not raised";
  } catch (const ShapeMismatch& e)
  {
    EXPECT_STREQ("Modules data: expected (..., 16, 512, 128), actual (2, 15, 512, 128)", e.what());
  }
}

TEST(TestUtilities, testLeadingShape)
{
  std::vector<size_t> shape {2, 3, 16, 512, 128};
  auto leading = utils::leadingShape(shape, 3);
  EXPECT_THAT(leading, ElementsAre(2, 3));
  EXPECT_EQ(6u, utils::nFrames(leading));

  auto no_leading = utils::leadingShape(std::vector<size_t>{16, 512, 128}, 3);
  EXPECT_THAT(no_leading, IsEmpty());
  EXPECT_EQ(1u, utils::nFrames(no_leading));
}

TEST(TestUtilities, testApplyFunctor2d)
{
  std::array<size_t, 2> shape {5, 7};
  std::vector<std::atomic<int>> visited(35);
  for (auto& v : visited) v = 0;

  utils::applyFunctor2d(shape, [&visited] (size_t i, size_t j) { ++visited[i * 7 + j]; });

  for (const auto& v : visited) EXPECT_EQ(1, v.load());
}

TEST(TestHelpers, testIntersection)
{
  // (y, x, h, w)
  std::array<int, 4> rect1 {0, 0, 10, 20};
  std::array<int, 4> rect2 {5, 15, 10, 10};
  EXPECT_THAT(intersection(rect1, rect2), ElementsAre(5, 15, 5, 5));
  EXPECT_TRUE(overlap(rect1, rect2));

  // touching edges do not overlap
  std::array<int, 4> rect3 {10, 0, 4, 4};
  EXPECT_FALSE(overlap(rect1, rect3));
  std::array<int, 4> rect4 {0, 20, 4, 4};
  EXPECT_FALSE(overlap(rect1, rect4));

  std::array<int, 4> rect5 {-50, -50, 10, 10};
  EXPECT_FALSE(overlap(rect1, rect5));
  EXPECT_TRUE(overlap(rect1, rect1));
}

TEST(TestTraits, testNoData)
{
  EXPECT_TRUE(std::isnan(NoData<float>::value()));
  EXPECT_TRUE(std::isnan(NoData<double>::value()));
  EXPECT_EQ(0, NoData<uint16_t>::value());
  EXPECT_EQ(0, NoData<int>::value());
  EXPECT_FALSE(NoData<bool>::value());

  EXPECT_TRUE(isNaN(NoData<float>::value()));
  EXPECT_FALSE(isNaN(1.f));
  EXPECT_FALSE(isNaN(uint16_t(0)));
}

TEST(TestTraits, testIsDenseArray)
{
  EXPECT_TRUE((IsDenseArray<xt::xarray<float>>::value));
  EXPECT_TRUE((IsDenseArray<xt::xtensor<uint16_t, 3>>::value));
  EXPECT_FALSE((IsDenseArray<std::vector<float>>::value));
}

TEST(TestLogging, testLogger)
{
  auto lg = logger();
  ASSERT_NE(nullptr, lg);
  EXPECT_EQ("panelgeom", lg->name());
  EXPECT_EQ(lg, spdlog::get("panelgeom"));
  EXPECT_EQ(lg, logger());
}

} // test
} // pgeom
