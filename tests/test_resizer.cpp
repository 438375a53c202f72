/*  SeamResize - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#include <gtest/gtest.h>

#include "grid_fixtures.hpp"
#include "seamresize/errors.hpp"
#include "seamresize/logging.hpp"
#include "seamresize/resizer.hpp"
#include "seamresize/seam_finder.hpp"
#include "seamresize/seam_operator.hpp"

using namespace seamresize;
using seamresize::testing::piGrid;
using seamresize::testing::randomGrid;
using seamresize::testing::uniformGrid;

namespace {

ResizeResult resizeGrid(const PixelGrid &grid, int target_width, int target_height,
                        const ResizeOptions &options = {}) {
    return resize(grid.data(), static_cast<std::uint32_t>(grid.width()),
                  static_cast<std::uint32_t>(grid.height()),
                  static_cast<std::uint8_t>(grid.channels()),
                  static_cast<std::uint32_t>(target_width),
                  static_cast<std::uint32_t>(target_height), options);
}

} // namespace

TEST(Resize, RemovesPiGridZeroBand) {
    const ResizeResult result = resizeGrid(piGrid(), 7, 3);
    EXPECT_EQ(result.width, 7u);
    EXPECT_EQ(result.height, 3u);
    EXPECT_EQ(result.channels, 1);
    EXPECT_EQ(result.pixels, (std::vector<std::uint8_t>{3, 1, 4, 0, 0, 1, 5, //
                                                        9, 2, 6, 0, 0, 5, 3, //
                                                        5, 8, 0, 0, 9, 7, 9}));
    EXPECT_EQ(result.stats.iterations, 1);
    EXPECT_EQ(result.stats.vertical_removals, 1);
}

TEST(Resize, RemovesHorizontalZeroBand) {
    const ResizeResult result = resizeGrid(piGrid().transposed(), 3, 7);
    EXPECT_EQ(result.width, 3u);
    EXPECT_EQ(result.height, 7u);
    EXPECT_EQ(result.pixels, (std::vector<std::uint8_t>{3, 9, 5, //
                                                        1, 2, 8, //
                                                        4, 6, 0, //
                                                        0, 0, 0, //
                                                        0, 0, 9, //
                                                        1, 5, 7, //
                                                        5, 3, 9}));
    EXPECT_EQ(result.stats.horizontal_removals, 1);
    EXPECT_EQ(result.stats.vertical_removals, 0);
}

TEST(Resize, RemovesTwoSeams) {
    const PixelGrid grid({7, 9, 9, 0, 0, 0, 9, 5, //
                          8, 9, 9, 0, 0, 0, 9, 3, //
                          8, 9, 0, 0, 0, 9, 7, 9},
                         8, 3, 1);
    const ResizeResult result = resizeGrid(grid, 6, 3);
    EXPECT_EQ(result.pixels, (std::vector<std::uint8_t>{7, 9, 0, 0, 9, 5, //
                                                        8, 9, 0, 0, 9, 3, //
                                                        9, 0, 0, 9, 7, 9}));
    EXPECT_EQ(result.stats.vertical_removals, 2);
    EXPECT_EQ(result.stats.iterations, 2);
}

TEST(Resize, UniformGridStaysUniform) {
    const ResizeResult result = resizeGrid(uniformGrid(4, 4, 3, 90), 2, 4);
    EXPECT_EQ(result.width, 2u);
    EXPECT_EQ(result.height, 4u);
    EXPECT_EQ(result.pixels, std::vector<std::uint8_t>(2 * 4 * 3, 90));
    EXPECT_EQ(result.stats.vertical_removals, 2);
    EXPECT_EQ(result.stats.horizontal_removals, 0);
    EXPECT_EQ(result.stats.vertical_insertions, 0);
    EXPECT_EQ(result.stats.horizontal_insertions, 0);
}

TEST(Resize, SameSizeIsUntouched) {
    const PixelGrid grid = randomGrid(5, 4, 3, 12);
    const ResizeResult result = resizeGrid(grid, 5, 4);
    EXPECT_EQ(result.pixels, grid.data());
    EXPECT_EQ(result.stats.iterations, 0);
}

TEST(Resize, GrowsByDuplicatingCheapestSeam) {
    const ResizeResult result = resizeGrid(piGrid(), 9, 3);
    EXPECT_EQ(result.pixels, (std::vector<std::uint8_t>{3, 1, 4, 0, 0, 0, 0, 1, 5, //
                                                        9, 2, 6, 0, 0, 0, 0, 5, 3, //
                                                        5, 8, 0, 0, 0, 0, 9, 7, 9}));
    EXPECT_EQ(result.stats.vertical_insertions, 1);
}

TEST(Resize, WideningMatchesOneSeamInsertion) {
    const PixelGrid grid = randomGrid(6, 5, 3, 17);

    PixelGrid expected = grid;
    insertSeam(expected, findVerticalSeam(computeEnergyMap(expected)));

    const ResizeResult result = resizeGrid(grid, 7, 5);
    EXPECT_EQ(result.pixels, expected.data());
}

TEST(Resize, RejectsBadBuffer) {
    const std::vector<std::uint8_t> pixels(5);
    EXPECT_THROW(resize(pixels, 2, 2, 1, 2, 2), ShapeError);
    EXPECT_THROW(resize(pixels, 5, 0, 1, 2, 2), ShapeError);
    // Shape problems are reported before target problems
    EXPECT_THROW(resize(pixels, 2, 2, 1, 0, 0), ShapeError);
}

TEST(Resize, RejectsZeroTarget) {
    const std::vector<std::uint8_t> pixels(9, 1);
    EXPECT_THROW(resize(pixels, 3, 3, 1, 0, 3), InvalidTarget);
    EXPECT_THROW(resize(pixels, 3, 3, 1, 3, 0), InvalidTarget);
    EXPECT_EQ(pixels, std::vector<std::uint8_t>(9, 1));
}

TEST(Resize, AxisOrderChangesMixedResize) {
    ResizeOptions width_first;
    width_first.order = AxisOrder::WidthFirst;

    const ResizeResult alternate = resizeGrid(piGrid(), 6, 4);
    EXPECT_EQ(alternate.pixels, (std::vector<std::uint8_t>{3, 1, 4, 0, 1, 5, //
                                                           3, 1, 4, 0, 1, 5, //
                                                           9, 2, 6, 0, 0, 3, //
                                                           5, 8, 0, 0, 9, 9}));

    const ResizeResult widthwise = resizeGrid(piGrid(), 6, 4, width_first);
    EXPECT_EQ(widthwise.pixels, (std::vector<std::uint8_t>{3, 1, 4, 0, 0, 1, //
                                                           3, 1, 4, 0, 0, 1, //
                                                           9, 2, 6, 0, 0, 5, //
                                                           5, 8, 0, 0, 9, 9}));

    for (const ResizeResult *result : {&alternate, &widthwise}) {
        EXPECT_EQ(result->stats.vertical_removals, 2);
        EXPECT_EQ(result->stats.horizontal_insertions, 1);
        EXPECT_EQ(result->stats.iterations, 3);
    }
}

TEST(Resize, ReachesTargetWithEveryOption) {
    const PixelGrid grid = randomGrid(9, 7, 3, 99);
    const int targets[][2] = {{5, 4}, {12, 10}, {6, 9}, {11, 3}, {1, 1}, {9, 8}};

    for (AxisOrder order : {AxisOrder::Alternate, AxisOrder::WidthFirst, AxisOrder::CheapestSeam}) {
        for (Enlargement enlargement : {Enlargement::SingleSeam, Enlargement::Batched}) {
            for (const auto &target : targets) {
                ResizeOptions options;
                options.order = order;
                options.enlargement = enlargement;

                const ResizeResult result = resizeGrid(grid, target[0], target[1], options);
                EXPECT_EQ(result.width, static_cast<std::uint32_t>(target[0]));
                EXPECT_EQ(result.height, static_cast<std::uint32_t>(target[1]));
                EXPECT_EQ(result.pixels.size(),
                          static_cast<size_t>(target[0]) * static_cast<size_t>(target[1]) * 3);
            }
        }
    }
}

TEST(Resize, IncrementalEnergyGivesSameResult) {
    const PixelGrid grid = randomGrid(10, 8, 3, 5);
    ResizeOptions incremental;
    incremental.energy_update = EnergyUpdate::Incremental;

    const int targets[][2] = {{6, 5}, {13, 11}, {7, 10}};
    for (const auto &target : targets) {
        const ResizeResult full = resizeGrid(grid, target[0], target[1]);
        const ResizeResult updated = resizeGrid(grid, target[0], target[1], incremental);
        EXPECT_EQ(full.pixels, updated.pixels) << target[0] << "x" << target[1];
    }
}

TEST(Resize, EnergyKernelsGiveSameResult) {
    const PixelGrid grid = randomGrid(8, 9, 4, 6);
    ResizeOptions direct;
    direct.energy_kernel = EnergyKernel::Direct;

    const ResizeResult with_opencv = resizeGrid(grid, 5, 11);
    const ResizeResult with_direct = resizeGrid(grid, 5, 11, direct);
    EXPECT_EQ(with_opencv.pixels, with_direct.pixels);
}

TEST(Resize, BatchedWideningTakesOneIteration) {
    ResizeOptions batched;
    batched.enlargement = Enlargement::Batched;

    const ResizeResult result = resizeGrid(piGrid(), 11, 3, batched);
    EXPECT_EQ(result.pixels, (std::vector<std::uint8_t>{3, 2, 1, 4, 0, 0, 0, 0, 1, 3, 5, //
                                                        9, 9, 2, 6, 0, 0, 0, 0, 5, 4, 3, //
                                                        5, 5, 8, 0, 0, 0, 0, 9, 8, 7, 9}));
    EXPECT_EQ(result.stats.iterations, 1);
    EXPECT_EQ(result.stats.vertical_insertions, 3);
}

TEST(Resize, BatchedGrowthBeyondDoubleTakesSeveralIterations) {
    ResizeOptions batched;
    batched.enlargement = Enlargement::Batched;

    // 3 -> 6 -> 10: each batch is limited to the current width
    const ResizeResult result = resizeGrid(randomGrid(3, 2, 1, 3), 10, 2, batched);
    EXPECT_EQ(result.width, 10u);
    EXPECT_EQ(result.stats.iterations, 2);
    EXPECT_EQ(result.stats.vertical_insertions, 7);
}

TEST(Resizer, AlternatesBetweenAxes) {
    Resizer resizer(randomGrid(6, 6, 3, 1), 4, 4);
    EXPECT_EQ(resizer.widthState(), AxisState::Shrinking);
    EXPECT_EQ(resizer.heightState(), AxisState::Shrinking);

    EXPECT_TRUE(resizer.step());
    EXPECT_EQ(resizer.grid().width(), 5);
    EXPECT_EQ(resizer.grid().height(), 6);

    EXPECT_TRUE(resizer.step());
    EXPECT_EQ(resizer.grid().width(), 5);
    EXPECT_EQ(resizer.grid().height(), 5);

    EXPECT_TRUE(resizer.step());
    EXPECT_FALSE(resizer.step());
    EXPECT_TRUE(resizer.done());
    EXPECT_EQ(resizer.stats().iterations, 4);

    // Nothing left to do
    EXPECT_FALSE(resizer.step());
    EXPECT_EQ(resizer.stats().iterations, 4);
}

TEST(Resizer, WidthFirstFinishesWidthBeforeHeight) {
    ResizeOptions options;
    options.order = AxisOrder::WidthFirst;
    Resizer resizer(randomGrid(6, 6, 3, 1), 4, 4, options);

    resizer.step();
    resizer.step();
    EXPECT_EQ(resizer.grid().width(), 4);
    EXPECT_EQ(resizer.grid().height(), 6);
    EXPECT_EQ(resizer.widthState(), AxisState::Done);
    EXPECT_EQ(resizer.heightState(), AxisState::Shrinking);
}

TEST(Resizer, TracksAxesIndependently) {
    Resizer resizer(randomGrid(4, 6, 1, 2), 6, 3);
    EXPECT_EQ(resizer.widthState(), AxisState::Growing);
    EXPECT_EQ(resizer.heightState(), AxisState::Shrinking);

    resizer.run();
    EXPECT_EQ(resizer.grid().width(), 6);
    EXPECT_EQ(resizer.grid().height(), 3);
    EXPECT_EQ(resizer.stats().vertical_insertions, 2);
    EXPECT_EQ(resizer.stats().horizontal_removals, 3);
    EXPECT_EQ(resizer.stats().iterations, 5);

    const PixelGrid grid = resizer.release();
    EXPECT_EQ(grid.data().size(), 6u * 3u);
}

TEST(Resizer, CheapestSeamPrefersFlatAxis) {
    // Every vertical seam has to cross the ramp in the last row; the top row is free
    const PixelGrid grid({0, 0, 0, 0, //
                          0, 0, 0, 0, //
                          0, 100, 200, 250},
                         4, 3, 1);
    ResizeOptions options;
    options.order = AxisOrder::CheapestSeam;
    Resizer resizer(grid, 3, 2, options);

    EXPECT_TRUE(resizer.step());
    EXPECT_EQ(resizer.stats().horizontal_removals, 1);
    EXPECT_EQ(resizer.grid().height(), 2);
}

TEST(Resizer, RejectsNonPositiveTarget) {
    EXPECT_THROW(Resizer(uniformGrid(3, 3, 1, 0), 0, 3), InvalidTarget);
    EXPECT_THROW(Resizer(uniformGrid(3, 3, 1, 0), 3, -2), InvalidTarget);
}

TEST(Resizer, RunsWithVerboseLogging) {
    initLogging(spdlog::level::trace);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::trace);

    const ResizeResult result = resizeGrid(randomGrid(5, 5, 3, 4), 4, 6);
    EXPECT_EQ(result.width, 4u);
    EXPECT_EQ(result.height, 6u);

    initLogging(spdlog::level::warn);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
}
