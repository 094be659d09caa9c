/**
 * @file test_brush.cpp
 * @brief Radial sculpt, level and paint brush
 */

#include "terrasculpt/edit/brush.hpp"
#include "terrasculpt/field/height_field.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace terrasculpt;

class BrushTest : public ::testing::Test {
protected:
    FieldGeometry geometry{256, 256.0f};
    worldgen::PermutationTable table{42};
    HeightField field{geometry, table};

    static BrushConfig sculpt(float radius, float strength) {
        BrushConfig config;
        config.radius = radius;
        config.strength = strength;
        config.mode = BrushMode::Sculpt;
        return config;
    }
};

// ============================================================================
// Sculpt
// ============================================================================

TEST_F(BrushTest, RaiseAtWorldOrigin) {
    auto dirty = applyBrush(field, {0.0f, 0.0f, 0.0f}, sculpt(10.0f, 5.0f));

    // World origin is grid cell 128 on both axes
    EXPECT_FLOAT_EQ(field.heightAt(128, 128), 5.0f);

    // Falloff decreases monotonically away from the center
    float previous = field.heightAt(128, 128);
    for (int32_t column = 129; column <= 137; ++column) {
        float h = field.heightAt(column, 128);
        EXPECT_LT(h, previous) << "column " << column;
        EXPECT_GT(h, 0.0f) << "column " << column;
        previous = h;
    }

    // Distance 10 is on the rim and stays untouched
    EXPECT_EQ(field.heightAt(138, 128), 0.0f);
    EXPECT_EQ(field.heightAt(118, 128), 0.0f);
    EXPECT_EQ(field.heightAt(128, 100), 0.0f);

    // The stamp straddles both chunk boundaries
    EXPECT_EQ(dirty, DirtyChunkSet({ChunkId(0, 0), ChunkId(1, 0), ChunkId(0, 1), ChunkId(1, 1)}));
}

TEST_F(BrushTest, FalloffIsQuadraticInDistanceSquared) {
    (void)applyBrush(field, {0.0f, 0.0f, 0.0f}, sculpt(10.0f, 5.0f));

    // d = 5: (1 - 25/100)^2 = 0.5625
    EXPECT_FLOAT_EQ(field.heightAt(133, 128), 5.0f * 0.5625f);
    // d^2 = 3^2 + 4^2 = 25 as well
    EXPECT_FLOAT_EQ(field.heightAt(131, 132), 5.0f * 0.5625f);
}

TEST_F(BrushTest, InteriorStampDirtiesOneChunk) {
    auto dirty = applyBrush(field, {-64.0f, 0.0f, -64.0f}, sculpt(10.0f, 1.0f));
    EXPECT_EQ(dirty, DirtyChunkSet({ChunkId(0, 0)}));
}

TEST_F(BrushTest, LowerGoesNegative) {
    auto config = BrushConfig::forTool(BrushTool::Lower, 6.0f, 2.0f, 0.0f, glm::vec3(0.0f));
    (void)applyBrush(field, {0.0f, 0.0f, 0.0f}, config);
    EXPECT_FLOAT_EQ(field.heightAt(128, 128), -2.0f);
}

TEST_F(BrushTest, OffGridPointIsNoOp) {
    auto dirty = applyBrush(field, {1000.0f, 0.0f, 0.0f}, sculpt(10.0f, 5.0f));
    EXPECT_TRUE(dirty.empty());

    dirty = applyBrush(field, {0.0f, 0.0f, -1e9f}, sculpt(10.0f, 5.0f));
    EXPECT_TRUE(dirty.empty());
}

TEST_F(BrushTest, ZeroStrengthChangesNothing) {
    auto dirty = applyBrush(field, {0.0f, 0.0f, 0.0f}, sculpt(10.0f, 0.0f));
    EXPECT_TRUE(dirty.empty());
}

TEST_F(BrushTest, EdgeStampIsClipped) {
    // Grid (0, 0): only the quarter disc inside the field is written
    auto dirty = applyBrush(field, {-128.0f, 0.0f, -128.0f}, sculpt(10.0f, 3.0f));
    EXPECT_FLOAT_EQ(field.heightAt(0, 0), 3.0f);
    EXPECT_EQ(dirty, DirtyChunkSet({ChunkId(0, 0)}));
}

TEST_F(BrushTest, ScaledGeometryUsesCellRadius) {
    FieldGeometry scaled(256, 1024.0f);
    HeightField big(scaled, table);

    // 40 world units = 10 cells
    (void)applyBrush(big, {0.0f, 0.0f, 0.0f}, sculpt(40.0f, 5.0f));
    EXPECT_FLOAT_EQ(big.heightAt(128, 128), 5.0f);
    EXPECT_GT(big.heightAt(137, 128), 0.0f);
    EXPECT_EQ(big.heightAt(138, 128), 0.0f);
}

// ============================================================================
// Level
// ============================================================================

TEST_F(BrushTest, LevelMovesTowardTarget) {
    BrushConfig config = BrushConfig::forTool(BrushTool::Level, 10.0f, 1.0f, 8.0f, glm::vec3(0.0f));
    (void)applyBrush(field, {0.0f, 0.0f, 0.0f}, config);

    // t = strength * 0.1 at the center
    EXPECT_FLOAT_EQ(field.heightAt(128, 128), 0.8f);
    EXPECT_LT(field.heightAt(133, 128), 0.8f);
    EXPECT_GT(field.heightAt(133, 128), 0.0f);
}

TEST_F(BrushTest, LevelAtTargetIsNoOp) {
    BrushConfig config = BrushConfig::forTool(BrushTool::Level, 10.0f, 1.0f, 0.0f, glm::vec3(0.0f));
    auto dirty = applyBrush(field, {0.0f, 0.0f, 0.0f}, config);
    EXPECT_TRUE(dirty.empty());
}

// ============================================================================
// Paint
// ============================================================================

TEST_F(BrushTest, PaintSaturatesNearCenter) {
    glm::vec3 red(1.0f, 0.0f, 0.0f);
    BrushConfig config = BrushConfig::forTool(BrushTool::Paint, 10.0f, 0.4f, 0.0f, red);
    glm::vec3 before = field.colorAt(137, 128);

    auto dirty = applyBrush(field, {0.0f, 0.0f, 0.0f}, config);

    // mix = clamp(0.4 * 1 * 5) = 1 at the center
    glm::vec3 center = field.colorAt(128, 128);
    EXPECT_FLOAT_EQ(center.r, 1.0f);
    EXPECT_FLOAT_EQ(center.g, 0.0f);
    EXPECT_FLOAT_EQ(center.b, 0.0f);

    // d = 9: falloff 0.0361, mix 0.0722 -> partial blend
    glm::vec3 rim = field.colorAt(137, 128);
    EXPECT_GT(rim.r, before.r);
    EXPECT_LT(rim.r, 1.0f);

    // Paint never touches height
    EXPECT_EQ(field.heightAt(128, 128), 0.0f);
    EXPECT_EQ(dirty.size(), 4u);
}

// ============================================================================
// Tool mapping
// ============================================================================

TEST(BrushConfigTest, ForToolMapsModesAndSigns) {
    glm::vec3 color(0.1f, 0.2f, 0.3f);

    auto raise = BrushConfig::forTool(BrushTool::Raise, 4.0f, -0.5f, 3.0f, color);
    EXPECT_EQ(raise.mode, BrushMode::Sculpt);
    EXPECT_FLOAT_EQ(raise.strength, 0.5f);
    EXPECT_FLOAT_EQ(raise.radius, 4.0f);

    auto lower = BrushConfig::forTool(BrushTool::Lower, 4.0f, 0.5f, 3.0f, color);
    EXPECT_EQ(lower.mode, BrushMode::Sculpt);
    EXPECT_FLOAT_EQ(lower.strength, -0.5f);

    auto level = BrushConfig::forTool(BrushTool::Level, 4.0f, 0.5f, 3.0f, color);
    EXPECT_EQ(level.mode, BrushMode::Level);
    EXPECT_FLOAT_EQ(level.targetHeight, 3.0f);

    auto paint = BrushConfig::forTool(BrushTool::Paint, 4.0f, 0.5f, 3.0f, color);
    EXPECT_EQ(paint.mode, BrushMode::Paint);
    EXPECT_FLOAT_EQ(paint.color.b, 0.3f);
}

// ============================================================================
// Extreme inputs and unchanged cells
// ============================================================================

TEST_F(BrushTest, HugeRadiusCoversWholeField) {
    auto dirty = applyBrush(field, {0.0f, 0.0f, 0.0f}, sculpt(1e13f, 1.0f));

    // Weight is 1 everywhere when the radius dwarfs the grid
    EXPECT_FLOAT_EQ(field.heightAt(0, 0), 1.0f);
    EXPECT_FLOAT_EQ(field.heightAt(255, 255), 1.0f);
    EXPECT_EQ(dirty.size(), 4u);

    dirty = applyBrush(field, {1e12f, 0.0f, -1e12f}, sculpt(1e13f, 1.0f));
    EXPECT_EQ(dirty.size(), 4u);
    EXPECT_GT(field.heightAt(128, 128), 1.0f);
}

TEST_F(BrushTest, InfiniteRadiusIsClampedToField) {
    auto dirty = applyBrush(field, {0.0f, 0.0f, 0.0f},
                            sculpt(std::numeric_limits<float>::infinity(), 2.0f));
    EXPECT_FLOAT_EQ(field.heightAt(0, 255), 2.0f);
    EXPECT_EQ(dirty.size(), 4u);
}

TEST_F(BrushTest, RepaintingSameColorIsNotDirty) {
    glm::vec3 clay(0.2f, 0.4f, 0.6f);
    BrushConfig config = BrushConfig::forTool(BrushTool::Paint, 10.0f, 1e6f, 0.0f, clay);

    auto first = applyBrush(field, {-64.0f, 0.0f, -64.0f}, config);
    EXPECT_EQ(first, DirtyChunkSet({ChunkId(0, 0)}));
    EXPECT_FLOAT_EQ(field.colorAt(64, 64).g, 0.4f);

    auto second = applyBrush(field, {-64.0f, 0.0f, -64.0f}, config);
    EXPECT_TRUE(second.empty());
}
