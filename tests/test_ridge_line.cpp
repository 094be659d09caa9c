/**
 * @file test_ridge_line.cpp
 * @brief Ridge raised along a polyline
 */

#include "terrasculpt/edit/ridge_line.hpp"
#include "terrasculpt/field/height_field.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace terrasculpt;

class RidgeLineTest : public ::testing::Test {
protected:
    FieldGeometry geometry{256, 256.0f};
    worldgen::PermutationTable table{99};
    HeightField field{geometry, table};

    // Grid (78, 128) to (178, 128)
    std::vector<glm::vec2> line{{-50, 0}, {50, 0}};

    static RidgeConfig smooth() {
        RidgeConfig c;
        c.targetHeight = 35.0f;
        c.halfWidth = 20.0f;
        c.ridgeNoise = 0.0f;
        return c;
    }
};

TEST_F(RidgeLineTest, CrestAndFoot) {
    auto dirty = applyRidgeLine(field, line, smooth());

    EXPECT_FLOAT_EQ(field.heightAt(128, 128), 35.0f);
    // d = 19: (1 - 0.95)^2 * 35
    EXPECT_NEAR(field.heightAt(128, 147), 0.0875f, 1e-4f);
    // d = 20 is outside the profile
    EXPECT_EQ(field.heightAt(128, 148), 0.0f);
    EXPECT_EQ(dirty.size(), 4u);
}

TEST_F(RidgeLineTest, ProfileIsSymmetricAndFalling) {
    (void)applyRidgeLine(field, line, smooth());

    float previous = field.heightAt(128, 128);
    for (int32_t d = 1; d < 20; ++d) {
        float above = field.heightAt(128, 128 - d);
        float below = field.heightAt(128, 128 + d);
        EXPECT_FLOAT_EQ(above, below) << "offset " << d;
        EXPECT_LT(below, previous) << "offset " << d;
        previous = below;
    }
}

TEST_F(RidgeLineTest, RoundedCapsBeyondEndpoints) {
    (void)applyRidgeLine(field, line, smooth());

    // 10 cells past the last vertex: (1 - 0.5)^2 * 35
    EXPECT_FLOAT_EQ(field.heightAt(188, 128), 8.75f);
    EXPECT_EQ(field.heightAt(200, 128), 0.0f);
}

TEST_F(RidgeLineTest, NoisyCrestStaysNonNegative) {
    RidgeConfig noisy = smooth();
    noisy.ridgeNoise = 4.0f;
    (void)applyRidgeLine(field, line, noisy);

    for (float h : field.heights()) {
        EXPECT_GE(h, 0.0f);
    }
}

TEST_F(RidgeLineTest, NeverLowersExistingTerrain) {
    std::vector<float> high(geometry.cellCount(), 1.0f);
    field.loadGrayscale(high, 50.0f);

    auto dirty = applyRidgeLine(field, line, smooth());
    EXPECT_TRUE(dirty.empty());
    EXPECT_FLOAT_EQ(field.heightAt(128, 128), 50.0f);
}

TEST_F(RidgeLineTest, DegenerateInputIsNoOp) {
    std::vector<glm::vec2> single{{0, 0}};
    EXPECT_TRUE(applyRidgeLine(field, single, smooth()).empty());

    RidgeConfig flat = smooth();
    flat.halfWidth = 0.0f;
    EXPECT_TRUE(applyRidgeLine(field, line, flat).empty());

    std::vector<glm::vec2> offGrid{{400, 400}, {500, 400}};
    EXPECT_TRUE(applyRidgeLine(field, offGrid, smooth()).empty());
}
