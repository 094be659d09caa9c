/**
 * @file test_carve.cpp
 * @brief Primitive carving into the heightfield
 */

#include "terrasculpt/edit/carve.hpp"
#include "terrasculpt/field/height_field.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace terrasculpt;

class CarveTest : public ::testing::Test {
protected:
    FieldGeometry geometry{256, 256.0f};
    worldgen::PermutationTable table{3};
    HeightField field{geometry, table};

    void fill(float height) {
        std::vector<float> ones(geometry.cellCount(), 1.0f);
        field.loadGrayscale(ones, height);
    }
};

TEST_F(CarveTest, CubeFlattensSquareFootprint) {
    fill(30.0f);
    // Floor = 10 - 20 / 2 = 0
    auto dirty = applyCarve(field, {0.0f, 10.0f, 0.0f}, {20.0f, 20.0f, 20.0f}, PrimitiveShape::Cube);

    for (int32_t c = 118; c <= 138; ++c) {
        EXPECT_EQ(field.heightAt(c, 128), 0.0f) << "column " << c;
        EXPECT_EQ(field.heightAt(128, c), 0.0f) << "row " << c;
    }
    EXPECT_EQ(field.heightAt(118, 118), 0.0f);
    EXPECT_EQ(field.heightAt(138, 138), 0.0f);

    EXPECT_EQ(field.heightAt(117, 128), 30.0f);
    EXPECT_EQ(field.heightAt(139, 128), 30.0f);
    EXPECT_EQ(dirty.size(), 4u);
}

TEST_F(CarveTest, SphereAndCylinderUseEllipticalFootprint) {
    for (PrimitiveShape shape : {PrimitiveShape::Sphere, PrimitiveShape::Cylinder}) {
        fill(30.0f);
        (void)applyCarve(field, {0.0f, 10.0f, 0.0f}, {20.0f, 20.0f, 20.0f}, shape);

        EXPECT_EQ(field.heightAt(128, 138), 0.0f);
        EXPECT_EQ(field.heightAt(135, 135), 0.0f);
        // Corner of the bounding square lies outside the ellipse
        EXPECT_EQ(field.heightAt(138, 138), 30.0f);
        EXPECT_EQ(field.heightAt(137, 136), 30.0f);
    }
}

TEST_F(CarveTest, NonUniformScaleStretchesFootprint) {
    fill(30.0f);
    (void)applyCarve(field, {0.0f, 10.0f, 0.0f}, {40.0f, 20.0f, 10.0f}, PrimitiveShape::Cube);

    EXPECT_EQ(field.heightAt(148, 128), 0.0f);
    EXPECT_EQ(field.heightAt(128, 133), 0.0f);
    EXPECT_EQ(field.heightAt(128, 134), 30.0f);
}

TEST_F(CarveTest, NeverRaises) {
    // Floor at 15 sits above the flat field
    auto dirty = applyCarve(field, {0.0f, 20.0f, 0.0f}, {10.0f, 10.0f, 10.0f}, PrimitiveShape::Cube);
    EXPECT_TRUE(dirty.empty());
    EXPECT_EQ(field.heightAt(128, 128), 0.0f);
}

TEST_F(CarveTest, DepthIsLimited) {
    (void)applyCarve(field, {0.0f, -100.0f, 0.0f}, {10.0f, 20.0f, 10.0f}, PrimitiveShape::Cube);
    EXPECT_EQ(field.heightAt(128, 128), CARVE_FLOOR_LIMIT);
}

TEST_F(CarveTest, DeepCellBelowLimitIsKept) {
    fill(-80.0f);
    auto dirty = applyCarve(field, {0.0f, -100.0f, 0.0f}, {10.0f, 20.0f, 10.0f}, PrimitiveShape::Cube);
    EXPECT_TRUE(dirty.empty());
    EXPECT_EQ(field.heightAt(128, 128), -80.0f);
}

TEST_F(CarveTest, DegenerateInputIsNoOp) {
    fill(30.0f);
    EXPECT_TRUE(applyCarve(field, {0.0f, 0.0f, 0.0f}, {0.0f, 20.0f, 20.0f}, PrimitiveShape::Cube).empty());
    EXPECT_TRUE(applyCarve(field, {0.0f, 0.0f, 0.0f}, {20.0f, 20.0f, -5.0f}, PrimitiveShape::Sphere).empty());
    EXPECT_TRUE(applyCarve(field, {900.0f, 0.0f, 0.0f}, {20.0f, 20.0f, 20.0f}, PrimitiveShape::Cube).empty());
    EXPECT_EQ(field.heightAt(128, 128), 30.0f);
}
