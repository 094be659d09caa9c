/**
 * @file test_editor_settings.cpp
 * @brief Settings loading, validation and defaults
 */

#include "terrasculpt/core/editor_settings.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace terrasculpt;

class EditorSettingsTest : public ::testing::Test {
protected:
    ConfigParser parser;

    EditorSettings load(std::string_view text) const {
        return EditorSettingsLoader::loadFromConfig(parser.parseString(text));
    }
};

TEST_F(EditorSettingsTest, DefaultsDescribeValidGeometry) {
    EditorSettings settings = load("");

    EXPECT_FLOAT_EQ(settings.worldSize, FieldGeometry::DEFAULT_WORLD_SIZE);
    EXPECT_EQ(settings.resolution, 256);
    EXPECT_FLOAT_EQ(settings.brushRadius, 6.0f);
    EXPECT_FLOAT_EQ(settings.brushColor.r, 68.0f / 255.0f);
    EXPECT_EQ(settings.historyDepth, 16u);
    EXPECT_TRUE(settings.regions.empty());

    FieldGeometry geometry = settings.geometry();
    EXPECT_EQ(geometry.resolution(), 256);
}

TEST_F(EditorSettingsTest, ReadsEveryGroup) {
    EditorSettings settings = load(
        "world.size: 1024\n"
        "world.resolution: 512\n"
        "world.chunk_size: 128\n"
        "noise.seed: 7\n"
        "brush.radius: 12\n"
        "brush.strength: -0.8\n"
        "brush.height: 3\n"
        "brush.color: #ff0000\n"
        "fill.height: 22\n"
        "fill.falloff: 0\n"
        "fill.noise: 0.5\n"
        "ridge.height: 40\n"
        "ridge.width: 25\n"
        "ridge.noise: 0.1\n"
        "scatter.count: 12\n"
        "scatter.seed: 5\n"
        "image.height_scale: 64\n"
        "history.depth: 3\n"
    );

    EXPECT_FLOAT_EQ(settings.worldSize, 1024.0f);
    EXPECT_EQ(settings.resolution, 512);
    EXPECT_EQ(settings.noiseSeed, 7u);
    EXPECT_FLOAT_EQ(settings.brushRadius, 12.0f);
    EXPECT_FLOAT_EQ(settings.brushStrength, -0.8f);
    EXPECT_FLOAT_EQ(settings.brushHeight, 3.0f);
    EXPECT_FLOAT_EQ(settings.brushColor.r, 1.0f);
    EXPECT_FLOAT_EQ(settings.brushColor.g, 0.0f);
    EXPECT_FLOAT_EQ(settings.fillHeight, 22.0f);
    EXPECT_FLOAT_EQ(settings.fillFalloff, 0.0f);
    EXPECT_FLOAT_EQ(settings.fillNoise, 0.5f);
    EXPECT_FLOAT_EQ(settings.ridgeHeight, 40.0f);
    EXPECT_FLOAT_EQ(settings.ridgeWidth, 25.0f);
    EXPECT_FLOAT_EQ(settings.ridgeNoise, 0.1f);
    EXPECT_EQ(settings.scatterCount, 12);
    EXPECT_EQ(settings.scatterSeed, 5u);
    EXPECT_FLOAT_EQ(settings.imageHeightScale, 64.0f);
    EXPECT_EQ(settings.historyDepth, 3u);

    FieldGeometry geometry = settings.geometry();
    EXPECT_EQ(geometry.chunksPerSide(), 8);
    EXPECT_EQ(geometry.cellsPerChunk(), 64);
}

TEST_F(EditorSettingsTest, InvalidValuesKeepDefaults) {
    EditorSettings settings = load(
        "world.size: -5\n"
        "world.resolution: 300\n"
        "noise.seed: -1\n"
        "brush.radius: 0\n"
        "brush.strength: strong\n"
        "brush.color: red\n"
        "fill.falloff: -2\n"
        "ridge.width: 0\n"
        "scatter.count: 2.5\n"
        "history.depth: 0\n"
    );

    EditorSettings defaults;
    EXPECT_FLOAT_EQ(settings.worldSize, defaults.worldSize);
    EXPECT_EQ(settings.resolution, defaults.resolution);
    EXPECT_EQ(settings.noiseSeed, defaults.noiseSeed);
    EXPECT_FLOAT_EQ(settings.brushRadius, defaults.brushRadius);
    EXPECT_FLOAT_EQ(settings.brushStrength, defaults.brushStrength);
    EXPECT_FLOAT_EQ(settings.brushColor.b, defaults.brushColor.b);
    EXPECT_FLOAT_EQ(settings.fillFalloff, defaults.fillFalloff);
    EXPECT_FLOAT_EQ(settings.ridgeWidth, defaults.ridgeWidth);
    EXPECT_EQ(settings.scatterCount, defaults.scatterCount);
    EXPECT_EQ(settings.historyDepth, defaults.historyDepth);
}

TEST_F(EditorSettingsTest, IncompatibleGeometryThrowsOnUse) {
    // Each value is valid alone, but 384 units is 3 chunks and 256 cells do not split into 3
    EditorSettings settings = load("world.size: 384\n");
    EXPECT_FLOAT_EQ(settings.worldSize, 384.0f);
    EXPECT_THROW((void)settings.geometry(), std::invalid_argument);
}

TEST_F(EditorSettingsTest, PaletteOverrides) {
    EditorSettings settings = load(
        "palette:snow: #ffffff\n"
        "palette:sand: 000000\n"
        "palette:lava: #ff4400\n"
        "palette:rock: nothex\n"
    );

    EditorSettings defaults;
    EXPECT_FLOAT_EQ(settings.palette.snow.r, 1.0f);
    EXPECT_FLOAT_EQ(settings.palette.sand.g, 0.0f);
    EXPECT_FLOAT_EQ(settings.palette.rock.r, defaults.palette.rock.r);
}

TEST_F(EditorSettingsTest, Regions) {
    EditorSettings settings = load(
        "region:lake:\n"
        "    -40 -40\n"
        "     40 -40\n"
        "     1 2 3\n"
        "     40  40\n"
        "region:\n"
        "    1 1\n"
    );

    ASSERT_EQ(settings.regions.size(), 1u);
    const auto& lake = settings.regions.at("lake");
    ASSERT_EQ(lake.size(), 3u);
    EXPECT_FLOAT_EQ(lake[0].x, -40.0f);
    EXPECT_FLOAT_EQ(lake[2].y, 40.0f);
}

TEST(EditorSettingsLoaderTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "terrasculpt_settings_test.cfg";
    {
        std::ofstream out(path);
        out << "# session\nbrush.radius: 9\n";
    }

    auto settings = EditorSettingsLoader::loadFromFile(path.string());
    ASSERT_TRUE(settings.has_value());
    EXPECT_FLOAT_EQ(settings->brushRadius, 9.0f);
    std::filesystem::remove(path);

    EXPECT_FALSE(EditorSettingsLoader::loadFromFile(path.string()).has_value());
}
