/**
 * @file edit_demo.cpp
 * @brief Headless walkthrough of one terrain editing session
 *
 * Demonstrates:
 * - Loading editor settings (optional file argument)
 * - Building a field from the configured geometry and noise seed
 * - Every edit operation once, with its dirty-chunk count
 * - Chunk version bookkeeping for a renderer
 * - Scatter placements and world height queries
 * - Whole-field undo through SnapshotHistory
 *
 * Command line:
 * - edit_demo [settings-file] [snapshot-output]
 */

#include <terrasculpt/core/editor_settings.hpp>
#include <terrasculpt/edit/brush.hpp>
#include <terrasculpt/edit/carve.hpp>
#include <terrasculpt/edit/region_fill.hpp>
#include <terrasculpt/edit/ridge_line.hpp>
#include <terrasculpt/edit/scatter.hpp>
#include <terrasculpt/field/dirty_chunks.hpp>
#include <terrasculpt/field/height_field.hpp>
#include <terrasculpt/field/image_io.hpp>
#include <terrasculpt/field/snapshot.hpp>
#include <terrasculpt/worldgen/noise.hpp>
#include <terrasculpt/worldgen/random.hpp>

#include <algorithm>
#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace terrasculpt;

namespace {

void report(const char* what, const DirtyChunkSet& dirty, ChunkVersionTable& versions) {
    versions.bump(dirty);
    std::cout << "  " << what << ": " << dirty.size() << " dirty chunk(s)";
    if (!dirty.empty()) {
        std::vector<ChunkId> sorted(dirty.begin(), dirty.end());
        std::sort(sorted.begin(), sorted.end());
        std::cout << " [";
        for (size_t i = 0; i < sorted.size(); ++i) {
            if (i > 0) std::cout << " ";
            std::cout << sorted[i].column << "," << sorted[i].row;
        }
        std::cout << "]";
    }
    std::cout << "\n";
}

std::vector<glm::vec2> regionOr(const EditorSettings& settings, const std::string& name,
                                std::vector<glm::vec2> fallback) {
    auto it = settings.regions.find(name);
    return it != settings.regions.end() ? it->second : fallback;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::cout << "TerraSculpt Edit Demo\n";
    std::cout << "=====================\n\n";

    EditorSettings settings;
    if (argc > 1) {
        auto loaded = EditorSettingsLoader::loadFromFile(argv[1]);
        if (!loaded) {
            return 1;
        }
        settings = std::move(*loaded);
    }

    try {
        FieldGeometry geometry = settings.geometry();
        worldgen::PermutationTable permutation(settings.noiseSeed);
        HeightField field(geometry, permutation, settings.palette);
        ChunkVersionTable versions;
        SnapshotHistory history(settings.historyDepth);

        std::cout << "Field " << geometry.resolution() << "x" << geometry.resolution() << " over "
                  << geometry.worldSize() << " units, " << geometry.chunksPerSide() << "x"
                  << geometry.chunksPerSide() << " chunks of " << geometry.cellsPerChunk() << " cells\n\n";

        std::cout << "Edits:\n";
        worldgen::SeededRandom offsets(static_cast<uint32_t>(settings.noiseSeed));

        history.record(field);
        BrushConfig raise = BrushConfig::forTool(BrushTool::Raise, settings.brushRadius * 2.0f,
                                                 settings.brushStrength * 10.0f, settings.brushHeight,
                                                 settings.brushColor);
        report("raise brush", applyBrush(field, {0.0f, 0.0f, 0.0f}, raise), versions);

        history.record(field);
        RegionFillConfig fill{settings.fillHeight, settings.fillFalloff, settings.fillNoise,
                              static_cast<float>(offsets.next() * 1000.0)};
        auto plateau = regionOr(settings, "plateau", {{-60, 20}, {-20, 20}, {-20, 60}, {-60, 60}});
        report("region fill", applyRegionFill(field, plateau, fill), versions);

        history.record(field);
        RidgeConfig ridge{settings.ridgeHeight, settings.ridgeWidth, settings.ridgeNoise,
                          static_cast<float>(offsets.next() * 1000.0)};
        auto spine = regionOr(settings, "ridge", {{20, -80}, {60, -20}, {80, 40}});
        report("ridge line", applyRidgeLine(field, spine, ridge), versions);

        history.record(field);
        report("carve", applyCarve(field, {60.0f, 10.0f, -20.0f}, {16.0f, 20.0f, 16.0f},
                                   PrimitiveShape::Cylinder), versions);

        BrushConfig paint = BrushConfig::forTool(BrushTool::Paint, settings.brushRadius, settings.brushStrength,
                                                 settings.brushHeight, settings.brushColor);
        report("paint brush", applyBrush(field, {-40.0f, 0.0f, 40.0f}, paint), versions);

        std::cout << "\nScatter:\n";
        auto placements = scatterInPolygon(field, plateau, settings.scatterCount, settings.scatterSeed);
        std::cout << "  " << placements.size() << " of " << settings.scatterCount << " placed\n";
        for (size_t i = 0; i < std::min<size_t>(placements.size(), 5); ++i) {
            const auto& p = placements[i];
            std::cout << "  (" << p.position.x << ", " << p.position.y << ", " << p.position.z
                      << ") yaw " << p.yaw << "\n";
        }

        std::cout << "\nHeight queries:\n";
        const glm::vec2 probes[] = {{0, 0}, {-40, 40}, {60, -20}, {geometry.worldSize(), 0}};
        for (const auto& probe : probes) {
            std::cout << "  (" << probe.x << ", " << probe.y << ") -> "
                      << field.heightAtWorld(probe.x, probe.y) << "\n";
        }

        auto heightImage = exportHeightImage(field.heights());
        auto colorImage = exportColorImage(field.colors());
        std::cout << "\nExported " << heightImage.size() << " height pixels, "
                  << colorImage.size() / 3 << " color pixels\n";

        if (argc > 2) {
            saveSnapshot(field.snapshot(), argv[2]);
            std::cout << "Saved snapshot to " << argv[2] << "\n";
        }

        std::cout << "\nUndo (" << history.size() << " snapshots):\n";
        if (auto dirty = history.undo(field)) {
            report("undo carve + paint", *dirty, versions);
        }
        std::cout << "  Chunk 0,0 is at version " << versions.version({0, 0}) << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[EditDemo] " << e.what() << "\n";
        return 1;
    }

    return 0;
}
