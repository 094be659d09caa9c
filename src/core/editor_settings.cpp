#include "terrasculpt/core/editor_settings.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <string>

namespace terrasculpt {

namespace {

void warn(const ConfigEntry& entry, std::string_view expected) {
    std::cerr << "[EditorSettings] Line " << entry.line << ": '" << entry.key;
    if (entry.hasSuffix()) std::cerr << ":" << entry.suffix;
    std::cerr << "' has invalid value '" << entry.value.asString() << "' (expected " << expected
              << "), keeping default\n";
}

void readFloat(const ConfigDocument& doc, std::string_view key, float& out) {
    auto* e = doc.get(key);
    if (!e) return;
    auto v = e->value.asNumber();
    if (v && std::isfinite(*v)) {
        out = *v;
    } else {
        warn(*e, "a number");
    }
}

void readPositive(const ConfigDocument& doc, std::string_view key, float& out) {
    auto* e = doc.get(key);
    if (!e) return;
    auto v = e->value.asNumber();
    if (v && std::isfinite(*v) && *v > 0.0f) {
        out = *v;
    } else {
        warn(*e, "a positive number");
    }
}

void readNonNegative(const ConfigDocument& doc, std::string_view key, float& out) {
    auto* e = doc.get(key);
    if (!e) return;
    auto v = e->value.asNumber();
    if (v && std::isfinite(*v) && *v >= 0.0f) {
        out = *v;
    } else {
        warn(*e, "a non-negative number");
    }
}

template<typename T>
void readInteger(const ConfigDocument& doc, std::string_view key, long minValue, T& out) {
    auto* e = doc.get(key);
    if (!e) return;
    auto v = e->value.asInteger();
    if (v && *v >= minValue && static_cast<unsigned long long>(*v) <= std::numeric_limits<T>::max()) {
        out = static_cast<T>(*v);
    } else {
        warn(*e, "an integer >= " + std::to_string(minValue));
    }
}

void readColor(const ConfigEntry& e, glm::vec3& out) {
    if (auto c = worldgen::parseHexColor(e.value.asString())) {
        out = *c;
    } else {
        warn(e, "#rrggbb");
    }
}

}  // namespace

std::optional<EditorSettings> EditorSettingsLoader::loadFromFile(const std::string& path) {
    ConfigParser parser;
    auto doc = parser.parseFile(path);
    if (!doc) {
        std::cerr << "[EditorSettings] Cannot open settings file '" << path << "'\n";
        return std::nullopt;
    }
    return loadFromConfig(*doc);
}

EditorSettings EditorSettingsLoader::loadFromConfig(const ConfigDocument& doc) {
    EditorSettings s;

    // World
    readPositive(doc, "world.size", s.worldSize);
    readPositive(doc, "world.chunk_size", s.chunkSize);
    if (auto* e = doc.get("world.resolution")) {
        auto v = e->value.asInteger();
        if (v && *v <= std::numeric_limits<int32_t>::max() &&
            FieldGeometry::isSupportedResolution(static_cast<int32_t>(*v))) {
            s.resolution = static_cast<int32_t>(*v);
        } else {
            warn(*e, "256, 512 or 1024");
        }
    }
    readInteger(doc, "noise.seed", 0, s.noiseSeed);

    // Brush
    readPositive(doc, "brush.radius", s.brushRadius);
    readFloat(doc, "brush.strength", s.brushStrength);
    readFloat(doc, "brush.height", s.brushHeight);
    if (auto* e = doc.get("brush.color")) readColor(*e, s.brushColor);

    // Polygon fill
    readFloat(doc, "fill.height", s.fillHeight);
    readNonNegative(doc, "fill.falloff", s.fillFalloff);
    readFloat(doc, "fill.noise", s.fillNoise);

    // Ridge line
    readFloat(doc, "ridge.height", s.ridgeHeight);
    readPositive(doc, "ridge.width", s.ridgeWidth);
    readFloat(doc, "ridge.noise", s.ridgeNoise);

    // Scatter
    readInteger(doc, "scatter.count", 0, s.scatterCount);
    readInteger(doc, "scatter.seed", 0, s.scatterSeed);

    readFloat(doc, "image.height_scale", s.imageHeightScale);
    readInteger(doc, "history.depth", 1, s.historyDepth);

    // Palette overrides, later entries win
    for (const auto* e : doc.getAll("palette")) {
        glm::vec3* slot = s.palette.find(e->suffix);
        if (!slot) {
            std::cerr << "[EditorSettings] Line " << e->line << ": unknown palette color '"
                      << e->suffix << "'\n";
            continue;
        }
        readColor(*e, *slot);
    }

    // Named regions
    for (const auto* e : doc.getAll("region")) {
        if (!e->hasSuffix()) {
            std::cerr << "[EditorSettings] Line " << e->line << ": region without a name\n";
            continue;
        }
        std::vector<glm::vec2> points;
        points.reserve(e->dataLines.size());
        for (const auto& line : e->dataLines) {
            if (line.size() != 2) {
                std::cerr << "[EditorSettings] Region '" << e->suffix << "': skipping data line with "
                          << line.size() << " values (expected x z)\n";
                continue;
            }
            points.emplace_back(line[0], line[1]);
        }
        s.regions[e->suffix] = std::move(points);
    }

    return s;
}

}  // namespace terrasculpt
