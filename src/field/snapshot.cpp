#include "terrasculpt/field/snapshot.hpp"
#include "terrasculpt/core/cbor.hpp"
#include "terrasculpt/field/height_field.hpp"

#include <lz4.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>

namespace terrasculpt {

namespace {

constexpr uint8_t SNAPSHOT_MAGIC[4] = {'T', 'S', 'F', 'S'};
constexpr size_t HEADER_SIZE = 12;
constexpr int64_t FORMAT_VERSION = 1;

void writeU32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value));
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value >> 16));
    out.push_back(static_cast<uint8_t>(value >> 24));
}

uint32_t readU32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

std::vector<uint8_t> serializeSnapshot(const FieldSnapshot& snapshot) {
    std::vector<uint8_t> out;
    out.reserve(64 + (snapshot.heights.size() + snapshot.colors.size()) * 4);

    cbor::encodeMapHeader(out, 6);
    cbor::encodeString(out, "version");
    cbor::encodeInt(out, FORMAT_VERSION);
    cbor::encodeString(out, "resolution");
    cbor::encodeInt(out, snapshot.geometry.resolution());
    cbor::encodeString(out, "world_size");
    cbor::encodeDouble(out, snapshot.geometry.worldSize());
    cbor::encodeString(out, "chunk_size");
    cbor::encodeDouble(out, snapshot.geometry.chunkEdge());
    cbor::encodeString(out, "heights");
    cbor::encodeFloatArray(out, snapshot.heights);
    cbor::encodeString(out, "colors");
    cbor::encodeFloatArray(out, snapshot.colors);

    return out;
}

FieldSnapshot deserializeSnapshot(std::span<const uint8_t> data) {
    cbor::Decoder decoder(data);

    auto [mapType, mapSize] = decoder.readHeader();
    if (mapType != cbor::MAP) {
        throw std::runtime_error("Invalid snapshot CBOR: expected map");
    }

    int64_t version = 0;
    int64_t resolution = 0;
    double worldSize = 0.0;
    double chunkSize = FieldGeometry::DEFAULT_CHUNK_EDGE;
    std::vector<float> heights;
    std::vector<float> colors;

    for (uint64_t i = 0; i < mapSize; ++i) {
        std::string key = decoder.readText();

        if (key == "version") {
            version = decoder.readInt();
        } else if (key == "resolution") {
            resolution = decoder.readInt();
        } else if (key == "world_size") {
            worldSize = decoder.readNumber();
        } else if (key == "chunk_size") {
            chunkSize = decoder.readNumber();
        } else if (key == "heights") {
            heights = decoder.readFloatArray();
        } else if (key == "colors") {
            colors = decoder.readFloatArray();
        } else {
            decoder.skipValue();
        }
    }

    if (version != FORMAT_VERSION) {
        throw std::runtime_error("Unsupported snapshot version " + std::to_string(version));
    }
    if (resolution <= 0 || resolution > std::numeric_limits<int32_t>::max()) {
        throw std::runtime_error("Invalid snapshot: bad resolution");
    }

    FieldGeometry geometry(static_cast<int32_t>(resolution), static_cast<float>(worldSize),
                           static_cast<float>(chunkSize));
    if (heights.size() != geometry.cellCount() || colors.size() != geometry.cellCount() * 3) {
        throw std::runtime_error("Invalid snapshot: buffer sizes do not match resolution");
    }

    return FieldSnapshot{geometry, std::move(heights), std::move(colors)};
}

}  // namespace

// ============================================================================
// Encoding
// ============================================================================

std::vector<uint8_t> encodeSnapshot(const FieldSnapshot& snapshot) {
    auto cborData = serializeSnapshot(snapshot);
    if (cborData.size() > static_cast<size_t>(LZ4_MAX_INPUT_SIZE)) {
        throw std::runtime_error("Snapshot too large for LZ4");
    }

    int maxCompressed = LZ4_compressBound(static_cast<int>(cborData.size()));
    std::vector<uint8_t> out(HEADER_SIZE + static_cast<size_t>(maxCompressed));

    int compressedSize = LZ4_compress_default(
        reinterpret_cast<const char*>(cborData.data()),
        reinterpret_cast<char*>(out.data() + HEADER_SIZE),
        static_cast<int>(cborData.size()),
        maxCompressed);

    if (compressedSize <= 0) {
        throw std::runtime_error("LZ4 compression failed");
    }

    std::vector<uint8_t> header;
    header.insert(header.end(), std::begin(SNAPSHOT_MAGIC), std::end(SNAPSHOT_MAGIC));
    writeU32(header, static_cast<uint32_t>(cborData.size()));
    writeU32(header, static_cast<uint32_t>(compressedSize));
    std::copy(header.begin(), header.end(), out.begin());

    out.resize(HEADER_SIZE + static_cast<size_t>(compressedSize));
    return out;
}

FieldSnapshot decodeSnapshot(std::span<const uint8_t> data) {
    if (data.size() < HEADER_SIZE) {
        throw std::runtime_error("Snapshot data too small");
    }
    if (!std::equal(std::begin(SNAPSHOT_MAGIC), std::end(SNAPSHOT_MAGIC), data.begin())) {
        throw std::runtime_error("Invalid snapshot magic");
    }

    uint32_t uncompressedSize = readU32(data.data() + 4);
    uint32_t compressedSize = readU32(data.data() + 8);
    if (compressedSize > data.size() - HEADER_SIZE ||
        compressedSize > static_cast<uint32_t>(std::numeric_limits<int>::max()) ||
        uncompressedSize > static_cast<uint32_t>(LZ4_MAX_INPUT_SIZE)) {
        throw std::runtime_error("Snapshot data truncated");
    }

    std::vector<uint8_t> cborData(uncompressedSize);
    int result = LZ4_decompress_safe(
        reinterpret_cast<const char*>(data.data() + HEADER_SIZE),
        reinterpret_cast<char*>(cborData.data()),
        static_cast<int>(compressedSize),
        static_cast<int>(uncompressedSize));

    if (result < 0 || static_cast<uint32_t>(result) != uncompressedSize) {
        throw std::runtime_error("LZ4 decompression failed");
    }

    return deserializeSnapshot(cborData);
}

// ============================================================================
// File I/O
// ============================================================================

void saveSnapshot(const FieldSnapshot& snapshot, const std::filesystem::path& path) {
    auto bytes = encodeSnapshot(snapshot);

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        throw std::runtime_error("Failed to write snapshot: " + path.string());
    }
}

FieldSnapshot loadSnapshot(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw std::runtime_error("Failed to open snapshot file: " + path.string());
    }

    auto fileSize = file.tellg();
    if (fileSize < 0) {
        throw std::runtime_error("Failed to read snapshot file: " + path.string());
    }
    file.seekg(0);

    std::vector<uint8_t> bytes(static_cast<size_t>(fileSize));
    file.read(reinterpret_cast<char*>(bytes.data()), fileSize);
    if (!file) {
        throw std::runtime_error("Failed to read snapshot file: " + path.string());
    }

    return decodeSnapshot(bytes);
}

// ============================================================================
// SnapshotHistory
// ============================================================================

SnapshotHistory::SnapshotHistory(size_t depth)
    : depth_(depth) {
    if (depth == 0) {
        throw std::invalid_argument("SnapshotHistory: depth must be at least 1");
    }
}

void SnapshotHistory::record(const HeightField& field) {
    entries_.push_back(encodeSnapshot(field.snapshot()));
    while (entries_.size() > depth_) {
        entries_.pop_front();
        std::cerr << "[SnapshotHistory] Depth " << depth_ << " reached, dropped oldest snapshot\n";
    }
}

std::optional<DirtyChunkSet> SnapshotHistory::undo(HeightField& field) {
    if (entries_.empty()) {
        return std::nullopt;
    }

    FieldSnapshot snapshot = decodeSnapshot(entries_.back());
    if (!(snapshot.geometry == field.geometry())) {
        std::cerr << "[SnapshotHistory] Recorded field is " << snapshot.geometry.resolution() << "^2 over "
                  << snapshot.geometry.worldSize() << " units, current field is "
                  << field.resolution() << "^2 over " << field.worldSize() << "\n";
        throw std::invalid_argument("SnapshotHistory: recorded geometry does not match field");
    }

    entries_.pop_back();
    return field.restore(snapshot);
}

}  // namespace terrasculpt
