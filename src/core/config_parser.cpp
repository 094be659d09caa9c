#include "terrasculpt/core/config_parser.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace terrasculpt {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

// ============================================================================
// ConfigValue
// ============================================================================

std::optional<float> ConfigValue::asNumber() const {
    if (text_.empty()) return std::nullopt;

    const char* begin = text_.c_str();
    char* end = nullptr;
    errno = 0;
    float val = std::strtof(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE) {
        return std::nullopt;
    }
    return val;
}

std::optional<long> ConfigValue::asInteger() const {
    if (text_.empty()) return std::nullopt;

    const char* begin = text_.c_str();
    char* end = nullptr;
    errno = 0;
    long val = std::strtol(begin, &end, 10);
    if (end == begin || *end != '\0' || errno == ERANGE) {
        return std::nullopt;
    }
    return val;
}

// ============================================================================
// ConfigDocument
// ============================================================================

void ConfigDocument::addEntry(ConfigEntry entry) {
    entries_.push_back(std::move(entry));
}

const ConfigEntry* ConfigDocument::get(std::string_view key) const {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->key == key) {
            return &(*it);
        }
    }
    return nullptr;
}

const ConfigEntry* ConfigDocument::get(std::string_view key, std::string_view suffix) const {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->key == key && it->suffix == suffix) {
            return &(*it);
        }
    }
    return nullptr;
}

std::string_view ConfigDocument::getString(std::string_view key, std::string_view defaultVal) const {
    if (auto* entry = get(key)) {
        auto sv = entry->value.asString();
        if (!sv.empty()) return sv;
    }
    return defaultVal;
}

std::optional<float> ConfigDocument::getNumber(std::string_view key) const {
    if (auto* entry = get(key)) {
        return entry->value.asNumber();
    }
    return std::nullopt;
}

std::vector<const ConfigEntry*> ConfigDocument::getAll(std::string_view key) const {
    std::vector<const ConfigEntry*> result;
    for (const auto& entry : entries_) {
        if (entry.key == key) {
            result.push_back(&entry);
        }
    }
    return result;
}

// ============================================================================
// ConfigParser
// ============================================================================

std::optional<ConfigDocument> ConfigParser::parseFile(const std::string& path) const {
    return parseFileAtDepth(path, 0);
}

ConfigDocument ConfigParser::parseString(std::string_view content, const std::string& basePath) const {
    return parseStringAtDepth(content, basePath, 0);
}

std::optional<ConfigDocument> ConfigParser::parseFileAtDepth(const std::string& path, int depth) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    // Includes resolve relative to this file
    std::string basePath;
    auto lastSlash = path.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        basePath = path.substr(0, lastSlash + 1);
    }

    return parseStringAtDepth(buffer.str(), basePath, depth);
}

ConfigDocument ConfigParser::parseStringAtDepth(std::string_view content, const std::string& basePath,
                                                int depth) const {
    ConfigDocument doc;
    ConfigEntry currentEntry;

    std::string_view remaining = content;
    size_t lineNumber = 0;

    while (!remaining.empty()) {
        auto lineEnd = remaining.find('\n');
        std::string_view line;
        if (lineEnd == std::string_view::npos) {
            line = remaining;
            remaining = {};
        } else {
            line = remaining.substr(0, lineEnd);
            remaining = remaining.substr(lineEnd + 1);
        }
        ++lineNumber;

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        parseLine(line, lineNumber, currentEntry, doc, basePath, depth);
    }

    flushEntry(currentEntry, doc);
    return doc;
}

void ConfigParser::parseLine(std::string_view line, size_t lineNumber, ConfigEntry& currentEntry,
                             ConfigDocument& doc, const std::string& basePath, int depth) const {
    if (trim(line).empty()) {
        return;
    }

    // Indented: data line for the current entry
    if (std::isspace(static_cast<unsigned char>(line[0]))) {
        auto numbers = parseDataLine(line);
        if (!numbers.empty() && !currentEntry.key.empty()) {
            currentEntry.dataLines.push_back(std::move(numbers));
        }
        return;
    }

    flushEntry(currentEntry, doc);

    if (line[0] == '#') {
        return;
    }

    currentEntry.line = lineNumber;

    auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
        currentEntry.key = std::string(trim(line));
        return;
    }

    currentEntry.key = std::string(trim(line.substr(0, colonPos)));

    // key:suffix: value. A suffix never contains spaces, which keeps a
    // value such as "12:30" from being split.
    auto rest = line.substr(colonPos + 1);
    auto secondColon = rest.find(':');
    if (secondColon != std::string_view::npos) {
        auto suffix = rest.substr(0, secondColon);
        if (suffix.find(' ') == std::string_view::npos && suffix.find('\t') == std::string_view::npos) {
            currentEntry.suffix = std::string(suffix);
            rest = rest.substr(secondColon + 1);
        }
    }

    rest = trim(rest);

    if (currentEntry.key == "include") {
        std::string includePath(rest);
        currentEntry = ConfigEntry{};

        if (depth + 1 > MAX_INCLUDE_DEPTH) {
            std::cerr << "[ConfigParser] Include depth exceeded at '" << includePath
                      << "' (line " << lineNumber << ")\n";
            return;
        }

        std::string resolvedPath = includeResolver_ ? includeResolver_(includePath) : basePath + includePath;

        if (auto includedDoc = parseFileAtDepth(resolvedPath, depth + 1)) {
            for (const auto& entry : *includedDoc) {
                doc.addEntry(entry);
            }
        } else {
            std::cerr << "[ConfigParser] Cannot open include '" << resolvedPath << "'\n";
        }
        return;
    }

    if (!rest.empty()) {
        currentEntry.value = ConfigValue(rest);
    }
}

std::vector<float> ConfigParser::parseDataLine(std::string_view line) {
    std::vector<float> numbers;
    std::string buffer(line);

    size_t pos = 0;
    while (pos < buffer.size()) {
        while (pos < buffer.size() && std::isspace(static_cast<unsigned char>(buffer[pos]))) {
            pos++;
        }
        if (pos >= buffer.size()) break;

        const char* start = buffer.c_str() + pos;
        char* end = nullptr;
        float val = std::strtof(start, &end);

        if (end == start) {
            // Not a number: skip the token
            while (pos < buffer.size() && !std::isspace(static_cast<unsigned char>(buffer[pos]))) {
                pos++;
            }
        } else {
            numbers.push_back(val);
            pos = static_cast<size_t>(end - buffer.c_str());
        }
    }

    return numbers;
}

void ConfigParser::flushEntry(ConfigEntry& entry, ConfigDocument& doc) {
    if (!entry.key.empty()) {
        doc.addEntry(std::move(entry));
    }
    entry = ConfigEntry{};
}

}  // namespace terrasculpt
