#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace terrasculpt {

// ============================================================================
// ConfigValue - A parsed configuration value
// ============================================================================

/**
 * @brief Raw text after the colon(s) of a settings line
 *
 * Numeric access is strict: the whole text must be a number, so
 * "12abc" is rejected rather than read as 12.
 */
class ConfigValue {
public:
    ConfigValue() = default;
    explicit ConfigValue(std::string_view text) : text_(text) {}

    [[nodiscard]] std::string_view asString() const { return text_; }

    /// Whole text parsed as a float, or nullopt
    [[nodiscard]] std::optional<float> asNumber() const;

    /// Whole text parsed as a base-10 integer, or nullopt
    [[nodiscard]] std::optional<long> asInteger() const;

    [[nodiscard]] bool empty() const { return text_.empty(); }

private:
    std::string text_;
};

// ============================================================================
// ConfigEntry - A key-value pair with optional suffix and data lines
// ============================================================================

/**
 * @brief A settings entry
 *
 * Represents entries like:
 *   brush.radius: 6
 *   palette:sand: #948e83
 *   region:lake:
 *       -40 -40
 *        40 -40
 *        40  40
 */
struct ConfigEntry {
    std::string key;              // Primary key (e.g. "brush.radius", "region")
    std::string suffix;           // Optional suffix (e.g. "lake")
    ConfigValue value;            // Value after the colon(s)
    std::vector<std::vector<float>> dataLines;  // Indented data lines (parsed as floats)
    size_t line = 0;              // 1-based source line of the key

    [[nodiscard]] bool hasSuffix() const { return !suffix.empty(); }
    [[nodiscard]] bool hasData() const { return !dataLines.empty(); }
};

// ============================================================================
// ConfigDocument - A parsed settings file
// ============================================================================

/**
 * @brief Entries of a settings file in source order (includes merged in place)
 *
 * Simple lookups return the last entry with a key, so later lines and
 * later includes override earlier ones.
 */
class ConfigDocument {
public:
    ConfigDocument() = default;

    void addEntry(ConfigEntry entry);

    [[nodiscard]] const ConfigEntry* get(std::string_view key) const;
    [[nodiscard]] const ConfigEntry* get(std::string_view key, std::string_view suffix) const;

    [[nodiscard]] std::string_view getString(std::string_view key, std::string_view defaultVal = "") const;

    /// Numeric value of the last entry with `key`; nullopt if absent or not a number
    [[nodiscard]] std::optional<float> getNumber(std::string_view key) const;

    [[nodiscard]] std::vector<const ConfigEntry*> getAll(std::string_view key) const;

    [[nodiscard]] const std::vector<ConfigEntry>& entries() const { return entries_; }
    [[nodiscard]] auto begin() const { return entries_.begin(); }
    [[nodiscard]] auto end() const { return entries_.end(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    std::vector<ConfigEntry> entries_;
};

// ============================================================================
// ConfigParser - Parses settings files
// ============================================================================

/**
 * @brief Parser for line-based settings files
 *
 * Format:
 * ```
 * # Comments start with #
 * key: value
 * key:suffix: value
 * key:suffix:
 *     1.0 2.0
 *     3.0 4.0
 * include: other_file
 * ```
 *
 * Only lines whose first character is '#' are comments; a value may
 * itself start with '#' (colors). Includes nest up to MAX_INCLUDE_DEPTH.
 */
class ConfigParser {
public:
    using IncludeResolver = std::function<std::string(const std::string&)>;

    static constexpr int MAX_INCLUDE_DEPTH = 8;

    ConfigParser() = default;

    /// Map an `include:` path to a filesystem path. Default: relative to
    /// the including file's directory.
    void setIncludeResolver(IncludeResolver resolver) { includeResolver_ = std::move(resolver); }

    /// Parse a file; nullopt if it cannot be opened
    [[nodiscard]] std::optional<ConfigDocument> parseFile(const std::string& path) const;

    [[nodiscard]] ConfigDocument parseString(std::string_view content,
                                             const std::string& basePath = "") const;

private:
    std::optional<ConfigDocument> parseFileAtDepth(const std::string& path, int depth) const;
    ConfigDocument parseStringAtDepth(std::string_view content, const std::string& basePath,
                                      int depth) const;

    void parseLine(std::string_view line, size_t lineNumber, ConfigEntry& currentEntry,
                   ConfigDocument& doc, const std::string& basePath, int depth) const;

    [[nodiscard]] static std::vector<float> parseDataLine(std::string_view line);

    static void flushEntry(ConfigEntry& entry, ConfigDocument& doc);

    IncludeResolver includeResolver_;
};

}  // namespace terrasculpt
