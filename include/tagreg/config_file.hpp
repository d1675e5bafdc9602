#pragma once

/**
 * @file config_file.hpp
 * @brief "key: value" config file parsing with comment preservation
 */

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tagreg {

// ============================================================================
// ConfigFile - A configuration file that preserves structure when modified
// ============================================================================
//
// This class handles reading and writing configuration files while preserving
// comments, blank lines, and ordering. When a value is modified, only that
// line changes. New keys are appended at the end.
//
// Format:
//   # comment
//   store.path: build/types.toml
//   lock.timeout_ms: 30000
//
// Usage:
//   ConfigFile config;
//   if (config.load("tagreg.conf")) {
//       auto store = config.getString("store.path", "types.toml");
//       config.set("store.key_scheme", "qualified");
//       config.save();
//   }
//
class ConfigFile {
public:
    ConfigFile() = default;

    // Load from file (returns false if file doesn't exist or can't be read)
    [[nodiscard]] bool load(const std::filesystem::path& path);

    // Save to file (creates directories if needed)
    [[nodiscard]] bool save();

    // Save to a different path
    [[nodiscard]] bool saveAs(const std::filesystem::path& path);

    [[nodiscard]] bool isLoaded() const { return loaded_; }
    [[nodiscard]] bool isDirty() const { return dirty_; }
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    // ========================================================================
    // Value access (read)
    // ========================================================================

    [[nodiscard]] bool has(std::string_view key) const;

    // Raw value text, nullopt if the key is absent
    [[nodiscard]] std::optional<std::string> raw(std::string_view key) const;

    [[nodiscard]] std::string getString(std::string_view key,
                                        std::string_view defaultVal = "") const;

    // Decimal or 0x-prefixed hex. Returns defaultVal if absent or not an integer.
    [[nodiscard]] int64_t getInt(std::string_view key, int64_t defaultVal = 0) const;

    // true/yes/on or false/no/off. Returns defaultVal otherwise.
    [[nodiscard]] bool getBool(std::string_view key, bool defaultVal = false) const;

    // ========================================================================
    // Value access (write)
    // ========================================================================

    void set(std::string_view key, std::string_view value);
    void set(std::string_view key, int64_t value);
    void set(std::string_view key, bool value);

    // Avoid const char* binding to bool
    void set(std::string_view key, const char* value) { set(key, std::string_view(value)); }

    // Remove a key (comments out the line rather than deleting)
    void remove(std::string_view key);

    // Set header comment (written at top of a file that was not loaded)
    void setHeader(std::string_view header) { header_ = header; }

    /// Parse an integer the way getInt does
    [[nodiscard]] static std::optional<int64_t> parseInt(std::string_view text);

    /// Parse a boolean the way getBool does
    [[nodiscard]] static std::optional<bool> parseBool(std::string_view text);

private:
    // A line in the config file
    struct Line {
        std::string content;      // Original line content
        std::string key;          // Key if this is a key-value line, empty otherwise
        size_t valueStart = 0;    // Position where value starts (after ": ")
        bool isKeyValue = false;  // True if this line has a key-value pair
    };

    void parseLines(std::string_view content);

    // Find the line index for a key (-1 if not found)
    [[nodiscard]] int findLine(std::string_view key) const;

    void setImpl(std::string_view key, const std::string& formattedValue);

    std::filesystem::path path_;
    std::vector<Line> lines_;
    std::unordered_map<std::string, size_t> keyToLine_;  // Key -> line index
    std::unordered_map<std::string, std::string> values_;
    std::string header_;
    bool loaded_ = false;
    bool dirty_ = false;
};

}  // namespace tagreg
