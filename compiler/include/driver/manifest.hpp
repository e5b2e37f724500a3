//! # Project Manifest
//!
//! This header defines `kindred.toml` parsing.
//!
//! ## Manifest Sections
//!
//! | Section     | Type            | Keys                                           |
//! |-------------|-----------------|------------------------------------------------|
//! | `[package]` | `PackageInfo`   | `name`                                         |
//! | `[build]`   | `BuildSettings` | `source`, `output_dir`, `mode`, `linker`, `timeout` |
//!
//! ## TOML Parser
//!
//! `SimpleTomlParser` handles the subset of TOML a manifest needs: section
//! headers, `key = value` pairs with string, integer and boolean values,
//! and `#` comments. Unknown sections and keys are errors.

#ifndef KINDRED_DRIVER_MANIFEST_HPP
#define KINDRED_DRIVER_MANIFEST_HPP

#include "common.hpp"
#include "driver/options.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace fs = std::filesystem;

namespace kindred::driver {

/// File name looked up in the working directory.
constexpr const char* MANIFEST_FILE = "kindred.toml";

/**
 * Package metadata from [package] section
 */
struct PackageInfo {
    std::string name;

    bool validate() const;
};

/**
 * Build settings from [build] section; unset keys leave options untouched
 */
struct BuildSettings {
    std::optional<std::string> source;
    std::optional<std::string> output_dir;
    std::optional<backend::OptimizationMode> mode;
    std::optional<std::string> linker;
    std::optional<int> timeout;

    bool validate() const;
};

/**
 * Complete manifest structure
 */
struct Manifest {
    PackageInfo package;
    BuildSettings build;

    /**
     * Load manifest from a kindred.toml file
     * @return the manifest, or a message naming the file and line
     */
    static Result<Manifest, std::string> load(const fs::path& path);

    /**
     * Parse manifest text
     */
    static Result<Manifest, std::string> parse(const std::string& content);

    bool validate() const;

    /**
     * Overrides `options` with every value the manifest sets. Relative paths
     * are taken relative to `base_dir`, the manifest's directory.
     */
    void apply_to(CompileOptions& options, const fs::path& base_dir) const;
};

/// A scalar TOML value.
using TomlValue = std::variant<std::string, int64_t, bool>;

/**
 * Simple TOML parser (subset of TOML spec)
 * Handles:
 * - Sections: [section]
 * - Key-value pairs: key = "value"
 * - Numbers: key = 123
 * - Booleans: key = true
 */
class SimpleTomlParser {
public:
    explicit SimpleTomlParser(const std::string& content);

    /**
     * Parse TOML content into manifest
     */
    std::optional<Manifest> parse();

    /**
     * Get error message if parsing failed
     */
    std::string get_error() const {
        return error_message_;
    }

private:
    std::string content_;
    std::string error_message_;
    size_t pos_ = 0;
    int line_ = 1;

    // Helper methods
    void skip_whitespace();
    void skip_inline_whitespace();
    void skip_comment();
    bool is_eof() const {
        return pos_ >= content_.size();
    }
    char peek() const {
        return is_eof() ? '\0' : content_[pos_];
    }
    char advance();
    bool at_line_end();

    std::string parse_identifier();
    std::optional<std::string> parse_string();
    std::optional<TomlValue> parse_value();

    bool assign_package(PackageInfo& info, const std::string& key, const TomlValue& value);
    bool assign_build(BuildSettings& build, const std::string& key, const TomlValue& value);

    void set_error(const std::string& message);
};

/**
 * Validate package name
 * @return true for a non-empty name made of letters, digits, `-` and `_`
 */
bool is_valid_package_name(const std::string& name);

} // namespace kindred::driver

#endif // KINDRED_DRIVER_MANIFEST_HPP
