//! # Configuration Loader
//!
//! Reads `polydoc.toml`, a subset of TOML:
//!
//! ```toml
//! [docgen]
//! output_dir = "build/docs"
//! format = "markdown"
//!
//! [[pass]]
//! module = "core"
//! platform = "jvm"
//! source_roots = ["src/jvm"]
//!
//! [[pass.package]]
//! prefix = "core.internal"
//! suppress = true
//!
//! [[pass.source_link]]
//! path = "src/jvm"
//! url = "https://example.org/blob/main/src/jvm"
//! line_suffix = "#L"
//! ```
//!
//! `[[pass.package]]`, `[[pass.source_link]]` and `[[pass.external_link]]`
//! attach to the most recent `[[pass]]`. Values are strings, integers,
//! booleans or string arrays (which may span lines). Unknown keys are
//! logged and ignored; everything else that does not parse is an error
//! carrying its line number.

#ifndef POLYDOC_CONFIG_CONFIG_LOADER_HPP
#define POLYDOC_CONFIG_CONFIG_LOADER_HPP

#include "config/configuration.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace polydoc::config {

/// Parser for the configuration TOML subset.
class ConfigParser {
public:
    explicit ConfigParser(std::string content);

    /// Parses the whole document.
    [[nodiscard]] auto parse() -> Result<DocConfiguration, ConfigError>;

private:
    struct Value {
        enum class Kind { String, Integer, Boolean, StringArray };

        Kind kind = Kind::String;
        std::string text;
        int64_t integer = 0;
        bool boolean = false;
        std::vector<std::string> items;
    };

    enum class Section { None, Docgen, Pass, Package, SourceLink, ExternalLink };

    std::string content_;
    size_t pos_ = 0;
    int line_ = 1;
    Section section_ = Section::None;
    DocConfiguration config_;

    [[nodiscard]] auto is_eof() const -> bool {
        return pos_ >= content_.size();
    }
    [[nodiscard]] auto peek() const -> char {
        return is_eof() ? '\0' : content_[pos_];
    }
    auto advance() -> char;
    void skip_inline_whitespace();
    void skip_whitespace_and_newlines();
    void skip_comment();

    auto error(const std::string& message) const -> ConfigError {
        return ConfigError{message, line_};
    }

    auto parse_header() -> Result<Unit, ConfigError>;
    auto parse_entry() -> Result<Unit, ConfigError>;
    auto parse_key() -> Result<std::string, ConfigError>;
    auto parse_value() -> Result<Value, ConfigError>;
    auto parse_string() -> Result<std::string, ConfigError>;
    auto parse_string_array() -> Result<std::vector<std::string>, ConfigError>;
    auto expect_line_end() -> Result<Unit, ConfigError>;

    auto assign(const std::string& key, const Value& value) -> Result<Unit, ConfigError>;
    auto assign_docgen(const std::string& key, const Value& value) -> Result<bool, ConfigError>;
    auto assign_pass(const std::string& key, const Value& value) -> Result<bool, ConfigError>;
    auto assign_package(const std::string& key, const Value& value) -> Result<bool, ConfigError>;
    auto assign_source_link(const std::string& key, const Value& value)
        -> Result<bool, ConfigError>;
    auto assign_external_link(const std::string& key, const Value& value)
        -> Result<bool, ConfigError>;

    auto as_string(const std::string& key, const Value& value) -> Result<std::string, ConfigError>;
    auto as_bool(const std::string& key, const Value& value) -> Result<bool, ConfigError>;
    auto as_int(const std::string& key, const Value& value) -> Result<int64_t, ConfigError>;
    auto as_list(const std::string& key, const Value& value)
        -> Result<std::vector<std::string>, ConfigError>;
};

/// Parses configuration text.
[[nodiscard]] auto parse_configuration(const std::string& content)
    -> Result<DocConfiguration, ConfigError>;

/// Reads and parses the configuration file at `path`.
[[nodiscard]] auto load_configuration(const std::filesystem::path& path)
    -> Result<DocConfiguration, ConfigError>;

} // namespace polydoc::config

#endif // POLYDOC_CONFIG_CONFIG_LOADER_HPP
