//! # Configuration Loader Implementation
//!
//! A hand-written parser for the configuration TOML subset. The parser keeps
//! a cursor (`pos_`, `line_`) over the whole text and dispatches every
//! `key = value` entry to the section that was opened last.

#include "config/config_loader.hpp"

#include "log/log.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

namespace polydoc::config {

ConfigParser::ConfigParser(std::string content) : content_(std::move(content)) {}

auto ConfigParser::advance() -> char {
    if (is_eof()) {
        return '\0';
    }
    char c = content_[pos_++];
    if (c == '\n') {
        ++line_;
    }
    return c;
}

void ConfigParser::skip_inline_whitespace() {
    while (!is_eof() && (peek() == ' ' || peek() == '\t' || peek() == '\r')) {
        advance();
    }
}

void ConfigParser::skip_comment() {
    if (peek() == '#') {
        while (!is_eof() && peek() != '\n') {
            advance();
        }
    }
}

void ConfigParser::skip_whitespace_and_newlines() {
    while (!is_eof()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            advance();
        } else if (c == '#') {
            skip_comment();
        } else {
            break;
        }
    }
}

auto ConfigParser::expect_line_end() -> Result<Unit, ConfigError> {
    skip_inline_whitespace();
    skip_comment();
    if (!is_eof() && peek() != '\n') {
        return error(std::string("unexpected character '") + peek() + "'");
    }
    return Unit{};
}

// ============================================================================
// Document Structure
// ============================================================================

auto ConfigParser::parse() -> Result<DocConfiguration, ConfigError> {
    while (true) {
        skip_whitespace_and_newlines();
        if (is_eof()) {
            break;
        }

        auto step = peek() == '[' ? parse_header() : parse_entry();
        if (is_err(step)) {
            return unwrap_err(step);
        }
    }
    return config_;
}

auto ConfigParser::parse_header() -> Result<Unit, ConfigError> {
    advance(); // '['
    bool array_table = false;
    if (peek() == '[') {
        advance();
        array_table = true;
    }

    std::string name;
    while (!is_eof() && peek() != ']' && peek() != '\n') {
        name += advance();
    }
    if (peek() != ']') {
        return error("unterminated table header");
    }
    advance();
    if (array_table) {
        if (peek() != ']') {
            return error("expected ']]' to close array table header");
        }
        advance();
    }

    auto trimmed_start = name.find_first_not_of(" \t");
    auto trimmed_end = name.find_last_not_of(" \t");
    name = trimmed_start == std::string::npos
               ? ""
               : name.substr(trimmed_start, trimmed_end - trimmed_start + 1);

    if (!array_table && name == "docgen") {
        section_ = Section::Docgen;
    } else if (array_table && name == "pass") {
        config_.passes.emplace_back();
        section_ = Section::Pass;
    } else if (array_table &&
               (name == "pass.package" || name == "pass.source_link" ||
                name == "pass.external_link")) {
        if (config_.passes.empty()) {
            return error("[[" + name + "]] must follow a [[pass]] table");
        }
        auto& pass = config_.passes.back();
        if (name == "pass.package") {
            pass.per_package_options.emplace_back();
            section_ = Section::Package;
        } else if (name == "pass.source_link") {
            pass.source_links.emplace_back();
            section_ = Section::SourceLink;
        } else {
            pass.external_documentation_links.emplace_back();
            section_ = Section::ExternalLink;
        }
    } else {
        return error("unknown table '" + name + "'");
    }

    return expect_line_end();
}

auto ConfigParser::parse_entry() -> Result<Unit, ConfigError> {
    int entry_line = line_;

    auto key = parse_key();
    if (is_err(key)) {
        return unwrap_err(key);
    }

    skip_inline_whitespace();
    if (peek() != '=') {
        return error("expected '=' after key '" + unwrap(key) + "'");
    }
    advance();
    skip_inline_whitespace();

    auto value = parse_value();
    if (is_err(value)) {
        return unwrap_err(value);
    }
    auto end = expect_line_end();
    if (is_err(end)) {
        return end;
    }

    auto assigned = assign(unwrap(key), unwrap(value));
    if (is_err(assigned)) {
        auto err = unwrap_err(assigned);
        err.line = entry_line;
        return err;
    }
    return Unit{};
}

auto ConfigParser::parse_key() -> Result<std::string, ConfigError> {
    std::string key;
    while (!is_eof()) {
        char c = peek();
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-') {
            key += advance();
        } else {
            break;
        }
    }
    if (key.empty()) {
        return error("expected a key");
    }
    return key;
}

// ============================================================================
// Values
// ============================================================================

auto ConfigParser::parse_value() -> Result<Value, ConfigError> {
    Value value;
    char c = peek();

    if (c == '"') {
        auto text = parse_string();
        if (is_err(text)) {
            return unwrap_err(text);
        }
        value.kind = Value::Kind::String;
        value.text = std::move(unwrap(text));
        return value;
    }

    if (c == '[') {
        auto items = parse_string_array();
        if (is_err(items)) {
            return unwrap_err(items);
        }
        value.kind = Value::Kind::StringArray;
        value.items = std::move(unwrap(items));
        return value;
    }

    std::string word;
    while (!is_eof()) {
        char w = peek();
        if (std::isalnum(static_cast<unsigned char>(w)) || w == '-' || w == '+' || w == '_') {
            word += advance();
        } else {
            break;
        }
    }

    if (word == "true" || word == "false") {
        value.kind = Value::Kind::Boolean;
        value.boolean = word == "true";
        return value;
    }

    if (!word.empty()) {
        try {
            size_t used = 0;
            int64_t number = std::stoll(word, &used);
            if (used == word.size()) {
                value.kind = Value::Kind::Integer;
                value.integer = number;
                return value;
            }
        } catch (const std::exception&) {
            // not a number; reported below
        }
    }

    return error("invalid value '" + word + "'");
}

auto ConfigParser::parse_string() -> Result<std::string, ConfigError> {
    advance(); // opening quote
    std::string out;
    while (true) {
        if (is_eof() || peek() == '\n') {
            return error("unterminated string");
        }
        char c = advance();
        if (c == '"') {
            break;
        }
        if (c == '\\') {
            char escaped = advance();
            switch (escaped) {
            case 'n':
                out += '\n';
                break;
            case 't':
                out += '\t';
                break;
            case '"':
                out += '"';
                break;
            case '\\':
                out += '\\';
                break;
            default:
                return error(std::string("unknown escape '\\") + escaped + "'");
            }
            continue;
        }
        out += c;
    }
    return out;
}

auto ConfigParser::parse_string_array() -> Result<std::vector<std::string>, ConfigError> {
    advance(); // '['
    std::vector<std::string> items;

    while (true) {
        skip_whitespace_and_newlines();
        if (is_eof()) {
            return error("unterminated array");
        }
        if (peek() == ']') {
            advance();
            break;
        }
        if (peek() != '"') {
            return error("arrays may only contain strings");
        }
        auto item = parse_string();
        if (is_err(item)) {
            return unwrap_err(item);
        }
        items.push_back(std::move(unwrap(item)));

        skip_whitespace_and_newlines();
        if (peek() == ',') {
            advance();
        } else if (peek() != ']') {
            return error("expected ',' or ']' in array");
        }
    }
    return items;
}

// ============================================================================
// Typed Accessors
// ============================================================================

auto ConfigParser::as_string(const std::string& key, const Value& value)
    -> Result<std::string, ConfigError> {
    if (value.kind != Value::Kind::String) {
        return ConfigError{"'" + key + "' must be a string", 0};
    }
    return value.text;
}

auto ConfigParser::as_bool(const std::string& key, const Value& value)
    -> Result<bool, ConfigError> {
    if (value.kind != Value::Kind::Boolean) {
        return ConfigError{"'" + key + "' must be true or false", 0};
    }
    return value.boolean;
}

auto ConfigParser::as_int(const std::string& key, const Value& value)
    -> Result<int64_t, ConfigError> {
    if (value.kind != Value::Kind::Integer) {
        return ConfigError{"'" + key + "' must be an integer", 0};
    }
    return value.integer;
}

auto ConfigParser::as_list(const std::string& key, const Value& value)
    -> Result<std::vector<std::string>, ConfigError> {
    if (value.kind == Value::Kind::String) {
        return std::vector<std::string>{value.text};
    }
    if (value.kind != Value::Kind::StringArray) {
        return ConfigError{"'" + key + "' must be an array of strings", 0};
    }
    return value.items;
}

namespace {

/// Stores a typed value into `target`, forwarding conversion errors.
template <typename T, typename Source>
auto store(Result<Source, ConfigError> converted, T& target) -> Result<bool, ConfigError> {
    if (is_err(converted)) {
        return unwrap_err(converted);
    }
    target = static_cast<T>(std::move(unwrap(converted)));
    return true;
}

} // namespace

// ============================================================================
// Section Assignment
// ============================================================================

auto ConfigParser::assign(const std::string& key, const Value& value)
    -> Result<Unit, ConfigError> {
    Result<bool, ConfigError> known = false;

    switch (section_) {
    case Section::None:
        return ConfigError{"key '" + key + "' outside of any table", 0};
    case Section::Docgen:
        known = assign_docgen(key, value);
        break;
    case Section::Pass:
        known = assign_pass(key, value);
        break;
    case Section::Package:
        known = assign_package(key, value);
        break;
    case Section::SourceLink:
        known = assign_source_link(key, value);
        break;
    case Section::ExternalLink:
        known = assign_external_link(key, value);
        break;
    }

    if (is_err(known)) {
        return unwrap_err(known);
    }
    if (!unwrap(known)) {
        POLYDOC_LOG_WARN("config", "line " << line_ << ": ignoring unknown key '" << key << "'");
    }
    return Unit{};
}

auto ConfigParser::assign_docgen(const std::string& key, const Value& value)
    -> Result<bool, ConfigError> {
    auto& c = config_;
    if (key == "output_dir" || key == "output") {
        return store(as_string(key, value), c.output_dir);
    }
    if (key == "format") {
        return store(as_string(key, value), c.format);
    }
    if (key == "cache_root") {
        auto text = as_string(key, value);
        if (is_err(text)) {
            return unwrap_err(text);
        }
        c.cache_root = unwrap(text);
        return true;
    }
    if (key == "implied_platforms") {
        return store(as_list(key, value), c.implied_platforms);
    }
    if (key == "generate_index_pages") {
        return store(as_bool(key, value), c.generate_index_pages);
    }
    if (key == "skip") {
        return store(as_bool(key, value), c.skip);
    }
    if (key == "fail_on_error") {
        return store(as_bool(key, value), c.fail_on_error);
    }
    if (key == "disabled_plugins") {
        return store(as_list(key, value), c.disabled_plugins);
    }
    return false;
}

auto ConfigParser::assign_pass(const std::string& key, const Value& value)
    -> Result<bool, ConfigError> {
    auto& p = config_.passes.back();
    if (key == "module" || key == "module_name") {
        return store(as_string(key, value), p.module_name);
    }
    if (key == "platform" || key == "analysis_platform") {
        auto text = as_string(key, value);
        if (is_err(text)) {
            return unwrap_err(text);
        }
        auto platform = model::platform_from_string(unwrap(text));
        if (is_err(platform)) {
            return ConfigError{unwrap_err(platform), 0};
        }
        p.analysis_platform = unwrap(platform);
        return true;
    }
    if (key == "targets") {
        return store(as_list(key, value), p.targets);
    }
    if (key == "source_roots") {
        return store(as_list(key, value), p.source_roots);
    }
    if (key == "classpath") {
        return store(as_list(key, value), p.classpath);
    }
    if (key == "samples") {
        return store(as_list(key, value), p.samples);
    }
    if (key == "includes") {
        return store(as_list(key, value), p.includes);
    }
    if (key == "suppressed_files") {
        return store(as_list(key, value), p.suppressed_files);
    }
    if (key == "jdk_version") {
        return store(as_int(key, value), p.jdk_version);
    }
    if (key == "skip_deprecated") {
        return store(as_bool(key, value), p.skip_deprecated);
    }
    if (key == "skip_empty_packages") {
        return store(as_bool(key, value), p.skip_empty_packages);
    }
    if (key == "report_undocumented") {
        return store(as_bool(key, value), p.report_undocumented);
    }
    if (key == "include_non_public") {
        return store(as_bool(key, value), p.include_non_public);
    }
    if (key == "include_root_package") {
        return store(as_bool(key, value), p.include_root_package);
    }
    if (key == "no_stdlib_link") {
        return store(as_bool(key, value), p.no_stdlib_link);
    }
    if (key == "no_jdk_link") {
        return store(as_bool(key, value), p.no_jdk_link);
    }
    if (key == "language_version") {
        return store(as_string(key, value), p.language_version);
    }
    if (key == "api_version") {
        return store(as_string(key, value), p.api_version);
    }
    if (key == "since_version") {
        return store(as_string(key, value), p.since_version);
    }
    return false;
}

auto ConfigParser::assign_package(const std::string& key, const Value& value)
    -> Result<bool, ConfigError> {
    auto& o = config_.passes.back().per_package_options.back();
    if (key == "prefix") {
        return store(as_string(key, value), o.prefix);
    }
    if (key == "include_non_public") {
        return store(as_bool(key, value), o.include_non_public);
    }
    if (key == "report_undocumented") {
        return store(as_bool(key, value), o.report_undocumented);
    }
    if (key == "skip_deprecated") {
        return store(as_bool(key, value), o.skip_deprecated);
    }
    if (key == "suppress") {
        return store(as_bool(key, value), o.suppress);
    }
    return false;
}

auto ConfigParser::assign_source_link(const std::string& key, const Value& value)
    -> Result<bool, ConfigError> {
    auto& link = config_.passes.back().source_links.back();
    if (key == "path") {
        return store(as_string(key, value), link.path);
    }
    if (key == "url") {
        return store(as_string(key, value), link.url);
    }
    if (key == "line_suffix") {
        return store(as_string(key, value), link.line_suffix);
    }
    return false;
}

auto ConfigParser::assign_external_link(const std::string& key, const Value& value)
    -> Result<bool, ConfigError> {
    auto& link = config_.passes.back().external_documentation_links.back();
    if (key == "url") {
        return store(as_string(key, value), link.url);
    }
    if (key == "package_list" || key == "package_list_url") {
        return store(as_string(key, value), link.package_list_url);
    }
    return false;
}

// ============================================================================
// Entry Points
// ============================================================================

auto parse_configuration(const std::string& content) -> Result<DocConfiguration, ConfigError> {
    ConfigParser parser(content);
    return parser.parse();
}

auto load_configuration(const std::filesystem::path& path)
    -> Result<DocConfiguration, ConfigError> {
    std::ifstream file(path);
    if (!file) {
        return ConfigError{"cannot open configuration file '" + path.string() + "'", 0};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    POLYDOC_LOG_DEBUG("config", "loading " << path.string());
    auto parsed = parse_configuration(buffer.str());
    if (is_err(parsed)) {
        auto err = unwrap_err(parsed);
        err.message = path.string() + ": " + err.message;
        return err;
    }
    return parsed;
}

} // namespace polydoc::config
