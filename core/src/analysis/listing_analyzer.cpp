//! # Listing Front End Implementation
//!
//! ## Parsing
//!
//! Listings are parsed line by line. A stack of open declarations tracks
//! nesting: a declaration indented deeper than the top of the stack becomes
//! its member, otherwise the stack is popped until a shallower entry remains.
//! Doc lines and annotations accumulate until the next declaration consumes
//! them.

#include "analysis/listing_analyzer.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>

namespace polydoc::analysis {

namespace fs = std::filesystem;

namespace {

auto trim(const std::string& s) -> std::string {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

auto indentation_of(const std::string& line) -> size_t {
    size_t width = 0;
    for (char c : line) {
        if (c == ' ') {
            width += 1;
        } else if (c == '\t') {
            width += 4;
        } else {
            break;
        }
    }
    return width;
}

auto is_identifier_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$' || c == '`';
}

auto is_package_name(const std::string& name) -> bool {
    if (name.empty() || name.front() == '.' || name.back() == '.') {
        return false;
    }
    return std::all_of(name.begin(), name.end(),
                       [](char c) { return is_identifier_char(c) || c == '.'; });
}

/// Pending doc comment and annotations for the next declaration.
struct Pending {
    std::vector<std::string> doc_lines;
    std::vector<std::string> annotations;
    std::optional<std::string> deprecation;

    void clear() {
        doc_lines.clear();
        annotations.clear();
        deprecation.reset();
    }
};

/// Parses "@Name" or "@Name(args)"; a quoted first argument of
/// `@Deprecated` becomes the deprecation message.
auto parse_annotation(const std::string& text, Pending& pending) -> bool {
    size_t i = 1;
    while (i < text.size() && (is_identifier_char(text[i]) || text[i] == '.')) {
        ++i;
    }
    auto name = text.substr(1, i - 1);
    if (name.empty()) {
        return false;
    }
    pending.annotations.push_back(name);

    if (name == "Deprecated" || name == "kotlin.Deprecated") {
        std::string message;
        auto open_quote = text.find('"', i);
        if (open_quote != std::string::npos) {
            auto close_quote = text.find('"', open_quote + 1);
            if (close_quote != std::string::npos) {
                message = text.substr(open_quote + 1, close_quote - open_quote - 1);
            }
        }
        pending.deprecation = message;
    }
    return true;
}

struct OpenDeclaration {
    size_t indent;
    Symbol* symbol;
};

class ListingParser {
public:
    ListingParser(const std::string& file_name, MessageCollector& messages)
        : messages_(messages) {
        result_.path = file_name;
    }

    auto parse(const std::string& text) -> SourceFile {
        std::istringstream stream(text);
        std::string raw;
        while (std::getline(stream, raw)) {
            ++line_;
            parse_line(raw);
        }
        if (!pending_.doc_lines.empty() || !pending_.annotations.empty()) {
            warn("documentation or annotations at end of file are not attached to anything");
        }
        return std::move(result_);
    }

private:
    void error(const std::string& message) {
        messages_.report(Severity::Error, message, model::SourceLocation{result_.path, line_});
    }

    void warn(const std::string& message) {
        messages_.report(Severity::Warning, message, model::SourceLocation{result_.path, line_});
    }

    void parse_line(const std::string& raw) {
        auto text = trim(raw);
        if (text.empty()) {
            return;
        }

        if (text.starts_with("///")) {
            auto doc = text.substr(3);
            if (!doc.empty() && doc.front() == ' ') {
                doc.erase(0, 1);
            }
            pending_.doc_lines.push_back(doc);
            return;
        }
        if (text.starts_with("//")) {
            return;
        }
        if (text.front() == '@') {
            if (!parse_annotation(text, pending_)) {
                error("malformed annotation '" + text + "'");
            }
            return;
        }
        if (text.starts_with("package ") || text == "package") {
            parse_package(text);
            return;
        }

        parse_declaration(text, indentation_of(raw));
    }

    void parse_package(const std::string& text) {
        auto name = trim(text.substr(7));
        if (!is_package_name(name)) {
            error("malformed package name '" + name + "'");
            return;
        }
        if (seen_declaration_) {
            error("package directive must precede all declarations");
            return;
        }
        result_.package_name = name;
    }

    void parse_declaration(const std::string& text, size_t indent) {
        std::istringstream words(text);
        std::string word;
        words >> word;

        Symbol symbol;
        if (auto vis = model::visibility_from_string(word)) {
            symbol.visibility = *vis;
            words >> word;
        }
        if (word == "deprecated") {
            symbol.deprecation = std::string();
            words >> word;
        }

        auto kind = model::kind_from_keyword(word);
        if (!kind || *kind == model::DocumentableKind::Package) {
            error("unknown declaration kind '" + word + "'");
            pending_.clear();
            return;
        }
        symbol.kind = *kind;
        symbol.keyword = word;

        // name and tail come from the raw remainder so spacing is preserved
        std::string rest;
        std::getline(words, rest);
        rest = trim(rest);

        size_t name_end = 0;
        while (name_end < rest.size() && is_identifier_char(rest[name_end])) {
            ++name_end;
        }
        if (name_end == 0) {
            error("declaration '" + word + "' has no name");
            pending_.clear();
            return;
        }
        symbol.name = rest.substr(0, name_end);
        symbol.signature_tail = rest.substr(name_end);
        if (!symbol.signature_tail.empty() && symbol.signature_tail.front() != '(' &&
            symbol.signature_tail.front() != '<' && symbol.signature_tail.front() != ':') {
            symbol.signature_tail = " " + trim(symbol.signature_tail);
        }
        symbol.location = model::SourceLocation{result_.path, line_};

        if (!pending_.doc_lines.empty()) {
            std::string doc;
            for (size_t i = 0; i < pending_.doc_lines.size(); ++i) {
                if (i > 0) {
                    doc += '\n';
                }
                doc += pending_.doc_lines[i];
            }
            symbol.doc = std::move(doc);
        }
        symbol.annotations = std::move(pending_.annotations);
        if (pending_.deprecation && !symbol.deprecation) {
            symbol.deprecation = pending_.deprecation;
        }
        pending_.clear();

        while (!open_.empty() && open_.back().indent >= indent) {
            open_.pop_back();
        }

        std::vector<Symbol>* container = &result_.symbols;
        if (!open_.empty()) {
            Symbol* parent = open_.back().symbol;
            if (!model::is_classlike(parent->kind)) {
                error("'" + symbol.name + "' is nested under " +
                      std::string(model::kind_to_string(parent->kind)) + " '" + parent->name +
                      "', which cannot have members");
                return;
            }
            container = &parent->members;
        }

        seen_declaration_ = true;
        container->push_back(std::move(symbol));
        open_.push_back(OpenDeclaration{indent, &container->back()});
    }

    MessageCollector& messages_;
    SourceFile result_;
    Pending pending_;
    std::vector<OpenDeclaration> open_;
    uint32_t line_ = 0;
    bool seen_declaration_ = false;
};

auto read_file(const fs::path& path) -> std::optional<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

/// Collects listing files below `root` in a stable (sorted) order.
auto collect_listings(const fs::path& root) -> std::vector<fs::path> {
    std::vector<fs::path> found;
    auto is_listing = [](const fs::path& p) {
        auto ext = p.extension().string();
        return ext == SYMBOL_LISTING_EXTENSION || ext == FILE_LISTING_EXTENSION;
    };

    if (fs::is_regular_file(root)) {
        if (is_listing(root)) {
            found.push_back(root);
        }
        return found;
    }

    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file() && is_listing(it->path())) {
            found.push_back(it->path());
        }
    }
    std::sort(found.begin(), found.end());
    return found;
}

} // namespace

auto parse_listing(const std::string& text, const std::string& file_name,
                   MessageCollector& messages) -> SourceFile {
    ListingParser parser(file_name, messages);
    return parser.parse(text);
}

void ListingAnalyzer::add_symbol_listing(SourceFile listing) {
    auto it = std::find_if(groups_.begin(), groups_.end(), [&](const SymbolGroup& group) {
        return group.package_name == listing.package_name;
    });
    if (it == groups_.end()) {
        groups_.push_back(SymbolGroup{listing.package_name, {}});
        it = std::prev(groups_.end());
    }
    for (auto& symbol : listing.symbols) {
        it->symbols.push_back(std::move(symbol));
    }
}

auto ListingAnalyzer::create(const AnalysisSettings& settings, MessageCollector& messages)
    -> Result<Rc<const AnalysisEnvironment>, std::string> {
    for (const auto& entry : settings.classpath) {
        if (std::string_view(entry).starts_with(JDK_CLASSPATH_PREFIX)) {
            continue;
        }
        if (!fs::exists(entry)) {
            return "classpath entry does not exist: " + entry;
        }
    }

    auto analyzer = Rc<ListingAnalyzer>(new ListingAnalyzer(settings));

    for (const auto& root : settings.source_roots) {
        if (!fs::exists(root)) {
            return "source root does not exist: " + root;
        }

        for (const auto& path : collect_listings(root)) {
            auto text = read_file(path);
            if (!text) {
                return "cannot read " + path.string();
            }
            POLYDOC_LOG_TRACE("analysis", "parsing " << path.string());

            auto listing = parse_listing(*text, path.generic_string(), messages);
            if (path.extension().string() == SYMBOL_LISTING_EXTENSION) {
                analyzer->add_symbol_listing(std::move(listing));
            } else {
                analyzer->files_.push_back(std::move(listing));
            }
        }
    }

    POLYDOC_LOG_DEBUG("analysis", "analyzed " << analyzer->groups_.size() << " package group(s) and "
                                              << analyzer->files_.size() << " source file(s) for "
                                              << model::platform_to_string(settings.platform));
    return Rc<const AnalysisEnvironment>(analyzer);
}

auto listing_analysis_factory() -> AnalysisFactory {
    return [](const config::PassConfiguration& /*pass*/, const AnalysisSettings& settings,
              MessageCollector& messages) {
        return ListingAnalyzer::create(settings, messages);
    };
}

} // namespace polydoc::analysis
