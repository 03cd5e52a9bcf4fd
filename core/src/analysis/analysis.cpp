//! # Analysis Support
//!
//! Symbol rendering, settings construction and the logging message collector.

#include "analysis/analysis.hpp"

#include "pipeline/doc_logger.hpp"

namespace polydoc::analysis {

namespace {

auto trim(const std::string& s) -> std::string {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

/// Splits a parameter list at top-level commas.
auto split_parameters(const std::string& params) -> std::vector<std::string> {
    std::vector<std::string> parts;
    std::string current;
    int depth = 0;
    char previous = '\0';
    for (char c : params) {
        bool arrow = c == '>' && previous == '-';
        previous = c;
        if (c == '(' || c == '<' || c == '[') {
            ++depth;
        } else if ((c == ')' || c == '>' || c == ']') && !arrow) {
            --depth;
        } else if (c == ',' && depth == 0) {
            parts.push_back(trim(current));
            current.clear();
            continue;
        }
        current += c;
    }
    if (!trim(current).empty()) {
        parts.push_back(trim(current));
    }
    return parts;
}

} // namespace

auto Symbol::signature() const -> std::string {
    std::string out;
    if (visibility != model::Visibility::Public) {
        out += model::visibility_to_string(visibility);
        out += ' ';
    }
    if (kind != model::DocumentableKind::EnumEntry) {
        out += keyword.empty() ? std::string(model::kind_to_string(kind)) : keyword;
        out += ' ';
    }
    out += name;
    out += signature_tail;
    return out;
}

auto Symbol::discriminator() const -> std::string {
    if (kind != model::DocumentableKind::Function) {
        return "";
    }

    auto open = signature_tail.find('(');
    if (open == std::string::npos) {
        return "()";
    }
    int depth = 0;
    size_t close = std::string::npos;
    for (size_t i = open; i < signature_tail.size(); ++i) {
        if (signature_tail[i] == '(') {
            ++depth;
        } else if (signature_tail[i] == ')' && --depth == 0) {
            close = i;
            break;
        }
    }
    if (close == std::string::npos) {
        return "()";
    }

    std::string result = "(";
    bool first = true;
    for (const auto& param : split_parameters(signature_tail.substr(open + 1, close - open - 1))) {
        auto type = param;
        auto colon = param.find(':');
        if (colon != std::string::npos) {
            type = param.substr(colon + 1);
        }
        auto default_value = type.find('=');
        if (default_value != std::string::npos) {
            type = type.substr(0, default_value);
        }
        if (!first) {
            result += ',';
        }
        result += trim(type);
        first = false;
    }
    result += ')';
    return result;
}

auto make_analysis_settings(const config::PassConfiguration& pass) -> AnalysisSettings {
    AnalysisSettings settings;
    settings.platform = pass.analysis_platform;
    settings.classpath = pass.classpath;
    settings.source_roots = pass.source_roots;
    settings.language_version = pass.language_version;
    settings.api_version = pass.api_version;
    settings.jdk_version = pass.jdk_version;

    if (pass.analysis_platform == model::Platform::Jvm && !pass.no_jdk_link) {
        settings.classpath.push_back(std::string(JDK_CLASSPATH_PREFIX) +
                                     std::to_string(pass.jdk_version));
    }
    return settings;
}

auto severity_to_string(Severity severity) -> std::string_view {
    switch (severity) {
    case Severity::Info:
        return "info";
    case Severity::Warning:
        return "warning";
    case Severity::Error:
        return "error";
    }
    return "unknown";
}

void LoggingMessageCollector::report(Severity severity, const std::string& message,
                                     const std::optional<model::SourceLocation>& location) {
    if (severity == Severity::Error) {
        seen_errors_ = true;
    }

    std::string text(severity_to_string(severity));
    text += ": ";
    if (location) {
        text += location->file;
        if (location->line > 0) {
            text += ":" + std::to_string(location->line);
        }
        text += ": ";
    }
    text += message;
    logger_.info(text);
}

} // namespace polydoc::analysis
