//! # Documentation Comment Parser Implementation

#include "model/doc_comment.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace polydoc::model {

namespace {

auto trim(const std::string& s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

/// Splits "word rest of text" into ("word", "rest of text").
auto split_first_word(const std::string& text) -> std::pair<std::string, std::string> {
    auto trimmed = trim(text);
    size_t space = trimmed.find_first_of(" \t");
    if (space == std::string::npos) {
        return {trimmed, ""};
    }
    return {trimmed.substr(0, space), trim(trimmed.substr(space + 1))};
}

auto is_fence(const std::string& trimmed) -> bool {
    return trimmed.rfind("```", 0) == 0;
}

void append_line(std::string& body, const std::string& line) {
    if (!body.empty()) {
        body += "\n";
    }
    body += line;
}

} // namespace

auto extract_summary(const std::string& doc_text) -> std::string {
    std::istringstream stream(doc_text);
    std::string line;
    std::string summary;

    while (std::getline(stream, line)) {
        auto trimmed = trim(line);

        if (trimmed.empty()) {
            if (!summary.empty()) {
                break;
            }
            continue;
        }
        if (trimmed[0] == '@' || is_fence(trimmed)) {
            break;
        }

        if (!summary.empty()) {
            summary += " ";
        }
        summary += trimmed;
    }

    return summary;
}

auto parse_doc_comment(const std::string& doc_text) -> ParsedDoc {
    ParsedDoc result;
    if (doc_text.empty()) {
        return result;
    }

    result.summary = extract_summary(doc_text);

    std::istringstream stream(doc_text);
    std::string line;
    std::string body;
    std::string tag;
    std::string tag_content;

    auto flush_tag = [&]() {
        if (tag.empty()) {
            return;
        }

        auto content = trim(tag_content);
        if (tag == "param") {
            auto [name, description] = split_first_word(content);
            if (!name.empty()) {
                result.params.push_back(ParamDoc{name, description});
            }
        } else if (tag == "see") {
            if (!content.empty()) {
                result.see_also.push_back(content);
            }
        } else if (tag == "since") {
            result.since = content;
        } else if (tag == "deprecated") {
            result.deprecated = Deprecation{content, ""};
        }

        tag.clear();
        tag_content.clear();
    };

    bool in_code_block = false;

    while (std::getline(stream, line)) {
        auto trimmed = trim(line);

        if (is_fence(trimmed)) {
            flush_tag();
            in_code_block = !in_code_block;
            append_line(body, line);
            continue;
        }

        if (in_code_block) {
            append_line(body, line);
            continue;
        }

        if (!trimmed.empty() && trimmed[0] == '@') {
            flush_tag();

            auto [name, rest] = split_first_word(trimmed.substr(1));
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            tag = name.empty() ? std::string("unknown") : name;
            tag_content = rest;
        } else if (!tag.empty()) {
            if (!tag_content.empty()) {
                tag_content += " ";
            }
            tag_content += trimmed;
        } else {
            append_line(body, line);
        }
    }

    flush_tag();
    result.body = trim(body);

    if (result.deprecated && result.since && result.deprecated->since.empty()) {
        result.deprecated->since = *result.since;
    }

    return result;
}

void apply_doc_comment(PlatformFacts& facts, const std::string& doc_text) {
    auto parsed = parse_doc_comment(doc_text);

    facts.documentation = std::move(parsed.body);
    facts.summary = std::move(parsed.summary);
    facts.params = std::move(parsed.params);
    facts.see_also = std::move(parsed.see_also);
    if (parsed.since) {
        facts.since = *parsed.since;
    }
    if (parsed.deprecated && !facts.deprecation) {
        facts.deprecation = std::move(parsed.deprecated);
    }
}

} // namespace polydoc::model
