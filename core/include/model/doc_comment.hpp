//! # Documentation Comment Parser
//!
//! Splits raw doc comment text into body, summary and block tags.
//!
//! ## Supported Tags
//!
//! - `@param name description` - Document a parameter
//! - `@see symbol` - Cross-reference another declaration
//! - `@since version` - Mark when the declaration was introduced
//! - `@deprecated message` - Mark the declaration as deprecated
//!
//! Unknown tags are dropped. Tags inside fenced code blocks are body text.

#ifndef POLYDOC_MODEL_DOC_COMMENT_HPP
#define POLYDOC_MODEL_DOC_COMMENT_HPP

#include "model/documentable.hpp"

#include <optional>
#include <string>
#include <vector>

namespace polydoc::model {

/// Result of parsing a documentation comment.
struct ParsedDoc {
    std::string summary;                   ///< First paragraph (before any tags).
    std::string body;                      ///< Body text without tags.
    std::vector<ParamDoc> params;          ///< @param tags.
    std::vector<std::string> see_also;     ///< @see references.
    std::optional<std::string> since;      ///< @since version.
    std::optional<Deprecation> deprecated; ///< @deprecated info.
};

/// Parses a documentation comment string.
[[nodiscard]] auto parse_doc_comment(const std::string& doc_text) -> ParsedDoc;

/// Extracts the first paragraph: the text before the first blank line,
/// tag or fenced code block.
[[nodiscard]] auto extract_summary(const std::string& doc_text) -> std::string;

/// Parses `doc_text` and stores the result in `facts`.
///
/// An explicit deprecation already present in `facts` (for example from a
/// `@Deprecated` annotation) is kept.
void apply_doc_comment(PlatformFacts& facts, const std::string& doc_text);

} // namespace polydoc::model

#endif // POLYDOC_MODEL_DOC_COMMENT_HPP
