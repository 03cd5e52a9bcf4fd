//! # JSON String Escaping
//!
//! Shared by the JSON log format and the search index page.

#ifndef POLYDOC_COMMON_JSON_ESCAPE_HPP
#define POLYDOC_COMMON_JSON_ESCAPE_HPP

#include <string>
#include <string_view>

namespace polydoc {

/// Escapes `text` as the body of a JSON string literal. Control characters
/// without a short form become `\uXXXX`.
[[nodiscard]] auto json_escape(std::string_view text) -> std::string;

} // namespace polydoc

#endif // POLYDOC_COMMON_JSON_ESCAPE_HPP
