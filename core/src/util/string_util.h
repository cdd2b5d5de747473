#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace hql::util {

/// Tests the whitespace set HQL recognizes: space, tab, CR and LF.
/// MUST NOT consult the locale so matching stays deterministic.
bool is_hql_space(char c);
/// Converts a string to lowercase using ASCII folding only.
std::string to_lower(std::string_view s);
/// Compares two strings with ASCII case folding.
/// MUST avoid locale-sensitive behavior to keep matching deterministic.
bool equals_ascii_ci(std::string_view a, std::string_view b);
/// Trims leading and trailing space/tab/CR/LF.
/// MUST preserve internal whitespace.
std::string trim_ws(std::string_view s);
/// Splits a string on space/tab/CR/LF, dropping empty tokens and keeping order.
std::vector<std::string_view> split_ws(std::string_view s);
/// Removes one leading occurrence of prefix; returns the input unchanged when absent.
std::string strip_prefix_once(std::string_view s, std::string_view prefix);
/// Removes one trailing occurrence of suffix; returns the input unchanged when absent.
std::string strip_suffix_once(std::string_view s, std::string_view suffix);
/// Escapes a string for embedding inside a JSON string literal.
std::string json_escape(std::string_view s);

}  // namespace hql::util
