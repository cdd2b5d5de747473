#pragma once

#include <string>

#include "hql/hql.h"

namespace hql::render {

/// One line for a text value; one line per node otherwise.
/// Elements render as their start tag, text nodes as their content.
std::string render_plain(const hql::QueryResult& result);

/// Stable-key JSON object describing the result kind and payload.
std::string render_json(const hql::QueryResult& result);

}  // namespace hql::render
