#include "result_renderer.h"

#include <sstream>

#include "util/string_util.h"

namespace hql::render {

namespace {

std::string escape_attribute_value(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    if (c == '&') {
      out += "&amp;";
    } else if (c == '"') {
      out += "&quot;";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string start_tag(const QueryResultRow& row) {
  std::string out = "<" + (row.tag.empty() ? std::string("#document") : row.tag);
  for (const auto& attr : row.attributes) {
    out += " " + attr.first + "=\"" + escape_attribute_value(attr.second) + "\"";
  }
  out += ">";
  return out;
}

}  // namespace

std::string render_plain(const hql::QueryResult& result) {
  if (result.kind == QueryResult::Kind::Text) {
    return result.text + "\n";
  }
  std::ostringstream out;
  for (const auto& row : result.rows) {
    if (row.kind == NodeKind::Text) {
      out << row.text << "\n";
    } else {
      out << start_tag(row) << "\n";
    }
  }
  return out.str();
}

std::string render_json(const hql::QueryResult& result) {
  std::ostringstream out;
  if (result.kind == QueryResult::Kind::Text) {
    out << "{\"kind\":\"text\",\"value\":\"" << util::json_escape(result.text) << "\"}";
    return out.str();
  }
  out << "{\"kind\":\"nodes\",\"nodes\":[";
  for (size_t i = 0; i < result.rows.size(); ++i) {
    const auto& row = result.rows[i];
    if (i != 0) out << ",";
    out << "{\"node_id\":" << row.node_id << ",";
    out << "\"kind\":\"" << (row.kind == NodeKind::Text ? "text" : "element") << "\",";
    out << "\"tag\":\"" << util::json_escape(row.tag) << "\",";
    out << "\"text\":\"" << util::json_escape(row.text) << "\",";
    out << "\"attributes\":{";
    for (size_t j = 0; j < row.attributes.size(); ++j) {
      if (j != 0) out << ",";
      out << "\"" << util::json_escape(row.attributes[j].first) << "\":\""
          << util::json_escape(row.attributes[j].second) << "\"";
    }
    out << "}}";
  }
  out << "]}";
  return out.str();
}

}  // namespace hql::render
