#include "hql/hql.h"

#include <utility>

#include "dom/html_document.h"
#include "io.h"
#include "runtime/traversal.h"

namespace hql {

struct ParsedDocumentHandle {
  HtmlDocument doc;
};

namespace {

std::string describe_parse_error(const ParseError& error) {
  return "Query parse error: " + error.message + " at position " + std::to_string(error.position) +
         " in '" + error.segment + "'";
}

}  // namespace

QueryError::QueryError(ParseError error)
    : std::runtime_error(describe_parse_error(error)), parse_error_(std::move(error)) {}

QueryError::QueryError(EvalError error)
    : std::runtime_error("Query evaluation error: " + error.message), eval_error_(std::move(error)) {}

std::shared_ptr<const CompiledQuery> compile(const std::string& hql) {
  ParseResult parsed = parse_pipeline(hql);
  if (!parsed.pipeline.has_value()) {
    throw QueryError(parsed.error.value_or(ParseError{}));
  }
  auto compiled = std::make_shared<CompiledQuery>();
  compiled->pipeline = std::move(*parsed.pipeline);
  return compiled;
}

EvalValue run(const CompiledQuery& query,
              const std::vector<NodeHandle>& context,
              const TreeAdapter& tree,
              const EvalOptions& options) {
  EvalResult result = evaluate(query.pipeline, context, tree, options);
  if (result.error.has_value()) {
    throw QueryError(std::move(*result.error));
  }
  return std::move(*result.value);
}

std::shared_ptr<const ParsedDocumentHandle> prepare_document(const std::string& html, ParseMode mode) {
  auto prepared = std::make_shared<ParsedDocumentHandle>();
  prepared->doc = parse_html(html, mode);
  return prepared;
}

const TreeAdapter& document_tree(const ParsedDocumentHandle& prepared) {
  return prepared.doc;
}

QueryResult materialize(const EvalValue& value, const TreeAdapter& tree) {
  QueryResult out;
  if (value.kind == EvalValue::Kind::Text) {
    out.kind = QueryResult::Kind::Text;
    out.text = value.text;
    return out;
  }
  out.kind = QueryResult::Kind::Nodes;
  out.rows.reserve(value.nodes.size());
  for (NodeHandle node : value.nodes) {
    QueryResultRow row;
    row.node_id = node;
    row.kind = tree.kind(node);
    row.doc_order = tree.document_position(node);
    row.parent_id = tree.parent(node);
    if (row.kind == NodeKind::Text) {
      row.text = tree.text_content(node);
    } else {
      row.tag = tree.tag(node);
      row.text = runtime::subtree_text(tree, node);
      row.attributes = tree.attributes(node);
    }
    out.rows.push_back(std::move(row));
  }
  return out;
}

QueryResult execute_query(const CompiledQuery& query,
                          const ParsedDocumentHandle& prepared,
                          const EvalOptions& options) {
  EvalValue value = run(query, {prepared.doc.root()}, prepared.doc, options);
  return materialize(value, prepared.doc);
}

QueryResult execute_query_from_document(const std::string& html, const std::string& hql, ParseMode mode) {
  auto compiled = compile(hql);
  auto prepared = prepare_document(html, mode);
  return execute_query(*compiled, *prepared);
}

QueryResult execute_query_from_prepared_document(const std::shared_ptr<const ParsedDocumentHandle>& prepared,
                                                 const std::string& hql) {
  if (!prepared) {
    throw std::runtime_error("Prepared document handle is null");
  }
  auto compiled = compile(hql);
  return execute_query(*compiled, *prepared);
}

QueryResult execute_query_from_file(const std::string& path, const std::string& hql, ParseMode mode) {
  auto compiled = compile(hql);
  std::string html = read_file(path);
  auto prepared = prepare_document(html, mode);
  return execute_query(*compiled, *prepared);
}

}  // namespace hql
