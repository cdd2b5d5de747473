#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "hql/pipeline.h"
#include "hql/tree.h"
#include "hql/value.h"

namespace hql {

struct ParsedDocumentHandle;

/// Compiled query that can be run any number of times against any document.
/// MUST stay immutable so handles can be shared across threads.
struct CompiledQuery {
  Pipeline pipeline;
};

/// Selects how raw markup is turned into a tree.
/// Document keeps the implied html/body wrappers; Fragment keeps the input's own top-level nodes.
enum class ParseMode {
  Document,
  Fragment,
};

/// Materialized node so callers can format results without holding the tree.
struct QueryResultRow {
  int64_t node_id = 0;
  NodeKind kind = NodeKind::Element;
  std::string tag;
  /// Concatenated descendant text for elements, content for text nodes.
  std::string text;
  std::vector<std::pair<std::string, std::string>> attributes;
  std::optional<int64_t> parent_id;
  int64_t doc_order = 0;
};

/// Final pipeline output: either a node-set (rows) or a text value.
struct QueryResult {
  enum class Kind { Nodes, Text } kind = Kind::Nodes;
  std::vector<QueryResultRow> rows;
  std::string text;
};

/// Raised by the facade when compilation or evaluation fails.
/// Carries the structured error so callers can render diagnostics.
class QueryError : public std::runtime_error {
 public:
  explicit QueryError(ParseError error);
  explicit QueryError(EvalError error);

  const std::optional<ParseError>& parse_error() const { return parse_error_; }
  const std::optional<EvalError>& eval_error() const { return eval_error_; }

 private:
  std::optional<ParseError> parse_error_;
  std::optional<EvalError> eval_error_;
};

/// Compiles HQL text once for repeated execution.
/// MUST throw QueryError on malformed input and never return a partial pipeline.
std::shared_ptr<const CompiledQuery> compile(const std::string& hql);

/// Runs a compiled query from an explicit context node-set over any tree.
/// MUST throw QueryError on evaluation failures.
EvalValue run(const CompiledQuery& query,
              const std::vector<NodeHandle>& context,
              const TreeAdapter& tree,
              const EvalOptions& options = EvalOptions{});

/// Parses markup once and returns a reusable handle for repeated query execution.
std::shared_ptr<const ParsedDocumentHandle> prepare_document(const std::string& html,
                                                             ParseMode mode = ParseMode::Document);
/// Exposes the tree behind a prepared handle for callers that use run() directly.
const TreeAdapter& document_tree(const ParsedDocumentHandle& prepared);

/// Executes a compiled query from the document root and materializes the result.
QueryResult execute_query(const CompiledQuery& query,
                          const ParsedDocumentHandle& prepared,
                          const EvalOptions& options = EvalOptions{});
/// Executes a query over an in-memory document.
/// MUST treat the input as immutable; failures throw and side effects are none.
QueryResult execute_query_from_document(const std::string& html,
                                        const std::string& hql,
                                        ParseMode mode = ParseMode::Document);
QueryResult execute_query_from_prepared_document(const std::shared_ptr<const ParsedDocumentHandle>& prepared,
                                                 const std::string& hql);
/// Executes a query over a file path and loads the file contents internally.
/// MUST report IO failures via std::runtime_error.
QueryResult execute_query_from_file(const std::string& path,
                                    const std::string& hql,
                                    ParseMode mode = ParseMode::Document);

/// Converts an evaluation value into rows/text using the tree it was produced from.
QueryResult materialize(const EvalValue& value, const TreeAdapter& tree);

}  // namespace hql
