#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "hql/pipeline.h"
#include "hql/tree.h"

namespace hql {

/// Value carried between stages: an ordered node-set or a text scalar.
/// NodeSet MUST be deduplicated and in document order.
struct EvalValue {
  enum class Kind { NodeSet, Text } kind = Kind::NodeSet;
  std::vector<NodeHandle> nodes;
  std::string text;
};

EvalValue make_node_set(std::vector<NodeHandle> nodes);
EvalValue make_text(std::string text);
std::string value_kind_name(EvalValue::Kind kind);

/// Semantic run-time failure. An out-of-range @child index is not an error.
struct EvalError {
  enum class Kind { TypeMismatch } kind = Kind::TypeMismatch;
  std::string message;
  /// Zero-based index of the failing stage within the pipeline.
  size_t stage_index = 0;
  std::string stage;
  EvalValue::Kind expected = EvalValue::Kind::NodeSet;
  Span span;
};

struct EvalResult {
  std::optional<EvalValue> value;
  std::optional<EvalError> error;
};

struct EvalOptions {
  /// Receives one line per applied stage when set; never owned.
  std::ostream* trace = nullptr;
};

/// Runs a compiled pipeline left to right starting from the context node-set.
/// MUST NOT mutate the tree and MUST set exactly one of value/error.
/// The context is normalized (deduplicated, document order) before the first stage.
/// Context handles MUST belong to tree; a foreign handle propagates the adapter's
/// exception (HtmlDocument throws std::out_of_range) instead of producing an EvalError.
EvalResult evaluate(const Pipeline& pipeline,
                    const std::vector<NodeHandle>& context,
                    const TreeAdapter& tree,
                    const EvalOptions& options = EvalOptions{});

}  // namespace hql
