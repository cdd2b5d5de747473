#include "evaluator.h"

#include <string>
#include <utility>
#include <vector>

#include "../util/string_util.h"
#include "traversal.h"

namespace hql {

EvalValue make_node_set(std::vector<NodeHandle> nodes) {
  EvalValue out;
  out.kind = EvalValue::Kind::NodeSet;
  out.nodes = std::move(nodes);
  return out;
}

EvalValue make_text(std::string text) {
  EvalValue out;
  out.kind = EvalValue::Kind::Text;
  out.text = std::move(text);
  return out;
}

std::string value_kind_name(EvalValue::Kind kind) {
  switch (kind) {
    case EvalValue::Kind::NodeSet:
      return "NodeSet";
    case EvalValue::Kind::Text:
      return "Text";
  }
  return "NodeSet";
}

namespace runtime {

namespace {

bool is_element(const TreeAdapter& tree, NodeHandle node) {
  return tree.kind(node) == NodeKind::Element;
}

bool matches_token(std::string_view candidate, const std::string& wanted, bool case_sensitive) {
  if (case_sensitive) return candidate == wanted;
  return util::equals_ascii_ci(candidate, wanted);
}

/// Runs one stage against the current value. Each handler assumes the variant was already checked.
struct StageRunner {
  EvalValue& value;
  const TreeAdapter& tree;

  void operator()(const FlatStage&) const {
    std::vector<NodeHandle> out;
    for (NodeHandle node : value.nodes) {
      for_each_in_subtree(tree, node, [&](NodeHandle n) { out.push_back(n); });
    }
    value.nodes = normalize_node_set(tree, std::move(out));
  }

  void operator()(const PathStage& stage) const {
    std::vector<NodeHandle> out;
    for (NodeHandle node : value.nodes) {
      if (stage.kind == PathKind::Child) {
        for (NodeHandle child : tree.children(node)) {
          if (is_element(tree, child) && util::equals_ascii_ci(tree.tag(child), stage.tag)) {
            out.push_back(child);
          }
        }
        continue;
      }
      // The walk starts at node, so a matching context node selects itself.
      for_each_in_subtree(tree, node, [&](NodeHandle n) {
        if (is_element(tree, n) && util::equals_ascii_ci(tree.tag(n), stage.tag)) {
          out.push_back(n);
        }
      });
    }
    value.nodes = normalize_node_set(tree, std::move(out));
  }

  void operator()(const AttrStage& stage) const {
    retain([&](NodeHandle node) {
      auto attr = tree.attribute(node, stage.field);
      if (!attr.has_value()) return false;
      return !stage.value.has_value() || *attr == *stage.value;
    });
  }

  void operator()(const IdStage& stage) const {
    retain([&](NodeHandle node) {
      auto id = tree.attribute(node, "id");
      return id.has_value() && matches_token(*id, stage.value, stage.case_sensitive);
    });
  }

  void operator()(const ClassStage& stage) const {
    retain([&](NodeHandle node) {
      auto classes = tree.attribute(node, "class");
      if (!classes.has_value()) return false;
      for (std::string_view token : util::split_ws(*classes)) {
        if (matches_token(token, stage.value, stage.case_sensitive)) return true;
      }
      return false;
    });
  }

  void operator()(const ChildStage& stage) const {
    std::vector<NodeHandle> out;
    for (NodeHandle node : value.nodes) {
      const auto& children = tree.children(node);
      const int64_t count = static_cast<int64_t>(children.size());
      const int64_t index = stage.index < 0 ? count + stage.index : stage.index;
      if (index < 0 || index >= count) continue;
      out.push_back(children[static_cast<size_t>(index)]);
    }
    value.nodes = normalize_node_set(tree, std::move(out));
  }

  void operator()(const TextStage&) const {
    std::string out;
    for (NodeHandle node : value.nodes) {
      if (tree.kind(node) == NodeKind::Text) {
        out += tree.text_content(node);
      } else {
        out += subtree_text(tree, node);
      }
    }
    value = make_text(std::move(out));
  }

  void operator()(const TrimStage&) const { value.text = util::trim_ws(value.text); }

  void operator()(const TrimPrefixStage& stage) const {
    value.text = util::strip_prefix_once(value.text, stage.text);
  }

  void operator()(const TrimSuffixStage& stage) const {
    value.text = util::strip_suffix_once(value.text, stage.text);
  }

  void operator()(const AttrExtractStage& stage) const {
    std::string out;
    for (NodeHandle node : value.nodes) {
      auto attr = tree.attribute(node, stage.field);
      if (attr.has_value()) out += *attr;
    }
    value = make_text(std::move(out));
  }

  template <typename Pred>
  void retain(Pred pred) const {
    std::vector<NodeHandle> out;
    for (NodeHandle node : value.nodes) {
      if (is_element(tree, node) && pred(node)) out.push_back(node);
    }
    value.nodes = std::move(out);
  }
};

EvalValue::Kind expected_input(const Stage& stage) {
  return consumes_text(stage) ? EvalValue::Kind::Text : EvalValue::Kind::NodeSet;
}

Span stage_span(const Stage& stage) {
  return std::visit([](const auto& s) { return s.span; }, stage);
}

}  // namespace

std::optional<EvalError> apply_stage(const Stage& stage,
                                     size_t stage_index,
                                     EvalValue& value,
                                     const TreeAdapter& tree) {
  const EvalValue::Kind expected = expected_input(stage);
  if (value.kind != expected) {
    EvalError error;
    error.kind = EvalError::Kind::TypeMismatch;
    error.stage_index = stage_index;
    error.stage = stage_name(stage);
    error.expected = expected;
    error.span = stage_span(stage);
    error.message = "Type mismatch: " + error.stage + " expects " + value_kind_name(expected) +
                    " but got " + value_kind_name(value.kind);
    return error;
  }
  std::visit(StageRunner{value, tree}, stage);
  return std::nullopt;
}

}  // namespace runtime

EvalResult evaluate(const Pipeline& pipeline,
                    const std::vector<NodeHandle>& context,
                    const TreeAdapter& tree,
                    const EvalOptions& options) {
  EvalResult result;
  EvalValue value = make_node_set(runtime::normalize_node_set(tree, context));
  for (size_t i = 0; i < pipeline.stages.size(); ++i) {
    const Stage& stage = pipeline.stages[i];
    if (options.trace) {
      *options.trace << "apply stage " << i << ": " << format_stage(stage) << " (in: ";
      if (value.kind == EvalValue::Kind::NodeSet) {
        *options.trace << value.nodes.size() << " nodes)\n";
      } else {
        *options.trace << "text, " << value.text.size() << " bytes)\n";
      }
    }
    if (auto error = runtime::apply_stage(stage, i, value, tree)) {
      if (options.trace) *options.trace << "stage " << i << " failed: " << error->message << "\n";
      result.error = std::move(*error);
      return result;
    }
  }
  result.value = std::move(value);
  return result;
}

}  // namespace hql
