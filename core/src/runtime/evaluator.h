#pragma once

#include <cstddef>
#include <optional>

#include "hql/pipeline.h"
#include "hql/tree.h"
#include "hql/value.h"

namespace hql::runtime {

/// Applies a single stage to the current value in place.
/// MUST leave value untouched and return an error when the stage does not accept its variant.
std::optional<EvalError> apply_stage(const Stage& stage,
                                     size_t stage_index,
                                     EvalValue& value,
                                     const TreeAdapter& tree);

}  // namespace hql::runtime
